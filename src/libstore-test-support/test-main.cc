#include <cstdlib>

#include "chunkcache/store/globals.hh"
#include "chunkcache/util/environment-variables.hh"
#include "chunkcache/util/logging.hh"

#include "chunkcache/store/tests/test-main.hh"

namespace chunkcache {

int testMainPre(int argc, char ** argv)
{
    initLibStore(false);

    // Keep the test logs readable unless asked otherwise.
    if (!getEnv("CHUNKCACHE_TEST_VERBOSE"))
        verbosity = lvlError;

    // Tests must never pick up a rebuild command from the environment.
    settings.rebuildCommand = Strings{};

    return EXIT_SUCCESS;
}

} // namespace chunkcache
