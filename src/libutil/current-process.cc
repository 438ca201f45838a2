#include "chunkcache/util/current-process.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/logging.hh"

#ifdef __GLIBC__
#  include <malloc.h>
#endif

namespace chunkcache {

bool reclaimHeap()
{
#ifdef __GLIBC__
    bool released = malloc_trim(0) != 0;
    vomit("heap trim %s memory", released ? "released" : "did not release");
    return released;
#else
    return false;
#endif
}

void restoreProcessContext()
{
    unix::restoreSignals();
}

} // namespace chunkcache
