#pragma once
///@file

namespace chunkcache {

/**
 * Call this from a GTest `main` before running tests that use the
 * chunk cache.
 */
int testMainPre(int argc, char ** argv);

} // namespace chunkcache
