#pragma once
///@file

#include <cstddef>

namespace chunkcache {

/**
 * Return free heap pages to the operating system. Long-running
 * transfers call this periodically so that chunk buffers released by
 * the allocator do not accumulate in the resident set.
 *
 * @return whether any memory was actually released.
 */
bool reclaimHeap();

/**
 * Restore the original inherited Unix process context (signal mask),
 * for use in a child process just before `exec()`.
 *
 * See unix::startSignalHandlerThread().
 */
void restoreProcessContext();

} // namespace chunkcache
