#pragma once
///@file

#include "chunkcache/store/cache-orchestrator.hh"

namespace chunkcache {

/**
 * A `RebuildFunction` that runs `command` (program and leading
 * arguments) with the artifact name and destination appended. The
 * command's output is logged line by line; it is killed along with
 * its process group after `timeout`.
 *
 * The returned function throws `RebuildFailure` if the command is
 * empty, fails, times out, or exits without creating the destination.
 */
RebuildFunction makeCommandRebuilder(Strings command, std::chrono::seconds timeout);

} // namespace chunkcache
