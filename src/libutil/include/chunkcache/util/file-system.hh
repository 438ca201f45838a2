#pragma once
/**
 * @file
 *
 * Paths and whole-file operations. Everything here throws `SysError`
 * on failure.
 */

#include "chunkcache/util/types.hh"
#include "chunkcache/util/error.hh"
#include "chunkcache/util/file-descriptor.hh"

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include <optional>

namespace chunkcache {

/**
 * `path` made absolute against `dir` (default: the working directory)
 * and canonicalised.
 */
Path absPath(PathView path, std::optional<PathView> dir = {});

/**
 * Resolve `.` and `..` components and collapse repeated or trailing
 * slashes, without looking at the file system.
 *
 * @throws Error if `path` is not absolute.
 */
Path canonPath(PathView path);

/**
 * Everything before the last `/`, `/` for top-level entries, and `.`
 * for a path without any slash.
 */
Path dirOf(const PathView path);

/**
 * The last component of `path`, ignoring trailing slashes.
 */
std::string_view baseNameOf(std::string_view path);

struct stat stat(const Path & path);

/**
 * Like `stat()`, but `std::nullopt` when `path` does not exist.
 */
std::optional<struct stat> maybeStat(const Path & path);

bool pathExists(const Path & path);

std::string readFile(const Path & path);

enum struct FsSync { Yes, No };

/**
 * Create or truncate `path` and write `s` to it. With `FsSync::Yes`
 * the data is on disk when this returns.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666, FsSync sync = FsSync::No);

/**
 * fsync the directory containing `path`, making a rename into it
 * durable.
 */
void syncParent(const Path & path);

/**
 * Remove `path` recursively. A missing path is not an error.
 */
void deletePath(const Path & path);

void createDirs(const Path & path);

/**
 * rename(2): atomically replaces `newName`, and only works within one
 * file system.
 */
void moveFile(const Path & oldName, const Path & newName);

void setWriteTime(const Path & path, time_t mtime);

/**
 * Deletes a path when it goes out of scope, unless `cancel()`ed first.
 */
class AutoDelete
{
    Path _path;
    bool del = false;
    bool recursive = true;

public:
    AutoDelete() {}
    AutoDelete(const Path & p, bool recursive = true);
    ~AutoDelete();

    void cancel()
    {
        del = false;
    }

    void reset(const Path & p, bool recursive = true);

    const Path & path() const
    {
        return _path;
    }

    operator const Path &() const
    {
        return _path;
    }
};

/**
 * Create a fresh directory under `tmpRoot` (default `$TMPDIR` or
 * `/tmp`).
 */
Path createTempDir(const Path & tmpRoot = "", const Path & prefix = "chunkcache", mode_t mode = 0755);

/**
 * `<root><suffix>-<pid>-<counter>`, a name no other process or thread
 * will pick. Nothing is created.
 */
Path makeTempPath(const Path & root, const Path & suffix = ".tmp");

} // namespace chunkcache
