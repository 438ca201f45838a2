#include "chunkcache/util/file-system.hh"
#include "chunkcache/util/environment-variables.hh"
#include "chunkcache/util/signals.hh"
#include "chunkcache/util/util.hh"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <random>

#include <fcntl.h>

namespace chunkcache {

Path absPath(PathView path, std::optional<PathView> dir)
{
    if (!path.empty() && path[0] == '/')
        return canonPath(path);

    std::string base;
    if (dir)
        base = *dir;
    else {
        std::error_code ec;
        base = std::filesystem::current_path(ec).string();
        if (ec)
            throw SysError(ec.value(), "cannot get the current directory");
    }
    return canonPath(base + "/" + std::string(path));
}

Path canonPath(PathView path)
{
    if (path.empty() || path[0] != '/')
        throw Error("not an absolute path: '%1%'", path);

    std::vector<std::string_view> components;
    for (size_t pos = 0; pos < path.size();) {
        auto end = std::min(path.find('/', pos), path.size());
        auto c = path.substr(pos, end - pos);
        if (c == "..") {
            if (!components.empty())
                components.pop_back();
        } else if (!c.empty() && c != ".")
            components.push_back(c);
        pos = end + 1;
    }

    if (components.empty())
        return "/";
    Path res;
    for (auto & c : components) {
        res += '/';
        res += c;
    }
    return res;
}

Path dirOf(const PathView path)
{
    auto slash = path.rfind('/');
    if (slash == path.npos)
        return ".";
    if (slash == 0)
        return "/";
    return Path(path.substr(0, slash));
}

std::string_view baseNameOf(std::string_view path)
{
    auto end = path.find_last_not_of('/');
    if (end == path.npos)
        return path.substr(0, 0);
    auto start = path.rfind('/', end);
    start = start == path.npos ? 0 : start + 1;
    return path.substr(start, end + 1 - start);
}

struct stat stat(const Path & path)
{
    if (auto st = maybeStat(path))
        return *st;
    throw SysError(ENOENT, "getting status of '%1%'", path);
}

std::optional<struct stat> maybeStat(const Path & path)
{
    struct stat st;
    if (::stat(path.c_str(), &st) == 0)
        return st;
    if (errno == ENOENT || errno == ENOTDIR)
        return std::nullopt;
    throw SysError("getting status of '%s'", path);
}

bool pathExists(const Path & path)
{
    return maybeStat(path).has_value();
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}

void writeFile(const Path & path, std::string_view s, mode_t mode, FsSync sync)
{
    AutoCloseFD fd = ::open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%1%'", path);

    try {
        writeFull(fd.get(), s);
        if (sync == FsSync::Yes)
            fd.fsync();
        /* close(2) can report a deferred write error. */
        fd.close();
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }
}

void syncParent(const Path & path)
{
    auto dir = dirOf(path);
    AutoCloseFD fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening directory '%1%'", dir);
    fd.fsync();
}

void deletePath(const Path & path)
{
    checkInterrupt();
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec)
        throw SysError(ec.value(), "deleting '%1%'", path);
}

void createDirs(const Path & path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
        throw SysError(ec.value(), "creating directory '%1%'", path);
}

void moveFile(const Path & oldName, const Path & newName)
{
    if (::rename(oldName.c_str(), newName.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", oldName, newName);
}

void setWriteTime(const Path & path, time_t mtime)
{
    /* Leave the access time alone. */
    struct timespec times[2] = {{0, UTIME_OMIT}, {mtime, 0}};
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) == -1)
        throw SysError("changing modification time of '%1%'", path);
}

AutoDelete::AutoDelete(const Path & p, bool recursive)
{
    reset(p, recursive);
}

AutoDelete::~AutoDelete()
{
    if (!del)
        return;
    try {
        if (recursive)
            deletePath(_path);
        else if (::unlink(_path.c_str()) == -1 && errno != ENOENT)
            throw SysError("deleting '%1%'", _path);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::reset(const Path & p, bool recursive)
{
    _path = p;
    this->recursive = recursive;
    del = true;
}

Path createTempDir(const Path & tmpRoot, const Path & prefix, mode_t mode)
{
    auto root = tmpRoot.empty() ? getEnvNonEmpty("TMPDIR").value_or("/tmp") : tmpRoot;
    while (true) {
        checkInterrupt();
        auto dir = makeTempPath(root, "/" + prefix);
        if (::mkdir(dir.c_str(), mode) == 0)
            return dir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", dir);
    }
}

Path makeTempPath(const Path & root, const Path & suffix)
{
    /* A random start makes collisions with leftovers of an earlier
       process that had the same pid unlikely. */
    static std::atomic<uint32_t> counter(std::random_device{}());
    return fmt("%s%s-%d-%d", root, suffix, getpid(), counter++);
}

} // namespace chunkcache
