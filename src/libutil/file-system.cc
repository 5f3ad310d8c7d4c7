#include "charx/util/file-system.hh"
#include "charx/util/util.hh"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace charx {

Path canonPath(PathView path)
{
    if (path.empty() || path[0] != '/')
        throw Error("not an absolute path: '%1%'", path);

    std::string result;

    while (!path.empty()) {
        auto slash = path.find('/');
        auto component = path.substr(0, slash);
        path.remove_prefix(slash == path.npos ? path.size() : slash + 1);

        if (component.empty() || component == ".")
            continue;
        if (component == "..")
            result.erase(std::min(result.size(), result.rfind('/')));
        else {
            result += '/';
            result += component;
        }
    }

    return result.empty() ? "/" : result;
}

Path dirOf(PathView path)
{
    auto pos = path.rfind('/');
    if (pos == path.npos)
        return ".";
    return pos == 0 ? "/" : Path(path.substr(0, pos));
}

std::string_view baseNameOf(std::string_view path)
{
    while (path.size() > 1 && path.back() == '/')
        path.remove_suffix(1);
    auto pos = path.rfind('/');
    return pos == path.npos ? path : path.substr(pos + 1);
}

bool isInDir(std::string_view path, std::string_view dir)
{
    return path.size() > dir.size() + 1 && hasPrefix(path, dir) && path[dir.size()] == '/';
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
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}

static void writeAll(const Path & path, std::string_view s, mode_t mode, bool sync)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    try {
        writeFull(fd.get(), s);
        if (sync)
            fd.fsync();
        fd.close();
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }
}

void writeFile(const Path & path, std::string_view s, mode_t mode)
{
    writeAll(path, s, mode, false);
}

void writeFileAtomic(const Path & path, std::string_view s)
{
    auto tmp = makeTempPath(dirOf(path), "." + std::string(baseNameOf(path)));
    try {
        writeAll(tmp, s, 0666, true);
        renameFile(tmp, path);
    } catch (Error &) {
        unlink(tmp.c_str());
        throw;
    }
    syncParent(path);
}

void syncParent(const Path & path)
{
    auto dir = dirOf(path);
    AutoCloseFD fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening directory '%1%'", dir);
    fd.fsync();
}

void deletePath(const Path & path)
{
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

void renameFile(const Path & src, const Path & dst)
{
    if (rename(src.c_str(), dst.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", src, dst);
}

Strings readDirectoryNames(const Path & path)
{
    Strings names;
    std::error_code ec;
    for (std::filesystem::directory_iterator i(path, ec), end; !ec && i != end; i.increment(ec))
        if (i->is_regular_file())
            names.push_back(i->path().filename().string());
    if (ec)
        throw SysError(ec.value(), "reading directory '%1%'", path);
    names.sort();
    return names;
}

AutoDelete::~AutoDelete()
{
    if (!del)
        return;
    try {
        deletePath(_path);
    } catch (Error &) {
        ignoreExceptionInDestructor();
    }
}

Path createTempDir(const Path & prefix)
{
    auto tmpdir = getenv("TMPDIR");
    Path root = canonPath(tmpdir && *tmpdir ? tmpdir : "/tmp");
    while (true) {
        auto dir = makeTempPath(root, prefix);
        if (mkdir(dir.c_str(), 0700) == 0)
            return dir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", dir);
    }
}

Path makeTempPath(const Path & root, const Path & name)
{
    /* Random start so that leftovers of an earlier run with the same
       pid are unlikely to collide. */
    static std::atomic<uint32_t> counter(std::random_device{}());
    return fmt("%s/%s-%d-%d", root, name, getpid(), counter++);
}

} // namespace charx
