#pragma once
/**
 * @file
 *
 * Path manipulation and whole-file I/O.
 */

#include "charx/util/types.hh"
#include "charx/util/file-descriptor.hh"

#include <optional>

#include <sys/types.h>
#include <sys/stat.h>

namespace charx {

/**
 * Resolve `.` and `..` components and drop repeated or trailing
 * slashes. `..` above the root stays at the root.
 *
 * @throws Error if `path` is not absolute.
 */
Path canonPath(PathView path);

/**
 * Everything before the final `/`: `/` for `/foo`, `.` for a path
 * with no slash.
 */
Path dirOf(PathView path);

/**
 * The final component, ignoring trailing slashes.
 */
std::string_view baseNameOf(std::string_view path);

/**
 * Whether the canonical `path` lies strictly below the canonical `dir`.
 */
bool isInDir(std::string_view path, std::string_view dir);

/**
 * `std::nullopt` if `path` does not exist.
 */
std::optional<struct stat> maybeStat(const Path & path);

bool pathExists(const Path & path);

std::string readFile(const Path & path);

void writeFile(const Path & path, std::string_view s, mode_t mode = 0666);

/**
 * Write `s` to a temporary sibling of `path`, sync it and rename it
 * into place. Readers see either the old or the new contents.
 */
void writeFileAtomic(const Path & path, std::string_view s);

/**
 * fsync the directory containing `path`, making a rename durable.
 */
void syncParent(const Path & path);

/**
 * Remove `path` recursively. A missing path is not an error.
 */
void deletePath(const Path & path);

void createDirs(const Path & path);

/**
 * rename(2): replaces `dst` atomically.
 */
void renameFile(const Path & src, const Path & dst);

/**
 * The sorted names of the regular files in a directory.
 */
Strings readDirectoryNames(const Path & path);

/**
 * Deletes a path, recursively, when it goes out of scope.
 */
class AutoDelete
{
    Path _path;
    bool del = false;

public:
    AutoDelete() {}

    AutoDelete(const Path & p)
        : _path(p)
        , del(true)
    {
    }

    AutoDelete(const AutoDelete &) = delete;

    ~AutoDelete();

    void cancel()
    {
        del = false;
    }

    void reset(const Path & p)
    {
        _path = p;
        del = true;
    }

    const Path & path() const
    {
        return _path;
    }
};

/**
 * Create a fresh directory under `$TMPDIR` (or `/tmp`).
 */
Path createTempDir(const Path & prefix = "charx");

/**
 * A path `<root>/<name>-<pid>-<counter>` that is not in use yet by this
 * process.
 */
Path makeTempPath(const Path & root, const Path & name = ".tmp");

} // namespace charx
