#pragma once
///@file
/// Path manipulation and the small set of file operations the builder's
/// state directories need. All paths handled here are absolute.

#include "inkforge/libutil/types.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/file-descriptor.hh"

#include <kj/common.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>

#include <memory>
#include <optional>

namespace inkforge {

/**
 * Make `path` absolute against `dir` (the working directory if unset) and
 * canonicalise it.
 */
Path absPath(Path path, std::optional<PathView> dir = {});

/**
 * Drop `.` and `..` components and repeated or trailing slashes. Purely
 * lexical, symlinks are left alone.
 */
Path canonPath(PathView path);

/**
 * Everything before the last `/`; `/` for the root and its children.
 */
Path dirOf(const PathView path);

/**
 * The last component of `path`, ignoring one trailing slash.
 */
std::string_view baseNameOf(std::string_view path);

struct stat lstat(const Path & path);

/**
 * Like `lstat`, but a missing path (ENOENT, ENOTDIR) is `nullopt` rather
 * than an error.
 */
std::optional<struct stat> maybeLstat(const Path & path);

bool pathExists(const Path & path);

struct DirEntry
{
    std::string name;
    ino_t ino;
    unsigned char type; // DT_*
    DirEntry(std::string name, ino_t ino, unsigned char type)
        : name(std::move(name)), ino(ino), type(type) { }
};

typedef std::vector<DirEntry> DirEntries;

/**
 * Read the entries of a directory, sorted by name.
 */
DirEntries readDirectory(const Path & path);

std::string readFile(const Path & path);

void writeFile(const Path & path, std::string_view s, mode_t mode = 0666);

/**
 * Write a string to a temporary sibling of `path`, fsync it, and rename it
 * into place. Readers see either the old contents or the new ones, and the
 * new ones survive a crash once this returns.
 */
void writeFileAtomic(const Path & path, std::string_view s, mode_t mode = 0644);

/**
 * fsync the directory containing `path`, making a rename into it durable.
 */
void syncParent(const Path & path);

/**
 * Remove `path` and, for a directory, everything below it. Read-only
 * directories left by a stage are made writable first. A missing path is
 * not an error.
 */
void deletePath(const Path & path);

/**
 * `mkdir -p`. Returns the directories that did not exist before, outermost
 * first.
 */
Paths createDirs(const Path & path);

void renameFile(const Path & src, const Path & dst);

/**
 * Create a temporary directory below `TMPDIR`, or `/tmp` if it is unset.
 */
Path createTempDir(const Path & prefix = "inkforge", mode_t mode = 0755);

/**
 * Deletes a path when it goes out of scope unless `cancel()`ed.
 */
class AutoDelete
{
    Path path;
    bool del;
    bool recursive;
public:
    KJ_DISALLOW_COPY_AND_MOVE(AutoDelete);

    AutoDelete();
    AutoDelete(const Path & p, bool recursive = true);
    ~AutoDelete();
    void cancel();
    operator Path() const { return path; }
};

struct DIRDeleter
{
    void operator()(DIR * dir) const {
        closedir(dir);
    }
};

typedef std::unique_ptr<DIR, DIRDeleter> AutoCloseDir;

}
