#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/finally.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/signals.hh"
#include "inkforge/libutil/strings.hh"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>

namespace inkforge {

Path absPath(Path path, std::optional<PathView> dir)
{
    if (path.empty() || path[0] != '/') {
        if (!dir) {
            char buf[PATH_MAX];
            if (!getcwd(buf, sizeof(buf)))
                throw SysError("cannot get cwd");
            path = concatStringsSep("/", Strings{buf, path});
        } else {
            path = concatStringsSep("/", Strings{std::string(*dir), path});
        }
    }
    return canonPath(path);
}

Path canonPath(PathView path)
{
    if (path.empty() || path[0] != '/')
        throw Error("not an absolute path: '%1%'", path);

    Path s;
    std::vector<std::string> parts;
    for (auto & c : tokenizeString<std::vector<std::string>>(path, "/")) {
        if (c == ".") continue;
        if (c == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(c);
    }
    for (auto & c : parts) {
        s += '/';
        s += c;
    }
    return s.empty() ? "/" : s;
}

Path dirOf(const PathView path)
{
    Path::size_type pos = path.rfind('/');
    if (pos == std::string::npos)
        return ".";
    return pos == 0 ? "/" : Path(path, 0, pos);
}

std::string_view baseNameOf(std::string_view path)
{
    if (path.empty())
        return "";

    auto last = path.size() - 1;
    if (path[last] == '/' && last > 0)
        last -= 1;

    auto pos = path.rfind('/', last);
    if (pos == std::string::npos)
        pos = 0;
    else
        pos += 1;

    return path.substr(pos, last - pos + 1);
}

struct stat lstat(const Path & path)
{
    struct stat st;
    if (::lstat(path.c_str(), &st))
        throw SysError("getting status of '%1%'", path);
    return st;
}

std::optional<struct stat> maybeLstat(const Path & path)
{
    std::optional<struct stat> st{std::in_place};
    if (::lstat(path.c_str(), &*st))
    {
        if (errno == ENOENT || errno == ENOTDIR)
            st.reset();
        else
            throw SysError("getting status of '%1%'", path);
    }
    return st;
}

bool pathExists(const Path & path)
{
    return maybeLstat(path).has_value();
}

DirEntries readDirectory(const Path & path)
{
    AutoCloseDir dir(opendir(path.c_str()));
    if (!dir) throw SysError("opening directory '%1%'", path);

    DirEntries entries;
    entries.reserve(64);

    struct dirent * dirent;
    while (errno = 0, dirent = readdir(dir.get())) { /* sic */
        checkInterrupt();
        std::string name = dirent->d_name;
        if (name == "." || name == "..") continue;
        entries.emplace_back(name, dirent->d_ino, dirent->d_type);
    }
    if (errno) throw SysError("reading directory '%1%'", path);

    std::sort(entries.begin(), entries.end(), [](const DirEntry & a, const DirEntry & b) {
        return a.name < b.name;
    });

    return entries;
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}

void writeFile(const Path & path, std::string_view s, mode_t mode)
{
    AutoCloseFD fd{open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode)};
    if (!fd)
        throw SysError("opening file '%1%'", path);

    writeFull(fd.get(), s);

    // close() reports write-back errors, the destructor would drop them
    fd.close();
}

void writeFileAtomic(const Path & path, std::string_view s, mode_t mode)
{
    static std::atomic<unsigned int> counter{0};
    auto tmp = fmt("%1%.tmp-%2%-%3%", path, getpid(), counter++);

    AutoDelete cleanup(tmp, false);
    {
        AutoCloseFD fd{open(tmp.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_EXCL | O_CLOEXEC, mode)};
        if (!fd)
            throw SysError("opening file '%1%'", tmp);
        // a crash between write and rename must not leave a torn record behind
        writeFull(fd.get(), s, false);
        fd.fsync();
        fd.close();
    }

    renameFile(tmp, path);
    cleanup.cancel();
    syncParent(path);
}

void syncParent(const Path & path)
{
    AutoCloseFD fd{open(dirOf(path).c_str(), O_RDONLY | O_CLOEXEC, 0)};
    if (!fd)
        throw SysError("opening file '%1%'", path);
    fd.fsync();
}

static void _deletePath(int parentfd, const std::string & name)
{
    checkInterrupt();

    struct stat st;
    if (fstatat(parentfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == -1) {
        if (errno == ENOENT) return;
        throw SysError("getting status of '%1%'", name);
    }

    if (S_ISDIR(st.st_mode)) {
        const auto PERM_MASK = S_IRUSR | S_IWUSR | S_IXUSR;
        if ((st.st_mode & PERM_MASK) != PERM_MASK) {
            if (fchmodat(parentfd, name.c_str(), st.st_mode | PERM_MASK, 0) == -1) {
                throw SysError("chmod '%1%'", name);
            }
        }

        int fd = openat(parentfd, name.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
        if (fd == -1)
            throw SysError("opening directory '%1%'", name);
        AutoCloseDir dir(fdopendir(fd));
        if (!dir) {
            ::close(fd);
            throw SysError("opening directory '%1%'", name);
        }

        std::vector<std::string> children;
        struct dirent * dirent;
        while (errno = 0, dirent = readdir(dir.get())) { /* sic */
            std::string child = dirent->d_name;
            if (child == "." || child == "..") continue;
            children.push_back(std::move(child));
        }
        if (errno) throw SysError("reading directory '%1%'", name);

        for (auto & child : children)
            _deletePath(dirfd(dir.get()), child);
    }

    int flags = S_ISDIR(st.st_mode) ? AT_REMOVEDIR : 0;
    if (unlinkat(parentfd, name.c_str(), flags) == -1) {
        if (errno == ENOENT) return;
        throw SysError("cannot unlink '%1%'", name);
    }
}

void deletePath(const Path & path)
{
    Path dir = dirOf(path);
    if (dir == "")
        dir = "/";

    AutoCloseFD dirfd{open(dir.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!dirfd) {
        if (errno == ENOENT) return;
        throw SysError("opening directory '%1%'", path);
    }

    _deletePath(dirfd.get(), std::string(baseNameOf(path)));
}

Paths createDirs(const Path & path)
{
    Paths created;
    if (path == "/") return created;

    struct stat st;
    if (::lstat(path.c_str(), &st) == -1) {
        created = createDirs(dirOf(path));
        if (mkdir(path.c_str(), 0777) == -1 && errno != EEXIST)
            throw SysError("creating directory '%1%'", path);
        st = lstat(path);
        created.push_back(path);
    }

    if (S_ISLNK(st.st_mode) && stat(path.c_str(), &st) == -1)
        throw SysError("statting symlink '%1%'", path);

    if (!S_ISDIR(st.st_mode)) throw Error("'%1%' is not a directory", path);

    return created;
}

void renameFile(const Path & oldName, const Path & newName)
{
    if (rename(oldName.c_str(), newName.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", oldName, newName);
}

Path createTempDir(const Path & prefix, mode_t mode)
{
    auto tmpDir = getenv("TMPDIR");
    Path tmpl = fmt("%s/%s.XXXXXX", tmpDir && *tmpDir ? tmpDir : "/tmp", prefix);
    if (!mkdtemp(tmpl.data()))
        throw SysError("creating temporary directory '%s'", tmpl);
    if (chmod(tmpl.c_str(), mode) == -1)
        throw SysError("setting permissions of '%s'", tmpl);
    return tmpl;
}

//////////////////////////////////////////////////////////////////////

AutoDelete::AutoDelete() : del{false}, recursive{false} {}

AutoDelete::AutoDelete(const std::string & p, bool recursive) : path(p)
{
    del = true;
    this->recursive = recursive;
}

AutoDelete::~AutoDelete()
{
    try {
        if (del) {
            if (recursive)
                deletePath(path);
            else {
                if (remove(path.c_str()) == -1 && errno != ENOENT)
                    throw SysError("cannot unlink '%1%'", path);
            }
        }
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::cancel()
{
    del = false;
}

}
