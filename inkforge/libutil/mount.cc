#include "inkforge/libutil/mount.hh"
#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/strings.hh"

#include <algorithm>
#include <sys/mount.h>

namespace inkforge {

void bindPath(const Path & source, const Path & target, bool readOnly, bool optional)
{
    debug("bind mounting '%1%' to '%2%'", source, target);

    auto bindMount = [&]() {
        if (mount(source.c_str(), target.c_str(), "", MS_BIND | MS_REC, 0) == -1)
            throw SysError("bind mount from '%1%' to '%2%' failed", source, target);
        if (readOnly
            && mount(
                   "", target.c_str(), "", MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID, 0
               ) == -1)
        {
            throw SysError("remounting '%1%' read-only", target);
        }
    };

    auto maybeSt = maybeLstat(source);
    if (!maybeSt) {
        if (optional)
            return;
        else
            throw SysError("getting attributes of path '%1%'", source);
    }
    auto st = *maybeSt;

    if (S_ISDIR(st.st_mode)) {
        createDirs(target);
        bindMount();
    } else if (S_ISLNK(st.st_mode)) {
        throw Error("refusing to bind mount symlink '%1%'", source);
    } else {
        createDirs(dirOf(target));
        if (!pathExists(target)) {
            writeFile(target, "");
        }
        bindMount();
    }
}

/* mountinfo escapes space, tab, newline and backslash as `\ooo` octal sequences */
static std::string unescapeMountInfo(std::string_view s)
{
    std::string res;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 3 < s.size()
            && std::all_of(s.begin() + i + 1, s.begin() + i + 4, [](char c) {
                   return c >= '0' && c <= '7';
               }))
        {
            res += char((s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 + (s[i + 3] - '0'));
            i += 3;
        } else {
            res += s[i];
        }
    }
    return res;
}

bool isMountPoint(const Path & path)
{
    auto wanted = canonPath(path);
    for (auto & line : tokenizeString<std::vector<std::string>>(readFile("/proc/self/mountinfo"), "\n")) {
        // id parent major:minor root mount-point options ...
        auto fields = tokenizeString<std::vector<std::string>>(line, " ");
        if (fields.size() < 5) {
            continue;
        }
        if (unescapeMountInfo(fields[4]) == wanted) {
            return true;
        }
    }
    return false;
}

bool unmount(const Path & path)
{
    if (umount2(path.c_str(), UMOUNT_NOFOLLOW) == -1) {
        if (errno == EINVAL || errno == ENOENT) {
            return false;
        }
        throw SysError("unmounting '%1%'", path);
    }
    debug("unmounted '%1%'", path);
    return true;
}
}
