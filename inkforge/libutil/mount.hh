#pragma once
///@file

#include "inkforge/libutil/types.hh"
#include "inkforge/libutil/file-system.hh"

namespace inkforge {

/**
 * Bind-mount file or directory from `source` to `destination`.
 * If source does not exist this will fail unless `optional` is set.
 * With `readOnly` the bind mount is remounted read-only afterwards, since
 * the kernel ignores MS_RDONLY on the initial bind.
 */
void bindPath(const Path & source, const Path & target, bool readOnly = false, bool optional = false);

/**
 * Whether `path` is the mount point of some mount in our mount namespace,
 * according to `/proc/self/mountinfo`.
 */
bool isMountPoint(const Path & path);

/**
 * Unmount `path`. Returns false if nothing was mounted there (or the path
 * does not exist), throws on any other failure.
 */
bool unmount(const Path & path);
}
