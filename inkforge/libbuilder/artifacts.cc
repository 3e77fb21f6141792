#include "inkforge/libbuilder/artifacts.hh"
#include "inkforge/libbuilder/build-error.hh"
#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/hash.hh"
#include "inkforge/libutil/json.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/strings.hh"

#include <fcntl.h>
#include <sys/stat.h>

namespace inkforge {

static AutoCloseFD openBelow(int dirFd, std::string_view name, int flags, std::string_view shown)
{
    AutoCloseFD fd{openat(dirFd, std::string(name).c_str(), flags | O_NOFOLLOW | O_CLOEXEC)};
    if (!fd) {
        if (errno == ENOENT) {
            throw BuildFailure(FailureKind::ArtifactMissing, "artifact '%s' does not exist", shown);
        }
        if (errno == ELOOP || errno == ENOTDIR) {
            throw BuildFailure(
                FailureKind::ArtifactInvalid, "'%s' is a symlink or not a directory", shown
            );
        }
        throw SysError("opening '%s'", shown);
    }
    return fd;
}

/**
 * Read one artifact file, enforcing its size limit before reading it.
 */
static std::string readArtifact(int dirFd, std::string_view dirShown, std::string_view name, uint64_t limit)
{
    auto shown = fmt("%s/%s", dirShown, name);
    // a fifo must not block the open
    auto fd = openBelow(dirFd, name, O_RDONLY | O_NONBLOCK, shown);

    struct stat st;
    if (fstat(fd.get(), &st) == -1) {
        throw SysError("statting '%s'", shown);
    }
    if (!S_ISREG(st.st_mode)) {
        throw BuildFailure(FailureKind::ArtifactInvalid, "artifact '%s' is not a regular file", shown);
    }
    if (static_cast<uint64_t>(st.st_size) > limit) {
        throw BuildFailure(
            FailureKind::ArtifactTooLarge,
            "artifact '%s' is %d bytes, the limit is %d",
            shown,
            st.st_size,
            limit
        );
    }

    auto contents = readFile(fd.get());
    // the build is over, but a file growing past the stat is still too large
    if (contents.size() > limit) {
        throw BuildFailure(
            FailureKind::ArtifactTooLarge, "artifact '%s' exceeds the limit of %d bytes", shown, limit
        );
    }
    return contents;
}

ArtifactSet collectArtifacts(
    const Path & volumeRoot,
    const Path & destDir,
    const ArtifactLimits & limits,
    const std::string & projectDir
)
{
    AutoCloseFD root{open(volumeRoot.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (!root) {
        throw SysError("opening volume root '%s'", volumeRoot);
    }

    auto dir = std::move(root);
    std::string shown;
    for (auto & component : tokenizeString<Strings>(fmt("%s/%s", projectDir, artifactSubdir), "/")) {
        if (component == ".") {
            continue;
        }
        shown = shown.empty() ? component : shown + "/" + component;
        if (component == "..") {
            throw BuildFailure(FailureKind::ArtifactInvalid, "'%s' leaves the volume", shown);
        }
        dir = openBelow(dir.get(), component, O_RDONLY | O_DIRECTORY, shown);
    }

    auto module = readArtifact(dir.get(), shown, moduleFileName, limits.moduleSize);
    if (!module.starts_with(std::string_view("\0asm", 4))) {
        throw BuildFailure(
            FailureKind::ArtifactInvalid,
            "artifact '%s/%s' is not a WebAssembly module",
            shown,
            moduleFileName
        );
    }

    auto metadata = readArtifact(dir.get(), shown, metadataFileName, limits.metadataSize);
    try {
        parseJSON(metadata, metadataFileName);
    } catch (JSONError & e) {
        throw BuildFailure(
            FailureKind::ArtifactInvalid,
            "artifact '%s/%s' is not valid JSON: %s",
            shown,
            metadataFileName,
            e.msg()
        );
    }

    createDirs(destDir);
    ArtifactSet artifacts{
        .module = fmt("%s/%s", destDir, moduleFileName),
        .metadata = fmt("%s/%s", destDir, metadataFileName),
        .moduleSize = module.size(),
        .metadataSize = metadata.size(),
        .codeHash = hashString(module).to_string(),
    };
    writeFileAtomic(artifacts.module, module);
    writeFileAtomic(artifacts.metadata, metadata);

    debug(
        "collected artifacts into '%s' (module %d bytes, code hash %s)",
        destDir,
        artifacts.moduleSize,
        artifacts.codeHash
    );
    return artifacts;
}

}
