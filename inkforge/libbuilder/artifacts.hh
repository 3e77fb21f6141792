#pragma once
///@file

#include "inkforge/libbuilder/build-session.hh"
#include "inkforge/libutil/types.hh"

namespace inkforge {

struct ArtifactLimits
{
    uint64_t moduleSize;
    uint64_t metadataSize;
};

/**
 * Where the normalize stage leaves the module and metadata, relative to the
 * project directory.
 */
constexpr std::string_view artifactSubdir = "target/ink";
constexpr std::string_view moduleFileName = "main.wasm";
constexpr std::string_view metadataFileName = "main.json";

/**
 * Validate the artifacts below `projectDir` in `volumeRoot` and copy them to
 * `destDir`. `projectDir` is relative to the volume root.
 *
 * Every path component is opened without following symlinks, so a build
 * cannot point the validator at files outside its volume. Throws
 * `BuildFailure` with `artifact-missing`, `artifact-too-large` or
 * `artifact-invalid`.
 */
ArtifactSet collectArtifacts(
    const Path & volumeRoot,
    const Path & destDir,
    const ArtifactLimits & limits,
    const std::string & projectDir = "."
);

}
