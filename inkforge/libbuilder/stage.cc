#include "inkforge/libbuilder/stage.hh"
#include "inkforge/libutil/async-io.hh"
#include "inkforge/libutil/file-descriptor.hh"
#include "inkforge/libutil/logging.hh"
#include "inkforge/libutil/processes.hh"
#include "inkforge/libutil/strings.hh"

#include <array>
#include <fcntl.h>
#include <regex>
#include <sys/stat.h>

namespace inkforge {

static const char * relayScript = R"(
find . -type f -name '*.rs' -not -path './target/*' -exec sh -c '
    for f; do
        curl --fail --silent --show-error \
            -F "${f#./}=@$f" \
            "$API_SERVER_URL/files/upload/$BUILD_SESSION_TOKEN" || exit 1
    done
' upload {} +
)";

static const char * toolchainScript = R"(
set -e
rustup toolchain install "$1" --profile minimal --component rust-src
rustup default "$1"
mkdir -p "$HOME/.cargo/bin"
if [ "$3" = link ]; then
    ln -sf "/opt/cargo-contract/$2/cargo-contract" "$HOME/.cargo/bin/cargo-contract"
else
    CARGO_TARGET_DIR="$HOME/.cargo-contract-build" \
        cargo install cargo-contract --locked --root "$HOME/.cargo" \
        --git https://github.com/paritytech/cargo-contract --tag "v$2"
    rm -rf "$HOME/.cargo-contract-build"
fi
)";

static const char * compileScript = R"(
cd -- "$1" && exec cargo contract build --release
)";

static const char * normalizeScript = R"(
set -e
cd -- "$1/target/ink"
for ext in wasm json; do
    set -- *."$ext"
    if [ "$#" -ne 1 ] || [ ! -f "$1" ]; then
        echo "expected exactly one .$ext file in target/ink, found: $*" >&2
        exit 1
    fi
    [ "$1" = "main.$ext" ] || mv -- "$1" "main.$ext"
done
)";

std::vector<StageDefinition> defaultPipeline(const BuilderSettings & settings)
{
    std::vector<StageDefinition> stages;

    stages.push_back({
        .name = "fetch",
        .state = SessionState::Unarchiving,
        .failureKind = FailureKind::DownloadFailure,
        .argv = {"curl", "--fail", "--silent", "--show-error", "--location",
                 "--output", "source.zip", "@SOURCE_CODE_URL@"},
        .requiredEnv = {"SOURCE_CODE_URL"},
    });

    stages.push_back({
        .name = "unpack",
        .state = SessionState::Unarchiving,
        .failureKind = FailureKind::UnpackFailure,
        .argv = {"sh", "-c", "unzip -q -o source.zip && rm -f source.zip"},
        .requiredEnv = {},
    });

    if (settings.relaySources) {
        stages.push_back({
            .name = "relay",
            .state = SessionState::Sealing,
            .failureKind = FailureKind::UploadFailure,
            .argv = {"sh", "-c", relayScript},
            .requiredEnv = {"API_SERVER_URL", "BUILD_SESSION_TOKEN"},
        });

        stages.push_back({
            .name = "seal",
            .state = SessionState::Sealing,
            .failureKind = FailureKind::SealFailure,
            .argv = {"curl", "--fail", "--silent", "--show-error", "-X", "POST",
                     "@API_SERVER_URL@/files/seal/@BUILD_SESSION_TOKEN@"},
            .requiredEnv = {"API_SERVER_URL", "BUILD_SESSION_TOKEN"},
        });
    }

    stages.push_back({
        .name = "toolchain",
        .state = SessionState::Building,
        .failureKind = FailureKind::ToolchainInstallFailure,
        .argv = {"sh", "-c", toolchainScript, "toolchain",
                 "@RUST_TOOLCHAIN@", "@CARGO_CONTRACT_VERSION@", "@TOOLCHAIN_MODE@"},
        .requiredEnv = {"RUST_TOOLCHAIN", "CARGO_CONTRACT_VERSION", "TOOLCHAIN_MODE"},
    });

    stages.push_back({
        .name = "compile",
        .state = SessionState::Building,
        .failureKind = FailureKind::CompileFailure,
        .argv = {"sh", "-c", compileScript, "compile", "@PROJECT_DIR@"},
        .requiredEnv = {"PROJECT_DIR"},
    });

    stages.push_back({
        .name = "normalize",
        .state = SessionState::NormalizingOutput,
        .failureKind = FailureKind::ArtifactMissing,
        .argv = {"sh", "-c", normalizeScript, "normalize", "@PROJECT_DIR@"},
        .requiredEnv = {"PROJECT_DIR"},
    });

    return stages;
}

StringMap stageParameters(const BuildRequest & request, const BuilderSettings & settings)
{
    auto prebaked = settings.prebakedCargoContractVersions.get().contains(request.cargoContractVersion);
    return {
        {"CARGO_CONTRACT_VERSION", request.cargoContractVersion},
        {"RUST_TOOLCHAIN", request.rustToolchain},
        {"TOOLCHAIN_MODE", prebaked ? "link" : "install"},
        {"PROJECT_DIR", request.projectDirectory.value_or(".")},
    };
}

void validateProjectDirectory(const BuildRequest & request)
{
    if (!request.projectDirectory) {
        return;
    }
    auto & dir = *request.projectDirectory;

    static const std::regex allowed(R"(^[A-Za-z0-9._/ -]{1,64}$)");
    if (!std::regex_match(dir, allowed)) {
        throw InvalidBuildRequest("invalid project directory '%s'", dir.substr(0, 64));
    }
    if (dir.starts_with("/")) {
        throw InvalidBuildRequest("project directory '%s' is not relative", dir);
    }
    for (auto & component : tokenizeString<Strings>(dir, "/")) {
        if (component == "..") {
            throw InvalidBuildRequest("project directory '%s' leaves the sources", dir);
        }
    }
}

void validateRequestVersions(const BuildRequest & request)
{
    static const std::regex cargoContractVersion(
        R"(^(0|[1-9][0-9]*)\.(0|[1-9][0-9]*)\.(0|[1-9][0-9]*)(-[0-9A-Za-z.-]+)?$)"
    );
    static const std::regex rustToolchain(R"(^[A-Za-z0-9._-]+$)");

    if (!std::regex_match(request.cargoContractVersion, cargoContractVersion)) {
        throw InvalidBuildRequest(
            "invalid cargo-contract version '%s'", request.cargoContractVersion
        );
    }
    if (!std::regex_match(request.rustToolchain, rustToolchain)) {
        throw InvalidBuildRequest("invalid rust toolchain '%s'", request.rustToolchain);
    }
}

static bool isVariableName(std::string_view s)
{
    if (s.empty() || (s[0] >= '0' && s[0] <= '9')) {
        return false;
    }
    for (auto c : s) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
            return false;
        }
    }
    return true;
}

Strings substituteArgv(const StageDefinition & stage, const StringMap & vars)
{
    for (auto & name : stage.requiredEnv) {
        auto i = vars.find(name);
        if (i == vars.end() || i->second.empty()) {
            throw BuildFailure(
                FailureKind::SandboxRuntimeFailure,
                "stage '%s' requires variable '%s', which is not set",
                stage.name,
                name
            );
        }
    }

    Strings result;
    for (auto & arg : stage.argv) {
        std::string out;
        size_t pos = 0;
        while (pos < arg.size()) {
            auto start = arg.find('@', pos);
            if (start == std::string::npos) {
                out.append(arg, pos);
                break;
            }
            out.append(arg, pos, start - pos);

            auto end = arg.find('@', start + 1);
            auto name = end == std::string::npos
                ? std::string_view{}
                : std::string_view(arg).substr(start + 1, end - start - 1);
            if (!isVariableName(name)) {
                // not a placeholder, e.g. curl's `-F name=@file`
                out += '@';
                pos = start + 1;
                continue;
            }

            auto value = vars.find(std::string(name));
            if (value == vars.end()) {
                throw BuildFailure(
                    FailureKind::SandboxRuntimeFailure,
                    "stage '%s' refers to undefined variable '%s'",
                    stage.name,
                    name
                );
            }
            out += value->second;
            pos = end + 1;
        }
        result.push_back(std::move(out));
    }
    return result;
}

StageLog::StageLog(const Path & path, uint64_t limit)
    : fd(open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644))
    , limit(limit)
{
    if (!fd) {
        throw SysError("opening stage log '%s'", path);
    }
    struct stat st;
    if (fstat(fd.get(), &st) == -1) {
        throw SysError("getting status of stage log '%s'", path);
    }
    written = st.st_size;
    full = written >= limit;
}

void StageLog::append(std::string_view data)
{
    if (full) {
        return;
    }
    if (data.size() <= limit - written) {
        writeFull(fd.get(), data);
        written += data.size();
        return;
    }
    writeFull(fd.get(), data.substr(0, limit - written));
    writeFull(fd.get(), fmt("\n--- log size limit of %d bytes reached, dropping further output\n", limit));
    written = limit;
    full = true;
}

static kj::Promise<Result<void>> drainStageOutput(
    BuildSession & session, const std::string & stage, AsyncInputStream & output, StageLog & log
)
try {
    LogLineSplitter splitter;
    auto emit = [&](std::string line) {
        printTalkative("%s/%s> %s", session.token(), stage, line);
        session.appendLogLine(std::move(line));
    };

    std::array<char, 65536> buf;
    while (true) {
        auto got = TRY_AWAIT(output.read(buf.data(), buf.size()));
        if (!got) {
            break;
        }
        std::string_view data(buf.data(), *got);
        log.append(data);
        while (auto line = splitter.feed(data)) {
            emit(std::move(*line));
        }
    }

    if (auto rest = splitter.finish(); !rest.empty()) {
        emit(std::move(rest));
    }
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

kj::Promise<Result<void>> runStage(
    BuildSession & session,
    Sandbox & sandbox,
    const StageDefinition & stage,
    const StringMap & vars,
    StageLog & log,
    std::function<void()> spawned
)
try {
    auto argv = substituteArgv(stage, vars);
    log.append(fmt("--- stage '%s'\n", stage.name));

    auto output = TRY_AWAIT(sandbox.spawn(argv));
    if (spawned) {
        spawned();
    }

    // read output while waiting for the exit, the stage blocks on a full pipe
    auto drained = drainStageOutput(session, stage.name, *output, log).eagerlyEvaluate(nullptr);
    auto outcome = TRY_AWAIT(sandbox.wait());
    TRY_AWAIT(std::move(drained));

    if (outcome.resourceExceeded) {
        throw BuildFailure(
            FailureKind::ResourceExceeded,
            "stage '%s' exceeded the resource limits of the sandbox",
            stage.name
        );
    }
    if (!statusOk(outcome.status)) {
        throw BuildFailure(
            stage.failureKind, "stage '%s' %s", stage.name, statusToString(outcome.status)
        );
    }

    debug("session '%s': stage '%s' succeeded", session.token(), stage.name);
    co_return result::success();
} catch (...) {
    co_return result::current_exception();
}

}
