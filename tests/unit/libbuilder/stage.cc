#include "inkforge/libbuilder/stage.hh"
#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/file-system.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace inkforge {

static StageDefinition seal()
{
    return StageDefinition{
        .name = "seal",
        .state = SessionState::Sealing,
        .failureKind = FailureKind::SealFailure,
        .argv = {"curl", "-X", "POST", "@API_SERVER_URL@/files/seal/@BUILD_SESSION_TOKEN@"},
        .requiredEnv = {"API_SERVER_URL", "BUILD_SESSION_TOKEN"},
    };
}

TEST(substituteArgv, replacesPlaceholders)
{
    auto argv = substituteArgv(seal(), {
        {"API_SERVER_URL", "http://api:3000"},
        {"BUILD_SESSION_TOKEN", "abc"},
    });
    ASSERT_EQ(argv, (Strings{"curl", "-X", "POST", "http://api:3000/files/seal/abc"}));
}

TEST(substituteArgv, keepsOtherAtSigns)
{
    StageDefinition upload{
        .name = "relay",
        .state = SessionState::Sealing,
        .failureKind = FailureKind::UploadFailure,
        .argv = {"curl", "-F", "lib.rs=@lib.rs", "user@host", "@", "@lower@"},
        .requiredEnv = {},
    };
    ASSERT_EQ(substituteArgv(upload, {}), upload.argv);
}

TEST(substituteArgv, missingRequiredVariable)
{
    try {
        substituteArgv(seal(), {{"API_SERVER_URL", "http://api:3000"}, {"BUILD_SESSION_TOKEN", ""}});
        FAIL() << "expected BuildFailure";
    } catch (BuildFailure & e) {
        ASSERT_EQ(e.kind, FailureKind::SandboxRuntimeFailure);
    }
}

TEST(substituteArgv, undefinedPlaceholder)
{
    auto stage = seal();
    stage.requiredEnv = {};
    try {
        substituteArgv(stage, {{"API_SERVER_URL", "http://api:3000"}});
        FAIL() << "expected BuildFailure";
    } catch (BuildFailure & e) {
        ASSERT_EQ(e.kind, FailureKind::SandboxRuntimeFailure);
    }
}

TEST(validateRequestVersions, acceptsReleaseVersions)
{
    BuildRequest request{.token = "t", .sourceUrl = "u", .cargoContractVersion = "4.0.1", .rustToolchain = "stable"};
    ASSERT_NO_THROW(validateRequestVersions(request));

    request.cargoContractVersion = "5.0.0-rc.1";
    request.rustToolchain = "1.76.0";
    ASSERT_NO_THROW(validateRequestVersions(request));

    request.rustToolchain = "nightly-2024-01-01";
    ASSERT_NO_THROW(validateRequestVersions(request));
}

TEST(validateRequestVersions, rejectsInjection)
{
    BuildRequest request{.token = "t", .sourceUrl = "u", .cargoContractVersion = "4.0", .rustToolchain = "stable"};
    ASSERT_THROW(validateRequestVersions(request), InvalidBuildRequest);

    request.cargoContractVersion = "4.0.1; rm -rf /";
    ASSERT_THROW(validateRequestVersions(request), InvalidBuildRequest);

    request.cargoContractVersion = "04.0.1";
    ASSERT_THROW(validateRequestVersions(request), InvalidBuildRequest);

    request.cargoContractVersion = "4.0.1";
    request.rustToolchain = "stable && curl evil";
    ASSERT_THROW(validateRequestVersions(request), InvalidBuildRequest);

    request.rustToolchain = "";
    ASSERT_THROW(validateRequestVersions(request), InvalidBuildRequest);
}

TEST(defaultPipeline, relayIsOptional)
{
    BuilderSettings settings;

    auto names = [](const std::vector<StageDefinition> & stages) {
        Strings result;
        for (auto & s : stages) {
            result.push_back(s.name);
        }
        return result;
    };

    ASSERT_EQ(
        names(defaultPipeline(settings)),
        (Strings{"fetch", "unpack", "toolchain", "compile", "normalize"})
    );

    settings.set("relay-sources", "true");
    auto stages = defaultPipeline(settings);
    ASSERT_EQ(
        names(stages),
        (Strings{"fetch", "unpack", "relay", "seal", "toolchain", "compile", "normalize"})
    );
    ASSERT_EQ(stages[2].state, SessionState::Sealing);
    ASSERT_EQ(stages[3].failureKind, FailureKind::SealFailure);
}

TEST(stageParameters, linksPrebakedVersions)
{
    BuilderSettings settings;
    settings.set("prebaked-cargo-contract-versions", "3.2.0 4.0.1");

    BuildRequest request{.token = "t", .sourceUrl = "u", .cargoContractVersion = "4.0.1", .rustToolchain = "1.76.0"};
    auto params = stageParameters(request, settings);
    ASSERT_EQ(params["TOOLCHAIN_MODE"], "link");
    ASSERT_EQ(params["RUST_TOOLCHAIN"], "1.76.0");
    ASSERT_EQ(params["CARGO_CONTRACT_VERSION"], "4.0.1");

    request.cargoContractVersion = "5.0.0";
    ASSERT_EQ(stageParameters(request, settings)["TOOLCHAIN_MODE"], "install");
}

TEST(defaultPipeline, toolchainStageSubstitutes)
{
    BuilderSettings settings;
    auto stages = defaultPipeline(settings);
    auto & toolchain = stages[2];
    ASSERT_EQ(toolchain.name, "toolchain");

    auto argv = substituteArgv(toolchain, {
        {"RUST_TOOLCHAIN", "stable"},
        {"CARGO_CONTRACT_VERSION", "4.0.1"},
        {"TOOLCHAIN_MODE", "install"},
    });
    ASSERT_EQ(argv.back(), "install");
    ASSERT_EQ(*std::prev(argv.end(), 2), "4.0.1");
}

TEST(validateProjectDirectory, acceptsRelativePaths)
{
    BuildRequest request{.token = "t", .sourceUrl = "u", .cargoContractVersion = "4.0.1", .rustToolchain = "stable"};
    ASSERT_NO_THROW(validateProjectDirectory(request));

    for (auto dir : {"flipper", "./contracts/flipper", "contracts/my contract/", "a.b_c-d"}) {
        request.projectDirectory = dir;
        ASSERT_NO_THROW(validateProjectDirectory(request)) << dir;
    }
}

TEST(validateProjectDirectory, rejectsEscapes)
{
    BuildRequest request{.token = "t", .sourceUrl = "u", .cargoContractVersion = "4.0.1", .rustToolchain = "stable"};

    for (auto dir : {
             "./contracts/test/../another_contract",
             "..",
             "contracts/..",
             "/etc",
             "\\",
             "$(reboot)",
             "contracts\nflipper",
         })
    {
        request.projectDirectory = dir;
        ASSERT_THROW(validateProjectDirectory(request), InvalidBuildRequest) << dir;
    }

    request.projectDirectory = std::string(65, 'a');
    ASSERT_THROW(validateProjectDirectory(request), InvalidBuildRequest);
}

TEST(stageParameters, projectDirectoryDefaultsToTheRoot)
{
    BuilderSettings settings;
    BuildRequest request{.token = "t", .sourceUrl = "u", .cargoContractVersion = "4.0.1", .rustToolchain = "stable"};
    ASSERT_EQ(stageParameters(request, settings)["PROJECT_DIR"], ".");

    request.projectDirectory = "contracts/flipper";
    ASSERT_EQ(stageParameters(request, settings)["PROJECT_DIR"], "contracts/flipper");
}

TEST(defaultPipeline, compileRunsInTheProjectDirectory)
{
    BuilderSettings settings;
    for (auto & stage : defaultPipeline(settings)) {
        if (stage.name != "compile" && stage.name != "normalize") {
            continue;
        }
        auto argv = substituteArgv(stage, {{"PROJECT_DIR", "contracts/flipper"}});
        ASSERT_EQ(argv.back(), "contracts/flipper") << stage.name;
        ASSERT_THROW(substituteArgv(stage, {}), BuildFailure) << stage.name;
    }
}

class StageLogTest : public ::testing::Test
{
protected:
    AsyncIoRoot aio;
    Path tmpDir;
    AutoDelete cleanup;
    Path logPath;

    StageLogTest() : tmpDir(createTempDir()), cleanup(tmpDir), logPath(tmpDir + "/flipper-1.log") {}
};

TEST_F(StageLogTest, stopsAtTheLimit)
{
    StageLog log(logPath, 10);
    log.append("0123");
    log.append("456");
    ASSERT_FALSE(log.truncated());
    log.append("789abc");
    ASSERT_TRUE(log.truncated());
    log.append("dropped");

    auto contents = readFile(logPath);
    ASSERT_TRUE(contents.starts_with("0123456789\n--- log size limit of 10 bytes reached"));
    ASSERT_THAT(contents, testing::Not(testing::HasSubstr("dropped")));
}

TEST_F(StageLogTest, countsWhatIsAlreadyThere)
{
    writeFile(logPath, "01234567");
    StageLog log(logPath, 10);
    log.append("89");
    ASSERT_FALSE(log.truncated());
    log.append("a");
    ASSERT_TRUE(log.truncated());
    ASSERT_TRUE(readFile(logPath).starts_with("0123456789\n---"));
}

TEST_F(StageLogTest, floodingStageIsBounded)
{
    VolumeHandle volume{.id = "flipper-1", .image = tmpDir, .mountPoint = tmpDir};
    ProcessSandboxRuntime runtime{"/usr/local/bin:/usr/bin:/bin"};
    BuildLimits limits{
        .memory = 4ULL << 30,
        .memorySwap = 4ULL << 30,
        .volumeSize = 1ULL << 30,
        .pids = 768,
        .maxBuildDuration = std::chrono::seconds(60),
        .wasmSize = 5ULL << 20,
        .metadataSize = 1ULL << 20,
    };
    auto sandbox = runtime.launch(volume, "/", {}, limits, "inkforge-flipper-1");
    BuildSession session(
        BuildRequest{.token = "flipper-1", .sourceUrl = "u", .cargoContractVersion = "4.0.1", .rustToolchain = "stable"},
        limits,
        5
    );

    StageDefinition flood{
        .name = "compile",
        .state = SessionState::Building,
        .failureKind = FailureKind::CompileFailure,
        // 8 MiB on a single line, then one short line
        .argv = {"sh", "-c", "head -c 8388608 /dev/zero | tr '\\0' a; echo; echo done"},
        .requiredEnv = {},
    };

    const uint64_t limit = 1 << 20;
    {
        StageLog log(logPath, limit);
        aio.blockOn(runStage(session, *sandbox, flood, {}, log));
        ASSERT_TRUE(log.truncated());
    }
    aio.blockOn(sandbox->terminate());

    auto size = readFile(logPath).size();
    ASSERT_GT(size, limit);
    ASSERT_LT(size, limit + 128);

    auto & tail = session.logTail();
    ASSERT_EQ(tail.size(), 5u);
    for (auto & line : tail) {
        ASSERT_LE(line.size(), 4096u);
    }
    ASSERT_EQ(tail.back(), "done");
}

}
