#include "inkforge/libbuilder/orchestrator.hh"
#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/hash.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace inkforge {

using namespace std::chrono_literals;

static const std::string_view wasmHeader("\0asm\1\0\0\0", 8);

static StageDefinition shellStage(
    std::string name, SessionState state, FailureKind kind, std::string script
)
{
    return StageDefinition{
        .name = name,
        .state = state,
        .failureKind = kind,
        .argv = {"sh", "-c", std::move(script), name, "@SOURCE_CODE_URL@"},
        .requiredEnv = {"SOURCE_CODE_URL"},
    };
}

/**
 * A pipeline shaped like the real one, with the network and the toolchain
 * replaced by local shell commands. The source URL is a local file.
 */
static std::vector<StageDefinition> localPipeline(std::string compile = "")
{
    if (compile.empty()) {
        compile = "mkdir -p target/ink"
                  " && printf '\\000asm\\001\\000\\000\\000' > target/ink/main.wasm"
                  " && echo '{\"source\": {}}' > target/ink/main.json";
    }
    return {
        shellStage("fetch", SessionState::Unarchiving, FailureKind::DownloadFailure,
            "cp \"$1\" source && echo fetched"),
        shellStage("compile", SessionState::Building, FailureKind::CompileFailure, compile),
        shellStage("normalize", SessionState::NormalizingOutput, FailureKind::ArtifactMissing, "true"),
    };
}

/**
 * Directory volumes by default; tests make single calls fail.
 */
class MockVolumeManager : public VolumeManager
{
public:
    explicit MockVolumeManager(VolumeManager & real)
    {
        ON_CALL(*this, plan).WillByDefault([&real](const std::string & id) { return real.plan(id); });
        ON_CALL(*this, provision).WillByDefault([&real](VolumeHandle & handle, uint64_t size) {
            return real.provision(handle, size);
        });
        ON_CALL(*this, release).WillByDefault([&real](VolumeHandle & handle) {
            return real.release(handle);
        });
        ON_CALL(*this, checkBackingStore).WillByDefault([&real] { return real.checkBackingStore(); });
    }

    MOCK_METHOD(VolumeHandle, plan, (const std::string & id), (override));
    MOCK_METHOD(kj::Promise<Result<void>>, provision, (VolumeHandle & handle, uint64_t size), (override));
    MOCK_METHOD(kj::Promise<Result<void>>, release, (VolumeHandle & handle), (override));
    MOCK_METHOD(kj::Promise<Result<void>>, checkBackingStore, (), (override));
};

template<typename E>
static kj::Promise<Result<void>> failWith(std::string message)
{
    return {result::failure(std::make_exception_ptr(E("%s", message)))};
}

class OrchestratorTest : public ::testing::Test
{
protected:
    AsyncIoRoot aio;
    Path tmpDir;
    AutoDelete cleanup;
    BuilderSettings settings;
    DirectoryVolumeManager volumes;
    ProcessSandboxRuntime runtime{"/usr/local/bin:/usr/bin:/bin"};
    Path source;

    OrchestratorTest()
        : tmpDir(createTempDir())
        , cleanup(tmpDir)
        , volumes(tmpDir + "/volumes")
        , source(tmpDir + "/flipper.zip")
    {
        settings.set("state-dir", tmpDir + "/state");
        settings.set("artifacts-dir", tmpDir + "/artifacts");
        settings.set("images-path", tmpDir + "/volumes");
        settings.set("toolchain-image", "/");
        settings.set("worker-count", "1");
        settings.set("max-build-duration", "30");
        writeFile(source, "flipper sources\n");
    }

    std::unique_ptr<Orchestrator> makeOrchestrator(std::vector<StageDefinition> pipeline)
    {
        return makeOrchestrator(std::move(pipeline), volumes);
    }

    std::unique_ptr<Orchestrator> makeOrchestrator(
        std::vector<StageDefinition> pipeline, VolumeManager & volumes
    )
    {
        return std::make_unique<Orchestrator>(
            settings, volumes, runtime, std::move(pipeline), aio.kj.provider->getTimer()
        );
    }

    BuildRequest request(const std::string & token)
    {
        return BuildRequest{
            .token = token,
            .sourceUrl = source,
            .cargoContractVersion = "3.2.0",
            .rustToolchain = "1.74.0",
        };
    }

    void wait(SessionHandle & handle)
    {
        handle.completion.wait(aio.kj.waitScope);
    }

    void sleep(kj::Duration d)
    {
        aio.kj.provider->getTimer().afterDelay(d).wait(aio.kj.waitScope);
    }

    static bool ranStage(const BuildSession & session, std::string_view stage)
    {
        for (auto & timing : session.timings()) {
            if (timing.stage == stage) {
                return true;
            }
        }
        return false;
    }
};

TEST_F(OrchestratorTest, successfulBuild)
{
    auto orchestrator = makeOrchestrator(localPipeline());
    std::vector<std::string> finished;
    orchestrator->onFinished([&](const BuildSession & s) { finished.push_back(s.token()); });

    auto handle = orchestrator->submit(request("flipper-1"));
    ASSERT_EQ(handle.session->state(), SessionState::Queued);
    wait(handle);

    auto & session = *handle.session;
    ASSERT_EQ(session.state(), SessionState::Succeeded) << session.reason();
    ASSERT_FALSE(session.failure());
    ASSERT_TRUE(session.artifacts());
    ASSERT_EQ(session.artifacts()->moduleSize, wasmHeader.size());
    ASSERT_EQ(session.artifacts()->codeHash, hashString(wasmHeader).to_string());
    ASSERT_EQ(readFile(session.artifacts()->module), wasmHeader);
    ASSERT_EQ(session.artifacts()->module, tmpDir + "/artifacts/flipper-1/main.wasm");

    ASSERT_TRUE(ranStage(session, "provision"));
    ASSERT_TRUE(ranStage(session, "normalize"));
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-1"));
    ASSERT_THAT(readFile(tmpDir + "/state/logs/flipper-1.log"), testing::HasSubstr("fetched"));

    auto record = SessionRecords(tmpDir + "/state").read("flipper-1");
    ASSERT_TRUE(record);
    ASSERT_EQ(record->state(), SessionState::Succeeded);
    ASSERT_TRUE(VolumeHandle::fromJSON(*record->volumeRecord()).released);

    ASSERT_EQ(finished, std::vector<std::string>{"flipper-1"});
    ASSERT_EQ(orchestrator->slots().used(), 0);
    ASSERT_TRUE(orchestrator->activeSessions().empty());
}

TEST_F(OrchestratorTest, buildRunningTooLongTimesOut)
{
    settings.set("max-build-duration", "1");
    auto orchestrator = makeOrchestrator(localPipeline("sleep 5"));

    auto started = std::chrono::steady_clock::now();
    auto handle = orchestrator->submit(request("flipper-1"));
    wait(handle);

    ASSERT_LT(std::chrono::steady_clock::now() - started, 4s);
    ASSERT_EQ(handle.session->state(), SessionState::TimedOut);
    ASSERT_EQ(handle.session->failure(), FailureKind::Timeout);
    ASSERT_EQ(handle.session->currentStage(), "compile");
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-1"));
    ASSERT_FALSE(pathExists(tmpDir + "/artifacts/flipper-1"));
}

TEST_F(OrchestratorTest, failedStageEndsThePipeline)
{
    auto orchestrator = makeOrchestrator(localPipeline());
    auto req = request("flipper-1");
    req.sourceUrl = tmpDir + "/missing.zip";

    auto handle = orchestrator->submit(req);
    wait(handle);

    auto & session = *handle.session;
    ASSERT_EQ(session.state(), SessionState::Failed);
    ASSERT_EQ(session.failure(), FailureKind::DownloadFailure);
    ASSERT_TRUE(ranStage(session, "fetch"));
    ASSERT_FALSE(ranStage(session, "compile"));
    ASSERT_FALSE(session.logTail().empty());
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-1"));
}

TEST_F(OrchestratorTest, missingModule)
{
    auto orchestrator = makeOrchestrator(
        localPipeline("mkdir -p target/ink && echo '{}' > target/ink/main.json")
    );

    auto handle = orchestrator->submit(request("flipper-1"));
    wait(handle);

    ASSERT_EQ(handle.session->state(), SessionState::Failed);
    ASSERT_EQ(handle.session->failure(), FailureKind::ArtifactMissing);
    ASSERT_FALSE(handle.session->artifacts());
    ASSERT_FALSE(pathExists(tmpDir + "/artifacts/flipper-1"));
}

TEST_F(OrchestratorTest, invalidModuleIsRemoved)
{
    auto orchestrator = makeOrchestrator(localPipeline(
        "mkdir -p target/ink && echo garbage > target/ink/main.wasm && echo '{}' > target/ink/main.json"
    ));

    auto handle = orchestrator->submit(request("flipper-1"));
    wait(handle);

    ASSERT_EQ(handle.session->failure(), FailureKind::ArtifactInvalid);
    ASSERT_FALSE(pathExists(tmpDir + "/artifacts/flipper-1"));
}

TEST_F(OrchestratorTest, admissionIsBoundedByWorkerCount)
{
    settings.set("worker-count", "2");
    auto orchestrator = makeOrchestrator(localPipeline(
        "sleep 1 && mkdir -p target/ink"
        " && printf '\\000asm\\001\\000\\000\\000' > target/ink/main.wasm"
        " && echo '{}' > target/ink/main.json"
    ));

    std::vector<SessionHandle> handles;
    for (auto token : {"flipper-1", "flipper-2", "flipper-3"}) {
        handles.push_back(orchestrator->submit(request(token)));
    }

    sleep(300 * kj::MILLISECONDS);
    ASSERT_NE(handles[0].session->state(), SessionState::Queued);
    ASSERT_NE(handles[1].session->state(), SessionState::Queued);
    ASSERT_EQ(handles[2].session->state(), SessionState::Queued);
    ASSERT_EQ(orchestrator->slots().used(), 2);
    ASSERT_EQ(orchestrator->activeSessions().size(), 3);

    for (auto & handle : handles) {
        wait(handle);
        ASSERT_EQ(handle.session->state(), SessionState::Succeeded) << handle.session->reason();
    }
    ASSERT_EQ(orchestrator->slots().peak(), 2);
    ASSERT_EQ(orchestrator->slots().used(), 0);
}

TEST_F(OrchestratorTest, cancelRunningSession)
{
    auto orchestrator = makeOrchestrator(localPipeline("sleep 30"));

    auto handle = orchestrator->submit(request("flipper-1"));
    sleep(500 * kj::MILLISECONDS);
    ASSERT_EQ(handle.session->state(), SessionState::Building);

    ASSERT_TRUE(orchestrator->cancel("flipper-1", "superseded by a newer upload"));
    wait(handle);

    ASSERT_EQ(handle.session->state(), SessionState::Failed);
    ASSERT_EQ(handle.session->failure(), FailureKind::Cancelled);
    ASSERT_EQ(handle.session->reason(), "superseded by a newer upload");
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-1"));
    ASSERT_FALSE(orchestrator->cancel("flipper-1"));
}

TEST_F(OrchestratorTest, cancelQueuedSession)
{
    auto orchestrator = makeOrchestrator(localPipeline("sleep 30"));

    auto running = orchestrator->submit(request("flipper-1"));
    auto queued = orchestrator->submit(request("flipper-2"));
    sleep(200 * kj::MILLISECONDS);
    ASSERT_EQ(queued.session->state(), SessionState::Queued);

    ASSERT_TRUE(orchestrator->cancel("flipper-2"));
    wait(queued);
    ASSERT_EQ(queued.session->state(), SessionState::Failed);
    ASSERT_EQ(queued.session->failure(), FailureKind::Cancelled);
    ASSERT_FALSE(ranStage(*queued.session, "provision"));
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-2"));

    auto record = SessionRecords(tmpDir + "/state").read("flipper-2");
    ASSERT_TRUE(record);
    ASSERT_EQ(record->failure(), FailureKind::Cancelled);

    ASSERT_NE(running.session->state(), SessionState::Failed);
    ASSERT_TRUE(orchestrator->cancel("flipper-1"));
    wait(running);
    ASSERT_FALSE(orchestrator->cancel("no-such-session"));
}

TEST_F(OrchestratorTest, rejectsInvalidRequests)
{
    auto orchestrator = makeOrchestrator(localPipeline("sleep 30"));

    ASSERT_THROW(orchestrator->submit(request("has spaces")), InvalidBuildRequest);
    ASSERT_THROW(orchestrator->submit(request("")), InvalidBuildRequest);
    ASSERT_THROW(orchestrator->submit(request(std::string(129, 'a'))), InvalidBuildRequest);

    auto noSource = request("flipper-1");
    noSource.sourceUrl = "";
    ASSERT_THROW(orchestrator->submit(noSource), InvalidBuildRequest);

    auto badVersion = request("flipper-1");
    badVersion.cargoContractVersion = "latest";
    ASSERT_THROW(orchestrator->submit(badVersion), InvalidBuildRequest);

    auto handle = orchestrator->submit(request("flipper-1"));
    ASSERT_THROW(orchestrator->submit(request("flipper-1")), InvalidBuildRequest);
    ASSERT_EQ(orchestrator->activeSessions().size(), 1);

    orchestrator->cancel("flipper-1");
    wait(handle);
}

TEST_F(OrchestratorTest, recoverReleasesOrphanedResources)
{
    SessionRecords records(tmpDir + "/state");

    BuildSession orphan(request("flipper-1"), settings.limits(), 25);
    orphan.advance(SessionState::Provisioning, "provision");
    auto volume = volumes.plan("flipper-1");
    aio.blockOn(volumes.provision(volume, 0));
    orphan.setVolumeRecord(volume.toJSON());
    orphan.advance(SessionState::Unarchiving, "fetch");
    orphan.advance(SessionState::Building, "compile");
    orphan.setSandboxRecord({
        {"runtime", "process"},
        {"name", "inkforge-flipper-1"},
        {"pgid", 0},
        {"start_time", nullptr},
    });
    records.write(orphan);

    BuildSession done(request("flipper-2"), settings.limits(), 25);
    done.fail(FailureKind::Cancelled, "cancelled by the operator");
    records.write(done);

    auto orchestrator = makeOrchestrator(localPipeline());
    std::vector<std::string> finished;
    orchestrator->onFinished([&](const BuildSession & s) { finished.push_back(s.token()); });
    aio.blockOn(orchestrator->recover());

    ASSERT_FALSE(pathExists(volume.mountPoint));
    auto record = records.read("flipper-1");
    ASSERT_TRUE(record);
    ASSERT_EQ(record->state(), SessionState::Failed);
    ASSERT_EQ(record->failure(), FailureKind::Cancelled);
    ASSERT_TRUE(VolumeHandle::fromJSON(*record->volumeRecord()).released);
    ASSERT_EQ(finished, std::vector<std::string>{"flipper-1"});
    ASSERT_FALSE(orchestrator->admissionsHalted());

    // a second recovery finds nothing left to do
    aio.blockOn(orchestrator->recover());
    ASSERT_EQ(finished.size(), 1);
}

TEST_F(OrchestratorTest, shutdownCancelsEverything)
{
    auto orchestrator = makeOrchestrator(localPipeline("sleep 30"));

    auto running = orchestrator->submit(request("flipper-1"));
    auto queued = orchestrator->submit(request("flipper-2"));
    sleep(300 * kj::MILLISECONDS);

    aio.blockOn(orchestrator->shutdown());

    for (auto * handle : {&running, &queued}) {
        ASSERT_EQ(handle->session->state(), SessionState::Failed);
        ASSERT_EQ(handle->session->failure(), FailureKind::Cancelled);
        ASSERT_EQ(handle->session->reason(), "the builder is shutting down");
    }
    ASSERT_TRUE(orchestrator->activeSessions().empty());
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-1"));
    ASSERT_THROW(orchestrator->submit(request("flipper-3")), Error);
}

TEST_F(OrchestratorTest, buildsInTheProjectDirectory)
{
    auto compile = shellStage("compile", SessionState::Building, FailureKind::CompileFailure,
        "cd \"$2\" && mkdir -p target/ink"
        " && printf '\\000asm\\001\\000\\000\\000' > target/ink/main.wasm"
        " && echo '{}' > target/ink/main.json");
    compile.argv.push_back("@PROJECT_DIR@");
    auto pipeline = localPipeline();
    pipeline[0] = shellStage("fetch", SessionState::Unarchiving, FailureKind::DownloadFailure,
        "mkdir -p contracts/flipper contracts/other && cp \"$1\" contracts/flipper/source");
    pipeline[1] = compile;
    auto orchestrator = makeOrchestrator(pipeline);

    auto req = request("flipper-1");
    req.projectDirectory = "contracts/flipper";
    auto handle = orchestrator->submit(req);
    wait(handle);

    auto & session = *handle.session;
    ASSERT_EQ(session.state(), SessionState::Succeeded) << session.reason();
    ASSERT_EQ(readFile(session.artifacts()->module), wasmHeader);

    auto record = SessionRecords(tmpDir + "/state").read("flipper-1");
    ASSERT_TRUE(record);
    ASSERT_EQ(record->request().projectDirectory, "contracts/flipper");

    // the artifacts of another directory are not picked up
    req = request("flipper-2");
    req.projectDirectory = "contracts/other";
    auto other = orchestrator->submit(req);
    wait(other);
    ASSERT_EQ(other.session->failure(), FailureKind::ArtifactMissing);

    req = request("flipper-3");
    req.projectDirectory = "contracts/../..";
    ASSERT_THROW(orchestrator->submit(req), InvalidBuildRequest);
}

TEST_F(OrchestratorTest, floodingStageKeepsTheLogBounded)
{
    settings.set("log-size-limit", "64K");
    auto orchestrator = makeOrchestrator(localPipeline(
        "head -c 4194304 /dev/zero | tr '\\0' x && exit 1"
    ));

    auto handle = orchestrator->submit(request("flipper-1"));
    wait(handle);

    ASSERT_EQ(handle.session->failure(), FailureKind::CompileFailure);
    auto log = readFile(tmpDir + "/state/logs/flipper-1.log");
    ASSERT_LT(log.size(), (64u << 10) + 128);
    ASSERT_THAT(log, testing::HasSubstr("log size limit"));
    for (auto & line : handle.session->logTail()) {
        ASSERT_LE(line.size(), 4096u);
    }
}

TEST_F(OrchestratorTest, oversizedModuleIsTooLarge)
{
    settings.set("wasm-size-limit", "64");
    auto orchestrator = makeOrchestrator(localPipeline(
        "mkdir -p target/ink"
        " && printf '\\000asm\\001\\000\\000\\000' > target/ink/main.wasm"
        " && head -c 1024 /dev/zero >> target/ink/main.wasm"
        " && echo '{}' > target/ink/main.json"
    ));

    auto handle = orchestrator->submit(request("flipper-1"));
    wait(handle);

    ASSERT_EQ(handle.session->state(), SessionState::Failed);
    ASSERT_EQ(handle.session->failure(), FailureKind::ArtifactTooLarge);
    ASSERT_TRUE(ranStage(*handle.session, "normalize"));
    ASSERT_FALSE(handle.session->artifacts());
    ASSERT_FALSE(pathExists(tmpDir + "/artifacts/flipper-1"));
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-1"));
}

TEST_F(OrchestratorTest, provisionFailureRaisesAnAlert)
{
    testing::NiceMock<MockVolumeManager> mock(volumes);
    EXPECT_CALL(mock, provision).WillOnce([](VolumeHandle &, uint64_t) {
        return failWith<VolumeProvisionError>("losetup: could not find any free loop device");
    });
    auto orchestrator = makeOrchestrator(localPipeline(), mock);

    testing::internal::CaptureStderr();
    auto handle = orchestrator->submit(request("flipper-1"));
    wait(handle);
    auto output = testing::internal::GetCapturedStderr();

    ASSERT_EQ(handle.session->state(), SessionState::Failed);
    ASSERT_EQ(handle.session->failure(), FailureKind::VolumeProvisionFailure);
    ASSERT_THAT(handle.session->reason(), testing::HasSubstr("free loop device"));
    ASSERT_FALSE(ranStage(*handle.session, "fetch"));
    ASSERT_THAT(output, testing::HasSubstr("volume provisioning failed"));
    ASSERT_FALSE(orchestrator->admissionsHalted());
}

TEST_F(OrchestratorTest, failuresOfUnknownTypeAreStillRecorded)
{
    testing::NiceMock<MockVolumeManager> mock(volumes);
    EXPECT_CALL(mock, provision).WillOnce([](VolumeHandle &, uint64_t) {
        return kj::Promise<Result<void>>(result::failure(std::make_exception_ptr(42)));
    });
    auto orchestrator = makeOrchestrator(localPipeline(), mock);

    testing::internal::CaptureStderr();
    auto handle = orchestrator->submit(request("flipper-1"));
    wait(handle);
    testing::internal::GetCapturedStderr();

    ASSERT_EQ(handle.session->failure(), FailureKind::VolumeProvisionFailure);
    ASSERT_EQ(handle.session->reason(), "(non-std::exception)");
    ASSERT_FALSE(pathExists(tmpDir + "/volumes/flipper-1"));
}

TEST_F(OrchestratorTest, releaseFailureHaltsAdmissions)
{
    testing::NiceMock<MockVolumeManager> mock(volumes);
    EXPECT_CALL(mock, release).WillOnce([](VolumeHandle &) {
        return failWith<VolumeReleaseError>("umount: target is busy");
    });
    // only the first session ever gets a volume
    EXPECT_CALL(mock, provision).Times(1);
    auto orchestrator = makeOrchestrator(localPipeline(
        "sleep 1 && mkdir -p target/ink"
        " && printf '\\000asm\\001\\000\\000\\000' > target/ink/main.wasm"
        " && echo '{}' > target/ink/main.json"
    ), mock);

    testing::internal::CaptureStderr();
    auto first = orchestrator->submit(request("flipper-1"));
    auto second = orchestrator->submit(request("flipper-2"));
    wait(first);
    sleep(300 * kj::MILLISECONDS);
    auto output = testing::internal::GetCapturedStderr();

    ASSERT_EQ(first.session->state(), SessionState::Succeeded) << first.session->reason();
    ASSERT_TRUE(orchestrator->admissionsHalted());
    ASSERT_THAT(output, testing::HasSubstr("no further sessions are admitted"));

    ASSERT_EQ(second.session->state(), SessionState::Queued);
    ASSERT_EQ(orchestrator->slots().used(), 0);
    ASSERT_EQ(orchestrator->activeSessions().size(), 1);

    // still queued work can be cancelled
    ASSERT_TRUE(orchestrator->cancel("flipper-2"));
    wait(second);
    ASSERT_EQ(second.session->failure(), FailureKind::Cancelled);
    ASSERT_FALSE(ranStage(*second.session, "provision"));
}

TEST_F(OrchestratorTest, sandboxFailuresRaiseAnAlertAtTheThreshold)
{
    settings.set("sandbox-failure-alert-threshold", "2");
    auto orchestrator = makeOrchestrator({StageDefinition{
        .name = "fetch",
        .state = SessionState::Unarchiving,
        .failureKind = FailureKind::DownloadFailure,
        .argv = {"inkforge-no-such-program"},
        .requiredEnv = {},
    }});

    testing::internal::CaptureStderr();
    auto first = orchestrator->submit(request("flipper-1"));
    wait(first);
    auto output = testing::internal::GetCapturedStderr();
    ASSERT_EQ(first.session->failure(), FailureKind::SandboxRuntimeFailure);
    ASSERT_THAT(output, testing::Not(testing::HasSubstr("consecutive sandbox failures")));

    testing::internal::CaptureStderr();
    auto second = orchestrator->submit(request("flipper-2"));
    wait(second);
    output = testing::internal::GetCapturedStderr();
    ASSERT_EQ(second.session->failure(), FailureKind::SandboxRuntimeFailure);
    ASSERT_THAT(output, testing::HasSubstr("2 consecutive sandbox failures, the last in session 'flipper-2'"));
    ASSERT_FALSE(orchestrator->admissionsHalted());
}

}
