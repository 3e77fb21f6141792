#include "inkforge/libbuilder/spool.hh"
#include "inkforge/libutil/async.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/json.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace inkforge {

class SpoolTest : public ::testing::Test
{
protected:
    AsyncIoRoot aio;
    Path tmpDir;
    AutoDelete cleanup;
    Path spoolDir;
    BuilderSettings settings;
    DirectoryVolumeManager volumes;
    ProcessSandboxRuntime runtime{"/usr/local/bin:/usr/bin:/bin"};

    SpoolTest()
        : tmpDir(createTempDir())
        , cleanup(tmpDir)
        , spoolDir(tmpDir + "/spool")
        , volumes(tmpDir + "/volumes")
    {
        settings.set("state-dir", tmpDir + "/state");
        settings.set("artifacts-dir", tmpDir + "/artifacts");
        settings.set("toolchain-image", "/");
        settings.set("default-rust-toolchain", "1.74.0");
    }

    std::unique_ptr<Orchestrator> makeOrchestrator(const std::string & script)
    {
        std::vector<StageDefinition> pipeline{StageDefinition{
            .name = "compile",
            .state = SessionState::Building,
            .failureKind = FailureKind::CompileFailure,
            .argv = {"sh", "-c", script},
            .requiredEnv = {},
        }};
        return std::make_unique<Orchestrator>(
            settings, volumes, runtime, std::move(pipeline), aio.kj.provider->getTimer()
        );
    }

    void drop(const std::string & name, const JSON & request)
    {
        writeFile(spoolDir + "/new/" + name, request.dump());
    }

    static JSON request(const std::string & token)
    {
        return {
            {"token", token},
            {"source_url", "https://example.com/" + token + ".zip"},
            {"cargo_contract_version", "3.2.0"},
        };
    }

    void drain(Orchestrator & orchestrator)
    {
        aio.blockOn(orchestrator.shutdown());
    }

    JSON result(const std::string & token)
    {
        auto path = spoolDir + "/results/" + token + ".json";
        return parseJSON(readFile(path), path);
    }
};

TEST_F(SpoolTest, createsItsLayout)
{
    auto orchestrator = makeOrchestrator("false");
    Spool spool(spoolDir, *orchestrator, settings);

    for (auto sub : {"new", "accepted", "rejected", "cancel", "results"}) {
        ASSERT_TRUE(pathExists(spoolDir + "/" + sub)) << sub;
    }
    ASSERT_EQ(spool.scan(), 0);
}

TEST_F(SpoolTest, acceptedRequestsGetAResult)
{
    auto orchestrator = makeOrchestrator("exit 1");
    Spool spool(spoolDir, *orchestrator, settings);

    drop("upload.json", request("flipper-1"));
    writeFile(spoolDir + "/new/upload.json.tmp", "partial");
    ASSERT_EQ(spool.scan(), 1);

    ASSERT_FALSE(pathExists(spoolDir + "/new/upload.json"));
    ASSERT_TRUE(pathExists(spoolDir + "/new/upload.json.tmp"));
    ASSERT_TRUE(pathExists(spoolDir + "/accepted/flipper-1.json"));
    ASSERT_EQ(orchestrator->activeSessions().size(), 1);
    ASSERT_EQ(orchestrator->activeSessions()[0]->request().rustToolchain, "1.74.0");

    drain(*orchestrator);

    auto json = result("flipper-1");
    ASSERT_EQ(json["token"], "flipper-1");
    ASSERT_EQ(json["state"], "failed");
    ASSERT_FALSE(json.contains("log_tail"));
    ASSERT_FALSE(json.contains("volume"));
    ASSERT_FALSE(json.contains("sandbox"));
    ASSERT_FALSE(pathExists(spoolDir + "/accepted/flipper-1.json"));
}

TEST_F(SpoolTest, invalidRequestsAreRejected)
{
    auto orchestrator = makeOrchestrator("true");
    Spool spool(spoolDir, *orchestrator, settings);

    writeFile(spoolDir + "/new/garbage.json", "{ not json");
    auto badToken = request("flipper 1");
    drop("bad-token.json", badToken);
    auto noVersion = request("flipper-2");
    noVersion.erase("cargo_contract_version");
    drop("no-version.json", noVersion);

    ASSERT_EQ(spool.scan(), 0);
    ASSERT_TRUE(orchestrator->activeSessions().empty());

    for (auto name : {"garbage.json", "bad-token.json", "no-version.json"}) {
        ASSERT_FALSE(pathExists(spoolDir + "/new/" + name)) << name;
        ASSERT_TRUE(pathExists(spoolDir + "/rejected/" + name)) << name;
        ASSERT_FALSE(readFile(spoolDir + "/rejected/" + name + ".reason").empty()) << name;
    }
    ASSERT_THAT(
        readFile(spoolDir + "/rejected/bad-token.json.reason"),
        testing::HasSubstr("invalid session token")
    );
}

TEST_F(SpoolTest, duplicateTokensAreRejected)
{
    auto orchestrator = makeOrchestrator("sleep 30");
    Spool spool(spoolDir, *orchestrator, settings);

    drop("first.json", request("flipper-1"));
    ASSERT_EQ(spool.scan(), 1);
    drop("second.json", request("flipper-1"));
    ASSERT_EQ(spool.scan(), 0);

    ASSERT_THAT(
        readFile(spoolDir + "/rejected/second.json.reason"),
        testing::HasSubstr("already submitted")
    );
    drain(*orchestrator);
}

TEST_F(SpoolTest, cancellationMarkers)
{
    auto orchestrator = makeOrchestrator("sleep 30");
    Spool spool(spoolDir, *orchestrator, settings);

    drop("upload.json", request("flipper-1"));
    ASSERT_EQ(spool.scan(), 1);
    aio.kj.provider->getTimer().afterDelay(300 * kj::MILLISECONDS).wait(aio.kj.waitScope);

    writeFile(spoolDir + "/cancel/flipper-1", "");
    writeFile(spoolDir + "/cancel/unknown", "");
    ASSERT_EQ(spool.scan(), 0);
    ASSERT_TRUE(readDirectory(spoolDir + "/cancel").empty());

    auto sessions = orchestrator->activeSessions();
    ASSERT_EQ(sessions.size(), 1);
    auto session = sessions[0];
    drain(*orchestrator);

    ASSERT_EQ(session->failure(), FailureKind::Cancelled);
    ASSERT_EQ(session->reason(), "cancelled by request");
    ASSERT_EQ(result("flipper-1")["failure"], "cancelled");
}

TEST_F(SpoolTest, resumeAfterRestart)
{
    // a request accepted by a previous run that never got a record, and one
    // whose session finished without its result being written
    createDirs(spoolDir + "/accepted");
    writeFile(spoolDir + "/accepted/flipper-1.json", request("flipper-1").dump());
    writeFile(spoolDir + "/accepted/flipper-2.json", request("flipper-2").dump());
    writeFile(spoolDir + "/accepted/broken.json", "[]");

    BuildSession done(
        BuildRequest::fromJSON(request("flipper-2"), "stable"), settings.limits(), 25
    );
    done.fail(FailureKind::Cancelled, "builder restarted while the session was running");
    SessionRecords(settings.stateDir).write(done);

    auto orchestrator = makeOrchestrator("exit 1");
    Spool spool(spoolDir, *orchestrator, settings);
    spool.resume();

    ASSERT_EQ(result("flipper-2")["reason"], "builder restarted while the session was running");
    ASSERT_FALSE(pathExists(spoolDir + "/accepted/flipper-2.json"));
    ASSERT_TRUE(pathExists(spoolDir + "/rejected/broken.json"));

    auto sessions = orchestrator->activeSessions();
    ASSERT_EQ(sessions.size(), 1);
    ASSERT_EQ(sessions[0]->token(), "flipper-1");

    drain(*orchestrator);
    ASSERT_TRUE(pathExists(spoolDir + "/results/flipper-1.json"));
}

TEST_F(SpoolTest, resumeSkipsUnreadableRecords)
{
    createDirs(spoolDir + "/accepted");
    writeFile(spoolDir + "/accepted/flipper-1.json", request("flipper-1").dump());
    writeFile(spoolDir + "/accepted/flipper-2.json", request("flipper-2").dump());
    BuildSession running(
        BuildRequest::fromJSON(request("flipper-1"), "stable"), settings.limits(), 25
    );
    SessionRecords(settings.stateDir).write(running);

    // truncate the record the way a crash in the middle of a write would
    auto recordFile = settings.stateDir.get() + "/sessions/flipper-1.json";
    ASSERT_TRUE(pathExists(recordFile));
    writeFile(recordFile, "{\"token\": \"flipper-1\", \"sta");

    auto orchestrator = makeOrchestrator("exit 1");
    Spool spool(spoolDir, *orchestrator, settings);
    ASSERT_NO_THROW(spool.resume());

    // the session with a record is neither resubmitted nor rejected
    ASSERT_TRUE(pathExists(spoolDir + "/accepted/flipper-1.json"));
    ASSERT_FALSE(pathExists(spoolDir + "/rejected/flipper-1.json"));
    ASSERT_TRUE(SessionRecords(settings.stateDir).list().empty());

    auto sessions = orchestrator->activeSessions();
    ASSERT_EQ(sessions.size(), 1);
    ASSERT_EQ(sessions[0]->token(), "flipper-2");
    drain(*orchestrator);
}

TEST_F(SpoolTest, projectDirectoryIsCarriedAndChecked)
{
    auto orchestrator = makeOrchestrator("sleep 30");
    Spool spool(spoolDir, *orchestrator, settings);

    auto nested = request("flipper-1");
    nested["project_directory"] = "contracts/flipper";
    drop("nested.json", nested);
    auto escaping = request("flipper-2");
    escaping["project_directory"] = "./contracts/test/../another_contract";
    drop("escaping.json", escaping);
    auto absolute = request("flipper-3");
    absolute["project_directory"] = "/etc";
    drop("absolute.json", absolute);

    ASSERT_EQ(spool.scan(), 1);
    auto sessions = orchestrator->activeSessions();
    ASSERT_EQ(sessions.size(), 1);
    ASSERT_EQ(sessions[0]->request().projectDirectory, "contracts/flipper");

    auto accepted = spoolDir + "/accepted/flipper-1.json";
    ASSERT_EQ(parseJSON(readFile(accepted), accepted)["project_directory"], "contracts/flipper");
    for (auto name : {"escaping.json", "absolute.json"}) {
        ASSERT_THAT(
            readFile(spoolDir + "/rejected/" + name + ".reason"),
            testing::HasSubstr("project directory")
        ) << name;
    }
    drain(*orchestrator);
}

}
