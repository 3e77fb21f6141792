#include "inkforge/libbuilder/build-session.hh"
#include "inkforge/libbuilder/session-records.hh"
#include "inkforge/libutil/file-system.hh"

#include <gtest/gtest.h>

namespace inkforge {

static BuildRequest flipperRequest()
{
    return BuildRequest{
        .token = "flipper-1",
        .sourceUrl = "https://example.com/flipper.zip",
        .cargoContractVersion = "4.0.1",
        .rustToolchain = "stable",
    };
}

static BuildLimits smallLimits()
{
    return BuildLimits{
        .memory = 1ULL << 30,
        .memorySwap = 2ULL << 30,
        .volumeSize = 4ULL << 30,
        .pids = 768,
        .maxBuildDuration = std::chrono::seconds(60),
        .wasmSize = 5ULL << 20,
        .metadataSize = 1ULL << 20,
    };
}

TEST(SessionState, namesRoundTrip)
{
    for (auto state : {SessionState::Queued, SessionState::NormalizingOutput, SessionState::TimedOut}) {
        ASSERT_EQ(parseSessionState(showSessionState(state)), state);
    }
    ASSERT_EQ(showSessionState(SessionState::NormalizingOutput), "normalizing-output");
    ASSERT_EQ(parseSessionState("done"), std::nullopt);
}

TEST(SessionState, terminalStates)
{
    ASSERT_FALSE(isTerminal(SessionState::Queued));
    ASSERT_FALSE(isTerminal(SessionState::NormalizingOutput));
    ASSERT_TRUE(isTerminal(SessionState::Succeeded));
    ASSERT_TRUE(isTerminal(SessionState::Failed));
    ASSERT_TRUE(isTerminal(SessionState::TimedOut));
}

TEST(BuildSession, walksThePipeline)
{
    BuildSession session(flipperRequest(), smallLimits(), 10);
    ASSERT_EQ(session.state(), SessionState::Queued);

    session.advance(SessionState::Provisioning, "provision");
    session.advance(SessionState::Unarchiving, "fetch");
    session.advance(SessionState::Unarchiving, "unpack");
    session.advance(SessionState::Sealing, "relay");
    session.advance(SessionState::Building, "toolchain");
    session.advance(SessionState::Building, "compile");
    session.advance(SessionState::NormalizingOutput, "normalize");
    session.succeed(ArtifactSet{.module = "/a/main.wasm", .metadata = "/a/main.json"});

    ASSERT_EQ(session.state(), SessionState::Succeeded);
    ASSERT_EQ(session.timings().size(), 7);
    ASSERT_EQ(session.currentStage(), "normalize");
    for (auto & timing : session.timings()) {
        ASSERT_TRUE(timing.end.has_value()) << timing.stage;
    }
    ASSERT_FALSE(session.failure());
}

TEST(BuildSession, sealingMayBeSkipped)
{
    BuildSession session(flipperRequest(), smallLimits(), 10);
    session.advance(SessionState::Provisioning, "provision");
    session.advance(SessionState::Unarchiving, "fetch");
    ASSERT_NO_THROW(session.advance(SessionState::Building, "compile"));
}

TEST(BuildSession, rejectsInvalidTransitions)
{
    BuildSession session(flipperRequest(), smallLimits(), 10);

    ASSERT_THROW(session.advance(SessionState::Unarchiving, "fetch"), InvalidTransition);
    ASSERT_THROW(session.advance(SessionState::Queued, "queue"), InvalidTransition);

    session.advance(SessionState::Provisioning, "provision");
    ASSERT_THROW(session.advance(SessionState::Building, "compile"), InvalidTransition);
    ASSERT_THROW(session.advance(SessionState::Succeeded, "done"), InvalidTransition);
    ASSERT_THROW(session.succeed(ArtifactSet{}), InvalidTransition);

    session.advance(SessionState::Unarchiving, "fetch");
    session.advance(SessionState::Building, "compile");
    ASSERT_THROW(session.advance(SessionState::Unarchiving, "fetch"), InvalidTransition);
}

TEST(BuildSession, terminalStatesAreFinal)
{
    BuildSession session(flipperRequest(), smallLimits(), 10);
    session.advance(SessionState::Provisioning, "provision");
    session.advance(SessionState::Unarchiving, "fetch");
    session.fail(FailureKind::DownloadFailure, "stage 'fetch' failed with exit code 22");

    ASSERT_EQ(session.state(), SessionState::Failed);
    ASSERT_EQ(session.failure(), FailureKind::DownloadFailure);
    ASSERT_EQ(session.currentStage(), "fetch");

    ASSERT_THROW(session.fail(FailureKind::Cancelled, "again"), InvalidTransition);
    ASSERT_THROW(session.timeOut("late"), InvalidTransition);
    ASSERT_THROW(session.advance(SessionState::Building, "compile"), InvalidTransition);
    ASSERT_EQ(session.failure(), FailureKind::DownloadFailure);
}

TEST(BuildSession, queuedSessionsCanFail)
{
    BuildSession session(flipperRequest(), smallLimits(), 10);
    session.fail(FailureKind::Cancelled, "cancelled by the operator");

    ASSERT_EQ(session.state(), SessionState::Failed);
    ASSERT_TRUE(session.timings().empty());
}

TEST(BuildSession, timeOutRecordsTimeoutKind)
{
    BuildSession session(flipperRequest(), smallLimits(), 10);
    session.advance(SessionState::Provisioning, "provision");
    session.timeOut("the build did not finish within 60 seconds");

    ASSERT_EQ(session.state(), SessionState::TimedOut);
    ASSERT_EQ(session.failure(), FailureKind::Timeout);
}

TEST(BuildSession, logTailIsBounded)
{
    BuildSession session(flipperRequest(), smallLimits(), 3);
    for (int i = 0; i < 10; i++) {
        session.appendLogLine(std::to_string(i));
    }
    ASSERT_EQ(session.logTail(), (std::deque<std::string>{"7", "8", "9"}));
}

TEST(BuildSession, jsonRoundTrip)
{
    BuildSession session(flipperRequest(), smallLimits(), 5);
    session.advance(SessionState::Provisioning, "provision");
    session.setVolumeRecord(JSON{{"id", "flipper-1"}});
    session.appendLogLine("Compiling flipper");
    session.fail(FailureKind::VolumeProvisionFailure, "no space left");

    auto json = session.toJSON();
    ASSERT_EQ(json["state"], "failed");
    ASSERT_EQ(json["failure"], "volume-provision-failure");
    ASSERT_EQ(json["limits"]["max_build_duration"], 60);

    auto copy = BuildSession::fromJSON(json);
    ASSERT_EQ(copy.token(), "flipper-1");
    ASSERT_EQ(copy.state(), SessionState::Failed);
    ASSERT_EQ(copy.failure(), FailureKind::VolumeProvisionFailure);
    ASSERT_EQ(copy.reason(), "no space left");
    ASSERT_EQ(copy.limits().memorySwap, 2ULL << 30);
    ASSERT_EQ(copy.logTail(), session.logTail());
    ASSERT_EQ(copy.timings().size(), 1);
    ASSERT_EQ(copy.volumeRecord(), session.volumeRecord());
    ASSERT_EQ(copy.toJSON(), json);
}

TEST(BuildRequest, defaultsTheToolchain)
{
    auto request = BuildRequest::fromJSON(
        JSON{{"token", "t"}, {"source_url", "u"}, {"cargo_contract_version", "4.0.1"}}, "nightly"
    );
    ASSERT_EQ(request.rustToolchain, "nightly");

    ASSERT_THROW(BuildRequest::fromJSON(JSON{{"token", "t"}}, "stable"), JSONError);
    ASSERT_THROW(BuildRequest::fromJSON(JSON::array(), "stable"), JSONError);
}

TEST(SessionRecords, writeReadList)
{
    auto dir = createTempDir();
    AutoDelete cleanup(dir);
    SessionRecords records(dir);

    ASSERT_FALSE(records.exists("flipper-1"));
    ASSERT_FALSE(records.read("flipper-1"));

    BuildSession session(flipperRequest(), smallLimits(), 5);
    session.advance(SessionState::Provisioning, "provision");
    records.write(session);

    ASSERT_TRUE(records.exists("flipper-1"));
    ASSERT_EQ(records.read("flipper-1")->state(), SessionState::Provisioning);

    writeFile(dir + "/sessions/broken.json", "{");
    auto all = records.list();
    ASSERT_EQ(all.size(), 1);
    ASSERT_EQ(all[0].token(), "flipper-1");
    // unreadable records stay where they are
    ASSERT_TRUE(pathExists(dir + "/sessions/broken.json"));
}

}
