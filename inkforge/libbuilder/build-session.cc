#include "inkforge/libbuilder/build-session.hh"
#include "inkforge/libutil/logging.hh"

namespace inkforge {

static const std::pair<SessionState, std::string_view> stateNames[] = {
    {SessionState::Queued, "queued"},
    {SessionState::Provisioning, "provisioning"},
    {SessionState::Unarchiving, "unarchiving"},
    {SessionState::Sealing, "sealing"},
    {SessionState::Building, "building"},
    {SessionState::NormalizingOutput, "normalizing-output"},
    {SessionState::Succeeded, "succeeded"},
    {SessionState::Failed, "failed"},
    {SessionState::TimedOut, "timed-out"},
};

std::string_view showSessionState(SessionState state)
{
    for (auto & [s, name] : stateNames) {
        if (s == state) {
            return name;
        }
    }
    throw Error("unknown session state %d", static_cast<int>(state));
}

std::optional<SessionState> parseSessionState(std::string_view s)
{
    for (auto & [state, name] : stateNames) {
        if (name == s) {
            return state;
        }
    }
    return std::nullopt;
}

bool isTerminal(SessionState state)
{
    return state == SessionState::Succeeded
        || state == SessionState::Failed
        || state == SessionState::TimedOut;
}

static uint64_t toMillis(std::chrono::system_clock::time_point t)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

static std::chrono::system_clock::time_point fromMillis(const JSON & j)
{
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(getUnsigned(j))
    );
}

JSON BuildRequest::toJSON() const
{
    return {
        {"token", token},
        {"source_url", sourceUrl},
        {"cargo_contract_version", cargoContractVersion},
        {"rust_toolchain", rustToolchain},
        {"project_directory", projectDirectory ? JSON(*projectDirectory) : JSON(nullptr)},
    };
}

BuildRequest BuildRequest::fromJSON(const JSON & json, const std::string & defaultToolchain)
{
    ensureType(json, JSON::value_t::object);
    BuildRequest request{
        .token = getString(valueAt(json, "token")),
        .sourceUrl = getString(valueAt(json, "source_url")),
        .cargoContractVersion = getString(valueAt(json, "cargo_contract_version")),
        .rustToolchain = defaultToolchain,
    };
    if (auto toolchain = optionalValueAt(json, "rust_toolchain"); toolchain && !toolchain->is_null()) {
        request.rustToolchain = getString(*toolchain);
    }
    if (auto dir = optionalValueAt(json, "project_directory"); dir && !dir->is_null()) {
        if (auto & s = getString(*dir); !s.empty()) {
            request.projectDirectory = s;
        }
    }
    return request;
}

JSON ArtifactSet::toJSON() const
{
    return {
        {"module", module},
        {"metadata", metadata},
        {"module_size", moduleSize},
        {"metadata_size", metadataSize},
        {"code_hash", codeHash},
    };
}

ArtifactSet ArtifactSet::fromJSON(const JSON & json)
{
    ensureType(json, JSON::value_t::object);
    return ArtifactSet{
        .module = getString(valueAt(json, "module")),
        .metadata = getString(valueAt(json, "metadata")),
        .moduleSize = getUnsigned(valueAt(json, "module_size")),
        .metadataSize = getUnsigned(valueAt(json, "metadata_size")),
        .codeHash = getString(valueAt(json, "code_hash")),
    };
}

BuildSession::BuildSession(BuildRequest request, BuildLimits limits, size_t logCapacity)
    : request_(std::move(request))
    , limits_(limits)
    , created_(std::chrono::system_clock::now())
    , createdSteady_(std::chrono::steady_clock::now())
    , logCapacity_(logCapacity)
{
}

std::optional<std::string> BuildSession::currentStage() const
{
    if (timings_.empty()) {
        return std::nullopt;
    }
    return timings_.back().stage;
}

static bool isForwardMove(SessionState from, SessionState to)
{
    if (isTerminal(from) || isTerminal(to)) {
        return false;
    }
    if (from == SessionState::Queued) {
        return to == SessionState::Provisioning;
    }

    auto f = static_cast<int>(from);
    auto t = static_cast<int>(to);
    // a new stage within the current state, the next state, or skipping the
    // relay of sources when it is disabled
    return t == f || t == f + 1
        || (from == SessionState::Unarchiving && to == SessionState::Building);
}

void BuildSession::enter(SessionState next, std::string_view stage)
{
    auto now = std::chrono::system_clock::now();
    if (!timings_.empty() && !timings_.back().end) {
        timings_.back().end = now;
    }
    if (!isTerminal(next)) {
        timings_.push_back(StageTiming{
            .stage = std::string(stage),
            .state = next,
            .start = now,
            .end = std::nullopt,
        });
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - createdSteady_);
    printInfo(
        "session '%s': %s -> %s (stage '%s', %.1fs elapsed)",
        request_.token,
        showSessionState(state_),
        showSessionState(next),
        stage,
        elapsed.count()
    );
    state_ = next;
}

void BuildSession::advance(SessionState next, std::string_view stage)
{
    if (!isForwardMove(state_, next)) {
        throw InvalidTransition(
            "session '%s' cannot move from %s to %s (stage '%s')",
            request_.token,
            showSessionState(state_),
            showSessionState(next),
            stage
        );
    }
    enter(next, stage);
}

void BuildSession::fail(FailureKind kind, std::string reason)
{
    if (isTerminal(state_)) {
        throw InvalidTransition(
            "session '%s' is already %s and cannot fail with %s",
            request_.token,
            showSessionState(state_),
            showFailureKind(kind)
        );
    }
    failure_ = kind;
    reason_ = std::move(reason);
    enter(SessionState::Failed, currentStage().value_or(""));
}

void BuildSession::timeOut(std::string reason)
{
    if (isTerminal(state_)) {
        throw InvalidTransition(
            "session '%s' is already %s and cannot time out",
            request_.token,
            showSessionState(state_)
        );
    }
    failure_ = FailureKind::Timeout;
    reason_ = std::move(reason);
    enter(SessionState::TimedOut, currentStage().value_or(""));
}

void BuildSession::succeed(ArtifactSet artifacts)
{
    if (state_ != SessionState::NormalizingOutput) {
        throw InvalidTransition(
            "session '%s' cannot succeed from %s",
            request_.token,
            showSessionState(state_)
        );
    }
    artifacts_ = std::move(artifacts);
    enter(SessionState::Succeeded, currentStage().value_or(""));
}

void BuildSession::appendLogLine(std::string line)
{
    logTail_.push_back(std::move(line));
    while (logTail_.size() > logCapacity_) {
        logTail_.pop_front();
    }
}

JSON BuildSession::toJSON() const
{
    auto timings = JSON::array();
    for (auto & t : timings_) {
        timings.push_back({
            {"stage", t.stage},
            {"state", std::string(showSessionState(t.state))},
            {"start", toMillis(t.start)},
            {"end", t.end ? JSON(toMillis(*t.end)) : JSON(nullptr)},
        });
    }

    return {
        {"token", request_.token},
        {"request", request_.toJSON()},
        {"limits", limits_.toJSON()},
        {"state", std::string(showSessionState(state_))},
        {"created", toMillis(created_)},
        {"timings", std::move(timings)},
        {"log_capacity", logCapacity_},
        {"log_tail", logTail_},
        {"failure", failure_ ? JSON(std::string(showFailureKind(*failure_))) : JSON(nullptr)},
        {"reason", reason_},
        {"artifacts", artifacts_ ? artifacts_->toJSON() : JSON(nullptr)},
        {"volume", volumeRecord_ ? *volumeRecord_ : JSON(nullptr)},
        {"sandbox", sandboxRecord_ ? *sandboxRecord_ : JSON(nullptr)},
    };
}

BuildSession BuildSession::fromJSON(const JSON & json)
{
    ensureType(json, JSON::value_t::object);

    auto & request = valueAt(json, "request");
    BuildSession session(
        BuildRequest::fromJSON(request, getString(valueAt(request, "rust_toolchain"))),
        BuildLimits::fromJSON(valueAt(json, "limits")),
        getUnsigned(valueAt(json, "log_capacity"))
    );

    auto & stateName = getString(valueAt(json, "state"));
    auto state = parseSessionState(stateName);
    if (!state) {
        throw JSONError("unknown session state '%s'", stateName);
    }
    session.state_ = *state;
    session.created_ = fromMillis(valueAt(json, "created"));

    for (auto & t : ensureType(valueAt(json, "timings"), JSON::value_t::array)) {
        auto & timingState = getString(valueAt(t, "state"));
        auto parsed = parseSessionState(timingState);
        if (!parsed) {
            throw JSONError("unknown session state '%s'", timingState);
        }
        auto & end = valueAt(t, "end");
        session.timings_.push_back(StageTiming{
            .stage = getString(valueAt(t, "stage")),
            .state = *parsed,
            .start = fromMillis(valueAt(t, "start")),
            .end = end.is_null() ? std::nullopt : std::optional(fromMillis(end)),
        });
    }

    for (auto & line : ensureType(valueAt(json, "log_tail"), JSON::value_t::array)) {
        session.logTail_.push_back(getString(line));
    }

    if (auto & failure = valueAt(json, "failure"); !failure.is_null()) {
        auto kind = parseFailureKind(getString(failure));
        if (!kind) {
            throw JSONError("unknown failure kind '%s'", getString(failure));
        }
        session.failure_ = *kind;
    }
    session.reason_ = getString(valueAt(json, "reason"));

    if (auto & artifacts = valueAt(json, "artifacts"); !artifacts.is_null()) {
        session.artifacts_ = ArtifactSet::fromJSON(artifacts);
    }
    if (auto & volume = valueAt(json, "volume"); !volume.is_null()) {
        session.volumeRecord_ = volume;
    }
    if (auto & sandbox = valueAt(json, "sandbox"); !sandbox.is_null()) {
        session.sandboxRecord_ = sandbox;
    }

    return session;
}

}
