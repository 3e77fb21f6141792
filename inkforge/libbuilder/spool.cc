#include "inkforge/libbuilder/spool.hh"
#include "inkforge/libbuilder/build-error.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/json.hh"
#include "inkforge/libutil/logging.hh"

#include <cerrno>

namespace inkforge {

Spool::Spool(Path root, Orchestrator & orchestrator, const BuilderSettings & settings)
    : root(std::move(root))
    , orchestrator(orchestrator)
    , settings(settings)
    , records(settings.stateDir)
{
    for (auto sub : {"new", "accepted", "rejected", "cancel", "results"}) {
        createDirs(dir(sub));
    }
    orchestrator.onFinished([this](const BuildSession & session) { writeResult(session); });
}

void Spool::reject(const Path & file, const std::string & name, const std::string & why)
{
    printTaggedWarning("rejecting build request '%s': %s", name, why);
    writeFileAtomic(dir("rejected") + "/" + name + ".reason", why + "\n");
    renameFile(file, dir("rejected") + "/" + name);
}

void Spool::writeResult(const BuildSession & session)
{
    auto json = session.toJSON();
    // the log tail and resource records are for operators, not producers
    json.erase("log_tail");
    json.erase("volume");
    json.erase("sandbox");
    writeFileAtomic(dir("results") + "/" + session.token() + ".json", json.dump(2) + "\n");
    deletePath(dir("accepted") + "/" + session.token() + ".json");
}

bool Spool::intake(const Path & file, const std::string & name)
{
    std::string contents;
    try {
        contents = readFile(file);
    } catch (SysError & e) {
        // the producer took it back
        if (e.errNo == ENOENT) {
            return false;
        }
        throw;
    }

    BuildRequest request;
    try {
        request = BuildRequest::fromJSON(
            parseJSON(contents, file), settings.defaultRustToolchain
        );
        orchestrator.validate(request);
        if (pathExists(dir("accepted") + "/" + request.token + ".json")
            || records.exists(request.token))
        {
            throw InvalidBuildRequest("session '%s' was already submitted", request.token);
        }
    } catch (Error & e) {
        reject(file, name, e.msg());
        return false;
    }

    renameFile(file, dir("accepted") + "/" + request.token + ".json");
    orchestrator.submit(std::move(request));
    return true;
}

void Spool::processCancellations()
{
    for (auto & entry : readDirectory(dir("cancel"))) {
        auto marker = dir("cancel") + "/" + entry.name;
        if (!orchestrator.cancel(entry.name, "cancelled by request")) {
            debug("ignoring cancellation of '%s', no such session is active", entry.name);
        }
        deletePath(marker);
    }
}

unsigned Spool::scan()
{
    unsigned submitted = 0;

    for (auto & entry : readDirectory(dir("new"))) {
        if (!entry.name.ends_with(".json")) {
            continue;
        }
        if (intake(dir("new") + "/" + entry.name, entry.name)) {
            submitted += 1;
        }
    }

    processCancellations();
    return submitted;
}

void Spool::resume()
{
    for (auto & entry : readDirectory(dir("accepted"))) {
        if (!entry.name.ends_with(".json")) {
            continue;
        }
        auto file = dir("accepted") + "/" + entry.name;
        auto token = entry.name.substr(0, entry.name.size() - 5);

        std::optional<BuildSession> session;
        try {
            session = records.read(token);
        } catch (Error & e) {
            // the session ran before, so it is not submitted again; like
            // `SessionRecords::list`, a broken record does not stop the builder
            printTaggedWarning("ignoring unreadable session record of '%s': %s", token, e.msg());
            continue;
        }
        if (session) {
            if (isTerminal(session->state())) {
                writeResult(*session);
            }
            continue;
        }

        try {
            auto request = BuildRequest::fromJSON(
                parseJSON(readFile(file), file), settings.defaultRustToolchain
            );
            notice("resubmitting build request '%s' accepted by a previous run", token);
            orchestrator.submit(std::move(request));
        } catch (InvalidBuildRequest & e) {
            reject(file, entry.name, e.msg());
        } catch (JSONError & e) {
            reject(file, entry.name, e.msg());
        }
    }
}

kj::Promise<Result<void>> Spool::run(kj::Timer & timer)
try {
    while (true) {
        try {
            if (auto n = scan()) {
                debug("submitted %d build requests from the spool", n);
            }
        } catch (Error & e) {
            printError("scanning the spool: %s", e.msg());
        }
        co_await timer.afterDelay(settings.spoolPollInterval.get() * kj::MILLISECONDS);
    }
} catch (...) {
    co_return result::current_exception();
}

}
