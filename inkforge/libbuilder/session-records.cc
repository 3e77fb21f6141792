#include "inkforge/libbuilder/session-records.hh"
#include "inkforge/libutil/file-system.hh"
#include "inkforge/libutil/logging.hh"

namespace inkforge {

SessionRecords::SessionRecords(const Path & stateDir)
    : dir(stateDir + "/sessions")
{
    createDirs(dir);
}

Path SessionRecords::recordPath(const std::string & token) const
{
    return dir + "/" + token + ".json";
}

void SessionRecords::write(const BuildSession & session)
{
    writeFileAtomic(recordPath(session.token()), session.toJSON().dump(2) + "\n");
}

bool SessionRecords::exists(const std::string & token) const
{
    return pathExists(recordPath(token));
}

std::optional<BuildSession> SessionRecords::read(const std::string & token) const
{
    auto path = recordPath(token);
    if (!pathExists(path)) {
        return std::nullopt;
    }
    return BuildSession::fromJSON(parseJSON(readFile(path), path));
}

std::vector<BuildSession> SessionRecords::list() const
{
    std::vector<BuildSession> sessions;
    for (auto & entry : readDirectory(dir)) {
        if (!entry.name.ends_with(".json")) {
            continue;
        }
        auto path = dir + "/" + entry.name;
        try {
            sessions.push_back(BuildSession::fromJSON(parseJSON(readFile(path), path)));
        } catch (Error & e) {
            printTaggedWarning("ignoring unreadable session record '%s': %s", path, e.msg());
        }
    }
    return sessions;
}

}
