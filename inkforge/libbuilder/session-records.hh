#pragma once
///@file

#include "inkforge/libbuilder/build-session.hh"
#include "inkforge/libutil/types.hh"

namespace inkforge {

/**
 * Durable copies of session state under `state-dir/sessions`. A record exists
 * for every session that got past `Queued`; a record that is not terminal
 * after a restart belongs to a session whose resources may still be live.
 */
class SessionRecords
{
    Path dir;

    Path recordPath(const std::string & token) const;

public:
    explicit SessionRecords(const Path & stateDir);

    /**
     * Atomically replace the record of `session`.
     */
    void write(const BuildSession & session);

    bool exists(const std::string & token) const;

    std::optional<BuildSession> read(const std::string & token) const;

    /**
     * All records, in token order. Records that cannot be parsed are reported
     * and skipped; they are never deleted.
     */
    std::vector<BuildSession> list() const;
};

}
