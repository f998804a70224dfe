#pragma once

#include "config/Config.hpp"
#include "types/Session.hpp"

#include <stdexcept>
#include <string>

namespace sm::dest { class Site; }
namespace sm::source { class SourceApi; }

namespace sm::sync {

class SessionStore;
class MigrationLock;
class PauseToken;

// Thrown out of a checkpoint once the session is persisted as paused.
struct Suspended : std::runtime_error {
    Suspended() : std::runtime_error("Migration suspended") {}
};

// Thrown out of a checkpoint once a cancelled session has been written and cleared.
struct Cancelled : std::runtime_error {
    Cancelled() : std::runtime_error("Migration cancelled") {}
};

// Drives one migration session through scan, database, files and finalize, persisting
// the session at every transition and after every unit of work.
// Defined outside Migration so it is complete for the `= {}` default arguments below.
struct MigrationOptions {
    bool overwrite = true;          // Smart-Merge the destination before the database phase
    std::string operatorLogin;      // empty: config smart_merge.operator_login
};

class Migration {
public:
    using Options = MigrationOptions;

    Migration(const config::Config& config, dest::Site& site, source::SourceApi& source, SessionStore& store,
              MigrationLock& lock, PauseToken& token);

    // Fails with ConcurrencyConflict while another migration holds the lock, or when a
    // resumable session is already persisted.
    types::Session start(const types::SourceEndpoint& endpoint, const Options& options = {});

    // Re-enters the persisted session's phase. NotFound when nothing is persisted.
    types::Session resume(const Options& options = {});

    [[nodiscard]] const types::Session& session() const noexcept { return session_; }

private:
    types::Session drive();

    void scan();
    void transferDatabase();
    void transferFiles();
    void finalize();

    void enter(types::Phase phase);
    void persist();
    void checkpoint();
    void pauseHere();
    void cancelHere();
    void fail(util::ErrorCode code, const std::string& message);
    void record(util::ErrorCode code, const std::string& unit, const std::string& message);

    const config::Config& config_;
    dest::Site& site_;
    source::SourceApi& source_;
    SessionStore& store_;
    MigrationLock& lock_;
    PauseToken& token_;

    types::Session session_;
    Options options_;
};

}
