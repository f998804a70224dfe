#include "cli/commands.hpp"
#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "config/ConfigRegistry.hpp"
#include "db/Engine.hpp"
#include "dest/SettingsStore.hpp"
#include "dest/Site.hpp"
#include "protocols/Command.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "source/HttpClient.hpp"
#include "source/Provider.hpp"
#include "sync/Migration.hpp"
#include "sync/MigrationLock.hpp"
#include "sync/PauseToken.hpp"
#include "sync/SessionStore.hpp"
#include "sync/SnapshotStore.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <cstring>
#include <exception>
#include <thread>
#include <sys/types.h>
#include <unistd.h>

using namespace sm::config;
using namespace sm::logging;
using namespace sm::util;
using namespace std::chrono_literals;

namespace sm::cli {

namespace {

std::atomic<bool> stopRequested = false;
std::atomic<bool> pauseRequested = false;
std::atomic<bool> resumeRequested = false;
std::atomic<bool> cancelRequested = false;

// SIGINT/SIGTERM suspend, SIGUSR1 pauses in place, SIGCONT resumes, SIGUSR2 cancels.
void signalHandler(const int signum) {
    switch (signum) {
        case SIGINT:
        case SIGTERM: stopRequested = true; break;
        case SIGUSR1: pauseRequested = true; break;
        case SIGCONT: resumeRequested = true; break;
        case SIGUSR2: cancelRequested = true; break;
        default: break;
    }
}

constexpr int CONTROL_SIGNALS[] = {SIGINT, SIGTERM, SIGUSR1, SIGUSR2, SIGCONT};

// Destination-side objects, built once per command.
struct Services {
    const Config& config;
    std::unique_ptr<db::Engine> engine;
    dest::SettingsStore settings;
    sync::SnapshotStore snapshots;
    dest::Site site;

    explicit Services(const Config& cfg)
        : config(cfg),
          engine(db::openEngine(cfg.database)),
          settings(cfg.site.settingsFile()),
          snapshots(cfg.site.snapshotDir(), cfg.transfer.snapshot_ttl),
          site(cfg, *engine, settings, snapshots) {}
};

CommandResult runCommand(dest::Site& site, const protocols::Command& cmd,
                         const std::function<std::string(const nlohmann::json&)>& render = {}) {
    const auto res = protocols::dispatch(site, cmd);
    if (!res.at("success").get<bool>()) {
        const auto& err = res.at("error");
        return failed(fmt::format("{}: {}\n", err.at("code").get<std::string>(), err.at("message").get<std::string>()));
    }
    return ok(render ? render(res.at("data")) : res.at("data").dump(2) + "\n");
}

std::string describe(const types::Session& s) {
    std::string out = fmt::format("session {}: {}", s.id, types::to_string(s.phase));
    if (s.phase == types::Phase::Paused || s.phase == types::Phase::Error)
        out += fmt::format(" (in {})", types::to_string(s.resumePhase));
    out += fmt::format("\n  tables {}/{}, rows {} (+{} duplicate, {} skipped)\n", s.databaseCursor.currentTableIndex,
                       s.totalTables, s.stats.rowsTransferred, s.stats.rowsDuplicate, s.stats.rowsSkipped);
    out += fmt::format("  files {}/{} ({} failed), {} bytes, {} retries\n", s.stats.filesTransferred, s.totalFiles,
                       s.stats.filesFailed, s.stats.bytesTransferred, s.stats.retryCount);
    if (!s.lastError.empty()) out += fmt::format("  last error: {}\n", s.lastError);
    return out;
}

// Runs the migration on a worker thread while this thread turns signals into token state.
types::Session runControlled(sync::PauseToken& token, const std::function<types::Session()>& fn) {
    stopRequested = pauseRequested = resumeRequested = cancelRequested = false;
    for (const int sig : CONTROL_SIGNALS) std::signal(sig, signalHandler);

    std::atomic<bool> finished = false;
    types::Session result;
    std::exception_ptr error;

    std::thread worker([&] {
        try {
            result = fn();
        } catch (...) {
            error = std::current_exception();
        }
        finished = true;
    });

    while (!finished) {
        if (stopRequested.exchange(false)) {
            LogRegistry::sitemigrate()->info("[cli] Stop requested, suspending at the next checkpoint");
            token.stop();
        }
        if (pauseRequested.exchange(false)) token.pause();
        if (resumeRequested.exchange(false)) token.resume();
        if (cancelRequested.exchange(false)) token.cancel();
        std::this_thread::sleep_for(200ms);
    }

    worker.join();
    for (const int sig : CONTROL_SIGNALS) std::signal(sig, SIG_DFL);

    if (error) std::rethrow_exception(error);
    return result;
}

CommandResult report(const types::Session& s) {
    switch (s.phase) {
        case types::Phase::Complete:
            return ok(describe(s));
        case types::Phase::Paused:
            return ok(describe(s) + "Run `sitemigrate resume` to continue.\n");
        case types::Phase::Cancelled:
            return ok(describe(s));
        default:
            return {1, describe(s), fmt::format("migration stopped: {}\n", s.lastError)};
    }
}

sync::Migration::Options migrationOptions(const CommandCall& call) {
    sync::Migration::Options o;
    o.overwrite = !hasFlag(call, "keep-existing");
    if (const auto op = optVal(call, "operator"); op && !op->empty()) o.operatorLogin = *op;
    return o;
}

std::unique_ptr<source::HttpClient> makeClient(const Config& cfg, const types::SourceEndpoint& endpoint) {
    auto client = std::make_unique<source::HttpClient>(endpoint.url, endpoint.secret, cfg.transfer);
    client->setOrigin(url_origin(cfg.site.home()));
    return client;
}

pid_t liveHolderPid(const Config& cfg) {
    const auto holder = sync::MigrationLock::holder(cfg.site.lockFile());
    return holder ? holder->pid : 0;
}

CommandResult signalHolder(const Config& cfg, const int sig, const std::string& what) {
    const auto pid = liveHolderPid(cfg);
    if (pid == 0) return failed("no migration is running\n");
    if (::kill(pid, sig) != 0) return failed(fmt::format("could not signal process {}: {}\n", pid, std::strerror(errno)));
    LogRegistry::audit()->info("[cli] {} requested for migration process {}", what, pid);
    return ok(fmt::format("{} requested for migration process {}\n", what, pid));
}

CommandResult serve(const CommandCall&) {
    namespace net = boost::asio;
    const auto& cfg = ConfigRegistry::get();

    auto engine = db::openEngine(cfg.database);
    dest::SettingsStore settings(cfg.site.settingsFile());

    if (settings.effectiveMode(cfg.site.mode) != SiteMode::Source)
        return failed("this site is not in source mode; run `sitemigrate mode source` first\n");
    if (settings.get().migrationSecret.empty())
        return failed("no migration secret; run `sitemigrate keygen` first\n");

    source::Provider provider(cfg, *engine, settings);

    net::io_context ioc{1};
    const protocols::http::tcp::endpoint endpoint{net::ip::make_address(cfg.server.host), cfg.server.port};
    auto server = std::make_shared<protocols::http::Server>(
        ioc, endpoint, std::make_shared<protocols::http::Router>(provider), cfg.server.max_body_bytes);
    server->run();

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, const int signum) {
        if (ec) return;
        LogRegistry::sitemigrate()->info("[!] Signal {} received. Shutting down gracefully...", signum);
        server->stop();
        ioc.stop();
    });

    ioc.run();
    return ok("");
}

CommandResult migrate(const CommandCall& call) {
    const auto& cfg = ConfigRegistry::get();
    Services svc(cfg);

    if (svc.settings.effectiveMode(cfg.site.mode) != SiteMode::Destination)
        return failed("this site is not in destination mode; run `sitemigrate mode destination` first\n");

    const auto key = svc.site.loadConnection();
    if (key.empty()) return failed("no saved connection; run `sitemigrate connect <key>` first\n");
    const auto endpoint = dest::Site::parseConnection(key);

    auto client = makeClient(cfg, endpoint);
    sync::SessionStore store(cfg.site.sessionFile());
    sync::MigrationLock lock(cfg.site.lockFile(), cfg.transfer.lock_timeout);
    sync::PauseToken token;
    sync::Migration migration(cfg, svc.site, *client, store, lock, token);

    const auto options = migrationOptions(call);
    return report(runControlled(token, [&] { return migration.start(endpoint, options); }));
}

CommandResult resume(const CommandCall& call) {
    const auto& cfg = ConfigRegistry::get();

    // A migration paused in place is still running in another process.
    if (const auto pid = liveHolderPid(cfg); pid != 0 && pid != ::getpid())
        return signalHolder(cfg, SIGCONT, "Resume");

    Services svc(cfg);
    sync::SessionStore store(cfg.site.sessionFile());

    auto session = store.load();
    if (!session) return failed("no migration session to resume\n");

    // Older sessions carry no secret; take it from the saved connection.
    if (session->source.secret.empty()) {
        const auto key = svc.site.loadConnection();
        if (key.empty()) return failed("the session has no secret and no connection is saved\n");
        const auto saved = dest::Site::parseConnection(key);
        if (!session->source.url.empty() && saved.url != session->source.url)
            return failed(fmt::format("saved connection points at {}, the session at {}\n", saved.url,
                                      session->source.url));
        session->source = saved;
        store.save(*session);
    }

    auto client = makeClient(cfg, session->source);
    sync::MigrationLock lock(cfg.site.lockFile(), cfg.transfer.lock_timeout);
    sync::PauseToken token;
    sync::Migration migration(cfg, svc.site, *client, store, lock, token);

    const auto options = migrationOptions(call);
    return report(runControlled(token, [&] { return migration.resume(options); }));
}

CommandResult cancel(const CommandCall&) {
    const auto& cfg = ConfigRegistry::get();
    if (liveHolderPid(cfg) != 0) return signalHolder(cfg, SIGUSR2, "Cancel");

    const sync::SessionStore store(cfg.site.sessionFile());
    if (!store.exists()) return ok("no migration session\n");
    store.clear();
    LogRegistry::audit()->info("[cli] Persisted migration session cleared");
    return ok("persisted migration session cleared\n");
}

CommandResult status(const CommandCall& call) {
    const auto& cfg = ConfigRegistry::get();
    const sync::SessionStore store(cfg.site.sessionFile());

    std::string out;
    if (const auto holder = sync::MigrationLock::holder(cfg.site.lockFile()))
        out += fmt::format("running: pid {} on {}, lock expires {}\n", holder->pid, holder->host,
                           timestampToString(holder->expiresAt));

    const auto session = store.load();
    if (!session) return ok(out + "no migration session\n");
    if (hasFlag(call, "json")) return ok(out + nlohmann::json(*session).dump(2) + "\n");
    return ok(out + describe(*session));
}

}

void registerCommands(Router& router) {
    router.registerCommand("serve", "serve", "Serve this site's content to destinations (source mode)", serve);

    router.registerCommand("mode", "mode <none|source|destination>", "Set the site mode",
        [](const CommandCall& call) {
            if (call.positionals.size() != 1) return invalid("usage: sitemigrate mode <none|source|destination>\n");
            Services svc(ConfigRegistry::get());
            return runCommand(svc.site, protocols::parseCommand({{"action", "set_mode"}, {"mode", call.positionals[0]}}));
        });

    router.registerCommand("keygen", "keygen", "Generate a new migration secret and print the connection key",
        [](const CommandCall&) {
            Services svc(ConfigRegistry::get());
            return runCommand(svc.site, protocols::command::RegenerateSecret{}, [](const nlohmann::json& d) {
                return d.at("key").get<std::string>() + "\n";
            });
        });

    router.registerCommand("connect", "connect <key>", "Save the connection key of a source site",
        [](const CommandCall& call) {
            if (call.positionals.size() != 1) return invalid("usage: sitemigrate connect <url|secret>\n");
            Services svc(ConfigRegistry::get());
            return runCommand(svc.site, protocols::command::SaveConnection{call.positionals[0]},
                              [](const nlohmann::json& d) {
                                  return fmt::format("connected to {}\n", d.at("source_url").get<std::string>());
                              });
        });

    router.registerCommand("migrate", "migrate [--operator <login>] [--keep-existing]",
                           "Start a migration from the connected source", migrate);
    router.registerCommand("resume", "resume [--operator <login>] [--keep-existing]",
                           "Resume a paused or failed migration", resume);

    router.registerCommand("pause", "pause", "Pause the running migration in place",
        [](const CommandCall&) { return signalHolder(ConfigRegistry::get(), SIGUSR1, "Pause"); });

    router.registerCommand("cancel", "cancel", "Cancel the running migration, or clear a persisted one", cancel);
    router.registerCommand("status", "status [--json]", "Show the migration session", status);

    router.registerCommand("search-replace", "search-replace [--from <url>] [--to <url>]",
                           "Rewrite URLs in the destination's content tables",
        [](const CommandCall& call) {
            Services svc(ConfigRegistry::get());
            return runCommand(svc.site, protocols::command::SearchReplace{optVal(call, "from").value_or(""),
                                                                          optVal(call, "to").value_or("")});
        });

    router.registerCommand("command", "command '<json>'", "Run one destination command, e.g. {\"action\":\"get_config\"}",
        [](const CommandCall& call) {
            if (call.positionals.size() != 1) return invalid("usage: sitemigrate command '<json>'\n");
            const auto j = nlohmann::json::parse(call.positionals[0], nullptr, false);
            if (j.is_discarded()) return invalid("command must be a JSON object\n");
            Services svc(ConfigRegistry::get());
            return runCommand(svc.site, protocols::parseCommand(j));
        });
}

}
