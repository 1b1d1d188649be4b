#include "runtime/App.hpp"
#include "backup/BackupManager.hpp"
#include "paths/PathResolver.hpp"
#include "pkg/PackageManager.hpp"
#include "process/Runner.hpp"
#include "safety/SafetyValidator.hpp"
#include "sync/Executor.hpp"
#include "types/SyncError.hpp"
#include "ui/Prompter.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

using namespace mg::runtime;
using namespace mg::types;
using namespace mg::concurrency;
using namespace mg::logging;

namespace fs = std::filesystem;

App::App(config::EffectiveConfig config,
         ui::Prompter& prompter,
         process::Runner& runner,
         CancelToken cancel,
         Environment env,
         std::ostream& out)
    : config_(std::move(config)),
      prompter_(prompter),
      runner_(runner),
      cancel_(std::move(cancel)),
      env_(std::move(env)),
      out_(out) {
    record_ = {
        {"timestamp", util::getCurrentTimestamp()},
        {"dry_run", config_.dry_run},
        {"mode", to_string(config_.mode)},
    };
}

int App::run() {
    try {
        return execute();
    } catch (const Cancelled& e) {
        const bool interrupted = e.reason() == Cancelled::Reason::Interrupt || cancel_.isCancelled();
        if (!interrupted) {
            fmt::print(out_, "Exiting.\n");
            return finish(0, "quit");
        }
        fmt::print(out_, "\nAborted by user.\n");
        return finish(130, "aborted", e.what());
    } catch (const SyncError& e) {
        LogRegistry::mirrorguard()->error("[App] {}", e.what());
        if (e.isValidation()) fmt::print(out_, "Nothing was changed.\n");
        record_["error_kind"] = to_string(e.kind());
        return finish(1, "failed", e.what());
    } catch (const std::runtime_error& e) {
        // Filesystem and process failures outside the SyncError taxonomy
        LogRegistry::mirrorguard()->error("[App] {}", e.what());
        return finish(1, "failed", e.what());
    }
}

int App::execute() {
    const auto ctx = env_.privileges ? *env_.privileges : priv::PrivilegeContext::detect(config_.no_sudo);
    LogRegistry::priv()->debug("[App] root={} elevation={}", ctx.has_root,
                               ctx.elevation_command ? ctx.elevation_command->front() : "none");
    priv::PrivilegeBroker broker(ctx, runner_);

    if (config_.dry_run)
        fmt::print(out_, "DRY-RUN: nothing will be created, modified, deleted or installed.\n");

    const paths::PathResolver resolver(prompter_, broker, config_.dry_run);
    const auto src = resolveDirectory(resolver, "source", config_.src, false);
    const auto dst = resolveDestination(resolver, src);
    record_["source"] = src.string();
    record_["destination"] = dst.string();
    cancel_.checkpoint("validation");

    const auto backend = chooseBackend();
    record_["backend"] = toolName(backend);
    ensureTool(backend, broker);

    SyncRequest request{
        .source_path = src,
        .destination_path = dst,
        .mode = config_.mode,
        .backend = backend,
        .extra_args = config_.extraArgsFor(backend)
    };

    const backup::BackupManager backups(runner_, env_.backup_root);
    sync::Executor executor(std::move(request), config_, prompter_, broker, runner_, backups, cancel_, out_);
    const auto outcome = executor.run();

    recordOutcome(outcome);
    fmt::print(out_, "{}\n", outcome.message);
    if (outcome.state == sync::State::Failed || outcome.state == sync::State::Aborted) {
        if (outcome.backup.exists()) fmt::print(out_, "Previous data backed up to: {}\n", outcome.backup.location());
    }

    return finish(outcome.exit_code, to_string(outcome.state),
                  outcome.exit_code == 0 ? std::string{} : outcome.message);
}

fs::path App::resolveDirectory(const paths::PathResolver& resolver, const std::string& role,
                               const std::optional<std::string>& configured, const bool allowMissing) const {
    if (configured) return resolver.resolve(*configured, allowMissing);

    // Typed paths get another chance; configured ones fail fast
    while (true) {
        cancel_.checkpoint("path entry");

        const auto answer = prompter_.ask(fmt::format("Enter the {} directory path (q to quit)", role));
        if (!answer) throw Cancelled(Cancelled::Reason::Quit);
        if (answer->empty()) continue;

        try {
            return resolver.resolve(*answer, allowMissing);
        } catch (const SyncError& e) {
            if (e.kind() != ErrorKind::PathNotFound) throw;
            fmt::print(out_, "{}. Try again.\n", e.what());
        }
    }
}

fs::path App::resolveDestination(const paths::PathResolver& resolver, const fs::path& src) const {
    const safety::SafetyValidator validator(prompter_);

    // A missing destination is created only once the pair has passed every safety rule
    while (true) {
        const auto dst = resolveDirectory(resolver, "destination", config_.dst, true);
        validator.validate(src, dst);
        cancel_.checkpoint("validation");

        try {
            return resolver.materialize(dst);
        } catch (const SyncError& e) {
            if (config_.dst || e.kind() != ErrorKind::PathNotFound) throw;
            fmt::print(out_, "{}. Try again.\n", e.what());
        }
    }
}

Backend App::chooseBackend() const {
    if (config_.tool) return *config_.tool;

    while (true) {
        cancel_.checkpoint("backend selection");

        fmt::print(out_, "\nChoose copy method:\n"
                         "  1) cp     - plain copy (mirror mode empties the destination first)\n"
                         "  2) rsync  - delta sync\n"
                         "  3) rclone - sync, also to cloud remotes\n");
        const auto answer = prompter_.ask("Select [1-3] (default 1, q to quit)");
        if (!answer) throw Cancelled(Cancelled::Reason::Quit);
        if (answer->empty()) return Backend::Plain;
        if (const auto backend = parseBackend(*answer)) return *backend;
        fmt::print(out_, "Invalid choice '{}'.\n", *answer);
    }
}

void App::ensureTool(const Backend backend, priv::PrivilegeBroker& broker) {
    const auto provisioner = env_.provisioner
        ? env_.provisioner
        : std::make_shared<pkg::SystemToolProvisioner>(broker, runner_, prompter_);

    if (provisioner->isPresent(backend)) return;

    const auto tool = toolName(backend);
    if (config_.dry_run) {
        LogRegistry::pkg()->warn("[App] {} is not installed; a real run would offer to install it", tool);
        return;
    }

    if (!ui::confirmOrThrow(prompter_, fmt::format("{} is not installed. Install it now?", tool), true))
        throw SyncError(ErrorKind::BackendUnavailable, fmt::format("{} is required but not installed", tool));

    if (!provisioner->install(backend))
        throw SyncError(ErrorKind::BackendUnavailable, fmt::format("Failed to install {}", tool));

    LogRegistry::pkg()->info("[App] Installed {}", tool);
}

void App::recordOutcome(const sync::Outcome& outcome) {
    if (outcome.delta) {
        record_["source_files"] = outcome.delta->source_files.size();
        record_["source_bytes"] = outcome.delta->sourceBytes();
        record_["transfer_files"] = outcome.delta->transfer_files.size();
        record_["transfer_bytes"] = outcome.delta->transferBytes();
    }
    record_["backup"] = outcome.backup.location();
    if (outcome.backup.exists()) record_["backup_created_at"] = util::timestampToString(outcome.backup.created_at);
    if (outcome.backend_status) record_["backend_status"] = *outcome.backend_status;
    if (outcome.error) record_["error_kind"] = to_string(*outcome.error);
}

int App::finish(const int exitCode, const std::string& status, const std::string& error) {
    record_["status"] = status;
    record_["exit_code"] = exitCode;
    if (!error.empty()) record_["error"] = error;
    LogRegistry::writeRunRecord(record_);
    return exitCode;
}
