#include "sync/Executor.hpp"
#include "config/Config.hpp"
#include "backup/BackupManager.hpp"
#include "priv/PrivilegeBroker.hpp"
#include "process/Runner.hpp"
#include "safety/SafetyValidator.hpp"
#include "types/SyncError.hpp"
#include "ui/Prompter.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

using namespace mg::sync;
using namespace mg::types;
using namespace mg::concurrency;
using namespace mg::preview;
using namespace mg::logging;

std::string mg::sync::to_string(const State state) {
    switch (state) {
    case State::Validated: return "validated";
    case State::Previewed: return "previewed";
    case State::BackedUp: return "backed_up";
    case State::Executing: return "executing";
    case State::Done: return "done";
    case State::Failed: return "failed";
    case State::Aborted: return "aborted";
    }
    return "unknown";
}

Executor::Executor(SyncRequest request,
                   const config::EffectiveConfig& config,
                   ui::Prompter& prompter,
                   priv::PrivilegeBroker& broker,
                   process::Runner& runner,
                   const backup::BackupManager& backups,
                   CancelToken cancel,
                   std::ostream& out)
    : request_(std::move(request)),
      config_(config),
      prompter_(prompter),
      broker_(broker),
      runner_(runner),
      backups_(backups),
      cancel_(std::move(cancel)),
      out_(out),
      backend_(makeBackend(request_.backend)) {
    // The request may have been built by hand; never dispatch a pair the validator would reject
    if (const auto violation = safety::checkStructuralRules(request_.source_path, request_.destination_path))
        throw SyncError(violation->kind, violation->message);
}

Outcome Executor::run() {
    Outcome outcome;

    try {
        if (!preview(outcome)) {
            transition(State::Aborted);
            outcome.message = "Cancelled by operator; nothing was changed";
            outcome.exit_code = 0;
        } else if (config_.dry_run) {
            outcome.message = "DRY-RUN: no changes made";
            outcome.exit_code = 0;
        } else {
            backup(outcome);
            execute(outcome);
            transition(State::Done);
            outcome.message = fmt::format("The task was completed successfully. Previous data backed up to: {}",
                                          outcome.backup.location());
            outcome.exit_code = 0;
        }
    } catch (const Cancelled& e) {
        transition(State::Aborted);
        const bool interrupted = e.reason() == Cancelled::Reason::Interrupt || cancel_.isCancelled();
        outcome.exit_code = interrupted ? 130 : 0;
        outcome.message = interrupted && e.reason() == Cancelled::Reason::Quit
                              ? Cancelled(Cancelled::Reason::Interrupt).what()
                              : e.what();
        LogRegistry::sync()->warn("[Executor] {}", outcome.message);
    } catch (const SyncError& e) {
        transition(State::Failed);
        outcome.exit_code = 1;
        outcome.error = e.kind();
        outcome.message = e.what();
        LogRegistry::sync()->error("[Executor] {}: {}", types::to_string(e.kind()), e.what());
    } catch (const std::runtime_error& e) {
        transition(State::Failed);
        outcome.exit_code = 1;
        outcome.message = e.what();
        LogRegistry::sync()->error("[Executor] {}", e.what());
    }

    if (state_ == State::Failed || state_ == State::Aborted)
        LogRegistry::sync()->info("[Executor] Backup location: {}", outcome.backup.location());

    outcome.state = state_;
    return outcome;
}

bool Executor::preview(Outcome& outcome) {
    cancel_.checkpoint("preview");

    const bool skipped = config_.skips(config::SKIP_PREVIEW) && !config_.dry_run;
    if (skipped) LogRegistry::preview()->debug("[Executor] Preview skipped by configuration");

    if (!skipped && (config_.dry_run || ui::confirmOrThrow(prompter_, "Preview copy plan first?", true))) {
        auto delta = previewEngine_.compute(request_);
        cancel_.checkpoint("preview");

        DeltaPreviewEngine::printSummary(out_, delta);
        if (!delta.transfer_files.empty() &&
            ui::confirmOrThrow(prompter_, "Show the list of files to transfer?", false))
            prompter_.show(DeltaPreviewEngine::transferList(delta));

        outcome.delta = std::move(delta);
    }

    if (config_.dry_run) {
        transition(State::Previewed);
        return true;
    }

    if (!ui::confirmOrThrow(prompter_, "Proceed with copy?", true)) return false;
    transition(State::Previewed);
    return true;
}

void Executor::backup(Outcome& outcome) {
    cancel_.checkpoint("backup");

    if (config_.skips(config::SKIP_BACKUP)) {
        LogRegistry::backup()->warn("[Executor] Backup skipped; changes to {} cannot be undone",
                                    request_.destination_path.string());
    } else {
        outcome.backup = backups_.snapshot(request_.destination_path);
        if (outcome.backup.exists())
            fmt::print(out_, "Backup created at: {}\n", outcome.backup.location());
    }

    transition(State::BackedUp);
}

void Executor::execute(Outcome& outcome) {
    cancel_.checkpoint("sync");
    transition(State::Executing);

    LogRegistry::sync()->info("[Executor] {} {} -> {} with {}", to_string(request_.mode),
                              request_.source_path.string(), request_.destination_path.string(),
                              toolName(request_.backend));

    const int rc = backend_->execute(request_, broker_, runner_);
    outcome.backend_status = rc;

    // The child shares our process group, so an interrupt usually also shows up as its exit status
    cancel_.checkpoint("sync");

    if (rc != 0)
        throw SyncError(ErrorKind::BackendExecutionFailed,
                        fmt::format("{} exited with status {}", toolName(request_.backend), rc));
}

void Executor::transition(const State next) {
    LogRegistry::sync()->debug("[Executor] {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}
