#pragma once

#include "sync/Backend.hpp"
#include "types/BackupRecord.hpp"
#include "types/FileRecord.hpp"
#include "types/SyncError.hpp"
#include "types/SyncRequest.hpp"
#include "concurrency/CancelToken.hpp"
#include "preview/DeltaPreview.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace mg::config {
struct EffectiveConfig;
}

namespace mg::ui {
class Prompter;
}

namespace mg::priv {
class PrivilegeBroker;
}

namespace mg::process {
class Runner;
}

namespace mg::backup {
class BackupManager;
}

namespace mg::sync {

enum class State { Validated, Previewed, BackedUp, Executing, Done, Failed, Aborted };

std::string to_string(State state);

struct Outcome {
    State state{State::Validated};
    std::optional<types::DeltaSet> delta;
    types::BackupRecord backup;
    std::optional<int> backend_status;
    int exit_code{0};
    std::string message;
    std::optional<types::ErrorKind> error;
};

// Runs one validated request through preview, backup and the backend. Every phase
// boundary is a cancellation checkpoint; nothing is rolled back on failure.
class Executor {
public:
    Executor(types::SyncRequest request,
             const config::EffectiveConfig& config,
             ui::Prompter& prompter,
             priv::PrivilegeBroker& broker,
             process::Runner& runner,
             const backup::BackupManager& backups,
             concurrency::CancelToken cancel,
             std::ostream& out = std::cout);

    // Failures and cancellations end up in the outcome, never thrown
    Outcome run();

    [[nodiscard]] State state() const { return state_; }

private:
    types::SyncRequest request_;
    const config::EffectiveConfig& config_;
    ui::Prompter& prompter_;
    priv::PrivilegeBroker& broker_;
    process::Runner& runner_;
    const backup::BackupManager& backups_;
    concurrency::CancelToken cancel_;
    std::ostream& out_;
    std::unique_ptr<Backend> backend_;
    preview::DeltaPreviewEngine previewEngine_;
    State state_{State::Validated};

    // False when the operator declines to proceed
    bool preview(Outcome& outcome);
    void backup(Outcome& outcome);
    void execute(Outcome& outcome);

    void transition(State next);
};

}
