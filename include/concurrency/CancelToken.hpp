#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace mg::concurrency {

// Thrown when the operator quits at a prompt or interrupts the process.
class Cancelled : public std::runtime_error {
public:
    enum class Reason { Quit, Interrupt };

    explicit Cancelled(Reason reason, const std::string& where = {});

    [[nodiscard]] Reason reason() const { return reason_; }

private:
    Reason reason_;
};

class CancelToken {
public:
    CancelToken();

    void cancel() const;
    [[nodiscard]] bool isCancelled() const;

    // Throws Cancelled(Interrupt) if a cancellation is pending
    void checkpoint(const std::string& phase) const;

    // Route SIGINT/SIGTERM into this token. Only one token can be bound at a time.
    static void bindSignals(const CancelToken& token);

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}
