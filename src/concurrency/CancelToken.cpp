#include "concurrency/CancelToken.hpp"

#include <csignal>

using namespace mg::concurrency;

namespace {
// The handler can only reach state through statics; boundFlag keeps the target alive.
std::shared_ptr<std::atomic<bool>> boundFlag;
std::atomic<bool>* volatile signalTarget = nullptr;

void onInterrupt(int) {
    if (auto* target = signalTarget) target->store(true);
}
}

Cancelled::Cancelled(const Reason reason, const std::string& where)
    : std::runtime_error(reason == Reason::Quit
                             ? "Exiting at operator request"
                             : "Aborted by user" + (where.empty() ? std::string{} : " during " + where)),
      reason_(reason) {}

CancelToken::CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancelToken::cancel() const { flag_->store(true); }

bool CancelToken::isCancelled() const { return flag_->load(); }

void CancelToken::checkpoint(const std::string& phase) const {
    if (isCancelled()) throw Cancelled(Cancelled::Reason::Interrupt, phase);
}

void CancelToken::bindSignals(const CancelToken& token) {
    boundFlag = token.flag_;
    signalTarget = boundFlag.get();

    // No SA_RESTART: a blocked prompt read returns so the interrupt is seen promptly
    struct sigaction sa{};
    sa.sa_handler = onInterrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}
