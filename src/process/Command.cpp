#include "process/Command.hpp"
#include "types/SyncError.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

using namespace mg::process;
using namespace mg::types;

Command::Command(std::string program) { argv_.push_back(std::move(program)); }

Command& Command::arg(std::string a) {
    argv_.push_back(std::move(a));
    return *this;
}

Command& Command::args(const std::vector<std::string>& a) {
    argv_.insert(argv_.end(), a.begin(), a.end());
    return *this;
}

Command& Command::endOfOptions() {
    argv_.emplace_back("--");
    operandsAt_ = static_cast<std::ptrdiff_t>(argv_.size());
    return *this;
}

Command& Command::operand(const std::filesystem::path& p) { return operand(p.string()); }

Command& Command::operand(std::string p) {
    argv_.push_back(std::move(p));
    return *this;
}

Command Command::wrappedWith(const std::vector<std::string>& prefix) const {
    if (prefix.empty()) return *this;

    Command wrapped(prefix.front());
    wrapped.argv_.insert(wrapped.argv_.end(), prefix.begin() + 1, prefix.end());
    const auto shift = static_cast<std::ptrdiff_t>(wrapped.argv_.size());
    wrapped.argv_.insert(wrapped.argv_.end(), argv_.begin(), argv_.end());
    wrapped.operandsAt_ = operandsAt_ < 0 ? -1 : operandsAt_ + shift;
    return wrapped;
}

void Command::validate() const {
    if (argv_.empty() || argv_.front().empty())
        throw SyncError(ErrorKind::InvalidArgument, "Command has no program");

    const auto optionsEnd = operandsAt_ < 0 ? static_cast<std::ptrdiff_t>(argv_.size()) : operandsAt_ - 1;
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(argv_.size()); ++i) {
        const auto& a = argv_[static_cast<size_t>(i)];
        if (a.empty())
            throw SyncError(ErrorKind::InvalidArgument, "Empty argument in command: " + display());
        if (a.find('\0') != std::string::npos)
            throw SyncError(ErrorKind::InvalidArgument, "NUL byte in argument of command: " + argv_.front());
        if (a == "--" && i > 0 && i < optionsEnd)
            throw SyncError(ErrorKind::InvalidArgument, "Unexpected '--' among options of: " + display());
    }
}

std::string Command::display() const {
    std::string out;
    for (const auto& a : argv_) {
        if (!out.empty()) out += ' ';
        const bool plain = !a.empty() && std::ranges::all_of(a, [](const char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || std::string_view("-_./=:,+@%").find(c) != std::string_view::npos;
        });
        if (plain) {
            out += a;
            continue;
        }
        out += '\'';
        for (const char c : a) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += '\'';
    }
    return out;
}
