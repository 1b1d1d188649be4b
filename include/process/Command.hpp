#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mg::process {

// argv list for a child process. Never passed through a shell.
class Command {
public:
    explicit Command(std::string program);

    Command& arg(std::string a);
    Command& args(const std::vector<std::string>& a);

    // Emits "--"; everything appended after it is an operand
    Command& endOfOptions();
    Command& operand(const std::filesystem::path& p);
    Command& operand(std::string p);

    // Same command run through an elevation prefix such as {"sudo"}
    [[nodiscard]] Command wrappedWith(const std::vector<std::string>& prefix) const;

    // Throws SyncError(InvalidArgument) on an empty program, empty or NUL-carrying args,
    // or a user supplied "--" before the operand separator
    void validate() const;

    [[nodiscard]] const std::string& program() const { return argv_.front(); }
    [[nodiscard]] const std::vector<std::string>& argv() const { return argv_; }

    // Quoted, human readable rendering for logs
    [[nodiscard]] std::string display() const;

private:
    std::vector<std::string> argv_;
    std::ptrdiff_t operandsAt_{-1};
};

}
