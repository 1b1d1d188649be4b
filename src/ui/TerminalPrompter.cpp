#include "ui/Prompter.hpp"
#include "concurrency/CancelToken.hpp"
#include "process/Runner.hpp"
#include "util/files.hpp"

#include <boost/algorithm/string.hpp>

#include <unistd.h>

using namespace mg::ui;
using namespace mg::concurrency;

namespace {
bool isQuit(const std::string& answer) {
    return answer == "q" || answer == "quit" || answer == "exit";
}
}

TerminalPrompter::TerminalPrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

Answer TerminalPrompter::confirm(const std::string& question, const bool defaultYes) {
    while (true) {
        out_ << question << (defaultYes ? " (Y/n): " : " (y/N): ") << std::flush;

        std::string answer;
        if (!std::getline(in_, answer)) {
            out_ << '\n';
            return Answer::Cancelled;
        }

        boost::algorithm::trim(answer);
        boost::algorithm::to_lower(answer);
        if (answer.empty()) return defaultYes ? Answer::Yes : Answer::No;

        if (answer == "y" || answer == "yes") return Answer::Yes;
        if (answer == "n" || answer == "no") return Answer::No;
        if (isQuit(answer)) return Answer::Cancelled;
        out_ << "Choose Y or N" << std::endl;
    }
}

std::optional<std::string> TerminalPrompter::ask(const std::string& question) {
    out_ << question << ": " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << '\n';
        return std::nullopt;
    }
    boost::algorithm::trim(answer);
    if (isQuit(boost::algorithm::to_lower_copy(answer))) return std::nullopt;
    return answer;
}

void TerminalPrompter::show(const std::string& text) {
    // Page through less when stdout is a terminal
    if (isatty(STDOUT_FILENO) && util::findExecutable("less")) {
        process::Command pager("less");
        pager.arg("-R");
        if (process::pipeTo(pager, text) != 127) return;
    }
    out_ << text << std::flush;
}

bool mg::ui::confirmOrThrow(Prompter& prompter, const std::string& question, const bool defaultYes) {
    const auto answer = prompter.confirm(question, defaultYes);
    if (answer == Answer::Cancelled) throw Cancelled(Cancelled::Reason::Quit);
    return answer == Answer::Yes;
}
