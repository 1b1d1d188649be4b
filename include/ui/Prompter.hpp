#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace mg::ui {

enum class Answer { Yes, No, Cancelled };

// Interactive confirmation capability. Cancelled means the operator asked to quit
// (or input ended); callers turn it into a concurrency::Cancelled.
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual Answer confirm(const std::string& question, bool defaultYes) = 0;

    // Free-form line; std::nullopt when the operator quits
    virtual std::optional<std::string> ask(const std::string& question) = 0;

    // Shows the lines (e.g. a file list), paged when attached to a terminal
    virtual void show(const std::string& text) = 0;
};

class TerminalPrompter : public Prompter {
public:
    TerminalPrompter(std::istream& in, std::ostream& out);

    Answer confirm(const std::string& question, bool defaultYes) override;
    std::optional<std::string> ask(const std::string& question) override;
    void show(const std::string& text) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

// Throws concurrency::Cancelled(Quit) for Answer::Cancelled, otherwise returns Yes as true
bool confirmOrThrow(Prompter& prompter, const std::string& question, bool defaultYes);

}
