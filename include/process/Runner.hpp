#pragma once

#include "process/Command.hpp"

#include <string>

namespace mg::process {

class Runner {
public:
    virtual ~Runner() = default;

    // Runs to completion with inherited stdio. Returns the exit status,
    // 128 + signal number if the child was killed, 127 if exec failed.
    virtual int run(const Command& cmd) = 0;
};

class ForkExecRunner : public Runner {
public:
    int run(const Command& cmd) override;
};

// Runs `cmd` with `input` on its stdin (stdout and stderr inherited), e.g. a pager.
// A reader that exits early is not an error. Same status convention as Runner::run.
int pipeTo(const Command& cmd, const std::string& input);

}
