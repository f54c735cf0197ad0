#pragma once

#include "iraw_source.h"

// Runs a command line through the system shell and captures stdout.
// On Windows, output that is not UTF-8 is converted from the console code
// page.
class CommandSource final : public IRawSource {
public:
    explicit CommandSource(std::string commandLine);

    std::string fetch() override;
    std::string describe() const override { return commandLine; }

private:
    std::string commandLine;
};
