#pragma once

#include <string>
#include <vector>
#include <mediacat/core/types.h>

namespace mediacat {

struct ProcessOutput {
    int exitCode = -1;
    std::string stdoutText;
};

/**
 * @brief Quote one argument for /bin/sh using single quotes
 */
std::string shellQuote(const std::string& arg);

/**
 * @brief Run a command line through popen and capture stdout
 *
 * stderr is discarded. Fails with ExternalToolFailed when the process cannot be started or
 * exits non-zero.
 */
Result<ProcessOutput> runProcess(const std::vector<std::string>& argv);

// True when `tool` resolves to an executable via PATH (or is an executable path itself)
bool toolAvailable(const std::string& tool);

} // namespace mediacat
