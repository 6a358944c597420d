#include <spdlog/spdlog.h>
#include <mediacat/core/process.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace mediacat {

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

Result<ProcessOutput> runProcess(const std::vector<std::string>& argv) {
    if (argv.empty())
        return Error{ErrorCode::InvalidArgument, "Empty command line"};

    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty())
            cmd += ' ';
        cmd += shellQuote(arg);
    }
    cmd += " 2>/dev/null";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return Error{ErrorCode::ExternalToolFailed, "Failed to start " + argv.front()};
    }

    ProcessOutput output;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.stdoutText.append(buffer, n);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        return Error{ErrorCode::ExternalToolFailed, "Failed to wait for " + argv.front()};
    }
    output.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (output.exitCode != 0) {
        return Error{ErrorCode::ExternalToolFailed,
                     argv.front() + " exited with status " + std::to_string(output.exitCode)};
    }
    return output;
}

bool toolAvailable(const std::string& tool) {
    namespace fs = std::filesystem;
    if (tool.find('/') != std::string::npos)
        return ::access(tool.c_str(), X_OK) == 0;

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return false;

    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty())
            continue;
        fs::path candidate = fs::path(dir) / tool;
        if (::access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

} // namespace mediacat
