#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

namespace kw::util {

struct ProcessResult {
    int exitCode = -1;
    std::string output; // captured stdout
    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

// Runs an executable (PATH lookup applies), captures stdout and waits for exit.
ProcessResult runAndCapture(const std::string& executable, const std::vector<std::string>& args = {});

// Runs an executable with inherited stdio and waits for it to exit.
int runAndWait(const std::string& executable, const std::vector<std::string>& args = {});

// Starts an executable and returns without waiting.
pid_t spawn(const std::string& executable, const std::vector<std::string>& args = {});

}
