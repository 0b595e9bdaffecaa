#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace blossom {

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;

    bool succeeded() const { return !timed_out && exit_code == 0; }
};

// Spawns external programs. argv[0] is the program path; no shell is involved.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;
};

// fork/exec implementation. stdout and stderr are drained concurrently through
// poll() so a chatty child cannot deadlock on a full pipe. On timeout the
// child is killed and reaped.
class SubprocessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override;
};

// Joins argv for log lines.
std::string describe_command(const std::vector<std::string>& argv);

} // namespace blossom
