/**
 * remoteops process runner
 *
 * Runs a program with fork()/execv() and collects everything it writes to
 * stdout and stderr. Output is buffered in memory without a cap.
 */
#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

namespace remoteops::runtime {

// Result of a finished child process
struct ProcessResult {
    bool spawned = false;       // fork/exec succeeded
    int exit_code = -1;         // -1 when killed by a signal or never started
    int term_signal = 0;        // Signal that ended the child, if any
    std::string stdout_data;
    std::string stderr_data;
    std::string error;          // Spawn failure description

    bool success() const { return spawned && exit_code == 0 && term_signal == 0; }
};

class ProcessRunner {
public:
    // Run `program` (an explicit path, PATH is not searched) with `args`
    // and block until it exits.
    static ProcessResult run(const std::string& program,
                             const std::vector<std::string>& args = {});

    // Same, but resolve `program` through PATH (used for helper tools like curl)
    static ProcessResult run_tool(const std::string& program,
                                  const std::vector<std::string>& args = {});

private:
    static ProcessResult spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool search_path);
};

} // namespace remoteops::runtime
