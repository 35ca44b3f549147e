#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace ProcessRunner {
    
    struct Command {
        std::vector<std::string> argv;
        std::string workingDirectory;   // empty: inherit
        std::string input;              // written to stdin when hasInput is set
        bool hasInput = false;
    };
    
    struct Result {
        int exitStatus;                 // -1 when killed by a signal
        std::string output;             // stdout and stderr, interleaved
    };
    
    // Blocks until the child exits. There is no timeout: a hung tool hangs
    // the caller. Throws ProcessError only when the child cannot be spawned.
    Result run(const Command& command);
    
    // run() that throws ProcessError(failureMessage) on a non-zero exit.
    Result runChecked(const Command& command, const std::string& failureMessage);
    
    // Tool binary to invoke: $envVar when set and non-empty, else fallback.
    std::string toolPath(const char* envVar, const std::string& fallback);
    
    bool isAvailable(const std::string& tool);
    
    std::string formatCommand(const std::vector<std::string>& argv);
}

#endif // PROCESS_RUNNER_HPP
