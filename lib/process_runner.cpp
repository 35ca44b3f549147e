#include "lib/process_runner.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace ProcessRunner {
    
    static const int EXEC_FAILED = 127;
    
    static void closeFd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
    
    // Restores the previous SIGPIPE disposition when the run is over, so a
    // child that exits before reading its stdin does not kill us.
    class SigpipeIgnorer {
    private:
        struct sigaction previous;
        
    public:
        SigpipeIgnorer() {
            struct sigaction ignore;
            memset(&ignore, 0, sizeof(ignore));
            ignore.sa_handler = SIG_IGN;
            sigemptyset(&ignore.sa_mask);
            sigaction(SIGPIPE, &ignore, &previous);
        }
        
        ~SigpipeIgnorer() {
            sigaction(SIGPIPE, &previous, nullptr);
        }
    };
    
    Result run(const Command& command) {
        if (command.argv.empty()) {
            throw InvalidArgumentError("Cannot run an empty command");
        }
        
        const std::string& tool = command.argv[0];
        Logs::debug("Running: " + formatCommand(command.argv) + 
                   (command.workingDirectory.empty() ? "" : " (in " + command.workingDirectory + ")"));
        
        int inPipe[2] = {-1, -1};
        int outPipe[2] = {-1, -1};
        
        if (pipe2(outPipe, O_CLOEXEC) < 0) {
            throw ProcessError(tool, -1, "pipe() failed: " + std::string(strerror(errno)));
        }
        if (command.hasInput && pipe2(inPipe, O_CLOEXEC) < 0) {
            int err = errno;
            closeFd(outPipe[0]);
            closeFd(outPipe[1]);
            throw ProcessError(tool, -1, "pipe() failed: " + std::string(strerror(err)));
        }
        
        std::vector<char*> argv;
        argv.reserve(command.argv.size() + 1);
        for (const auto& arg : command.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        
        SigpipeIgnorer sigpipeGuard;
        
        pid_t pid = fork();
        if (pid < 0) {
            int err = errno;
            closeFd(inPipe[0]);
            closeFd(inPipe[1]);
            closeFd(outPipe[0]);
            closeFd(outPipe[1]);
            throw ProcessError(tool, -1, "fork() failed: " + std::string(strerror(err)));
        }
        
        if (pid == 0) {
            // child: only async-signal-safe calls from here on
            if (command.hasInput) {
                dup2(inPipe[0], STDIN_FILENO);
            } else {
                int devNull = open("/dev/null", O_RDONLY);
                if (devNull >= 0) {
                    dup2(devNull, STDIN_FILENO);
                }
            }
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(outPipe[1], STDERR_FILENO);
            
            if (!command.workingDirectory.empty() && 
                chdir(command.workingDirectory.c_str()) != 0) {
                _exit(EXEC_FAILED);
            }
            
            execvp(argv[0], argv.data());
            _exit(EXEC_FAILED);
        }
        
        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        
        Result result;
        result.exitStatus = -1;
        
        size_t written = 0;
        if (command.hasInput && command.input.empty()) {
            closeFd(inPipe[1]);
        }
        
        char buffer[4096];
        bool outputOpen = true;
        
        while (outputOpen || inPipe[1] >= 0) {
            struct pollfd fds[2];
            nfds_t count = 0;
            int outIndex = -1;
            int inIndex = -1;
            
            if (outputOpen) {
                fds[count].fd = outPipe[0];
                fds[count].events = POLLIN;
                outIndex = static_cast<int>(count++);
            }
            if (inPipe[1] >= 0) {
                fds[count].fd = inPipe[1];
                fds[count].events = POLLOUT;
                inIndex = static_cast<int>(count++);
            }
            
            if (poll(fds, count, -1) < 0) {
                if (errno == EINTR) continue;
                break;
            }
            
            if (outIndex >= 0 && fds[outIndex].revents != 0) {
                ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
                if (n > 0) {
                    result.output.append(buffer, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    outputOpen = false;
                }
            }
            
            if (inIndex >= 0 && fds[inIndex].revents != 0) {
                if (fds[inIndex].revents & (POLLERR | POLLHUP)) {
                    closeFd(inPipe[1]);
                } else {
                    ssize_t n = write(inPipe[1], command.input.data() + written, 
                                      command.input.size() - written);
                    if (n > 0) {
                        written += static_cast<size_t>(n);
                    } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
                        closeFd(inPipe[1]);
                    }
                    if (written >= command.input.size()) {
                        // EOF tells the tool its path list is complete
                        closeFd(inPipe[1]);
                    }
                }
            }
        }
        
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        
        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw ProcessError(tool, -1, "waitpid() failed: " + std::string(strerror(errno)));
            }
        }
        
        if (WIFEXITED(status)) {
            result.exitStatus = WEXITSTATUS(status);
        }
        
        if (!result.output.empty()) {
            Logs::debug(tool + " output:\n" + result.output);
        }
        
        return result;
    }
    
    Result runChecked(const Command& command, const std::string& failureMessage) {
        Result result = run(command);
        
        if (result.exitStatus != 0) {
            if (!result.output.empty()) {
                Logs::error(command.argv[0] + " reported:\n" + result.output);
            }
            if (result.exitStatus == EXEC_FAILED) {
                throw ProcessError(command.argv[0], result.exitStatus, 
                                   failureMessage + ": cannot execute " + command.argv[0]);
            }
            throw ProcessError(command.argv[0], result.exitStatus, failureMessage);
        }
        
        return result;
    }
    
    std::string toolPath(const char* envVar, const std::string& fallback) {
        const char* value = std::getenv(envVar);
        if (value != nullptr && value[0] != '\0') {
            return value;
        }
        return fallback;
    }
    
    bool isAvailable(const std::string& tool) {
        if (tool.find('/') != std::string::npos) {
            return access(tool.c_str(), X_OK) == 0;
        }
        
        const char* path = std::getenv("PATH");
        if (path == nullptr) {
            return false;
        }
        
        std::stringstream dirs(path);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) dir = ".";
            std::string candidate = dir + "/" + tool;
            struct stat st;
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && 
                access(candidate.c_str(), X_OK) == 0) {
                return true;
            }
        }
        return false;
    }
    
    std::string formatCommand(const std::vector<std::string>& argv) {
        std::string line;
        for (const auto& arg : argv) {
            if (!line.empty()) line += " ";
            if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos) {
                line += "'" + arg + "'";
            } else {
                line += arg;
            }
        }
        return line;
    }
}
