#include "lib/errors.hpp"
#include "utils/logs.hpp"

InjectISOException::InjectISOException(const std::string& msg) : message(msg) {}

const char* InjectISOException::what() const noexcept {
    return message.c_str();
}

NotFoundError::NotFoundError(const std::string& path, const std::string& cause)
    : InjectISOException(cause + ": '" + path + "'") {}

NotADirectoryError::NotADirectoryError(const std::string& path, const std::string& cause)
    : InjectISOException(cause + ": '" + path + "'") {}

AlreadyExistsError::AlreadyExistsError(const std::string& path, const std::string& cause)
    : InjectISOException(cause + ": '" + path + "'") {}

InvalidFormatError::InvalidFormatError(const std::string& path, const std::string& cause)
    : InjectISOException(cause + ": '" + path + "'") {}

InvalidArgumentError::InvalidArgumentError(const std::string& msg)
    : InjectISOException(msg) {}

ProcessError::ProcessError(const std::string& tool, int status, const std::string& cause)
    : InjectISOException(cause + " (" + tool + " exited with status " + std::to_string(status) + ")"),
      tool(tool), status(status) {}

FilesystemError::FilesystemError(const std::string& msg)
    : InjectISOException("Filesystem error: " + msg) {}

namespace ErrorHandler {
    int exitCodeFor(const std::exception& e) {
        if (dynamic_cast<const InvalidArgumentError*>(&e) != nullptr) {
            return 2;
        }
        return 1;
    }
    
    void reportFatalError(const std::exception& e) {
        if (dynamic_cast<const ProcessError*>(&e) != nullptr) {
            Logs::fatal("External tool failed: " + std::string(e.what()));
        } else if (dynamic_cast<const InjectISOException*>(&e) != nullptr) {
            Logs::fatal(e.what());
        } else {
            Logs::fatal("Unexpected error: " + std::string(e.what()));
        }
    }
}
