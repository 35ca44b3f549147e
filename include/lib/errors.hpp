#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <exception>

class InjectISOException : public std::exception {
private:
    std::string message;
    
public:
    explicit InjectISOException(const std::string& msg);
    const char* what() const noexcept override;
};

class NotFoundError : public InjectISOException {
public:
    explicit NotFoundError(const std::string& path, const std::string& cause = "No such file or directory");
};

class NotADirectoryError : public InjectISOException {
public:
    explicit NotADirectoryError(const std::string& path, const std::string& cause = "No such directory");
};

class AlreadyExistsError : public InjectISOException {
public:
    explicit AlreadyExistsError(const std::string& path, const std::string& cause = "Existing file would get overwritten");
};

class InvalidFormatError : public InjectISOException {
public:
    explicit InvalidFormatError(const std::string& path, const std::string& cause);
};

class InvalidArgumentError : public InjectISOException {
public:
    explicit InvalidArgumentError(const std::string& msg);
};

class ProcessError : public InjectISOException {
private:
    std::string tool;
    int status;
    
public:
    ProcessError(const std::string& tool, int status, const std::string& cause);
    
    const std::string& getTool() const { return tool; }
    int getStatus() const { return status; }
};

class FilesystemError : public InjectISOException {
public:
    explicit FilesystemError(const std::string& msg);
};

namespace ErrorHandler {
    int exitCodeFor(const std::exception& e);
    void reportFatalError(const std::exception& e);
}

#endif // ERRORS_HPP
