#ifndef SITEWARDEN_ERRORS_HPP
#define SITEWARDEN_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace SiteWarden {

/**
 * @brief Base class for all SiteWarden exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief The remote authority could not be reached or answered with a status other than 200.
 *
 * A status of 0 means no HTTP response was received at all.
 */
class RemoteCommunicationError : public RuntimeError {
public:
    RemoteCommunicationError(long status, const std::string& reason)
        : RuntimeError("Unable to communicate with Warden (" + std::to_string(status) + ") " + reason),
          status_(status),
          reason_(reason) {}

    long status() const noexcept { return status_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    long status_;
    std::string reason_;
};

/**
 * @brief Sealing or opening failed, or an envelope could not be understood.
 */
class EncryptionError : public RuntimeError {
public:
    explicit EncryptionError(const std::string& message) : RuntimeError(message) {}
    explicit EncryptionError(const char* message) : RuntimeError(message) {}
};

} // namespace SiteWarden

#endif // SITEWARDEN_ERRORS_HPP
