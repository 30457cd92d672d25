#include <cfs_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstring>
#include <sstream>

namespace cfs_bridge {

Error Error::FromRemoteStatus(const std::string& operation,
                              const std::string& endpoint,
                              int status,
                              const std::optional<std::string>& remote_error) {
    const std::string text =
        (remote_error.has_value() && !remote_error->empty())
            ? *remote_error
            : std::string("Unknown error");
    return Error{operation,
                 endpoint,
                 status,
                 "cFS error: " + text,
                 text,
                 ErrorCategory::Application,
                 std::nullopt};
}

Error Error::FromErrno(const std::string& operation,
                       const std::string& endpoint,
                       const std::string& message,
                       int errnum) {
    return Error{operation,
                 endpoint,
                 std::nullopt,
                 message + ": " + std::strerror(errnum),
                 std::nullopt,
                 ErrorCategory::Transport,
                 errnum};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (remote_status.has_value()) {
        oss << " (status " << *remote_status << ")";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (remote_status.has_value()) {
        body["remote_status"] = *remote_status;
    }
    body["message"] = message;
    if (remote_error.has_value()) {
        body["remote_error"] = *remote_error;
    }
    if (sys_errno.has_value()) {
        body["errno"] = *sys_errno;
    }
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace cfs_bridge
