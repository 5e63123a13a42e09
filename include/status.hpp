#pragma once

#include <string>
#include <utility>

namespace cen {

// Outcome of a persistence step. Non-fatal by nature: callers branch on it.
class Status {
public:
    enum class Code : int {
        kOk = 0,
        kNotFound,
        kIoError,
        kUnavailable,
        kParseError,
    };

    Status() = default;
    Status(Code code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
    [[nodiscard]] Code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    static Status ok_status() { return Status(); }
    static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
    static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
    static Status unavailable(std::string msg) { return Status(Code::kUnavailable, std::move(msg)); }
    static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }

private:
    Code code_ = Code::kOk;
    std::string message_;
};

}  // namespace cen
