#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace WS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidPath,
        InvalidPathSubcomponent,
        MalformedInput,
        MissingField,
        InvalidFormat,
        PermissionDenied,
        LaunchFailure,
        ReloadFailed,
        InvalidState,
        NotFound,
        AlreadyExists,
        Timeout,
        MethodNotFound,
        InvalidInput,
        ExecutorShutdown,
        IoError
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::InvalidPathSubcomponent:
        return "invalid_path_subcomponent";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::MissingField:
        return "missing_field";
    case Error::Code::InvalidFormat:
        return "invalid_format";
    case Error::Code::PermissionDenied:
        return "permission_denied";
    case Error::Code::LaunchFailure:
        return "launch_failure";
    case Error::Code::ReloadFailed:
        return "reload_failed";
    case Error::Code::InvalidState:
        return "invalid_state";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::AlreadyExists:
        return "already_exists";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::MethodNotFound:
        return "method_not_found";
    case Error::Code::InvalidInput:
        return "invalid_input";
    case Error::Code::ExecutorShutdown:
        return "executor_shutdown";
    case Error::Code::IoError:
        return "io_error";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace WS
