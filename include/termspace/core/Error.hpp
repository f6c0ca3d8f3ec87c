#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        NotAllowed,
        InvalidPayload,
        Timeout,
        Composite,
        Canceled,
        ActionFailed,
        NotSupported,
        MalformedInput,
        CapacityExceeded,
        IOError
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Error(Code c, std::string m, std::vector<Error> children)
        : code(c), message(std::move(m)), causes(std::move(children)) {}

    Code                       code;
    std::optional<std::string> message;
    // Child failures of a Composite error; the first entry is the primary cause.
    std::vector<Error>         causes;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::NotAllowed:
        return "not_allowed";
    case Error::Code::InvalidPayload:
        return "invalid_payload";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::Composite:
        return "composite";
    case Error::Code::Canceled:
        return "canceled";
    case Error::Code::ActionFailed:
        return "action_failed";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    case Error::Code::IOError:
        return "io_error";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const  label = errorCodeToString(error.code);
    std::string description{label};
    if (error.message && !error.message->empty()) {
        description.reserve(label.size() + 1 + error.message->size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
    }
    if (error.code == Error::Code::Composite && !error.causes.empty()) {
        description.append(" (caused by ");
        description.append(describeError(error.causes.front()));
        description.push_back(')');
    }
    return description;
}

// Primary cause of an error: itself unless it aggregates children.
[[nodiscard]] inline auto primaryCause(Error const& error) -> Error const& {
    if (error.code == Error::Code::Composite && !error.causes.empty())
        return primaryCause(error.causes.front());
    return error;
}

} // namespace TS
