#pragma once

#include <stdexcept>
#include <string>

namespace wasistub
{
enum class ErrorKind
{
    InputNotValid,
    DecodeError,
    UnsupportedImportLayout,
    UnsupportedSignature,
    OutputNotValid,
};

inline std::string to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::InputNotValid:
        return "InputNotValid";
    case ErrorKind::DecodeError:
        return "DecodeError";
    case ErrorKind::UnsupportedImportLayout:
        return "UnsupportedImportLayout";
    case ErrorKind::UnsupportedSignature:
        return "UnsupportedSignature";
    case ErrorKind::OutputNotValid:
        return "OutputNotValid";
    default:
        return "unknown";
    }
}

// Base of every error the rewrite pipeline reports. None of them is retried.
struct StubError : std::runtime_error
{
    StubError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {
    }

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

struct InputNotValid final : StubError
{
    explicit InputNotValid(const std::string& message)
        : StubError(ErrorKind::InputNotValid, "the given wasm binary is invalid: " + message)
    {
    }
};

struct DecodeError final : StubError
{
    explicit DecodeError(const std::string& message)
        : StubError(ErrorKind::DecodeError, "decode error: " + message)
    {
    }
};

struct UnsupportedImportLayout final : StubError
{
    explicit UnsupportedImportLayout(const std::string& message)
        : StubError(ErrorKind::UnsupportedImportLayout, message)
    {
    }
};

struct UnsupportedSignature final : StubError
{
    explicit UnsupportedSignature(const std::string& message)
        : StubError(ErrorKind::UnsupportedSignature, message)
    {
    }
};

struct OutputNotValid final : StubError
{
    explicit OutputNotValid(const std::string& message)
        : StubError(ErrorKind::OutputNotValid, "rewritten module is invalid: " + message)
    {
    }
};
} // namespace wasistub
