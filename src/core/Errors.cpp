#include "filecrypt/core/Errors.hpp"

namespace filecrypt::core
{

[[nodiscard]] ErrorCategory categoryOf(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::IoFailed:
        return ErrorCategory::Io;
    case ErrorCode::ContainerTooShort:
    case ErrorCode::BadMagic:
    case ErrorCode::UnsupportedVersion:
    case ErrorCode::PayloadTooShort:
        return ErrorCategory::Format;
    case ErrorCode::KeyDerivationFailed:
    case ErrorCode::AuthenticationFailed:
    case ErrorCode::RandomFailed:
    case ErrorCode::CipherFailed:
        return ErrorCategory::Crypto;
    case ErrorCode::NotADirectory:
    case ErrorCode::InvalidArgument:
        return ErrorCategory::Argument;
    }
    return ErrorCategory::Argument;
}

[[nodiscard]] std::string_view describe(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::IoFailed:
        return "file I/O failed";
    case ErrorCode::ContainerTooShort:
        return "invalid encrypted file: too short";
    case ErrorCode::BadMagic:
        return "invalid encrypted file: wrong magic bytes";
    case ErrorCode::UnsupportedVersion:
        return "unsupported encrypted file version";
    case ErrorCode::PayloadTooShort:
        return "invalid ciphertext: too short";
    case ErrorCode::KeyDerivationFailed:
        return "key derivation failed";
    case ErrorCode::AuthenticationFailed:
        return "decryption failed - wrong password or corrupted file";
    case ErrorCode::RandomFailed:
        return "secure random generator failed";
    case ErrorCode::CipherFailed:
        return "cipher backend failed";
    case ErrorCode::NotADirectory:
        return "input is not a directory";
    case ErrorCode::InvalidArgument:
        return "invalid argument";
    }
    return "unknown error";
}

[[nodiscard]] std::string_view describe(ErrorCategory category) noexcept
{
    switch (category)
    {
    case ErrorCategory::Io:
        return "I/O error";
    case ErrorCategory::Format:
        return "format error";
    case ErrorCategory::Crypto:
        return "crypto error";
    case ErrorCategory::Argument:
        return "argument error";
    }
    return "error";
}

[[nodiscard]] std::string formatError(const Error& error)
{
    std::string out{ describe(categoryOf(error.code)) };
    out += ": ";
    out += describe(error.code);
    if (!error.path.empty())
    {
        out += ": ";
        out += error.path.string();
    }
    if (!error.detail.empty())
    {
        out += " (";
        out += error.detail;
        out += ")";
    }
    return out;
}

} // namespace filecrypt::core
