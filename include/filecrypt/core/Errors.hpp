#ifndef INCLUDE_FILECRYPT_CORE_ERRORS_HPP
#define INCLUDE_FILECRYPT_CORE_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace filecrypt::core
{

enum class ErrorCode : std::uint8_t
{
    IoFailed,
    ContainerTooShort,
    BadMagic,
    UnsupportedVersion,
    PayloadTooShort,
    KeyDerivationFailed,
    // Wrong password and tampered data are deliberately the same code.
    AuthenticationFailed,
    RandomFailed,
    CipherFailed,
    NotADirectory,
    InvalidArgument,
};

enum class ErrorCategory : std::uint8_t
{
    Io,
    Format,
    Crypto,
    Argument,
};

struct Error final
{
    ErrorCode code{ ErrorCode::InvalidArgument };
    std::filesystem::path path{};
    std::string detail{};
};

template <class T> using Result = std::variant<T, Error>;

// Batch operations also report how far they got before the failing file.
struct BatchFailure final
{
    Error error{};
    std::size_t filesCompleted{ 0U };
};

template <class T> using BatchResult = std::variant<T, BatchFailure>;

[[nodiscard]] ErrorCategory categoryOf(ErrorCode code) noexcept;
[[nodiscard]] std::string_view describe(ErrorCode code) noexcept;
[[nodiscard]] std::string_view describe(ErrorCategory category) noexcept;

// One line: "<category>: <description>[: <path>][ (<detail>)]".
[[nodiscard]] std::string formatError(const Error& error);

[[nodiscard]] inline Error makeError(ErrorCode code, std::filesystem::path path = {}, std::string detail = {})
{
    return Error{ .code = code, .path = std::move(path), .detail = std::move(detail) };
}

// Attaches `path` to errors raised below the file level (codec, cipher).
[[nodiscard]] inline Error withPath(Error error, const std::filesystem::path& path)
{
    if (error.path.empty())
    {
        error.path = path;
    }
    return error;
}

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_ERRORS_HPP
