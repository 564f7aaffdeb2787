#include "filecrypt/core/FileService.hpp"
#include "filecrypt/core/Envelope.hpp"
#include "filecrypt/core/FileIo.hpp"
#include "filecrypt/core/OutputPaths.hpp"
#include "filecrypt/security/ScopeWipe.hpp"

#include <system_error>
#include <utility>
#include <variant>

namespace filecrypt::core
{
namespace
{

[[nodiscard]] std::optional<Error> requireRegularFile(const std::filesystem::path& input)
{
    std::error_code ec{};
    const auto status{ std::filesystem::status(input, ec) };
    if (ec || !std::filesystem::exists(status))
    {
        return makeError(ErrorCode::IoFailed, input, "no such file");
    }
    if (!std::filesystem::is_regular_file(status))
    {
        return makeError(ErrorCode::InvalidArgument, input, "not a regular file");
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<Error> requireDistinct(const std::filesystem::path& input,
                                                   const std::filesystem::path& output)
{
    std::error_code ec{};
    if (std::filesystem::equivalent(input, output, ec) && !ec)
    {
        return makeError(ErrorCode::InvalidArgument, output, "output would overwrite the input");
    }
    return std::nullopt;
}

} // namespace

[[nodiscard]] Result<std::filesystem::path> encryptFile(filecrypt::crypto::ICryptoProvider& crypto,
                                                        const std::filesystem::path& input,
                                                        const std::optional<std::filesystem::path>& output,
                                                        const filecrypt::security::SecureString& password,
                                                        const ProgressSink& progress)
{
    if (auto err{ requireRegularFile(input) })
    {
        return std::move(*err);
    }
    const std::filesystem::path target{ output.value_or(defaultEncryptOutputFile(input)) };
    if (auto err{ requireDistinct(input, target) })
    {
        return std::move(*err);
    }

    auto plainOrErr{ readWholeFile(input, progress) };
    if (auto* err{ std::get_if<Error>(&plainOrErr) })
    {
        return std::move(*err);
    }
    auto& plain{ std::get<filecrypt::security::SecureBuffer>(plainOrErr) };
    auto wipePlain{ filecrypt::security::scopeWipe(plain) };

    auto containerOrErr{ encryptBytes(crypto, password, filecrypt::security::asSpan(plain)) };
    if (auto* err{ std::get_if<Error>(&containerOrErr) })
    {
        return withPath(std::move(*err), input);
    }

    const auto written{ writeFileAtomic(target, std::get<std::vector<std::uint8_t>>(containerOrErr), progress) };
    if (const auto* err{ std::get_if<Error>(&written) })
    {
        return *err;
    }
    return target;
}

[[nodiscard]] Result<std::filesystem::path> decryptFile(filecrypt::crypto::ICryptoProvider& crypto,
                                                        const std::filesystem::path& input,
                                                        const std::optional<std::filesystem::path>& output,
                                                        const filecrypt::security::SecureString& password,
                                                        const ProgressSink& progress)
{
    if (auto err{ requireRegularFile(input) })
    {
        return std::move(*err);
    }
    const std::filesystem::path target{ output.value_or(defaultDecryptOutputFile(input)) };
    if (auto err{ requireDistinct(input, target) })
    {
        return std::move(*err);
    }

    auto containerOrErr{ readWholeFile(input, progress) };
    if (auto* err{ std::get_if<Error>(&containerOrErr) })
    {
        return std::move(*err);
    }

    auto plainOrErr{ decryptBytes(crypto, password,
                                  filecrypt::security::asSpan(std::get<filecrypt::security::SecureBuffer>(containerOrErr))) };
    if (auto* err{ std::get_if<Error>(&plainOrErr) })
    {
        return withPath(std::move(*err), input);
    }
    auto& plain{ std::get<filecrypt::security::SecureBuffer>(plainOrErr) };
    auto wipePlain{ filecrypt::security::scopeWipe(plain) };

    const auto written{ writeFileAtomic(target, filecrypt::security::asSpan(plain), progress) };
    if (const auto* err{ std::get_if<Error>(&written) })
    {
        return *err;
    }
    return target;
}

} // namespace filecrypt::core
