#include "filecrypt/core/BatchProcessor.hpp"
#include "filecrypt/core/AeadCipher.hpp"
#include "filecrypt/core/Envelope.hpp"
#include "filecrypt/core/FileIo.hpp"
#include "filecrypt/core/KdfPolicy.hpp"
#include "filecrypt/core/OutputPaths.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace filecrypt::core
{
namespace
{

[[nodiscard]] std::optional<Error> requireDirectory(const std::filesystem::path& root)
{
    std::error_code ec{};
    if (!std::filesystem::is_directory(root, ec))
    {
        return makeError(ErrorCode::NotADirectory, root);
    }
    return std::nullopt;
}

[[nodiscard]] BatchFailure failAt(Error error, std::size_t filesCompleted)
{
    return BatchFailure{ .error = std::move(error), .filesCompleted = filesCompleted };
}

// Seals one file with `cipher`/`salt` and writes it atomically.
[[nodiscard]] std::optional<Error> encryptOne(const AeadCipher& cipher, const Salt& salt,
                                              const std::filesystem::path& source,
                                              const std::filesystem::path& target)
{
    auto plainOrErr{ readWholeFile(source) };
    if (auto* err{ std::get_if<Error>(&plainOrErr) })
    {
        return std::move(*err);
    }

    auto containerOrErr{ sealEnvelope(cipher, salt,
                                      filecrypt::security::asSpan(std::get<filecrypt::security::SecureBuffer>(plainOrErr))) };
    if (auto* err{ std::get_if<Error>(&containerOrErr) })
    {
        return withPath(std::move(*err), source);
    }

    auto written{ writeFileAtomic(target, std::get<std::vector<std::uint8_t>>(containerOrErr)) };
    if (auto* err{ std::get_if<Error>(&written) })
    {
        return std::move(*err);
    }
    return std::nullopt;
}

} // namespace

BatchProcessor::BatchProcessor(filecrypt::crypto::ICryptoProvider& crypto, const IFileEnumerator& enumerator,
                               ProgressSink progress)
    : m_crypto{ &crypto }, m_enumerator{ &enumerator }, m_progress{ std::move(progress) }
{
}

[[nodiscard]] BatchResult<BatchReport>
BatchProcessor::encryptDirectory(const std::filesystem::path& inputRoot, const std::filesystem::path& outputRoot,
                                 const filecrypt::security::SecureString& password, SaltPolicy saltPolicy) const
{
    if (auto err{ requireDirectory(inputRoot) })
    {
        return failAt(std::move(*err), 0U);
    }

    auto filesOrErr{ m_enumerator->listRegularFiles(inputRoot) };
    if (auto* err{ std::get_if<Error>(&filesOrErr) })
    {
        return failAt(std::move(*err), 0U);
    }
    const auto& files{ std::get<std::vector<std::filesystem::path>>(filesOrErr) };

    BatchReport report{ .outputRoot = outputRoot, .filesProcessed = 0U };
    if (files.empty())
    {
        return report;
    }

    // PerBatch: derive once up front, reused read-only for every file.
    std::optional<Salt> batchSalt{};
    std::optional<AeadCipher> batchCipher{};
    if (saltPolicy == SaltPolicy::PerBatch)
    {
        auto saltOrErr{ generateSalt(*m_crypto) };
        if (auto* err{ std::get_if<Error>(&saltOrErr) })
        {
            return failAt(std::move(*err), 0U);
        }
        batchSalt = std::get<Salt>(saltOrErr);

        auto cipherOrErr{ AeadCipher::fromPassword(*m_crypto, password, *batchSalt) };
        if (auto* err{ std::get_if<Error>(&cipherOrErr) })
        {
            return failAt(std::move(*err), 0U);
        }
        batchCipher.emplace(std::move(std::get<AeadCipher>(cipherOrErr)));
    }

    for (const auto& rel : files)
    {
        const auto source{ inputRoot / rel };
        const auto target{ encryptedName(outputRoot / rel) };

        std::optional<Error> failure{};
        if (batchCipher)
        {
            failure = encryptOne(*batchCipher, *batchSalt, source, target);
        }
        else
        {
            auto saltOrErr{ generateSalt(*m_crypto) };
            if (auto* err{ std::get_if<Error>(&saltOrErr) })
            {
                return failAt(withPath(std::move(*err), source), report.filesProcessed);
            }
            const auto& salt{ std::get<Salt>(saltOrErr) };

            auto cipherOrErr{ AeadCipher::fromPassword(*m_crypto, password, salt) };
            if (auto* err{ std::get_if<Error>(&cipherOrErr) })
            {
                return failAt(withPath(std::move(*err), source), report.filesProcessed);
            }
            failure = encryptOne(std::get<AeadCipher>(cipherOrErr), salt, source, target);
        }

        if (failure)
        {
            return failAt(std::move(*failure), report.filesProcessed);
        }

        ++report.filesProcessed;
        notifyProgress(m_progress, ProgressEvent{ .kind = ProgressKind::FileDone,
                                                  .path = rel,
                                                  .done = report.filesProcessed,
                                                  .total = files.size() });
    }

    return report;
}

[[nodiscard]] BatchResult<BatchReport>
BatchProcessor::decryptDirectory(const std::filesystem::path& inputRoot, const std::filesystem::path& outputRoot,
                                 const filecrypt::security::SecureString& password) const
{
    if (auto err{ requireDirectory(inputRoot) })
    {
        return failAt(std::move(*err), 0U);
    }

    auto filesOrErr{ m_enumerator->listRegularFiles(inputRoot) };
    if (auto* err{ std::get_if<Error>(&filesOrErr) })
    {
        return failAt(std::move(*err), 0U);
    }
    const auto& all{ std::get<std::vector<std::filesystem::path>>(filesOrErr) };

    std::vector<std::filesystem::path> files{};
    std::copy_if(all.begin(), all.end(), std::back_inserter(files),
                 [](const std::filesystem::path& p) { return hasEncryptedExtension(p); });

    BatchReport report{ .outputRoot = outputRoot, .filesProcessed = 0U };
    for (const auto& rel : files)
    {
        const auto source{ inputRoot / rel };
        const auto target{ decryptedName(outputRoot / rel) };

        auto containerOrErr{ readWholeFile(source) };
        if (auto* err{ std::get_if<Error>(&containerOrErr) })
        {
            return failAt(std::move(*err), report.filesProcessed);
        }

        auto plainOrErr{ openEnvelope(
            *m_crypto, password, filecrypt::security::asSpan(std::get<filecrypt::security::SecureBuffer>(containerOrErr))) };
        if (auto* err{ std::get_if<Error>(&plainOrErr) })
        {
            return failAt(withPath(std::move(*err), source), report.filesProcessed);
        }

        auto written{ writeFileAtomic(target,
                                      filecrypt::security::asSpan(std::get<filecrypt::security::SecureBuffer>(plainOrErr))) };
        if (auto* err{ std::get_if<Error>(&written) })
        {
            return failAt(std::move(*err), report.filesProcessed);
        }

        ++report.filesProcessed;
        notifyProgress(m_progress, ProgressEvent{ .kind = ProgressKind::FileDone,
                                                  .path = rel,
                                                  .done = report.filesProcessed,
                                                  .total = files.size() });
    }

    return report;
}

} // namespace filecrypt::core
