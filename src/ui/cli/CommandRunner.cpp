#include "CommandRunner.hpp"
#include "ConsoleProgress.hpp"
#include "filecrypt/core/BatchProcessor.hpp"
#include "filecrypt/core/FileEnumerator.hpp"
#include "filecrypt/core/FileService.hpp"
#include "filecrypt/core/OutputPaths.hpp"
#include "filecrypt/crypto/providers/NativeProviderFactory.hpp"
#include "filecrypt/security/ScopeWipe.hpp"
#include "filecrypt/security/SecureEquals.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <system_error>
#include <utility>
#include <variant>

#if defined(FILECRYPT_ENABLE_OPENSSL_KDF)
#include "filecrypt/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace filecrypt::ui::cli
{

namespace
{

[[nodiscard]] filecrypt::core::ProgressSink makeSink(std::ostream& out, bool quiet)
{
    if (quiet)
    {
        return {};
    }
    return ConsoleProgress{ out };
}

[[nodiscard]] bool isDirectory(const std::filesystem::path& p)
{
    std::error_code ec{};
    return std::filesystem::is_directory(p, ec) && !ec;
}

} // namespace

std::unique_ptr<filecrypt::crypto::ICryptoProvider> makeCryptoProvider(KdfBackend backend)
{
    switch (backend)
    {
    case KdfBackend::Native:
        return filecrypt::crypto::providers::makeNativeCryptoProvider();
    case KdfBackend::OpenSsl:
#if defined(FILECRYPT_ENABLE_OPENSSL_KDF)
        return filecrypt::crypto::providers::makeOpenSslCryptoProvider();
#else
        return nullptr;
#endif
    }
    return nullptr;
}

CommandRunner::CommandRunner(std::ostream& out, std::ostream& err, PasswordReader pwdReader,
                             ProviderFactory providers)
    : m_out(out), m_err(err), m_pwdReader(std::move(pwdReader)), m_providers(std::move(providers))
{
}

int CommandRunner::run(const std::vector<std::string>& args)
{
    CLI::App app{ "Password-based file and directory encryption (Argon2id + AES-256-GCM)", "filecrypt" };
    app.require_subcommand(1);
    app.fallthrough();

    Options opts{};
    std::string backendArg{ "native" };
    std::string outputArg{};

    app.add_option("--kdf-backend", backendArg, "Argon2id implementation")
        ->check(CLI::IsMember({ "native", "openssl" }));
    app.add_flag("-q,--quiet", opts.quiet, "Suppress progress output");

    const auto addPaths = [&](CLI::App* sub, const std::string& what)
    {
        sub->add_option("-i,--input", opts.input, "Input " + what)->required();
        return sub->add_option("-o,--output", outputArg, "Output " + what + " (derived from the input if omitted)");
    };

    auto* subEncrypt = app.add_subcommand("encrypt", "Encrypt a single file");
    auto* outEncrypt = addPaths(subEncrypt, "file");

    auto* subDecrypt = app.add_subcommand("decrypt", "Decrypt a single file");
    auto* outDecrypt = addPaths(subDecrypt, "file");

    auto* subEncryptDir = app.add_subcommand("encrypt-dir", "Encrypt every file below a directory");
    auto* outEncryptDir = addPaths(subEncryptDir, "directory");
    subEncryptDir->add_flag("--salt-per-file", opts.saltPerFile, "Derive a fresh key for every file (slower)");

    auto* subDecryptDir = app.add_subcommand("decrypt-dir", "Decrypt every .encrypted file below a directory");
    auto* outDecryptDir = addPaths(subDecryptDir, "directory");

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e, m_out, m_err);
    }

    opts.backend = (backendArg == "openssl") ? KdfBackend::OpenSsl : KdfBackend::Native;
    for (const auto* out : { outEncrypt, outDecrypt, outEncryptDir, outDecryptDir })
    {
        if (out->count() > 0U)
        {
            opts.output = outputArg;
        }
    }

    try
    {
        if (subEncrypt->parsed())
        {
            return doEncryptFile(opts);
        }
        if (subDecrypt->parsed())
        {
            return doDecryptFile(opts);
        }
        if (subEncryptDir->parsed())
        {
            return doEncryptDir(opts);
        }
        return doDecryptDir(opts);
    }
    catch (const std::exception& e)
    {
        m_err << "error: " << e.what() << "\n";
        return g_exitFailure;
    }
}

// --- Handlers ---

int CommandRunner::doEncryptFile(const Options& opts)
{
    auto crypto = provider(opts);
    if (!crypto)
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::InvalidArgument, {},
                                               "kdf backend not available in this build"));
    }

    auto pass = readNewPassword();
    if (!pass)
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::InvalidArgument, {},
                                               "passwords do not match"));
    }
    auto wipePass = filecrypt::security::scopeWipe(*pass);

    std::optional<std::filesystem::path> output{};
    if (opts.output)
    {
        output = std::filesystem::path{ *opts.output };
    }

    const auto result = filecrypt::core::encryptFile(*crypto, opts.input, output, *pass, makeSink(m_out, opts.quiet));
    if (const auto* err = std::get_if<filecrypt::core::Error>(&result))
    {
        return fail(*err);
    }

    m_out << "Encrypted " << opts.input << " -> " << std::get<std::filesystem::path>(result).string() << "\n";
    return g_exitOk;
}

int CommandRunner::doDecryptFile(const Options& opts)
{
    auto crypto = provider(opts);
    if (!crypto)
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::InvalidArgument, {},
                                               "kdf backend not available in this build"));
    }

    auto pass = m_pwdReader("Password: ");
    auto wipePass = filecrypt::security::scopeWipe(pass);

    std::optional<std::filesystem::path> output{};
    if (opts.output)
    {
        output = std::filesystem::path{ *opts.output };
    }

    const auto result = filecrypt::core::decryptFile(*crypto, opts.input, output, pass, makeSink(m_out, opts.quiet));
    if (const auto* err = std::get_if<filecrypt::core::Error>(&result))
    {
        return fail(*err);
    }

    m_out << "Decrypted " << opts.input << " -> " << std::get<std::filesystem::path>(result).string() << "\n";
    return g_exitOk;
}

int CommandRunner::doEncryptDir(const Options& opts)
{
    const std::filesystem::path input{ opts.input };
    if (!isDirectory(input))
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::NotADirectory, input));
    }

    auto crypto = provider(opts);
    if (!crypto)
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::InvalidArgument, {},
                                               "kdf backend not available in this build"));
    }

    auto pass = readNewPassword();
    if (!pass)
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::InvalidArgument, {},
                                               "passwords do not match"));
    }
    auto wipePass = filecrypt::security::scopeWipe(*pass);

    const std::filesystem::path output{ opts.output ? std::filesystem::path{ *opts.output }
                                                    : filecrypt::core::defaultEncryptOutputDir(input) };
    const auto enumerator = filecrypt::core::makeRecursiveFileEnumerator();
    const filecrypt::core::BatchProcessor batch{ *crypto, *enumerator, makeSink(m_out, opts.quiet) };

    const auto policy = opts.saltPerFile ? filecrypt::core::SaltPolicy::PerFile : filecrypt::core::SaltPolicy::PerBatch;
    const auto result = batch.encryptDirectory(input, output, *pass, policy);
    if (const auto* failure = std::get_if<filecrypt::core::BatchFailure>(&result))
    {
        m_err << filecrypt::core::formatError(failure->error) << " (" << failure->filesCompleted
              << " file(s) completed before the failure)\n";
        return g_exitFailure;
    }

    const auto& report = std::get<filecrypt::core::BatchReport>(result);
    m_out << "Encrypted " << report.filesProcessed << " file(s) into " << report.outputRoot.string() << "\n";
    return g_exitOk;
}

int CommandRunner::doDecryptDir(const Options& opts)
{
    const std::filesystem::path input{ opts.input };
    if (!isDirectory(input))
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::NotADirectory, input));
    }

    auto crypto = provider(opts);
    if (!crypto)
    {
        return fail(filecrypt::core::makeError(filecrypt::core::ErrorCode::InvalidArgument, {},
                                               "kdf backend not available in this build"));
    }

    auto pass = m_pwdReader("Password: ");
    auto wipePass = filecrypt::security::scopeWipe(pass);

    const std::filesystem::path output{ opts.output ? std::filesystem::path{ *opts.output }
                                                    : filecrypt::core::defaultDecryptOutputDir(input) };
    const auto enumerator = filecrypt::core::makeRecursiveFileEnumerator();
    const filecrypt::core::BatchProcessor batch{ *crypto, *enumerator, makeSink(m_out, opts.quiet) };

    const auto result = batch.decryptDirectory(input, output, pass);
    if (const auto* failure = std::get_if<filecrypt::core::BatchFailure>(&result))
    {
        m_err << filecrypt::core::formatError(failure->error) << " (" << failure->filesCompleted
              << " file(s) completed before the failure)\n";
        return g_exitFailure;
    }

    const auto& report = std::get<filecrypt::core::BatchReport>(result);
    m_out << "Decrypted " << report.filesProcessed << " file(s) into " << report.outputRoot.string() << "\n";
    return g_exitOk;
}

// --- Helpers ---

std::optional<filecrypt::security::SecureString> CommandRunner::readNewPassword()
{
    auto p1 = m_pwdReader("Password: ");
    auto wipeP1 = filecrypt::security::scopeWipe(p1);

    auto p2 = m_pwdReader("Confirm Password: ");
    auto wipeP2 = filecrypt::security::scopeWipe(p2);

    if (!filecrypt::security::secureEquals(p1, p2))
    {
        return std::nullopt;
    }
    wipeP1.release();
    return p1;
}

std::unique_ptr<filecrypt::crypto::ICryptoProvider> CommandRunner::provider(const Options& opts)
{
    return m_providers ? m_providers(opts.backend) : nullptr;
}

int CommandRunner::fail(const filecrypt::core::Error& error)
{
    m_err << filecrypt::core::formatError(error) << "\n";
    return g_exitFailure;
}

} // namespace filecrypt::ui::cli
