#ifndef FILECRYPT_UI_CLI_COMMANDRUNNER_HPP
#define FILECRYPT_UI_CLI_COMMANDRUNNER_HPP

#include "filecrypt/core/Errors.hpp"
#include "filecrypt/crypto/ICryptoProvider.hpp"
#include "filecrypt/security/SecureString.hpp"

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace filecrypt::ui::cli
{

enum class KdfBackend : std::uint8_t
{
    Native,
    OpenSsl,
};

// In tests: returns a pre-determined string.
using PasswordReader = std::function<filecrypt::security::SecureString(const std::string&)>;

// Returns nullptr when the backend is not compiled in.
using ProviderFactory = std::function<std::unique_ptr<filecrypt::crypto::ICryptoProvider>(KdfBackend)>;

[[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider> makeCryptoProvider(KdfBackend backend);

inline constexpr int g_exitOk{ 0 };
inline constexpr int g_exitFailure{ 1 };

// One process invocation: parses `args` (args[0] is the program name), runs the selected
// command and returns the exit code. Status goes to `out`, the single failure line to `err`.
class CommandRunner final
{
public:
    CommandRunner(std::ostream& out, std::ostream& err, PasswordReader pwdReader,
                  ProviderFactory providers = makeCryptoProvider);

    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    std::ostream& m_out;
    std::ostream& m_err;
    PasswordReader m_pwdReader;
    ProviderFactory m_providers;

    struct Options final
    {
        std::string input{};
        std::optional<std::string> output{};
        KdfBackend backend{ KdfBackend::Native };
        bool quiet{ false };
        bool saltPerFile{ false };
    };

    [[nodiscard]] int doEncryptFile(const Options& opts);
    [[nodiscard]] int doDecryptFile(const Options& opts);
    [[nodiscard]] int doEncryptDir(const Options& opts);
    [[nodiscard]] int doDecryptDir(const Options& opts);

    [[nodiscard]] std::optional<filecrypt::security::SecureString> readNewPassword();
    [[nodiscard]] std::unique_ptr<filecrypt::crypto::ICryptoProvider> provider(const Options& opts);
    [[nodiscard]] int fail(const filecrypt::core::Error& error);
};

} // namespace filecrypt::ui::cli

#endif // FILECRYPT_UI_CLI_COMMANDRUNNER_HPP
