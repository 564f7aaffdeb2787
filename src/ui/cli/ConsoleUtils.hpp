#ifndef FILECRYPT_UI_CLI_CONSOLEUTILS_HPP
#define FILECRYPT_UI_CLI_CONSOLEUTILS_HPP

#include "filecrypt/security/SecureString.hpp"
#include <string>

namespace filecrypt::ui::cli
{

// Keeps passwords and keys out of core files. Memory is not locked: Argon2id needs a
// 64 MiB work area that mlockall(MCL_FUTURE) could refuse.
void disableCoreDumps() noexcept;

// Prompts on stdout and reads one line from stdin with echo off.
// Throws std::runtime_error when stdin is closed.
[[nodiscard]] filecrypt::security::SecureString readPassword(const std::string& prompt);

} // namespace filecrypt::ui::cli

#endif // FILECRYPT_UI_CLI_CONSOLEUTILS_HPP
