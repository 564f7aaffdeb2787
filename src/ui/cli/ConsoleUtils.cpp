#include "ConsoleUtils.hpp"
#include "filecrypt/security/MemoryWiper.hpp"

#include <iostream>
#include <span>
#include <stdexcept>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace filecrypt::ui::cli
{

namespace
{
void setConsoleEcho(bool enable)
{
#if defined(_WIN32)
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    if (!GetConsoleMode(hStdin, &mode))
    {
        return; // not a console
    }
    if (!enable)
        mode &= ~ENABLE_ECHO_INPUT;
    else
        mode |= ENABLE_ECHO_INPUT;
    SetConsoleMode(hStdin, mode);
#elif defined(__linux__)
    struct termios tty
    {
    };
    if (tcgetattr(STDIN_FILENO, &tty) != 0)
    {
        return; // not a terminal
    }
    if (!enable)
    {
        tty.c_lflag &= ~ECHO;
    }
    else
    {
        tty.c_lflag |= ECHO;
    }
    tcsetattr(STDIN_FILENO, TCSANOW, &tty);
#endif
}

// Restores echo even when reading throws.
class EchoOffGuard final
{
public:
    EchoOffGuard()
    {
        setConsoleEcho(false);
    }
    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;
    ~EchoOffGuard()
    {
        setConsoleEcho(true);
    }
};
} // namespace

void disableCoreDumps() noexcept
{
#if defined(__linux__)
    struct rlimit lim
    {
        0, 0
    };
    setrlimit(RLIMIT_CORE, &lim);
#endif
}

filecrypt::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    bool gotLine{ false };
    {
        EchoOffGuard echoOff{};
        gotLine = static_cast<bool>(std::getline(std::cin, line));
    }
    std::cout << "\n";

    auto sec = filecrypt::security::secureStringFrom(line);
    filecrypt::security::secureWipe(std::span<char>{ line.data(), line.size() });

    if (!gotLine)
    {
        throw std::runtime_error("no password on standard input");
    }
    return sec;
}

} // namespace filecrypt::ui::cli
