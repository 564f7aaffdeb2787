#ifndef FILECRYPT_UI_CLI_CONSOLEPROGRESS_HPP
#define FILECRYPT_UI_CLI_CONSOLEPROGRESS_HPP

#include "filecrypt/core/Progress.hpp"
#include <cstdint>
#include <iosfwd>

namespace filecrypt::ui::cli
{

inline constexpr std::uint64_t g_byteProgressThreshold{ 1024U * 1024U };

// Renders progress events as text:
//   byte events (files >= 1 MiB only): "\r<path>: reading 42%", newline at 100%
//   batch events:                      "[i/n] <relative path>"
class ConsoleProgress final
{
public:
    explicit ConsoleProgress(std::ostream& out) noexcept;

    void operator()(const filecrypt::core::ProgressEvent& event);

private:
    std::ostream* m_out{ nullptr };
    int m_lastPercent{ -1 };
};

} // namespace filecrypt::ui::cli

#endif // FILECRYPT_UI_CLI_CONSOLEPROGRESS_HPP
