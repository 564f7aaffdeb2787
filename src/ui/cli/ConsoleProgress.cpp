#include "ConsoleProgress.hpp"

#include <ostream>

namespace filecrypt::ui::cli
{

ConsoleProgress::ConsoleProgress(std::ostream& out) noexcept : m_out{ &out }
{
}

void ConsoleProgress::operator()(const filecrypt::core::ProgressEvent& event)
{
    using filecrypt::core::ProgressKind;

    if (event.kind == ProgressKind::FileDone)
    {
        *m_out << "[" << event.done << "/" << event.total << "] " << event.path.string() << "\n";
        return;
    }

    if (event.total < g_byteProgressThreshold)
    {
        return;
    }

    constexpr std::uint64_t kPercent{ 100U };
    const int percent{ static_cast<int>((event.done * kPercent) / event.total) };
    if (percent == m_lastPercent)
    {
        return;
    }
    m_lastPercent = percent;

    const char* verb{ event.kind == ProgressKind::Read ? "reading" : "writing" };
    *m_out << "\r" << event.path.string() << ": " << verb << " " << percent << "%" << std::flush;
    if (event.done >= event.total)
    {
        *m_out << "\n";
        m_lastPercent = -1;
    }
}

} // namespace filecrypt::ui::cli
