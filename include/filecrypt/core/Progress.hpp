#ifndef INCLUDE_FILECRYPT_CORE_PROGRESS_HPP
#define INCLUDE_FILECRYPT_CORE_PROGRESS_HPP

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>

namespace filecrypt::core
{

enum class ProgressKind : std::uint8_t
{
    Read,     // done/total in bytes, after every chunk read
    Write,    // done/total in bytes, after every chunk written
    FileDone, // done/total in files, after every file of a batch
};

struct ProgressEvent final
{
    ProgressKind kind{ ProgressKind::Read };
    std::filesystem::path path{};
    std::uint64_t done{ 0U };
    std::uint64_t total{ 0U };
};

// Observer only: invoked synchronously, must not block.
using ProgressSink = std::function<void(const ProgressEvent&)>;

// A failing observer never aborts the operation it observes.
inline void notifyProgress(const ProgressSink& sink, const ProgressEvent& event) noexcept
{
    if (!sink)
    {
        return;
    }
    try
    {
        sink(event);
    }
    catch (const std::exception&)
    {
        return;
    }
    catch (...)
    {
        return;
    }
}

} // namespace filecrypt::core

#endif // INCLUDE_FILECRYPT_CORE_PROGRESS_HPP
