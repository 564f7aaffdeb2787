#include "filecrypt/core/FileIo.hpp"
#include "filecrypt/security/MemoryWiper.hpp"
#include "filecrypt/security/SecureRandom.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <new>
#include <string>
#include <system_error>

namespace filecrypt::core
{
namespace
{

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

[[nodiscard]] Error ioError(const std::filesystem::path& path, std::string detail)
{
    return makeError(ErrorCode::IoFailed, path, std::move(detail));
}

[[nodiscard]] Error ioError(const std::filesystem::path& path, const std::string& what, const std::error_code& ec)
{
    return makeError(ErrorCode::IoFailed, path, what + ": " + ec.message());
}

// Removes the temporary file unless the rename went through.
class TempFileGuard final
{
public:
    explicit TempFileGuard(std::filesystem::path p) : m_path{ std::move(p) }
    {
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;
    ~TempFileGuard() noexcept
    {
        if (!m_path.empty())
        {
            std::error_code ec{};
            std::filesystem::remove(m_path, ec);
        }
    }

    void release() noexcept
    {
        m_path.clear();
    }

private:
    std::filesystem::path m_path;
};

// Fixed-length name in the target's directory so a long target name still leaves room.
[[nodiscard]] std::filesystem::path makeTempSibling(const std::filesystem::path& target)
{
    constexpr std::size_t kTokenBytes{ 8U };
    std::array<std::uint8_t, kTokenBytes> rnd{};
    if (!filecrypt::security::secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        return {};
    }

    return target.parent_path() / (".fc-" + toHex(std::span<const std::uint8_t>{ rnd }) + ".tmp");
}

} // namespace

[[nodiscard]] Result<filecrypt::security::SecureBuffer> readWholeFile(const std::filesystem::path& path,
                                                                      const ProgressSink& progress)
{
    std::error_code ec{};
    const auto total{ std::filesystem::file_size(path, ec) };
    if (ec)
    {
        return ioError(path, "failed to read file metadata", ec);
    }

    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        return ioError(path, "failed to open file");
    }

    filecrypt::security::SecureBuffer data{};
    try
    {
        data.reserve(static_cast<std::size_t>(total));
    }
    catch (const std::length_error&)
    {
        return ioError(path, "file too large");
    }
    catch (const std::bad_alloc&)
    {
        return ioError(path, "file does not fit in memory");
    }

    std::array<char, g_ioChunkBytes> chunk{};
    std::uint64_t done{ 0U };
    while (in)
    {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got{ in.gcount() };
        if (got <= 0)
        {
            break;
        }
        const auto* first{ reinterpret_cast<const std::uint8_t*>(chunk.data()) };
        data.insert(data.end(), first, first + got);
        done += static_cast<std::uint64_t>(got);
        notifyProgress(progress, ProgressEvent{ .kind = ProgressKind::Read, .path = path, .done = done, .total = total });
    }
    filecrypt::security::secureWipe(std::span<char>{ chunk });

    if (in.bad() || !in.eof())
    {
        filecrypt::security::secureRelease(data);
        return ioError(path, "failed to read file");
    }

    return data;
}

[[nodiscard]] Result<std::monostate> writeFileAtomic(const std::filesystem::path& path,
                                                     std::span<const std::uint8_t> data, const ProgressSink& progress)
{
    if (path.empty() || !path.has_filename())
    {
        return makeError(ErrorCode::InvalidArgument, path, "output path has no file name");
    }

    std::error_code ec{};
    if (const auto parent{ path.parent_path() }; !parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return ioError(parent, "failed to create directory", ec);
        }
    }

    const auto temp{ makeTempSibling(path) };
    if (temp.empty())
    {
        return makeError(ErrorCode::RandomFailed, path, "temporary file name");
    }
    TempFileGuard cleanup{ temp };

    {
        std::ofstream out{ temp, std::ios::binary | std::ios::trunc };
        if (!out)
        {
            return ioError(path, "failed to create file");
        }

        const std::uint64_t total{ data.size() };
        std::uint64_t done{ 0U };
        while (done < total)
        {
            const std::size_t slice{ static_cast<std::size_t>(std::min<std::uint64_t>(g_ioChunkBytes, total - done)) };
            out.write(reinterpret_cast<const char*>(data.data() + done), static_cast<std::streamsize>(slice));
            if (!out)
            {
                return ioError(path, "failed to write file");
            }
            done += slice;
            notifyProgress(progress,
                           ProgressEvent{ .kind = ProgressKind::Write, .path = path, .done = done, .total = total });
        }

        out.flush();
        out.close();
        if (out.fail())
        {
            return ioError(path, "failed to write file");
        }
    }

    // No fsync: the rename keeps readers from seeing a partial file but does not make it durable.
    std::filesystem::rename(temp, path, ec);
    if (ec)
    {
        return ioError(path, "failed to move file into place", ec);
    }
    cleanup.release();

    return std::monostate{};
}

} // namespace filecrypt::core
