#include "filecrypt/core/Container.hpp"

#include <algorithm>

namespace filecrypt::core
{

[[nodiscard]] std::vector<std::uint8_t> encodeContainer(const Salt& salt, std::span<const std::uint8_t> payload)
{
    std::vector<std::uint8_t> out{};
    out.reserve(g_containerHeaderBytes + payload.size());

    out.insert(out.end(), g_containerMagic.begin(), g_containerMagic.end());
    out.push_back(g_containerVersionCurrent);
    out.insert(out.end(), salt.begin(), salt.end());
    out.insert(out.end(), payload.begin(), payload.end());

    return out;
}

[[nodiscard]] Result<ContainerView> decodeContainer(std::span<const std::uint8_t> bytes) noexcept
{
    if (bytes.size() < g_containerHeaderBytes)
    {
        return makeError(ErrorCode::ContainerTooShort);
    }

    if (!std::equal(g_containerMagic.begin(), g_containerMagic.end(), bytes.begin()))
    {
        return makeError(ErrorCode::BadMagic);
    }

    ContainerView view{};
    view.version = bytes[g_containerVersionOffset];
    if (view.version != g_containerVersionV1)
    {
        return makeError(ErrorCode::UnsupportedVersion);
    }

    const auto saltBytes{ bytes.subspan(g_containerSaltOffset, view.salt.size()) };
    std::copy(saltBytes.begin(), saltBytes.end(), view.salt.begin());
    view.payload = bytes.subspan(g_containerHeaderBytes);

    return view;
}

} // namespace filecrypt::core
