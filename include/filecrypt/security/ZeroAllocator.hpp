#ifndef INCLUDE_FILECRYPT_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_FILECRYPT_SECURITY_ZEROALLOCATOR_HPP

#include "filecrypt/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace filecrypt::security
{

// Allocator that wipes every block before handing it back to the heap.
// Used for passwords, derived keys and decrypted plaintext.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        }
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& lhs,
                          [[maybe_unused]] const ZeroAllocator<U>& rhs) noexcept
{
    return true;
}

} // namespace filecrypt::security

#endif // INCLUDE_FILECRYPT_SECURITY_ZEROALLOCATOR_HPP
