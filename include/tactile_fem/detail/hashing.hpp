#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace tactile::fem::detail
{
    // 64-bit FNV-1a.
    class Fnv1a64
    {
    public:
        void update(const void* data, std::size_t size) noexcept
        {
            const auto* bytes = static_cast<const unsigned char*>(data);
            for (std::size_t i = 0; i < size; ++i)
            {
                m_state ^= bytes[i];
                m_state *= prime;
            }
        }

        void update(std::string_view text) noexcept { update(text.data(), text.size()); }

        [[nodiscard]] std::uint64_t digest() const noexcept { return m_state; }

    private:
        static constexpr std::uint64_t prime = 0x100000001b3ULL;
        std::uint64_t m_state{0xcbf29ce484222325ULL};
    };

    // 128-bit FNV-1a kept as two 64-bit halves. The prime is 2^88 + 0x13b, so
    // h * prime = h * 0x13b + (h << 88) modulo 2^128.
    class Fnv1a128
    {
    public:
        void update(const void* data, std::size_t size) noexcept
        {
            const auto* bytes = static_cast<const unsigned char*>(data);
            for (std::size_t i = 0; i < size; ++i)
            {
                m_low ^= bytes[i];
                multiply();
            }
        }

        void update(std::string_view text) noexcept { update(text.data(), text.size()); }

        [[nodiscard]] std::string hex() const { return fmt::format("{:016x}{:016x}", m_high, m_low); }

    private:
        void multiply() noexcept
        {
            constexpr std::uint64_t small = 0x13b;
            const std::uint64_t carry = ((m_low >> 32) * small + (((m_low & 0xffffffffULL) * small) >> 32)) >> 32;
            const std::uint64_t shifted = m_low << 24;
            m_low *= small;
            m_high = m_high * small + carry + shifted;
        }

        std::uint64_t m_high{0x6c62272e07bb0142ULL};
        std::uint64_t m_low{0x62b821756295c58dULL};
    };
} // namespace tactile::fem::detail
