#pragma once

#include <careful/base/stringview.h>

#include <stdint.h>

#include <string>

namespace careful::Hash
{
    // 64-bit FNV-1a
    struct Fnv1a64Hasher
    {
        void add_bytes(const void* start, const void* end) noexcept;
        void add_string(StringView sv) noexcept;
        // Adds `sv` followed by a NUL byte, so adjacent fields cannot run together.
        void add_field(StringView sv) noexcept;

        uint64_t get_hash() const noexcept { return m_state; }
        // decimal rendering of get_hash()
        std::string get_hash_string() const;

        void clear() noexcept;

    private:
        uint64_t m_state = offset_basis;

        static constexpr uint64_t offset_basis = 14695981039346656037ull;
        static constexpr uint64_t prime = 1099511628211ull;
    };

    uint64_t get_string_hash(StringView sv) noexcept;
}
