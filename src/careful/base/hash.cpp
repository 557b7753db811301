#include <careful/base/fmt.h>
#include <careful/base/hash.h>

namespace careful::Hash
{
    void Fnv1a64Hasher::add_bytes(const void* start, const void* end) noexcept
    {
        auto first = static_cast<const unsigned char*>(start);
        const auto last = static_cast<const unsigned char*>(end);
        for (; first != last; ++first)
        {
            m_state ^= *first;
            m_state *= prime;
        }
    }

    void Fnv1a64Hasher::add_string(StringView sv) noexcept { add_bytes(sv.begin(), sv.end()); }

    void Fnv1a64Hasher::add_field(StringView sv) noexcept
    {
        static constexpr char separator = '\0';
        add_string(sv);
        add_bytes(&separator, &separator + 1);
    }

    std::string Fnv1a64Hasher::get_hash_string() const { return fmt::format("{}", m_state); }

    void Fnv1a64Hasher::clear() noexcept { m_state = offset_basis; }

    uint64_t get_string_hash(StringView sv) noexcept
    {
        Fnv1a64Hasher hasher;
        hasher.add_string(sv);
        return hasher.get_hash();
    }
}
