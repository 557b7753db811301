#pragma once

#include <careful/base/fmt.h>
#include <careful/base/stringview.h>

#include <string>

namespace careful
{
#if defined(_WIN32)
    inline constexpr char preferred_separator = '\\';
#else
    inline constexpr char preferred_separator = '/';
#endif

    struct Path
    {
        Path() = default;
        Path(const StringView sv);
        Path(const std::string& s);
        Path(std::string&& s);
        Path(const char* s);

        const std::string& native() const& noexcept;
        std::string&& native() && noexcept;
        operator StringView() const noexcept;

        const char* c_str() const noexcept;

        bool empty() const noexcept;

        // Lexically resolves `sv` relative to *this; an absolute `sv` replaces *this.
        Path operator/(StringView sv) const&;
        Path operator/(StringView sv) &&;
        Path operator+(StringView sv) const&;
        Path operator+(StringView sv) &&;

        Path& operator/=(StringView sv);
        Path& operator+=(StringView sv);

        void clear();

        // Sets *this to parent_path, returns whether anything was removed
        bool make_parent_path();

        StringView parent_path() const;
        StringView filename() const;
        StringView extension() const;
        StringView stem() const;

        bool is_absolute() const;
        bool is_relative() const;

    private:
        std::string m_str;
    };
}

template<class Char>
struct fmt::range_format_kind<careful::Path, Char>
    : std::integral_constant<fmt::range_format, fmt::range_format::disabled>
{
};

CAREFUL_FORMAT_AS(careful::Path, careful::StringView);
