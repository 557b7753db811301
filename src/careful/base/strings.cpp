#include <careful/base/strings.h>

#include <errno.h>
#include <stdlib.h>

#include <algorithm>
#include <iterator>

using namespace careful;

namespace
{
    constexpr bool is_space_char(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    constexpr char tolower_char(char c) noexcept { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c; }
}

namespace careful::Strings::details
{
    void append_internal(std::string& into, char c) { into.push_back(c); }
    void append_internal(std::string& into, const char* v) { into.append(v); }
    void append_internal(std::string& into, const std::string& s) { into.append(s); }
    void append_internal(std::string& into, StringView s) { into.append(s.begin(), s.end()); }
}

std::string Strings::ascii_to_lowercase(StringView s)
{
    std::string result;
    result.reserve(s.size());
    std::transform(s.begin(), s.end(), std::back_inserter(result), tolower_char);
    return result;
}

void Strings::inplace_trim(std::string& s)
{
    s.erase(std::find_if_not(s.rbegin(), s.rend(), is_space_char).base(), s.end());
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), is_space_char));
}

StringView Strings::trim(StringView sv)
{
    auto last =
        std::find_if_not(std::make_reverse_iterator(sv.end()), std::make_reverse_iterator(sv.begin()), is_space_char)
            .base();
    auto first = std::find_if_not(sv.begin(), last, is_space_char);
    return StringView(first, last);
}

void Strings::inplace_trim_all_and_remove_whitespace_strings(std::vector<std::string>& strings)
{
    for (std::string& s : strings)
    {
        inplace_trim(s);
    }

    strings.erase(std::remove_if(strings.begin(), strings.end(), [](const std::string& s) { return s.empty(); }),
                  strings.end());
}

std::vector<std::string> Strings::split(StringView s, const char delimiter)
{
    std::vector<std::string> output;
    auto first = s.begin();
    const auto last = s.end();
    for (;;)
    {
        first = std::find_if(first, last, [=](const char c) { return c != delimiter; });
        if (first == last)
        {
            return output;
        }

        auto next = std::find(first, last, delimiter);
        output.emplace_back(first, next);
        first = next;
    }
}

std::vector<std::string> Strings::split_keep_empty(StringView s, const char delimiter)
{
    std::vector<std::string> output;
    auto first = s.begin();
    const auto last = s.end();
    for (;;)
    {
        auto next = std::find(first, last, delimiter);
        output.emplace_back(first, next);
        if (next == last)
        {
            return output;
        }

        first = next + 1;
    }
}

const char* Strings::find_first_of(StringView input, StringView chars)
{
    return std::find_first_of(input.begin(), input.end(), chars.begin(), chars.end());
}

template<>
Optional<long long> Strings::strto<long long>(StringView sv)
{
    // disallow initial whitespace
    if (sv.empty() || is_space_char(sv[0]))
    {
        return nullopt;
    }

    auto with_nul_terminator = sv.to_string();

    errno = 0;
    char* endptr = nullptr;
    long long res = strtoll(with_nul_terminator.c_str(), &endptr, 10);
    if (endptr != with_nul_terminator.data() + with_nul_terminator.size())
    {
        // contains invalid characters
        return nullopt;
    }
    else if (errno == ERANGE)
    {
        return nullopt;
    }

    return res;
}

template<>
Optional<unsigned long long> Strings::strto<unsigned long long>(StringView sv)
{
    // disallow initial whitespace and signs; strtoull silently negates "-1"
    if (sv.empty() || is_space_char(sv[0]) || sv[0] == '-' || sv[0] == '+')
    {
        return nullopt;
    }

    auto with_nul_terminator = sv.to_string();

    errno = 0;
    char* endptr = nullptr;
    unsigned long long res = strtoull(with_nul_terminator.c_str(), &endptr, 10);
    if (endptr != with_nul_terminator.data() + with_nul_terminator.size())
    {
        // contains invalid characters
        return nullopt;
    }
    else if (errno == ERANGE)
    {
        return nullopt;
    }

    return res;
}

template<>
Optional<double> Strings::strto<double>(StringView sv)
{
    // disallow initial whitespace
    if (sv.empty() || is_space_char(sv[0]))
    {
        return nullopt;
    }

    auto with_nul_terminator = sv.to_string();

    errno = 0;
    char* endptr = nullptr;
    double res = strtod(with_nul_terminator.c_str(), &endptr);
    if (endptr != with_nul_terminator.data() + with_nul_terminator.size())
    {
        // contains invalid characters
        return nullopt;
    }
    // else, we may have HUGE_VAL but we expect the caller to deal with that
    return res;
}
