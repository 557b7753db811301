#pragma once

#include <careful/base/fmt.h>
#include <careful/base/optional.h>
#include <careful/base/stringview.h>

#include <iterator>
#include <string>
#include <type_traits>
#include <vector>

namespace careful::Strings::details
{
    void append_internal(std::string& into, char c);
    void append_internal(std::string& into, const char* v);
    void append_internal(std::string& into, const std::string& s);
    void append_internal(std::string& into, StringView s);
    template<class T, class = decltype(std::declval<const T&>().to_string(std::declval<std::string&>()))>
    void append_internal(std::string& into, const T& t)
    {
        t.to_string(into);
    }
    template<class T,
             class = void,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, char> && !std::is_same_v<T, bool>, int> = 0>
    void append_internal(std::string& into, const T& t)
    {
        fmt::format_to(std::back_inserter(into), "{}", t);
    }

    static constexpr struct IdentityTransformer
    {
        template<class T>
        T&& operator()(T&& t) const noexcept
        {
            return static_cast<T&&>(t);
        }
    } identity_transformer;
}

namespace careful::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string into;
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    [[nodiscard]] std::string ascii_to_lowercase(StringView s);

    template<class InputIterator, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter,
                                   InputIterator first,
                                   InputIterator last,
                                   Transformer transformer)
    {
        std::string output;
        if (first == last)
        {
            return output;
        }

        for (;;)
        {
            Strings::append(output, transformer(*first));
            if (++first == last)
            {
                return output;
            }

            output.append(delimiter.data(), delimiter.size());
        }
    }

    template<class Container, class Transformer>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& v, Transformer transformer)
    {
        return join(delimiter, std::begin(v), std::end(v), transformer);
    }

    template<class InputIterator>
    [[nodiscard]] std::string join(StringLiteral delimiter, InputIterator first, InputIterator last)
    {
        return join(delimiter, first, last, details::identity_transformer);
    }

    template<class Container>
    [[nodiscard]] std::string join(StringLiteral delimiter, const Container& v)
    {
        return join(delimiter, std::begin(v), std::end(v), details::identity_transformer);
    }

    void inplace_trim(std::string& s);

    [[nodiscard]] StringView trim(StringView sv);

    void inplace_trim_all_and_remove_whitespace_strings(std::vector<std::string>& strings);

    // Splits on `delimiter`, dropping empty segments.
    [[nodiscard]] std::vector<std::string> split(StringView s, const char delimiter);

    [[nodiscard]] std::vector<std::string> split_keep_empty(StringView s, const char delimiter);

    const char* find_first_of(StringView searched, StringView candidates);

    // Equivalent to one of the `::strto[T]` functions. Returns `nullopt` if there is an error.
    template<class T>
    Optional<T> strto(StringView sv);

    template<>
    Optional<long long> strto<long long>(StringView);
    template<>
    Optional<unsigned long long> strto<unsigned long long>(StringView);
    template<>
    Optional<double> strto<double>(StringView);
}
