#include <careful/base/path.h>

#include <algorithm>

namespace
{
    using namespace careful;

    struct IsSlash
    {
        constexpr bool operator()(const char c) const noexcept
        {
#if defined(_WIN32)
            return c == '/' || c == '\\';
#else
            return c == '/';
#endif
        }
    };

    constexpr IsSlash is_slash;

    const char* find_root_name_end(const char* const first, const char* const last) noexcept
    {
#if defined(_WIN32)
        // only drive letters are recognized as root names
        if (last - first >= 2 && first[1] == ':' &&
            ((first[0] >= 'A' && first[0] <= 'Z') || (first[0] >= 'a' && first[0] <= 'z')))
        {
            return first + 2;
        }
#endif
        (void)last;
        return first;
    }

    const char* find_relative_path(const char* const first, const char* const last) noexcept
    {
        return std::find_if_not(find_root_name_end(first, last), last, is_slash);
    }

    StringView parse_parent_path(const StringView str) noexcept
    {
        const auto first = str.data();
        auto last = first + str.size();
        const auto relative_path = find_relative_path(first, last);
        // drop the filename, then the separators before it, so "/cat/dog" becomes "/cat"
        while (relative_path != last && !is_slash(last[-1]))
        {
            --last;
        }

        while (relative_path != last && is_slash(last[-1]))
        {
            --last;
        }

        return StringView(first, static_cast<size_t>(last - first));
    }

    const char* find_filename(const char* const first, const char* last) noexcept
    {
        const auto relative_path = find_relative_path(first, last);
        while (relative_path != last && !is_slash(last[-1]))
        {
            --last;
        }

        return last;
    }

    StringView parse_filename(const StringView str) noexcept
    {
        const auto first = str.data();
        const auto last = first + str.size();
        const auto filename = find_filename(first, last);
        return StringView(filename, static_cast<size_t>(last - filename));
    }

    constexpr const char* find_extension(const char* const filename, const char* const last) noexcept
    {
        auto extension = last;
        if (filename == extension)
        {
            return last;
        }

        --extension;
        if (filename == extension)
        {
            // length 1: either "." or no dots
            return last;
        }

        if (*extension == '.')
        {
            if (filename == extension - 1 && extension[-1] == '.')
            {
                // ".."
                return last;
            }

            return extension;
        }

        while (filename != --extension)
        {
            if (*extension == '.')
            {
                return extension;
            }
        }

        // no dots, or only a leading dot
        return last;
    }

    bool is_absolute_path(const StringView str) noexcept
    {
#if defined(_WIN32)
        const auto first = str.data();
        const auto last = first + str.size();
        const auto root_name_end = find_root_name_end(first, last);
        return root_name_end != first && root_name_end != last && is_slash(*root_name_end);
#else
        return !str.empty() && str[0] == '/';
#endif
    }
}

namespace careful
{
    Path::Path(const StringView sv) : m_str(sv.to_string()) { }
    Path::Path(const std::string& s) : m_str(s) { }
    Path::Path(std::string&& s) : m_str(std::move(s)) { }
    Path::Path(const char* s) : m_str(s) { }

    const std::string& Path::native() const& noexcept { return m_str; }
    std::string&& Path::native() && noexcept { return std::move(m_str); }
    Path::operator StringView() const noexcept { return m_str; }

    const char* Path::c_str() const noexcept { return m_str.c_str(); }

    bool Path::empty() const noexcept { return m_str.empty(); }

    Path Path::operator/(StringView sv) const&
    {
        Path result = *this;
        result /= sv;
        return result;
    }

    Path Path::operator/(StringView sv) &&
    {
        *this /= sv;
        return std::move(*this);
    }

    Path Path::operator+(StringView sv) const&
    {
        Path result = *this;
        result.m_str.append(sv.data(), sv.size());
        return result;
    }

    Path Path::operator+(StringView sv) &&
    {
        m_str.append(sv.data(), sv.size());
        return std::move(*this);
    }

    Path& Path::operator/=(StringView sv)
    {
        if (is_absolute_path(sv))
        {
            m_str.assign(sv.data(), sv.size());
            return *this;
        }

        const char* my_first = m_str.data();
        const auto my_last = my_first + m_str.size();
        const auto other_first = sv.data();
        const auto other_last = other_first + sv.size();
        const auto my_root_name_end = find_root_name_end(my_first, my_last);
        const auto other_root_name_end = find_root_name_end(other_first, other_last);
        if (other_first != other_root_name_end &&
            !std::equal(my_first, my_root_name_end, other_first, other_root_name_end))
        {
            // a different root name replaces *this entirely
            m_str.assign(sv.data(), sv.size());
            return *this;
        }

        if (other_root_name_end != other_last && is_slash(*other_root_name_end))
        {
            m_str.erase(static_cast<size_t>(my_root_name_end - my_first));
        }
        else
        {
            const auto my_relative_first = std::find_if_not(my_root_name_end, my_last, is_slash);
            if (my_relative_first != my_last && !is_slash(my_last[-1]))
            {
                m_str.push_back(preferred_separator);
            }
        }

        m_str.append(other_root_name_end, static_cast<size_t>(other_last - other_root_name_end));
        return *this;
    }

    Path& Path::operator+=(StringView sv)
    {
        m_str.append(sv.data(), sv.size());
        return *this;
    }

    void Path::clear() { m_str.clear(); }

    bool Path::make_parent_path()
    {
        const auto parent = parent_path();
        if (parent.size() == m_str.size())
        {
            return false;
        }

        m_str.resize(parent.size());
        return true;
    }

    StringView Path::parent_path() const { return parse_parent_path(m_str); }
    StringView Path::filename() const { return parse_filename(m_str); }

    StringView Path::extension() const
    {
        const auto name = filename();
        const auto extension = find_extension(name.begin(), name.end());
        return StringView(extension, name.end());
    }

    StringView Path::stem() const
    {
        const auto name = filename();
        const auto extension = find_extension(name.begin(), name.end());
        return StringView(name.begin(), extension);
    }

    bool Path::is_absolute() const { return is_absolute_path(m_str); }

    bool Path::is_relative() const { return !is_absolute(); }
}
