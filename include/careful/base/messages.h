#pragma once

#include <careful/base/fwd/messages.h>

#include <careful/base/fmt.h>
#include <careful/base/stringview.h>

#include <string>
#include <type_traits>
#include <vector>

namespace careful
{
    template<class T>
    struct identity
    {
        using type = T;
    };
    template<class T>
    using identity_t = typename identity<T>::type;
}

#define CAREFUL_DECL_MSG_TEMPLATE class... MessageTags, class... MessageTypes
#define CAREFUL_DECL_MSG_ARGS                                                                                          \
    ::careful::msg::MessageT<MessageTags...> _message_token,                                                           \
        ::careful::msg::TagArg<::careful::identity_t<MessageTags>, MessageTypes>... _message_args
#define CAREFUL_EXPAND_MSG_ARGS _message_token, _message_args...

namespace careful::msg
{
    namespace detail
    {
        template<class... Tags>
        struct MessageT<Tags...> make_message_base(Tags...);

        LocalizedString format_message_by_index(size_t index, fmt::format_args args);
        void format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args);
    }
    template<class Tag, class Type>
    struct TagArg
    {
        static_assert(!std::is_constructible<StringView, Type>::value);
        const Type& t;
        auto arg() const { return fmt::arg(Tag::name.c_str(), t); }
    };
    template<class Tag>
    struct TagArg<Tag, StringView>
    {
        StringView const t;
        auto arg() const { return fmt::arg(Tag::name.c_str(), t); }
    };

    template<class Type>
    using StringViewable = std::conditional_t<std::is_constructible<StringView, Type>::value, StringView, Type>;

    template<class... Tags>
    struct MessageT
    {
        const size_t index;
    };

    template<CAREFUL_DECL_MSG_TEMPLATE>
    LocalizedString format(CAREFUL_DECL_MSG_ARGS);
    template<CAREFUL_DECL_MSG_TEMPLATE>
    void format_to(LocalizedString&, CAREFUL_DECL_MSG_ARGS);

    extern template LocalizedString format<>(MessageT<>);
    extern template void format_to<>(LocalizedString&, MessageT<>);
}

namespace careful
{
    struct LocalizedString
    {
        LocalizedString() = default;
        operator StringView() const noexcept;
        const std::string& data() const noexcept;
        const std::string& to_string() const noexcept;

        template<class T, std::enable_if_t<std::is_same<char, T>::value, int> = 0>
        static LocalizedString from_raw(std::basic_string<T>&& s) noexcept;
        static LocalizedString from_raw(StringView s);

        LocalizedString& append_raw(char c) &;
        LocalizedString&& append_raw(char c) &&;
        LocalizedString& append_raw(StringView s) &;
        LocalizedString&& append_raw(StringView s) &&;
        LocalizedString& append(const LocalizedString& s) &;
        LocalizedString&& append(const LocalizedString& s) &&;
        template<CAREFUL_DECL_MSG_TEMPLATE>
        LocalizedString& append(CAREFUL_DECL_MSG_ARGS) &
        {
            msg::format_to(*this, CAREFUL_EXPAND_MSG_ARGS);
            return *this;
        }
        template<CAREFUL_DECL_MSG_TEMPLATE>
        LocalizedString&& append(CAREFUL_DECL_MSG_ARGS) &&
        {
            return std::move(append(CAREFUL_EXPAND_MSG_ARGS));
        }

        friend bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept;
        friend bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept;
        bool empty() const noexcept;
        void clear() noexcept;

        friend void msg::detail::format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args);

    private:
        std::string m_data;

        explicit LocalizedString(StringView data);
        explicit LocalizedString(std::string&& data) noexcept;
    };

    // Every diagnostic that terminates the tool starts with this prefix.
    inline constexpr StringLiteral FatalErrorPrefix = "fatal error: ";
    LocalizedString fatal_error_prefix();
    inline constexpr StringLiteral ErrorPrefix = "error: ";
    LocalizedString error_prefix();
    inline constexpr StringLiteral InternalErrorPrefix = "internal error: ";
    LocalizedString internal_error_prefix();
}

CAREFUL_FORMAT_AS(careful::LocalizedString, careful::StringView);

namespace careful::msg
{
    namespace detail
    {
        template<class... FmtArgs>
        LocalizedString format_impl(std::size_t index, FmtArgs&&... args)
        {
            // no forward to intentionally make an lvalue here
            return detail::format_message_by_index(index, fmt::make_format_args(args...));
        }
        template<class... FmtArgs>
        void format_to_impl(LocalizedString& s, std::size_t index, FmtArgs&&... args)
        {
            // no forward to intentionally make an lvalue here
            return detail::format_message_by_index_to(s, index, fmt::make_format_args(args...));
        }
    }

    template<class... Tags, class... Types>
    LocalizedString format(MessageT<Tags...> m, TagArg<identity_t<Tags>, Types>... args)
    {
        return detail::format_impl(m.index, args.arg()...);
    }
    template<class... Tags, class... Types>
    void format_to(LocalizedString& s, MessageT<Tags...> m, TagArg<identity_t<Tags>, Types>... args)
    {
        return detail::format_to_impl(s, m.index, args.arg()...);
    }

    inline void println() { msg::write_unlocalized_text(Color::none, "\n"); }

    inline void print(Color c, const LocalizedString& s) { msg::write_unlocalized_text(c, s); }
    inline void print(const LocalizedString& s) { msg::write_unlocalized_text(Color::none, s); }
    inline void println(Color c, const LocalizedString& s)
    {
        msg::write_unlocalized_text(c, s);
        msg::write_unlocalized_text(Color::none, "\n");
    }
    inline void println(const LocalizedString& s)
    {
        msg::write_unlocalized_text(Color::none, s);
        msg::write_unlocalized_text(Color::none, "\n");
    }

    template<CAREFUL_DECL_MSG_TEMPLATE>
    [[nodiscard]] LocalizedString format_error(CAREFUL_DECL_MSG_ARGS)
    {
        auto s = error_prefix();
        msg::format_to(s, CAREFUL_EXPAND_MSG_ARGS);
        return s;
    }

    template<CAREFUL_DECL_MSG_TEMPLATE>
    void print(CAREFUL_DECL_MSG_ARGS)
    {
        print(msg::format(CAREFUL_EXPAND_MSG_ARGS));
    }
    template<CAREFUL_DECL_MSG_TEMPLATE>
    void println(CAREFUL_DECL_MSG_ARGS)
    {
        println(msg::format(CAREFUL_EXPAND_MSG_ARGS));
    }
    template<CAREFUL_DECL_MSG_TEMPLATE>
    void println(Color c, CAREFUL_DECL_MSG_ARGS)
    {
        println(c, msg::format(CAREFUL_EXPAND_MSG_ARGS));
    }

#define DECLARE_MSG_ARG(NAME, EXAMPLE)                                                                                 \
    static constexpr struct NAME##_t                                                                                   \
    {                                                                                                                  \
        static const ::careful::StringLiteral name;                                                                    \
        template<class T>                                                                                              \
        TagArg<NAME##_t, StringViewable<T>> operator=(const T& t) const noexcept                                       \
        {                                                                                                              \
            return TagArg<NAME##_t, StringViewable<T>>{t};                                                             \
        }                                                                                                              \
    } NAME = {};

#include <careful/base/message-args.inc.h>

#undef DECLARE_MSG_ARG
}
namespace careful
{

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    extern const decltype(::careful::msg::detail::make_message_base ARGS) msg##NAME;

#include <careful/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}
