#pragma once

#include <catch2/catch.hpp>

#include <careful/base/fwd/files.h>

#include <careful/base/files.h>
#include <careful/base/fmt.h>
#include <careful/base/message_sinks.h>
#include <careful/base/messages.h>
#include <careful/base/strings.h>

#include <iomanip>
#include <string>
#include <vector>

#define CHECK_EC(ec)                                                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL(ec.message());                                                                                        \
        }                                                                                                              \
    } while (0)

namespace Catch
{
    template<>
    struct StringMaker<careful::LocalizedString>
    {
        static const std::string convert(const careful::LocalizedString& value)
        {
            return "LL\"" + value.data() + "\"";
        }
    };

    template<>
    struct StringMaker<careful::Path>
    {
        static const std::string convert(const careful::Path& value) { return "\"" + value.native() + "\""; }
    };
}

namespace careful
{
    inline std::ostream& operator<<(std::ostream& os, const LocalizedString& value)
    {
        return os << "LL" << std::quoted(value.data());
    }

    inline std::ostream& operator<<(std::ostream& os, const Path& value) { return os << value.native(); }

    template<class T>
    inline auto operator<<(std::ostream& os, const Optional<T>& value) -> decltype(os << *(value.get()))
    {
        if (auto v = value.get())
        {
            return os << *v;
        }
        else
        {
            return os << "nullopt";
        }
    }
}

namespace careful::Test
{
    // Records everything printed, without color.
    struct CapturingMessageSink final : MessageSink
    {
        void print(Color, StringView sv) override { output.append(sv.data(), sv.size()); }
        using MessageSink::print;

        std::string output;
    };

    const Path& base_temporary_directory() noexcept;

    // Returns base_temporary_directory() / name, emptied.
    Path make_clean_directory(const Filesystem& fs, StringView name);

    // Creates `<root>/library/std/src/lib.rs` and `<root>/Cargo.lock` and returns `<root>/library`.
    Path make_fake_library_source(const Filesystem& fs, const Path& root);
}
