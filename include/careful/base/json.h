#pragma once

#include <careful/base/fwd/json.h>

#include <careful/base/checks.h>
#include <careful/base/expected.h>
#include <careful/base/stringview.h>

#include <stdint.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace careful::Json
{
    enum class ValueKind : int
    {
        Null,
        Boolean,
        Integer,
        Number,
        String,
        Array,
        Object
    };

    namespace impl
    {
        struct ValueImpl;
    }

    struct Value
    {
        Value() noexcept; // equivalent to Value::null()
        Value(Value&&) noexcept;
        Value(const Value&);
        Value& operator=(Value&&) noexcept;
        Value& operator=(const Value&);
        ~Value();

        ValueKind kind() const noexcept;

        bool is_null() const noexcept;
        bool is_boolean() const noexcept;
        bool is_integer() const noexcept;
        // either integer _or_ number
        bool is_number() const noexcept;
        bool is_string() const noexcept;
        bool is_array() const noexcept;
        bool is_object() const noexcept;

        // a.x() asserts when !a.is_x()
        bool boolean(LineInfo li) const noexcept;
        int64_t integer(LineInfo li) const noexcept;
        double number(LineInfo li) const noexcept;
        StringView string(LineInfo li) const noexcept;

        const Array& array(LineInfo li) const& noexcept;
        Array& array(LineInfo li) & noexcept;
        Array&& array(LineInfo li) && noexcept;

        const Object& object(LineInfo li) const& noexcept;
        Object& object(LineInfo li) & noexcept;
        Object&& object(LineInfo li) && noexcept;

        const std::string* maybe_string() const noexcept;
        const Array* maybe_array() const noexcept;
        const Object* maybe_object() const noexcept;

        static Value null(std::nullptr_t) noexcept;
        static Value boolean(bool) noexcept;
        static Value integer(int64_t i) noexcept;
        static Value number(double d) noexcept;
        static Value string(std::string&& s) noexcept;
        static Value string(StringView s) { return string(s.to_string()); }
        static Value array(Array&&) noexcept;
        static Value object(Object&&) noexcept;

        friend bool operator==(const Value& lhs, const Value& rhs);
        friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

    private:
        friend struct impl::ValueImpl;
        std::unique_ptr<impl::ValueImpl> underlying_;
    };

    struct Array
    {
    private:
        using underlying_t = std::vector<Value>;

    public:
        using iterator = underlying_t::iterator;
        using const_iterator = underlying_t::const_iterator;

        Value& push_back(std::string&& value);
        Value& push_back(Value&& value);

        std::size_t size() const noexcept { return this->underlying_.size(); }

        // asserts idx < size
        const Value& operator[](std::size_t idx) const noexcept
        {
            Checks::check_exit(CAREFUL_LINE_INFO, idx < this->size());
            return this->underlying_[idx];
        }

        iterator begin() { return underlying_.begin(); }
        iterator end() { return underlying_.end(); }
        const_iterator begin() const { return underlying_.cbegin(); }
        const_iterator end() const { return underlying_.cend(); }

        friend bool operator==(const Array& lhs, const Array& rhs);
        friend bool operator!=(const Array& lhs, const Array& rhs) { return !(lhs == rhs); }

    private:
        underlying_t underlying_;
    };

    struct Object
    {
    private:
        using value_type = std::pair<std::string, Value>;
        using underlying_t = std::vector<value_type>;

    public:
        using const_iterator = underlying_t::const_iterator;

        // asserts if the key is found
        Value& insert(StringView key, Value&& value);

        const Value* get(StringView key) const noexcept;
        bool contains(StringView key) const noexcept { return this->get(key) != nullptr; }

        std::size_t size() const noexcept { return this->underlying_.size(); }

        const_iterator begin() const noexcept { return underlying_.cbegin(); }
        const_iterator end() const noexcept { return underlying_.cend(); }

        friend bool operator==(const Object& lhs, const Object& rhs);
        friend bool operator!=(const Object& lhs, const Object& rhs) { return !(lhs == rhs); }

    private:
        underlying_t underlying_;
    };

    // Parses a complete JSON document. Errors are prefixed with `origin:row:column: `.
    ExpectedL<Value> parse(StringView text, StringView origin = {});

    // Parses a JSON document that must be an array of strings.
    ExpectedL<std::vector<std::string>> parse_string_array(StringView text, StringView origin = {});
}
