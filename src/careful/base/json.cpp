#include <careful/base/json.h>
#include <careful/base/messages.h>
#include <careful/base/optional.h>
#include <careful/base/strings.h>

#include <math.h>

#include <new>

namespace careful::Json
{
    using VK = ValueKind;

    // struct Value {
    namespace impl
    {
        template<ValueKind Vk>
        using ValueKindConstant = std::integral_constant<ValueKind, Vk>;

        struct ValueImpl
        {
            VK tag;
            union
            {
                std::nullptr_t null;
                bool boolean;
                int64_t integer;
                double number;
                std::string string;
                Array array;
                Object object;
            };

            ValueImpl(ValueKindConstant<VK::Null> vk, std::nullptr_t) : tag(vk), null() { }
            ValueImpl(ValueKindConstant<VK::Boolean> vk, bool b) : tag(vk), boolean(b) { }
            ValueImpl(ValueKindConstant<VK::Integer> vk, int64_t i) : tag(vk), integer(i) { }
            ValueImpl(ValueKindConstant<VK::Number> vk, double d) : tag(vk), number(d) { }
            ValueImpl(ValueKindConstant<VK::String> vk, std::string&& s) : tag(vk), string(std::move(s)) { }
            ValueImpl(ValueKindConstant<VK::String> vk, const std::string& s) : tag(vk), string(s) { }
            ValueImpl(ValueKindConstant<VK::Array> vk, Array&& arr) : tag(vk), array(std::move(arr)) { }
            ValueImpl(ValueKindConstant<VK::Array> vk, const Array& arr) : tag(vk), array(arr) { }
            ValueImpl(ValueKindConstant<VK::Object> vk, Object&& obj) : tag(vk), object(std::move(obj)) { }
            ValueImpl(ValueKindConstant<VK::Object> vk, const Object& obj) : tag(vk), object(obj) { }

            ValueImpl(const ValueImpl&) = delete;
            ValueImpl& operator=(const ValueImpl&) = delete;

            ~ValueImpl() { destroy_underlying(); }

        private:
            void destroy_underlying() noexcept
            {
                switch (tag)
                {
                    case VK::String: string.~basic_string(); break;
                    case VK::Array: array.~Array(); break;
                    case VK::Object: object.~Object(); break;
                    default: break;
                }
                new (&null) std::nullptr_t();
                tag = VK::Null;
            }
        };
    }

    using impl::ValueImpl;
    using impl::ValueKindConstant;

    VK Value::kind() const noexcept
    {
        if (underlying_)
        {
            return underlying_->tag;
        }

        return VK::Null;
    }

    bool Value::is_null() const noexcept { return kind() == VK::Null; }
    bool Value::is_boolean() const noexcept { return kind() == VK::Boolean; }
    bool Value::is_integer() const noexcept { return kind() == VK::Integer; }
    bool Value::is_number() const noexcept
    {
        auto k = kind();
        return k == VK::Integer || k == VK::Number;
    }
    bool Value::is_string() const noexcept { return kind() == VK::String; }
    bool Value::is_array() const noexcept { return kind() == VK::Array; }
    bool Value::is_object() const noexcept { return kind() == VK::Object; }

    bool Value::boolean(LineInfo li) const noexcept
    {
        Checks::check_exit(li, is_boolean());
        return underlying_->boolean;
    }
    int64_t Value::integer(LineInfo li) const noexcept
    {
        Checks::check_exit(li, is_integer());
        return underlying_->integer;
    }
    double Value::number(LineInfo li) const noexcept
    {
        auto k = kind();
        if (k == VK::Integer)
        {
            return static_cast<double>(underlying_->integer);
        }

        Checks::check_exit(li, k == VK::Number);
        return underlying_->number;
    }
    StringView Value::string(LineInfo li) const noexcept
    {
        Checks::check_exit(li, is_string());
        return underlying_->string;
    }

    const Array& Value::array(LineInfo li) const& noexcept
    {
        Checks::check_exit(li, is_array());
        return underlying_->array;
    }
    Array& Value::array(LineInfo li) & noexcept
    {
        Checks::check_exit(li, is_array());
        return underlying_->array;
    }
    Array&& Value::array(LineInfo li) && noexcept { return std::move(this->array(li)); }

    const Object& Value::object(LineInfo li) const& noexcept
    {
        Checks::check_exit(li, is_object());
        return underlying_->object;
    }
    Object& Value::object(LineInfo li) & noexcept
    {
        Checks::check_exit(li, is_object());
        return underlying_->object;
    }
    Object&& Value::object(LineInfo li) && noexcept { return std::move(this->object(li)); }

    const std::string* Value::maybe_string() const noexcept
    {
        if (is_string())
        {
            return &underlying_->string;
        }

        return nullptr;
    }

    const Array* Value::maybe_array() const noexcept
    {
        if (is_array())
        {
            return &underlying_->array;
        }

        return nullptr;
    }

    const Object* Value::maybe_object() const noexcept
    {
        if (is_object())
        {
            return &underlying_->object;
        }

        return nullptr;
    }

    Value::Value() noexcept = default;
    Value::Value(Value&&) noexcept = default;
    Value& Value::operator=(Value&&) noexcept = default;

    Value::Value(const Value& other)
    {
        switch (other.kind())
        {
            case ValueKind::Null: return; // default construct underlying_
            case ValueKind::Boolean:
                underlying_.reset(new ValueImpl(ValueKindConstant<VK::Boolean>(), other.underlying_->boolean));
                break;
            case ValueKind::Integer:
                underlying_.reset(new ValueImpl(ValueKindConstant<VK::Integer>(), other.underlying_->integer));
                break;
            case ValueKind::Number:
                underlying_.reset(new ValueImpl(ValueKindConstant<VK::Number>(), other.underlying_->number));
                break;
            case ValueKind::String:
                underlying_.reset(new ValueImpl(ValueKindConstant<VK::String>(), other.underlying_->string));
                break;
            case ValueKind::Array:
                underlying_.reset(new ValueImpl(ValueKindConstant<VK::Array>(), other.underlying_->array));
                break;
            case ValueKind::Object:
                underlying_.reset(new ValueImpl(ValueKindConstant<VK::Object>(), other.underlying_->object));
                break;
            default: Checks::unreachable(CAREFUL_LINE_INFO);
        }
    }

    Value& Value::operator=(const Value& other)
    {
        if (this != &other)
        {
            Value copy(other);
            *this = std::move(copy);
        }

        return *this;
    }

    Value::~Value() = default;

    Value Value::null(std::nullptr_t) noexcept { return Value(); }
    Value Value::boolean(bool b) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Boolean>(), b);
        return val;
    }
    Value Value::integer(int64_t i) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Integer>(), i);
        return val;
    }
    Value Value::number(double d) noexcept
    {
        Checks::check_exit(CAREFUL_LINE_INFO, isfinite(d));
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Number>(), d);
        return val;
    }
    Value Value::string(std::string&& s) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::String>(), std::move(s));
        return val;
    }
    Value Value::array(Array&& arr) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Array>(), std::move(arr));
        return val;
    }
    Value Value::object(Object&& obj) noexcept
    {
        Value val;
        val.underlying_ = std::make_unique<ValueImpl>(ValueKindConstant<VK::Object>(), std::move(obj));
        return val;
    }

    bool operator==(const Value& lhs, const Value& rhs)
    {
        if (lhs.kind() != rhs.kind()) return false;

        switch (lhs.kind())
        {
            case ValueKind::Null: return true;
            case ValueKind::Boolean: return lhs.underlying_->boolean == rhs.underlying_->boolean;
            case ValueKind::Integer: return lhs.underlying_->integer == rhs.underlying_->integer;
            case ValueKind::Number: return lhs.underlying_->number == rhs.underlying_->number;
            case ValueKind::String: return lhs.underlying_->string == rhs.underlying_->string;
            case ValueKind::Array: return lhs.underlying_->array == rhs.underlying_->array;
            case ValueKind::Object: return lhs.underlying_->object == rhs.underlying_->object;
            default: Checks::unreachable(CAREFUL_LINE_INFO);
        }
    }
    // } struct Value

    // struct Array {
    Value& Array::push_back(std::string&& value) { return this->push_back(Json::Value::string(std::move(value))); }
    Value& Array::push_back(Value&& value) { return underlying_.emplace_back(std::move(value)); }

    bool operator==(const Array& lhs, const Array& rhs) { return lhs.underlying_ == rhs.underlying_; }
    // } struct Array

    // struct Object {
    Value& Object::insert(StringView key, Value&& value)
    {
        Checks::check_exit(CAREFUL_LINE_INFO, !contains(key));
        underlying_.emplace_back(key.to_string(), std::move(value));
        return underlying_.back().second;
    }

    const Value* Object::get(StringView key) const noexcept
    {
        for (auto&& entry : underlying_)
        {
            if (entry.first == key)
            {
                return &entry.second;
            }
        }

        return nullptr;
    }

    bool operator==(const Object& lhs, const Object& rhs) { return lhs.underlying_ == rhs.underlying_; }
    // } struct Object

    // auto parse() {
    namespace
    {
        constexpr bool is_ascii_digit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

        void utf8_append_code_point(std::string& out, uint32_t code_point)
        {
            if (code_point < 0x80)
            {
                out.push_back(static_cast<char>(code_point));
            }
            else if (code_point < 0x800)
            {
                out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else if (code_point < 0x10000)
            {
                out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
        }

        // Recursive descent over bytes; stops at the first error.
        struct Parser
        {
            Parser(StringView text, StringView origin) : m_text(text), m_origin(origin) { }

            bool at_eof() const noexcept { return m_pos == m_text.size(); }
            char cur() const noexcept { return at_eof() ? '\0' : m_text[m_pos]; }
            bool failed() const noexcept { return m_error.has_value(); }

            void next() noexcept
            {
                if (at_eof()) return;
                if (m_text[m_pos] == '\n')
                {
                    ++m_row;
                    m_column = 1;
                }
                else
                {
                    ++m_column;
                }

                ++m_pos;
            }

            void skip_whitespace() noexcept
            {
                for (;;)
                {
                    const char ch = cur();
                    if (at_eof() || (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n')) return;
                    next();
                }
            }

            void add_error(LocalizedString&& message)
            {
                if (failed()) return;
                m_error.emplace(msg::format(msgJsonErrorLocation,
                                            msg::path = m_origin,
                                            msg::row = m_row,
                                            msg::column = m_column)
                                    .append(message));
            }

            void add_unexpected()
            {
                if (at_eof())
                {
                    add_error(msg::format(msgJsonUnexpectedEof));
                }
                else
                {
                    add_error(msg::format(msgJsonUnexpectedCharacter));
                }
            }

            Optional<uint32_t> parse_hex4()
            {
                uint32_t code_unit = 0;
                for (int i = 0; i < 4; ++i)
                {
                    next();
                    const char ch = cur();
                    code_unit *= 16;
                    if (is_ascii_digit(ch))
                    {
                        code_unit += static_cast<uint32_t>(ch - '0');
                    }
                    else if (ch >= 'a' && ch <= 'f')
                    {
                        code_unit += static_cast<uint32_t>(ch - 'a' + 10);
                    }
                    else if (ch >= 'A' && ch <= 'F')
                    {
                        code_unit += static_cast<uint32_t>(ch - 'A' + 10);
                    }
                    else
                    {
                        return nullopt;
                    }
                }

                next();
                return code_unit;
            }

            std::string parse_string()
            {
                Checks::check_exit(CAREFUL_LINE_INFO, cur() == '"');
                next();

                std::string res;
                uint32_t pending_leading_surrogate = 0;
                while (!at_eof())
                {
                    const char ch = cur();
                    if (ch == '"')
                    {
                        next();
                        if (pending_leading_surrogate) utf8_append_code_point(res, pending_leading_surrogate);
                        return res;
                    }

                    if (static_cast<unsigned char>(ch) <= 0x1F)
                    {
                        add_error(msg::format(msgJsonControlCharacterInString));
                        return res;
                    }

                    if (ch != '\\')
                    {
                        if (pending_leading_surrogate)
                        {
                            utf8_append_code_point(res, pending_leading_surrogate);
                            pending_leading_surrogate = 0;
                        }

                        res.push_back(ch);
                        next();
                        continue;
                    }

                    next();
                    const char escaped = cur();
                    uint32_t code_point;
                    switch (escaped)
                    {
                        case '"': code_point = '"'; break;
                        case '\\': code_point = '\\'; break;
                        case '/': code_point = '/'; break;
                        case 'b': code_point = '\b'; break;
                        case 'f': code_point = '\f'; break;
                        case 'n': code_point = '\n'; break;
                        case 'r': code_point = '\r'; break;
                        case 't': code_point = '\t'; break;
                        case 'u':
                        {
                            auto maybe_code_unit = parse_hex4();
                            if (auto code_unit = maybe_code_unit.get())
                            {
                                if (pending_leading_surrogate && *code_unit >= 0xDC00 && *code_unit <= 0xDFFF)
                                {
                                    utf8_append_code_point(
                                        res,
                                        0x10000 + ((pending_leading_surrogate - 0xD800) << 10) + (*code_unit - 0xDC00));
                                    pending_leading_surrogate = 0;
                                    continue;
                                }

                                if (pending_leading_surrogate)
                                {
                                    utf8_append_code_point(res, pending_leading_surrogate);
                                    pending_leading_surrogate = 0;
                                }

                                if (*code_unit >= 0xD800 && *code_unit <= 0xDBFF)
                                {
                                    pending_leading_surrogate = *code_unit;
                                }
                                else
                                {
                                    utf8_append_code_point(res, *code_unit);
                                }

                                continue;
                            }

                            add_error(msg::format(msgJsonInvalidEscape));
                            return res;
                        }
                        default:
                            if (at_eof())
                            {
                                add_error(msg::format(msgJsonUnexpectedEof));
                            }
                            else
                            {
                                add_error(msg::format(msgJsonInvalidEscape));
                            }

                            return res;
                    }

                    next();
                    if (pending_leading_surrogate)
                    {
                        utf8_append_code_point(res, pending_leading_surrogate);
                        pending_leading_surrogate = 0;
                    }

                    utf8_append_code_point(res, code_point);
                }

                add_error(msg::format(msgJsonUnexpectedEof));
                return res;
            }

            Value parse_number()
            {
                std::string number_to_parse;
                bool floating = false;
                if (cur() == '-')
                {
                    number_to_parse.push_back('-');
                    next();
                }

                if (!is_ascii_digit(cur()))
                {
                    add_unexpected();
                    return Value();
                }

                if (cur() == '0')
                {
                    number_to_parse.push_back('0');
                    next();
                    if (is_ascii_digit(cur()))
                    {
                        add_error(msg::format(msgJsonInvalidNumber, msg::value = number_to_parse));
                        return Value();
                    }
                }

                while (is_ascii_digit(cur()))
                {
                    number_to_parse.push_back(cur());
                    next();
                }

                if (cur() == '.')
                {
                    floating = true;
                    number_to_parse.push_back('.');
                    next();
                    if (!is_ascii_digit(cur()))
                    {
                        add_error(msg::format(msgJsonInvalidNumber, msg::value = number_to_parse));
                        return Value();
                    }

                    while (is_ascii_digit(cur()))
                    {
                        number_to_parse.push_back(cur());
                        next();
                    }
                }

                if (cur() == 'e' || cur() == 'E')
                {
                    floating = true;
                    number_to_parse.push_back('e');
                    next();
                    if (cur() == '-' || cur() == '+')
                    {
                        number_to_parse.push_back(cur());
                        next();
                    }

                    if (!is_ascii_digit(cur()))
                    {
                        add_error(msg::format(msgJsonInvalidNumber, msg::value = number_to_parse));
                        return Value();
                    }

                    while (is_ascii_digit(cur()))
                    {
                        number_to_parse.push_back(cur());
                        next();
                    }
                }

                if (!floating)
                {
                    if (auto res = Strings::strto<long long>(number_to_parse).get())
                    {
                        return Value::integer(static_cast<int64_t>(*res));
                    }
                }

                if (auto res = Strings::strto<double>(number_to_parse).get())
                {
                    if (isfinite(*res))
                    {
                        return Value::number(*res);
                    }
                }

                add_error(msg::format(msgJsonInvalidNumber, msg::value = number_to_parse));
                return Value();
            }

            Value parse_keyword()
            {
                StringView rest = m_text.substr(m_pos);
                if (rest.starts_with("true"))
                {
                    advance(4);
                    return Value::boolean(true);
                }

                if (rest.starts_with("false"))
                {
                    advance(5);
                    return Value::boolean(false);
                }

                if (rest.starts_with("null"))
                {
                    advance(4);
                    return Value::null(nullptr);
                }

                add_unexpected();
                return Value();
            }

            Value parse_array()
            {
                Checks::check_exit(CAREFUL_LINE_INFO, cur() == '[');
                next();

                Array arr;
                skip_whitespace();
                if (cur() == ']')
                {
                    next();
                    return Value::array(std::move(arr));
                }

                for (;;)
                {
                    arr.push_back(parse_value());
                    if (failed()) return Value();

                    skip_whitespace();
                    if (cur() == ',')
                    {
                        next();
                        continue;
                    }

                    if (cur() == ']')
                    {
                        next();
                        return Value::array(std::move(arr));
                    }

                    add_unexpected();
                    return Value();
                }
            }

            Value parse_object()
            {
                Checks::check_exit(CAREFUL_LINE_INFO, cur() == '{');
                next();

                Object obj;
                skip_whitespace();
                if (cur() == '}')
                {
                    next();
                    return Value::object(std::move(obj));
                }

                for (;;)
                {
                    skip_whitespace();
                    if (cur() != '"')
                    {
                        add_unexpected();
                        return Value();
                    }

                    const auto key_row = m_row;
                    const auto key_column = m_column;
                    auto key = parse_string();
                    if (failed()) return Value();

                    skip_whitespace();
                    if (cur() != ':')
                    {
                        add_unexpected();
                        return Value();
                    }

                    next();
                    auto value = parse_value();
                    if (failed()) return Value();

                    if (obj.contains(key))
                    {
                        m_row = key_row;
                        m_column = key_column;
                        add_error(msg::format(msgJsonDuplicateKey, msg::value = key));
                        return Value();
                    }

                    obj.insert(key, std::move(value));
                    skip_whitespace();
                    if (cur() == ',')
                    {
                        next();
                        continue;
                    }

                    if (cur() == '}')
                    {
                        next();
                        return Value::object(std::move(obj));
                    }

                    add_unexpected();
                    return Value();
                }
            }

            Value parse_value()
            {
                skip_whitespace();
                if (at_eof())
                {
                    add_error(msg::format(msgJsonUnexpectedEof));
                    return Value();
                }

                switch (cur())
                {
                    case '{': return parse_object();
                    case '[': return parse_array();
                    case '"': return Value::string(parse_string());
                    case 'n':
                    case 't':
                    case 'f': return parse_keyword();
                    default:
                        if (cur() == '-' || is_ascii_digit(cur()))
                        {
                            return parse_number();
                        }

                        add_error(msg::format(msgJsonUnexpectedCharacter));
                        return Value();
                }
            }

            ExpectedL<Value> parse_document()
            {
                // skip a UTF-8 byte order mark
                if (m_text.starts_with("\xEF\xBB\xBF"))
                {
                    m_pos = 3;
                }

                auto val = parse_value();
                skip_whitespace();
                if (!failed() && !at_eof())
                {
                    add_error(msg::format(msgJsonTrailingCharacters));
                }

                if (auto error = m_error.get())
                {
                    return std::move(*error);
                }

                return val;
            }

        private:
            void advance(size_t count) noexcept
            {
                while (count-- != 0)
                {
                    next();
                }
            }

            StringView m_text;
            StringView m_origin;
            size_t m_pos = 0;
            int m_row = 1;
            int m_column = 1;
            Optional<LocalizedString> m_error;
        };
    }

    ExpectedL<Value> parse(StringView text, StringView origin)
    {
        Parser parser(text, origin);
        return parser.parse_document();
    }

    ExpectedL<std::vector<std::string>> parse_string_array(StringView text, StringView origin)
    {
        auto maybe_value = Json::parse(text, origin);
        if (!maybe_value)
        {
            return std::move(maybe_value).error();
        }

        std::vector<std::string> result;
        if (auto arr = maybe_value.get()->maybe_array())
        {
            for (auto&& element : *arr)
            {
                if (auto str = element.maybe_string())
                {
                    result.push_back(*str);
                }
                else
                {
                    return msg::format(msgJsonExpectedStringArray);
                }
            }

            return result;
        }

        return msg::format(msgJsonExpectedStringArray);
    }
}
