#include <careful-test/util.h>

#include <careful/base/json.h>

using namespace careful;

TEST_CASE ("parse scalars", "[json]")
{
    CHECK(Json::parse("null").value_or_exit(CAREFUL_LINE_INFO).is_null());
    CHECK(Json::parse(" true ").value_or_exit(CAREFUL_LINE_INFO).boolean(CAREFUL_LINE_INFO));
    CHECK(!Json::parse("false").value_or_exit(CAREFUL_LINE_INFO).boolean(CAREFUL_LINE_INFO));
    CHECK(Json::parse("-42").value_or_exit(CAREFUL_LINE_INFO).integer(CAREFUL_LINE_INFO) == -42);
    CHECK(Json::parse("1.5e2").value_or_exit(CAREFUL_LINE_INFO).number(CAREFUL_LINE_INFO) == 150.0);
    CHECK(Json::parse("\"a\\\"b\\\\c\\n\"").value_or_exit(CAREFUL_LINE_INFO).string(CAREFUL_LINE_INFO) ==
          "a\"b\\c\n");
}

TEST_CASE ("parse unicode escapes", "[json]")
{
    CHECK(Json::parse(R"("\u00e9")").value_or_exit(CAREFUL_LINE_INFO).string(CAREFUL_LINE_INFO) == "\xC3\xA9");
    CHECK(Json::parse(R"("\ud83d\udc4d")").value_or_exit(CAREFUL_LINE_INFO).string(CAREFUL_LINE_INFO) ==
          "\xF0\x9F\x91\x8D");
}

TEST_CASE ("parse target specification", "[json]")
{
    auto value = Json::parse(R"({
  "arch": "x86_64",
  "crt-static-respected": true,
  "max-atomic-width": 64,
  "supported-sanitizers": [
    "address",
    "leak"
  ]
})",
                             "target-spec-json")
                     .value_or_exit(CAREFUL_LINE_INFO);
    auto object = value.maybe_object();
    REQUIRE(object != nullptr);
    CHECK(object->size() == 4);
    CHECK(object->contains("arch"));
    CHECK(!object->contains("os"));
    auto sanitizers = object->get("supported-sanitizers");
    REQUIRE(sanitizers != nullptr);
    auto array = sanitizers->maybe_array();
    REQUIRE(array != nullptr);
    REQUIRE(array->size() == 2);
    CHECK((*array)[1].string(CAREFUL_LINE_INFO) == "leak");
}

TEST_CASE ("parse errors", "[json]")
{
    auto truncated = Json::parse("[1, 2", "origin");
    REQUIRE(!truncated.has_value());
    CHECK(StringView{truncated.error().data()}.starts_with("origin:1:"));
    CHECK(StringView{truncated.error().data()}.contains("unexpected end of input"));

    auto trailing = Json::parse("{} x", "origin");
    REQUIRE(!trailing.has_value());
    CHECK(StringView{trailing.error().data()}.contains("unexpected characters after the top-level value"));

    auto duplicate = Json::parse("{\"a\": 1,\n \"a\": 2}", "origin");
    REQUIRE(!duplicate.has_value());
    CHECK(StringView{duplicate.error().data()}.starts_with("origin:2:"));
    CHECK(StringView{duplicate.error().data()}.contains("duplicated key \"a\""));

    CHECK(!Json::parse("\"tab\there\"").has_value());
    CHECK(!Json::parse("\"\\q\"").has_value());
    CHECK(!Json::parse("01").has_value());
    CHECK(!Json::parse("tru").has_value());
    CHECK(!Json::parse("").has_value());
}

TEST_CASE ("parse string arrays", "[json]")
{
    CHECK(Json::parse_string_array("[]").value_or_exit(CAREFUL_LINE_INFO).empty());
    CHECK(Json::parse_string_array("[\"-Cfoo\", \"--cfg\", \"bar\"]\n").value_or_exit(CAREFUL_LINE_INFO) ==
          std::vector<std::string>{"-Cfoo", "--cfg", "bar"});

    auto mixed = Json::parse_string_array("[\"a\", 1]", "cargo config");
    REQUIRE(!mixed.has_value());
    CHECK(StringView{mixed.error().data()}.contains("expected an array of strings"));
    CHECK(!Json::parse_string_array("\"-Cfoo\"").has_value());
}

TEST_CASE ("value equality", "[json]")
{
    Json::Object object;
    object.insert("a", Json::Value::integer(1));
    Json::Array array;
    array.push_back(Json::Value::string(StringView{"x"}));
    object.insert("b", Json::Value::array(std::move(array)));

    auto parsed = Json::parse(R"({"a": 1, "b": ["x"]})").value_or_exit(CAREFUL_LINE_INFO);
    CHECK(parsed == Json::Value::object(std::move(object)));
    CHECK(parsed != Json::Value::null(nullptr));
}
