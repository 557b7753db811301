#include <careful-test/util.h>

#include <careful/base/hash.h>
#include <careful/base/strings.h>

#include <string>
#include <vector>

using namespace careful;

TEST_CASE ("split by char", "[strings]")
{
    using Strings::split;
    using result_t = std::vector<std::string>;
    REQUIRE(split(",,,,,,", ',').empty());
    REQUIRE(split(",,a,,b,,", ',') == result_t{"a", "b"});
    REQUIRE(split("hello world", ' ') == result_t{"hello", "world"});
    REQUIRE(split("no delimiters", ',') == result_t{"no delimiters"});
}

TEST_CASE ("split keeping empty segments", "[strings]")
{
    using Strings::split_keep_empty;
    using result_t = std::vector<std::string>;
    REQUIRE(split_keep_empty("", '\x1f') == result_t{""});
    REQUIRE(split_keep_empty("a\x1f\x1f"
                             "b",
                             '\x1f') == result_t{"a", "", "b"});
    REQUIRE(split_keep_empty("a\x1f", '\x1f') == result_t{"a", ""});
}

TEST_CASE ("trim", "[strings]")
{
    REQUIRE(Strings::trim("  a b \r\n") == "a b");
    REQUIRE(Strings::trim("\t\n").empty());

    std::vector<std::string> flags{" -Cfoo", "", "  ", "--cfg "};
    Strings::inplace_trim_all_and_remove_whitespace_strings(flags);
    REQUIRE(flags == std::vector<std::string>{"-Cfoo", "--cfg"});
}

TEST_CASE ("join and concat", "[strings]")
{
    REQUIRE(Strings::join(", ", std::vector<std::string>{"a", "b", "c"}) == "a, b, c");
    REQUIRE(Strings::join(", ", std::vector<std::string>{}).empty());
    REQUIRE(Strings::concat("abc", '-', 42, std::string("x"), StringView{"yz"}) == "abc-42xyz");
    REQUIRE(Strings::ascii_to_lowercase("YeS") == "yes");
}

TEST_CASE ("strto", "[strings]")
{
    REQUIRE(Strings::strto<long long>("-12") == -12LL);
    REQUIRE(!Strings::strto<long long>(" 12").has_value());
    REQUIRE(!Strings::strto<long long>("12a").has_value());
    REQUIRE(!Strings::strto<long long>("99999999999999999999").has_value());

    REQUIRE(Strings::strto<unsigned long long>("18446744073709551615") == 18446744073709551615ull);
    REQUIRE(!Strings::strto<unsigned long long>("-1").has_value());
    REQUIRE(!Strings::strto<unsigned long long>("").has_value());

    REQUIRE(Strings::strto<double>("2.5") == 2.5);
    REQUIRE(!Strings::strto<double>("2.5.1").has_value());
}

TEST_CASE ("fnv-1a", "[hash]")
{
    // reference values of the 64-bit FNV-1a test suite
    REQUIRE(Hash::get_string_hash("") == 0xcbf29ce484222325ull);
    REQUIRE(Hash::get_string_hash("a") == 0xaf63dc4c8601ec8cull);
    REQUIRE(Hash::get_string_hash("foobar") == 0x85944171f73967e8ull);

    Hash::Fnv1a64Hasher hasher;
    hasher.add_string("foo");
    hasher.add_string("bar");
    REQUIRE(hasher.get_hash() == 0x85944171f73967e8ull);
    REQUIRE(hasher.get_hash_string() == "9625390261332436968");

    hasher.clear();
    hasher.add_field("foo");
    hasher.add_field("bar");
    Hash::Fnv1a64Hasher shifted;
    shifted.add_field("fo");
    shifted.add_field("obar");
    REQUIRE(hasher.get_hash() != shifted.get_hash());
}
