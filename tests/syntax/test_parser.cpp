#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

#include "envfile/syntax/parser.hpp"

using envfile::syntax::QuoteClass;

namespace {

auto single(std::string_view text) -> envfile::syntax::Binding {
    auto bindings = envfile::syntax::parse(text);
    REQUIRE(bindings.size() == 1);
    return bindings.front();
}

auto value_of(std::string_view text) -> std::string {
    auto binding = single(text);
    REQUIRE(binding.value.has_value());
    return *binding.value;
}

} // anonymous namespace

TEST_CASE("parse basic KEY=VALUE lines", "[syntax][parser]") {
    auto bindings = envfile::syntax::parse("FOO=bar\nBAZ=qux\n");

    REQUIRE(bindings.size() == 2);
    CHECK(bindings[0].key == "FOO");
    CHECK(bindings[0].value == "bar");
    CHECK(bindings[1].key == "BAZ");
    CHECK(bindings[1].value == "qux");
    CHECK(bindings[0].original.line == 1);
    CHECK(bindings[1].original.line == 2);
}

TEST_CASE("parse skips comments and blank lines", "[syntax][parser]") {
    auto bindings = envfile::syntax::parse(
        "# This is a comment\n"
        "\n"
        "KEY1=value1\n"
        "  \n"
        "   # Indented comment\n"
        "KEY2=value2\n");

    REQUIRE(bindings.size() == 2);
    CHECK(bindings[0].key == "KEY1");
    CHECK(bindings[1].key == "KEY2");
    CHECK(bindings[1].original.line == 6);
}

TEST_CASE("parse strips the export keyword", "[syntax][parser]") {
    SECTION("export followed by blanks") {
        auto b = single("export API_KEY=secret123");
        CHECK(b.key == "API_KEY");
        CHECK(b.value == "secret123");
    }

    SECTION("export as a key") {
        auto b = single("export=1");
        CHECK(b.key == "export");
        CHECK(b.value == "1");
    }
}

TEST_CASE("parse bare names without '='", "[syntax][parser]") {
    SECTION("bare name") {
        auto b = single("foo");
        CHECK(b.key == "foo");
        CHECK_FALSE(b.value.has_value());
    }

    SECTION("bare name with comment") {
        auto b = single("foo # note");
        CHECK(b.key == "foo");
        CHECK_FALSE(b.value.has_value());
    }

    SECTION("empty value is not a bare name") {
        auto b = single("foo=");
        REQUIRE(b.value.has_value());
        CHECK(b.value->empty());
    }
}

TEST_CASE("parse unquoted values", "[syntax][parser]") {
    CHECK(value_of("XX=TEST") == "TEST");
    CHECK(value_of("XX=TE ST") == "TE ST");
    CHECK(value_of("XX=  padded  ") == "padded");
    CHECK(value_of("PORT=8080 # server port") == "8080");
    CHECK(value_of("XX=a#b") == "a#b");
    CHECK(value_of("XX=$TEST") == "$TEST");
    CHECK(value_of("XX=\\$\\{TEST\\}") == "\\$\\{TEST\\}");
    CHECK(value_of("XX=${TEST:-default value}") == "${TEST:-default value}");
}

TEST_CASE("parse single-quoted values", "[syntax][parser]") {
    CHECK(value_of("XX='hello world'") == "hello world");
    CHECK(value_of("XX='hello\\nworld'") == "hello\\nworld");
    CHECK(value_of("XX='it\\'s'") == "it's");
    CHECK(value_of("XX='a\\\\b'") == "a\\b");
    CHECK(value_of("XX='\\$\\{TEST\\}'") == "\\$\\{TEST\\}");
    CHECK(value_of("XX='  keep  '") == "  keep  ");
    CHECK(value_of("XX=''") == "");
}

TEST_CASE("parse double-quoted values", "[syntax][parser]") {
    CHECK(value_of(R"(MSG="hello world")") == "hello world");
    CHECK(value_of(R"(ESCAPED="line1\nline2")") == "line1\nline2");
    CHECK(value_of(R"(TAB="hello\tworld")") == "hello\tworld");
    CHECK(value_of(R"(QUOTE="say \"hi\"")") == "say \"hi\"");
    CHECK(value_of(R"(BACKSLASH="path\\to\\file")") == "path\\to\\file");
    CHECK(value_of(R"(XX="\$\{TEST\}")") == "\\$\\{TEST\\}");
    CHECK(value_of(R"(XX="${TEST}")") == "${TEST}");
    CHECK(value_of(R"(XX="a" # comment)") == "a");
}

TEST_CASE("parse concatenates adjacent segments", "[syntax][parser]") {
    CHECK(value_of("XX=\"TE\"ST") == "TEST");
    CHECK(value_of("XX='TE'ST") == "TEST");
    CHECK(value_of("XX=\"TE\"'ST'") == "TEST");
    CHECK(value_of("XX=TE'ST'") == "TEST");
    CHECK(value_of("XX=TE\"ST\"") == "TEST");
    CHECK(value_of("XX=TE \"ST\"") == "TE ST");

    auto b = single("XX=a'b'\"c\"");
    REQUIRE(b.segments.size() == 3);
    CHECK(b.segments[0].quote == QuoteClass::Unquoted);
    CHECK(b.segments[1].quote == QuoteClass::SingleQuoted);
    CHECK(b.segments[2].quote == QuoteClass::DoubleQuoted);
}

TEST_CASE("parse multi-line quoted values", "[syntax][parser]") {
    auto bindings = envfile::syntax::parse("A=\"first\nsecond\"\nB='x\ny'\nC=3\n");

    REQUIRE(bindings.size() == 3);
    CHECK(bindings[0].value == "first\nsecond");
    CHECK(bindings[1].value == "x\ny");
    CHECK(bindings[2].value == "3");
    CHECK(bindings[2].original.line == 5);
}

TEST_CASE("parse accepts CRLF and CR line endings", "[syntax][parser]") {
    auto bindings = envfile::syntax::parse("A=1\r\nB=2\rC=3");

    REQUIRE(bindings.size() == 3);
    CHECK(bindings[0].value == "1");
    CHECK(bindings[1].value == "2");
    CHECK(bindings[2].value == "3");
    CHECK(bindings[2].original.line == 3);
}

TEST_CASE("parse single-quoted keys", "[syntax][parser]") {
    auto b = single("'my key'=v");
    CHECK(b.key == "my key");
    CHECK(b.value == "v");
}

TEST_CASE("parse skips malformed lines", "[syntax][parser]") {
    auto bindings = envfile::syntax::parse(
        "GOOD=value\n"
        "no equals sign\n"
        "=missing_key\n"
        "UNTERMINATED=\"oops\n"
        "ALSO_GOOD=another\n");

    REQUIRE(bindings.size() == 2);
    CHECK(bindings[0].key == "GOOD");
    CHECK(bindings[1].key == "ALSO_GOOD");
    CHECK(bindings[1].original.line == 5);
}

TEST_CASE("parse keeps quotes opened mid-value on one line", "[syntax][parser]") {
    SECTION("apostrophes in unquoted values do not pair across lines") {
        auto statements = envfile::syntax::parse_statements("K0=it's\nK1=it's\n");
        REQUIRE(statements.size() == 2);
        CHECK(statements[0].error);
        CHECK(statements[0].original.text == "K0=it's\n");
        CHECK(statements[1].error);
        CHECK(statements[1].original.line == 2);
        CHECK(envfile::syntax::parse("K0=it's\nK1=it's\n").empty());
    }

    SECTION("only the offending line is skipped") {
        auto bindings = envfile::syntax::parse("K0=it's\nK1=ok\nK2=say \"hi\nK3=\"x\"\n");
        REQUIRE(bindings.size() == 2);
        CHECK(bindings[0].key == "K1");
        CHECK(bindings[0].value == "ok");
        CHECK(bindings[0].original.line == 2);
        CHECK(bindings[1].key == "K3");
        CHECK(bindings[1].value == "x");
    }

    SECTION("a closed mid-value quote is fine") {
        CHECK(value_of("K=it's'\n") == "its");
        CHECK(value_of("K=a\"b c\"d\n") == "ab cd");
    }

    SECTION("a quote that opens the value may still span lines") {
        auto bindings = envfile::syntax::parse("K0='it\ns'\nK1=ok\n");
        REQUIRE(bindings.size() == 2);
        CHECK(bindings[0].value == "it\ns");
        CHECK(bindings[1].original.line == 3);
    }
}

TEST_CASE("parse_statements covers the whole input", "[syntax][parser]") {
    std::string text = "# header\n\na=b\n  bad line here\nexport c='d'  # tail\ne";
    auto statements = envfile::syntax::parse_statements(text);

    std::string joined;
    for (const auto& s : statements) joined += s.original.text;
    CHECK(joined == text);

    REQUIRE(statements.size() == 6);
    CHECK_FALSE(statements[0].binding.has_value());
    CHECK_FALSE(statements[1].binding.has_value());
    CHECK(statements[2].binding->key == "a");
    CHECK(statements[2].original.text == "a=b\n");
    CHECK(statements[3].error);
    CHECK(statements[4].binding->value == "d");
    CHECK(statements[5].binding->key == "e");
    CHECK_FALSE(statements[5].binding->value.has_value());
}

TEST_CASE("parse never fails on arbitrary text", "[syntax][parser]") {
    CHECK(envfile::syntax::parse("").empty());
    CHECK(envfile::syntax::parse("\n\n\n").empty());
    CHECK(envfile::syntax::parse("'").empty());
    CHECK(envfile::syntax::parse("a=\"").empty());
    CHECK(envfile::syntax::parse("=").empty());
    CHECK(envfile::syntax::parse("a='").empty());
}

TEST_CASE("parse reads a stream to the end", "[syntax][parser]") {
    std::istringstream in("a=b\nc=d");
    auto bindings = envfile::syntax::parse(in);

    REQUIRE(bindings.size() == 2);
    CHECK(bindings[1].value == "d");
}
