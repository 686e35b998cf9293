#include "catch2/catch_approx.hpp"

#include <catch2/catch_test_macros.hpp>
#include <sjson/sjson.hpp>

#include <cmath>
#include <string>

using namespace sjson;

namespace {

    Value decode_ok(const std::string_view text, const DecodeOptions& opts = {}) {
        auto r = decode(text, 1, opts);
        INFO(r.err.format<ErrorFormat::Compact>());
        REQUIRE(r.ok());
        return r.value;
    }

    ErrorCode decode_code(const std::string_view text, const DecodeOptions& opts = {}) {
        return decode(text, 1, opts).err.code;
    }

    DecodeOptions strict() {
        DecodeOptions o;
        o.strict = true;
        return o;
    }

} // namespace

TEST_CASE("decode primitives", "[sjson][decode]") {
    CHECK(decode_ok("null").is_null());
    CHECK(decode_ok("true").as_bool());
    CHECK_FALSE(decode_ok("false").as_bool());
    CHECK(decode_ok("42").as_i64() == 42);
    CHECK(decode_ok("-17").as_i64() == -17);
    CHECK(decode_ok("3.5").as_double() == Catch::Approx(3.5));
    CHECK(decode_ok("-1.25e2").as_double() == Catch::Approx(-125.0));
    CHECK(decode_ok(R"("hello")").as_string() == "hello");
    CHECK(decode_ok(R"("")").as_string().empty());
}

TEST_CASE("decode reports next position", "[sjson][decode]") {
    auto r = decode(R"(  {"a": 1}  [2])");

    REQUIRE(r.ok());
    CHECK(r.next == 11);

    auto second = decode(R"(  {"a": 1}  [2])", r.next);
    REQUIRE(second.ok());
    CHECK(second.value == Value::array({2}));
    CHECK(second.next == 16);
}

TEST_CASE("decode nested document", "[sjson][decode]") {
    auto v = decode_ok(R"({
        "player": {
            "health": 100,
            "alive": true,
            "tags": ["a", "b"]
        },
        "n": null
    })");

    REQUIRE(v.is_object());
    const Value* player = v.find("player");
    REQUIRE(player != nullptr);
    CHECK(player->find("health")->as_i64() == 100);
    CHECK(player->find("alive")->as_bool());
    CHECK(player->find("tags")->size() == 2);
    CHECK(player->find("tags")->at(1)->as_string() == "b");
    CHECK(v.find("n")->is_null());
}

TEST_CASE("decode empty containers", "[sjson][decode]") {
    CHECK(decode_ok("{}").is_empty_object());
    CHECK(decode_ok("{ }").is_empty_object());
    CHECK(decode_ok("[]").is_array());
    CHECK(decode_ok("[]").size() == 0);

    auto v = decode_ok(R"({"e":{},"a":[]})");
    CHECK(v.find("e")->is_empty_object());
    CHECK(v.find("a")->is_array());
}

TEST_CASE("decode duplicate keys keep the last", "[sjson][decode]") {
    auto v = decode_ok(R"({"f": 1, "f": 2})");

    CHECK(v.size() == 1);
    CHECK(v.find("f")->as_i64() == 2);
}

TEST_CASE("decode string escapes", "[sjson][decode]") {
    auto v = decode_ok(R"("line\n\t\"quoted\"\\slash\/\b\f\r")");

    CHECK(v.as_string() == "line\n\t\"quoted\"\\slash/\b\f\r");
}

TEST_CASE("decode unicode escapes", "[sjson][decode]") {
    CHECK(decode_ok(R"("\u0041")").as_string() == "A");
    CHECK(decode_ok(R"("\u00A7")").as_string() == "\xC2\xA7");
    CHECK(decode_ok(R"("\u20AC")").as_string() == "\xE2\x82\xAC");
}

TEST_CASE("decode surrogate pairs", "[sjson][decode]") {
    CHECK(decode_ok(R"("\ud834\udd1e")").as_string() == "\xF0\x9D\x84\x9E");
    CHECK(decode_ok(R"("\uD83D\uDE02")").as_string() == "\xF0\x9F\x98\x82");
    CHECK(decode_ok(R"(" \"\uD834\uDD1E\" ")").as_string() == " \"\xF0\x9D\x84\x9E\" ");
}

TEST_CASE("decode lone surrogates", "[sjson][decode]") {
    CHECK(decode_ok(R"("a\uD800b")").as_string() == "ab");
    CHECK(decode_ok(R"("a\uDC00b")").as_string() == "ab");

    CHECK(decode_code(R"("\uD800")", strict()) == ErrorCode::InvalidUnicode);
    CHECK(decode_code(R"("\uDC00")", strict()) == ErrorCode::InvalidUnicode);
}

TEST_CASE("decode bad unicode escapes", "[sjson][decode]") {
    CHECK(decode_code(R"("\u12G4")") == ErrorCode::InvalidUnicode);
    CHECK(decode_code(R"("\u12)") == ErrorCode::UnterminatedString);
}

TEST_CASE("decode unknown escapes", "[sjson][decode]") {
    CHECK(decode_ok(R"("\q\x")").as_string() == "qx");
    CHECK(decode_code(R"("\q")", strict()) == ErrorCode::InvalidEscape);
}

TEST_CASE("decode raw control bytes", "[sjson][decode]") {
    const std::string text = "\"a\tb\"";

    CHECK(decode_ok(text).as_string() == "a\tb");
    CHECK(decode_code(text, strict()) == ErrorCode::InvalidString);
}

TEST_CASE("decode utf8 passthrough", "[sjson][decode]") {
    auto v = decode_ok(R"({"ru": "Привет", "cn": "你好"})");

    CHECK(v.find("ru")->as_string() == "Привет");
    CHECK(v.find("cn")->as_string() == "你好");
}

TEST_CASE("decode numbers", "[sjson][decode]") {
    CHECK(decode_ok("0").as_i64() == 0);
    CHECK(decode_ok("-0.5").as_double() == Catch::Approx(-0.5));
    CHECK(decode_ok("1E3").as_double() == Catch::Approx(1000.0));
    CHECK(decode_ok("2e-2").as_double() == Catch::Approx(0.02));
    CHECK(decode_ok("9223372036854775807").as_i64() == 9223372036854775807LL);

    auto big = decode_ok("92233720368547758070");
    CHECK_FALSE(big.is_integer());
    CHECK(big.as_double() > 9e18);
}

TEST_CASE("decode lenient numbers", "[sjson][decode]") {
    CHECK(decode_ok("01").as_i64() == 1);
    CHECK(decode_ok("1.").as_double() == Catch::Approx(1.0));
    CHECK(decode_ok("1.e2").as_double() == Catch::Approx(100.0));

    CHECK(decode_code("01", strict()) == ErrorCode::InvalidNumber);
    CHECK(decode_code("1.", strict()) == ErrorCode::InvalidNumber);
    CHECK(decode_ok("10", strict()).as_i64() == 10);
}

TEST_CASE("decode invalid numbers", "[sjson][decode]") {
    CHECK(decode_code(R"({"x": -})") == ErrorCode::InvalidNumber);
    CHECK(decode_code(R"({"x": 1e})") == ErrorCode::InvalidNumber);
    CHECK(decode_code(R"({"x": 1e+})") == ErrorCode::InvalidNumber);
    CHECK(decode_code("1+2") == ErrorCode::InvalidNumber);
    CHECK(decode_code("1e400") == ErrorCode::InvalidNumber);
    CHECK(decode_code("+1") == ErrorCode::UnexpectedToken);
}

TEST_CASE("decode numbers below double range are zero", "[sjson][decode]") {
    auto tiny = decode_ok("1e-400");
    CHECK_FALSE(tiny.is_integer());
    CHECK(tiny.as_double() == 0.0);

    auto negative = decode_ok("-1e-400");
    CHECK(negative.as_double() == 0.0);
    CHECK(std::signbit(negative.as_double()));

    CHECK(decode_ok("0.00001e-999999999999", strict()).as_double() == 0.0);
    CHECK(decode_ok("1.e-400").as_double() == 0.0);
    CHECK(decode_ok("[1e-400, 2]") == Value::array({0.0, 2}));

    CHECK(decode_code("1e400", strict()) == ErrorCode::InvalidNumber);
    CHECK(decode_code("-1e400") == ErrorCode::InvalidNumber);
    CHECK(decode_code("0.001e312") == ErrorCode::InvalidNumber);
}

TEST_CASE("decode comments", "[sjson][decode]") {
    auto v = decode_ok(R"(/* head */ { /* k */ "a" /* c */ : /* v */ [1, /* x */ 2] /* tail */ })");

    CHECK(v == Value::object({{"a", Value::array({1, 2})}}));

    CHECK(decode_code("/* open") == ErrorCode::UnterminatedComment);

    DecodeOptions no_comments;
    no_comments.allow_comments = false;
    CHECK(decode_code("/* c */ 1", no_comments) == ErrorCode::UnexpectedToken);
}

TEST_CASE("decode whitespace and comments do not change the result", "[sjson][decode]") {
    const Value compact = decode_ok(R"({"a":[1,2,{"b":null}],"c":"d"})");
    const Value spaced = decode_ok(" {\n\t\"a\" : [ 1 , 2 , { \"b\" : null } ] ,\r\n \"c\" : \"d\" } ");
    const Value commented = decode_ok(R"({/*1*/"a":[1,/*2*/2,{"b":null}],"c":"d"/*3*/})");

    CHECK(compact == spaced);
    CHECK(compact == commented);
}

TEST_CASE("decode lenient separators", "[sjson][decode]") {
    CHECK(decode_ok("[1 2 3]") == Value::array({1, 2, 3}));
    CHECK(decode_ok(R"({"a":1 "b":2})") == Value::object({{"a", 1}, {"b", 2}}));
    CHECK(decode_ok("[,1]") == Value::array({1}));

    CHECK(decode_code("[1 2]", strict()) == ErrorCode::UnexpectedToken);
    CHECK(decode_code("[,1]", strict()) == ErrorCode::UnexpectedToken);
    CHECK(decode_code(R"({"a":1 "b":2})", strict()) == ErrorCode::UnexpectedToken);
}

TEST_CASE("decode scalar keys", "[sjson][decode]") {
    auto v = decode_ok("{1: \"a\", true: 2, null: 3}");

    CHECK(v.find("1")->as_string() == "a");
    CHECK(v.find("true")->as_i64() == 2);
    CHECK(v.find("null")->as_i64() == 3);

    CHECK(decode_code("{1: 2}", strict()) == ErrorCode::InvalidKey);
    CHECK(decode_code("{[1]: 2}") == ErrorCode::InvalidKey);
}

TEST_CASE("decode malformed input", "[sjson][decode]") {
    CHECK(decode_code("") == ErrorCode::UnexpectedEOF);
    CHECK(decode_code("   ") == ErrorCode::UnexpectedEOF);
    CHECK(decode_code(R"({"a":})") == ErrorCode::UnexpectedToken);
    CHECK(decode_code("[1,2") == ErrorCode::UnexpectedEOF);
    CHECK(decode_code(R"({"a" 1})") == ErrorCode::ExpectedColon);
    CHECK(decode_code(R"("abc)") == ErrorCode::UnterminatedString);
    CHECK(decode_code("tru") == ErrorCode::UnexpectedToken);
    CHECK(decode_code("nul") == ErrorCode::UnexpectedToken);
    CHECK(decode_code("[1,]") == ErrorCode::UnexpectedToken);
}

TEST_CASE("decode failure carries no value", "[sjson][decode]") {
    auto r = decode(R"({"a":[1,2)");

    CHECK_FALSE(r.ok());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.value.is_null());
    CHECK(r.next == 0);
    CHECK(r.err.kind() == ErrorKind::Structural);
}

TEST_CASE("decode error positions", "[sjson][decode]") {
    auto colon = decode(R"({"a":})");
    CHECK(colon.err.pos == 6);

    auto unterminated = decode(R"([1, "abc)");
    CHECK(unterminated.err.code == ErrorCode::UnterminatedString);
    CHECK(unterminated.err.pos == 5);
}

TEST_CASE("decode trailing content is not inspected", "[sjson][decode]") {
    auto r = decode(R"({"a":1} xxx)");

    REQUIRE(r.ok());
    CHECK(r.next == 8);
}

TEST_CASE("decode start position", "[sjson][decode]") {
    const std::string_view text = R"({"a":[10,20],"b":"x"})";

    auto inner = decode(text, 6);
    REQUIRE(inner.ok());
    CHECK(inner.value == Value::array({10, 20}));
    CHECK(inner.next == 13);

    auto past_end = decode(text, text.size() + 1);
    CHECK(past_end.err.code == ErrorCode::UnexpectedEOF);

    auto zero = decode(text, 0);
    CHECK(zero.err.code == ErrorCode::InvalidPosition);
}

TEST_CASE("decode depth limit", "[sjson][decode]") {
    DecodeOptions opts;
    opts.max_depth = 5;

    CHECK(decode_code("[[[[[[[[[[1]]]]]]]]]]", opts) == ErrorCode::DepthExceeded);
    CHECK(decode_ok("[[[[[1]]]]]", opts).is_array());

    std::string deep(kDefaultMaxDepth + 1, '[');
    deep += std::string(kDefaultMaxDepth + 1, ']');
    CHECK(decode_code(deep) == ErrorCode::DepthExceeded);
}

TEST_CASE("decode error formatting", "[sjson][decode]") {
    const std::string_view text = "{\n  \"a\": ?\n}";
    auto r = decode(text);

    REQUIRE_FALSE(r.ok());
    CHECK(r.err.code == ErrorCode::UnexpectedToken);

    const auto loc = locate_error(text, r.err);
    CHECK(loc.line == 2);
    CHECK(loc.column == 8);

    const std::string compact = r.err.format<ErrorFormat::Compact>();
    CHECK(compact == "sjson: UnexpectedToken at 2:8 (position 10) unexpected '?'");

    const std::string pretty = r.err.format<ErrorFormat::Pretty>();
    CHECK(pretty.find("UnexpectedToken") != std::string::npos);
    CHECK(pretty.find(" 2 |   \"a\": ?") != std::string::npos);
    CHECK(pretty.find('^') != std::string::npos);

    CHECK(r.err.to_string() == "UnexpectedToken");
    CHECK(ParseError {}.format<ErrorFormat::Compact>().empty());
}
