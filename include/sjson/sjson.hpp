/*
 * sjson
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef SJSON_HPP
#define SJSON_HPP

#pragma once
#include <algorithm>
#include <charconv>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <ios>
#include <istream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#ifdef _MSC_VER
    #define SJSON_FORCEINLINE __forceinline
#else
    #define SJSON_FORCEINLINE __attribute__((always_inline)) inline
#endif

namespace sjson::detail {

    struct CharMask256 {
        std::uint64_t w[4] {};

        static consteval CharMask256 make_ws() {
            CharMask256 m {};
            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };
            set(' ');
            set('\n');
            set('\r');
            set('\t');
            return m;
        }

        static consteval CharMask256 make_digit() {
            CharMask256 m {};
            for (unsigned c = '0'; c <= '9'; ++c)
                m.w[c >> 6] |= 1ull << (c & 63);
            return m;
        }

        // bytes a number token may be built from
        static consteval CharMask256 make_number_run() {
            CharMask256 m {};
            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };
            for (unsigned c = '0'; c <= '9'; ++c)
                set(c);
            set('+');
            set('-');
            set('.');
            set('e');
            set('E');
            return m;
        }

        static consteval CharMask256 make_escape() {
            CharMask256 m {};

            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };

            set('"');
            set('\\');
            set('/');
            set(0x7F);

            for (unsigned c = 0; c < 0x20; ++c)
                set(c);

            return m;
        }

        [[nodiscard]] static constexpr bool test(const CharMask256& m, const unsigned char c) noexcept {
            return m.w[c >> 6] >> (c & 63) & 1ull;
        }
    };

    inline constexpr CharMask256 kWsMask = CharMask256::make_ws();
    inline constexpr CharMask256 kDigitMask = CharMask256::make_digit();
    inline constexpr CharMask256 kNumberRunMask = CharMask256::make_number_run();
    inline constexpr CharMask256 kEscapeMask = CharMask256::make_escape();

    inline constexpr char kHexDigits[] = "0123456789ABCDEF";

    [[nodiscard]] SJSON_FORCEINLINE constexpr bool is_ws(const char c) noexcept {
        return CharMask256::test(kWsMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] SJSON_FORCEINLINE constexpr bool is_digit(const char c) noexcept {
        return CharMask256::test(kDigitMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] SJSON_FORCEINLINE constexpr bool is_number_char(const char c) noexcept {
        return CharMask256::test(kNumberRunMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] SJSON_FORCEINLINE bool hex4_to_u16(const char* p, std::uint16_t& out) noexcept {
        out = 0;
        for (auto i = 0; i < 4; ++i) {
            const auto x = static_cast<std::uint8_t>(p[i]);

            const auto d = static_cast<std::uint8_t>(x - '0');
            const auto l = static_cast<std::uint8_t>((x | 0x20u) - 'a');

            const std::uint16_t v = d <= 9 ? d : l <= 5 ? static_cast<std::uint16_t>(l + 10) : 0xFFFFu;

            if (v == 0xFFFFu)
                return false;

            out = static_cast<std::uint16_t>(out << 4 | v);
        }
        return true;
    }

    [[nodiscard]] SJSON_FORCEINLINE std::size_t utf8_encode(char* out, const std::uint32_t cp) noexcept {
        if (cp > 0x10FFFFu)
            return 0;
        if (cp >= 0xD800u && cp <= 0xDFFFu)
            return 0;

        if (cp <= 0x7F) {
            out[0] = static_cast<char>(cp);
            return 1;
        }
        if (cp <= 0x7FF) {
            out[0] = static_cast<char>(0xC0 | cp >> 6);
            out[1] = static_cast<char>(0x80 | (cp & 0x3F));
            return 2;
        }
        if (cp <= 0xFFFF) {
            out[0] = static_cast<char>(0xE0 | cp >> 12);
            out[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out[2] = static_cast<char>(0x80 | (cp & 0x3F));
            return 3;
        }
        out[0] = static_cast<char>(0xF0 | cp >> 18);
        out[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }

} // namespace sjson::detail

namespace sjson {

    // 1-based byte offset into the logical input stream.
    using Position = std::size_t;

    constexpr auto kDefaultMaxDepth = 512u;
    constexpr auto kWriterMaxDepth = 512u;
    constexpr auto kDefaultChunkSize = 4096u;
    constexpr std::int64_t kMaxArrayIndex = 1'000'000;

    // ------------------------------------------------------------------
    // errors
    // ------------------------------------------------------------------

    enum class ErrorCode : std::uint8_t {
        None,
        UnexpectedEOF,
        UnexpectedToken,
        InvalidNumber,
        InvalidString,
        UnterminatedString,
        InvalidEscape,
        InvalidUnicode,
        UnterminatedComment,
        ExpectedColon,
        InvalidKey,
        DepthExceeded,
        InvalidPosition,
        NonFiniteNumber,
        UnsupportedType,
        EncodeDepthExceeded,
    };

    enum class ErrorKind : std::uint8_t {
        None,
        Structural,
        Encoding
    };

    enum class ErrorFormat : std::uint8_t {
        Pretty,
        Compact
    };

    [[nodiscard]] constexpr ErrorKind error_kind(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return ErrorKind::None;
        case ErrorCode::NonFiniteNumber:
        case ErrorCode::UnsupportedType:
        case ErrorCode::EncodeDepthExceeded:
            return ErrorKind::Encoding;
        default:
            return ErrorKind::Structural;
        }
    }

    struct ParseError {
        ErrorCode code {ErrorCode::None};
        Position pos {}; // 0 when the error has no input position (encoding)
        std::string_view input {};

        SJSON_FORCEINLINE void set(const ErrorCode c, const Position at = 0) {
            if (code == ErrorCode::None) {
                code = c;
                pos = at;
            }
        }

        SJSON_FORCEINLINE void reset() {
            code = ErrorCode::None;
            pos = 0;
            input = {};
        }

        template <ErrorFormat Fmt>
        [[nodiscard]] std::string format() const;

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] constexpr ErrorKind kind() const noexcept {
            return error_kind(code);
        }

        [[nodiscard]] SJSON_FORCEINLINE constexpr bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] SJSON_FORCEINLINE constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::UnexpectedEOF:
            return "UnexpectedEOF";
        case ErrorCode::UnexpectedToken:
            return "UnexpectedToken";
        case ErrorCode::InvalidNumber:
            return "InvalidNumber";
        case ErrorCode::InvalidString:
            return "InvalidString";
        case ErrorCode::UnterminatedString:
            return "UnterminatedString";
        case ErrorCode::InvalidEscape:
            return "InvalidEscape";
        case ErrorCode::InvalidUnicode:
            return "InvalidUnicode";
        case ErrorCode::UnterminatedComment:
            return "UnterminatedComment";
        case ErrorCode::ExpectedColon:
            return "ExpectedColon";
        case ErrorCode::InvalidKey:
            return "InvalidKey";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::InvalidPosition:
            return "InvalidPosition";
        case ErrorCode::NonFiniteNumber:
            return "NonFiniteNumber";
        case ErrorCode::UnsupportedType:
            return "UnsupportedType";
        case ErrorCode::EncodeDepthExceeded:
            return "EncodeDepthExceeded";
        }
        return "Unknown";
    }

    struct ErrorLocation {
        std::size_t offset {};
        std::size_t line {1};
        std::size_t column {1};
    };

    // offset is 0-based; line and column are 1-based
    [[nodiscard]] inline ErrorLocation locate_error(const std::string_view input, const ParseError& e) noexcept {
        ErrorLocation loc {};
        if (e.code == ErrorCode::None || e.pos == 0)
            return loc;

        const std::size_t offset = std::min(e.pos - 1, input.size());
        loc.offset = offset;

        std::size_t line = 1;
        std::size_t col = 1;
        for (std::size_t i = 0; i < offset; ++i) {
            if (input[i] == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
        }
        loc.line = line;
        loc.column = col;
        return loc;
    }

    [[nodiscard]] inline std::string format_error_compact(const std::string_view input, const ParseError& e) {
        if (e.code == ErrorCode::None)
            return {};

        std::string out;
        out.reserve(96);

        out.append("sjson: ");
        out.append(error_code_name(e.code));

        if (e.pos == 0)
            return out;

        if (input.empty()) {
            out.append(" at position ");
            out.append(std::to_string(e.pos));
            return out;
        }

        const auto [offset, line, column] = locate_error(input, e);

        out.append(" at ");
        out.append(std::to_string(line));
        out.push_back(':');
        out.append(std::to_string(column));
        out.append(" (position ");
        out.append(std::to_string(e.pos));
        out.push_back(')');

        if (offset < input.size()) {
            out.append(" unexpected '");
            out.push_back(input[offset]);
            out.push_back('\'');
        }

        return out;
    }

    [[nodiscard]] inline std::string format_error(const std::string_view input, const ParseError& e) {
        if (e.code == ErrorCode::None)
            return {};

        if (input.empty() || e.pos == 0)
            return format_error_compact(input, e) + '\n';

        constexpr std::size_t kMaxWidth = 100;
        constexpr std::size_t kHalfWin = 40;

        const auto [offset, line, column] = locate_error(input, e);

        std::size_t start = offset;
        while (start > 0 && input[start - 1] != '\n')
            --start;

        std::size_t end = offset;
        while (end < input.size() && input[end] != '\n')
            ++end;

        std::string_view full = input.substr(start, end - start);

        std::size_t caret = column ? column - 1 : 0;
        std::size_t trim_left = 0;

        if (full.size() > kMaxWidth) {
            std::size_t win = caret > kHalfWin ? caret - kHalfWin : 0;

            if (win + kMaxWidth > full.size())
                win = full.size() - kMaxWidth;

            trim_left = win;
            full = full.substr(win, kMaxWidth);
            caret -= trim_left;
        }

        std::string out;
        out.reserve(full.size() + 128);

        out.append("sjson: ");
        out.append(error_code_name(e.code));
        out.push_back('\n');

        out.append(" --> ");
        out.append(std::to_string(line));
        out.push_back(':');
        out.append(std::to_string(column));
        out.append(" (position ");
        out.append(std::to_string(e.pos));
        out.append(")\n\n");

        const std::string prefix = " " + std::to_string(line) + " | ";
        std::string rendered = prefix;

        if (trim_left)
            rendered += "...";

        rendered.append(full);

        if (trim_left + full.size() < end - start)
            rendered += "...";

        out.append(rendered);
        out.push_back('\n');

        std::string caret_line(rendered.size() + 1, ' ');

        const std::size_t caret_pos = prefix.size() + (trim_left ? 3 : 0) + caret;

        if (caret_pos < caret_line.size())
            caret_line[caret_pos] = '^';

        out.append(caret_line);

        if (offset < input.size()) {
            out.append(" unexpected '");
            out.push_back(input[offset]);
            out.push_back('\'');
        }

        out.push_back('\n');

        return out;
    }

    template <ErrorFormat Fmt>
    std::string ParseError::format() const {
        if constexpr (Fmt == ErrorFormat::Compact)
            return format_error_compact(input, *this);
        else
            return format_error(input, *this);
    }

    inline std::string ParseError::to_string() const {
        return error_code_name(code);
    }

    // ------------------------------------------------------------------
    // value model
    // ------------------------------------------------------------------

    enum class Type : std::uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
        EmptyObject
    };

    enum class NumberKind : std::uint8_t {
        Integer,
        Double
    };

    struct Number {
        NumberKind kind {NumberKind::Double};
        union {
            std::int64_t i;
            double d;
        };

        constexpr Number() noexcept: d(0.0) { }

        static constexpr Number from_i64(const std::int64_t v) noexcept {
            Number n;
            n.kind = NumberKind::Integer;
            n.i = v;
            return n;
        }

        static constexpr Number from_double(const double v) noexcept {
            Number n;
            n.kind = NumberKind::Double;
            n.d = v;
            return n;
        }

        [[nodiscard]] constexpr bool is_integer() const noexcept {
            return kind == NumberKind::Integer;
        }

        // doubles truncate toward zero and saturate at the int64 range; NaN is 0
        [[nodiscard]] constexpr std::int64_t as_i64() const noexcept {
            if (kind == NumberKind::Integer)
                return i;
            if (d != d)
                return 0;
            if (d >= 9223372036854775808.0)
                return std::numeric_limits<std::int64_t>::max();
            if (d < -9223372036854775808.0)
                return std::numeric_limits<std::int64_t>::min();
            return static_cast<std::int64_t>(d);
        }

        [[nodiscard]] constexpr double as_double() const noexcept {
            return kind == NumberKind::Integer ? static_cast<double>(i) : d;
        }

        [[nodiscard]] bool is_finite() const noexcept {
            return kind == NumberKind::Integer || std::isfinite(d);
        }

        // mixed kinds compare by value
        friend constexpr bool operator==(const Number& a, const Number& b) noexcept {
            if (a.kind == NumberKind::Integer && b.kind == NumberKind::Integer)
                return a.i == b.i;
            return a.as_double() == b.as_double();
        }
    };

    // JSON null inside a value graph.
    struct Null {
        friend constexpr bool operator==(Null, Null) noexcept {
            return true;
        }
    };

    // The `{}` sentinel. Holds nothing and offers nothing to mutate; an object
    // only becomes an Object once it has a member.
    struct EmptyObject {
        friend constexpr bool operator==(EmptyObject, EmptyObject) noexcept {
            return true;
        }
    };

    inline constexpr Null null {};
    inline constexpr EmptyObject empty_object {};

    class Value;

    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value, std::less<>>;

    class Value {
    public:
        using Storage = std::variant<Null, bool, Number, std::string, Array, Object, EmptyObject>;

        Value() noexcept = default;
        Value(Null) noexcept { }
        Value(EmptyObject) noexcept: v_ {EmptyObject {}} { }
        Value(const bool b) noexcept: v_ {b} { }
        Value(const Number n) noexcept: v_ {n} { }
        Value(const double d) noexcept: v_ {Number::from_double(d)} { }

        template <std::integral T>
            requires(!std::same_as<T, bool>)
        Value(const T v) noexcept: v_ {Number::from_i64(static_cast<std::int64_t>(v))} { }

        Value(std::string s) noexcept: v_ {std::move(s)} { }
        Value(const std::string_view s): v_ {std::string {s}} { }
        Value(const char* s): v_ {std::string {s}} { }
        Value(Array a) noexcept: v_ {std::move(a)} { }
        Value(Object o) noexcept: v_ {std::move(o)} { }

        [[nodiscard]] static Value array(std::initializer_list<Value> items = {}) {
            return Value {Array(items)};
        }

        [[nodiscard]] static Value object(std::initializer_list<std::pair<const std::string, Value>> members = {}) {
            return Value {Object(members)};
        }

        [[nodiscard]] Type type() const noexcept {
            return static_cast<Type>(v_.index());
        }

        [[nodiscard]] bool is_null() const noexcept {
            return std::holds_alternative<Null>(v_);
        }
        [[nodiscard]] bool is_bool() const noexcept {
            return std::holds_alternative<bool>(v_);
        }
        [[nodiscard]] bool is_number() const noexcept {
            return std::holds_alternative<Number>(v_);
        }
        [[nodiscard]] bool is_integer() const noexcept {
            return is_number() && std::get<Number>(v_).is_integer();
        }
        [[nodiscard]] bool is_string() const noexcept {
            return std::holds_alternative<std::string>(v_);
        }
        [[nodiscard]] bool is_array() const noexcept {
            return std::holds_alternative<Array>(v_);
        }
        [[nodiscard]] bool is_object() const noexcept {
            return std::holds_alternative<Object>(v_);
        }
        [[nodiscard]] bool is_empty_object() const noexcept {
            return std::holds_alternative<EmptyObject>(v_);
        }

        [[nodiscard]] bool as_bool() const {
            return std::get<bool>(v_);
        }
        [[nodiscard]] const Number& as_number() const {
            return std::get<Number>(v_);
        }
        [[nodiscard]] std::int64_t as_i64() const {
            return std::get<Number>(v_).as_i64();
        }
        [[nodiscard]] double as_double() const {
            return std::get<Number>(v_).as_double();
        }
        [[nodiscard]] const std::string& as_string() const {
            return std::get<std::string>(v_);
        }
        [[nodiscard]] const Array& as_array() const {
            return std::get<Array>(v_);
        }
        [[nodiscard]] const Object& as_object() const {
            return std::get<Object>(v_);
        }

        // throws std::bad_variant_access on a type mismatch, EmptyObject included
        [[nodiscard]] std::string& as_string() {
            return std::get<std::string>(v_);
        }
        [[nodiscard]] Array& as_array() {
            return std::get<Array>(v_);
        }
        [[nodiscard]] Object& as_object() {
            return std::get<Object>(v_);
        }

        [[nodiscard]] const Value* find(const std::string_view key) const {
            if (!is_object())
                return nullptr;
            const auto& o = std::get<Object>(v_);
            const auto it = o.find(key);
            return it == o.end() ? nullptr : &it->second;
        }

        [[nodiscard]] const Value* at(const std::size_t index) const {
            if (!is_array())
                return nullptr;
            const auto& a = std::get<Array>(v_);
            return index < a.size() ? &a[index] : nullptr;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            if (const auto* a = std::get_if<Array>(&v_))
                return a->size();
            if (const auto* o = std::get_if<Object>(&v_))
                return o->size();
            return 0;
        }

        friend bool operator==(const Value& a, const Value& b) {
            return a.v_ == b.v_;
        }

    private:
        Storage v_ {};
    };

    // ------------------------------------------------------------------
    // input sources
    // ------------------------------------------------------------------

    template <class S>
    concept InputSource = requires(S& s, const Position p, char& c, std::string_view& sv) {
        { s.peek(p, c) } -> std::same_as<bool>;
        { s.slice(p, p, sv) } -> std::same_as<bool>;
        { s.exhausted(p) } -> std::same_as<bool>;
        { s.first() } -> std::same_as<Position>;
        { s.text() } -> std::same_as<std::string_view>;
    };

    // An empty chunk or nullopt ends the stream.
    template <class L>
    concept ChunkLoader = std::invocable<L&> && std::convertible_to<std::invoke_result_t<L&>, std::optional<std::string>>;

    class StringSource {
    public:
        explicit StringSource(const std::string_view s) noexcept: s_(s) { }

        [[nodiscard]] bool peek(const Position pos, char& out) const noexcept {
            if (pos == 0 || pos > s_.size())
                return false;
            out = s_[pos - 1];
            return true;
        }

        [[nodiscard]] bool slice(const Position a, const Position b, std::string_view& out) const noexcept {
            if (a == 0 || a > b || b > s_.size() + 1)
                return false;
            out = s_.substr(a - 1, b - a);
            return true;
        }

        [[nodiscard]] bool exhausted(const Position pos) const noexcept {
            return pos > s_.size();
        }

        [[nodiscard]] Position first() const noexcept {
            return 1;
        }

        [[nodiscard]] std::string_view text() const noexcept {
            return s_;
        }

    private:
        std::string_view s_;
    };

    // Pulls chunks from a loader as lookahead requires. The buffer only grows,
    // so every position handed out during a call stays readable. Views from
    // slice() are invalidated by the next fetch.
    template <ChunkLoader L>
    class LoaderSource {
    public:
        // origin: logical position of the first byte the loader yields
        explicit LoaderSource(L loader, const Position origin = 1): loader_(std::move(loader)), origin_(origin ? origin : 1) { }

        [[nodiscard]] bool peek(const Position pos, char& out) {
            if (!fill(pos))
                return false;
            out = buf_[pos - origin_];
            return true;
        }

        [[nodiscard]] bool slice(const Position a, const Position b, std::string_view& out) {
            if (a < origin_ || a > b)
                return false;
            if (b > a && !fill(b - 1))
                return false;
            if (a - origin_ > buf_.size())
                return false;
            out = std::string_view {buf_}.substr(a - origin_, b - a);
            return true;
        }

        [[nodiscard]] bool exhausted(const Position pos) {
            return !fill(pos);
        }

        [[nodiscard]] Position first() const noexcept {
            return origin_;
        }

        [[nodiscard]] std::string_view text() const noexcept {
            return {};
        }

        [[nodiscard]] std::size_t buffered() const noexcept {
            return buf_.size();
        }

    private:
        [[nodiscard]] bool fill(const Position pos) {
            if (pos < origin_)
                return false;

            while (pos - origin_ >= buf_.size()) {
                if (done_)
                    return false;

                std::optional<std::string> chunk = std::invoke(loader_);
                if (!chunk || chunk->empty()) {
                    done_ = true;
                    return false;
                }
                buf_.append(*chunk);
            }
            return true;
        }

        L loader_;
        Position origin_ {1};
        std::string buf_ {};
        bool done_ {};
    };

    // Reads `in` chunk_size bytes at a time. A stream that goes bad throws
    // std::ios_base::failure out of the decode/traverse call.
    [[nodiscard]] inline auto stream_loader(std::istream& in, const std::size_t chunk_size = kDefaultChunkSize) {
        return [&in, n = chunk_size ? chunk_size : 1u]() -> std::optional<std::string> {
            std::string chunk(n, '\0');
            in.read(chunk.data(), static_cast<std::streamsize>(n));
            if (in.bad())
                throw std::ios_base::failure("sjson: stream read failed");
            chunk.resize(static_cast<std::size_t>(in.gcount()));
            if (chunk.empty())
                return std::nullopt;
            return chunk;
        };
    }

    // ------------------------------------------------------------------
    // scanners and decoder
    // ------------------------------------------------------------------

    struct DecodeOptions {
        // RFC 8259 only: no unknown escapes, lone surrogates, raw control
        // bytes, leading zeros, empty fractions, non-string keys or missing commas
        bool strict {false};
        bool allow_comments {true};
        std::uint32_t max_depth {kDefaultMaxDepth};
    };

    struct Decoded {
        Value value {};
        Position next {};
        ParseError err {};

        [[nodiscard]] bool ok() const noexcept {
            return err.ok();
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return ok();
        }
    };

    namespace detail {

        [[nodiscard]] inline bool append_number_text(std::string& out, const Number& n) {
            char tmp[32];
            std::to_chars_result r {};
            if (n.kind == NumberKind::Integer) {
                r = std::to_chars(tmp, tmp + sizeof(tmp), n.i);
            } else {
                if (!std::isfinite(n.d))
                    return false;
                r = std::to_chars(tmp, tmp + sizeof(tmp), n.d);
            }
            if (r.ec != std::errc {})
                return false;
            out.append(tmp, r.ptr);
            return true;
        }

        // -? digits (. digits)? ([eE] [+-]? digits)?
        // Lenient grammar also takes leading zeros and an empty fraction ("1.", "1.e5").
        // Power of ten of the leading significant digit of a well-formed
        // number run. The exponent saturates; all-zero runs report 0.
        [[nodiscard]] inline std::int64_t decimal_order(const char* p, const char* const end) noexcept {
            if (p < end && *p == '-')
                ++p;

            std::int64_t order = 0;
            auto seen = false;
            for (; p < end && is_digit(*p); ++p) {
                if (seen)
                    ++order;
                else if (*p != '0')
                    seen = true;
            }

            if (p < end && *p == '.') {
                std::int64_t place = -1;
                for (++p; p < end && is_digit(*p); ++p, --place) {
                    if (!seen && *p != '0') {
                        seen = true;
                        order = place;
                    }
                }
            }

            if (!seen)
                return 0;

            if (p < end && (*p == 'e' || *p == 'E')) {
                ++p;
                const auto negative = p < end && *p == '-';
                if (p < end && (*p == '+' || *p == '-'))
                    ++p;
                std::int64_t exp = 0;
                for (; p < end && is_digit(*p); ++p) {
                    if (exp < 1'000'000'000)
                        exp = exp * 10 + (*p - '0');
                }
                order += negative ? -exp : exp;
            }

            return order;
        }

        [[nodiscard]] inline bool parse_number(const std::string_view run, const bool strict, Number& out) {
            const char* const start = run.data();
            const char* const end = start + run.size();
            const char* p = start;

            if (p < end && *p == '-')
                ++p;

            const char* const int_begin = p;
            while (p < end && is_digit(*p))
                ++p;

            if (p == int_begin)
                return false;
            if (strict && p - int_begin > 1 && *int_begin == '0')
                return false;

            auto integral = true;
            const char* dot = nullptr;

            if (p < end && *p == '.') {
                integral = false;
                dot = p++;
                const char* const frac = p;
                while (p < end && is_digit(*p))
                    ++p;
                if (p == frac && strict)
                    return false;
            }

            if (p < end && (*p == 'e' || *p == 'E')) {
                integral = false;
                ++p;
                if (p < end && (*p == '+' || *p == '-'))
                    ++p;
                const char* const exp = p;
                while (p < end && is_digit(*p))
                    ++p;
                if (p == exp)
                    return false;
            }

            if (p != end)
                return false;

            if (integral) {
                std::int64_t iv {};
                if (const auto [ptr, ec] = std::from_chars(start, end, iv); ec == std::errc {} && ptr == end) {
                    out = Number::from_i64(iv);
                    return true;
                }
                // too large for int64: falls back to double
            }

            const char* b = start;
            const char* e = end;
            std::string tmp;
            if (dot && (dot + 1 == end || !is_digit(dot[1]))) {
                tmp.assign(start, dot);
                tmp.append(dot + 1, end);
                b = tmp.data();
                e = b + tmp.size();
            }

            double dv {};
            const auto [ptr, ec] = std::from_chars(b, e, dv);
            if (ptr != e)
                return false;
            if (ec == std::errc::result_out_of_range && decimal_order(start, end) < 0)
                dv = *start == '-' ? -0.0 : 0.0;
            else if (ec != std::errc {} || !std::isfinite(dv))
                return false;

            out = Number::from_double(dv);
            return true;
        }

    } // namespace detail

    // Lexical scanners plus the recursive-descent decoder over one source.
    // Every scan takes the position to start at and reports the next
    // unconsumed position; false means error() holds the reason.
    template <InputSource Source>
    class Scanner {
    public:
        Scanner(Source& src, const DecodeOptions& opts): src_(src), opts_(opts) {
            err_.input = src_.text();
        }

        [[nodiscard]] const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] bool fail(const ErrorCode c, const Position at) {
            err_.set(c, at);
            return false;
        }

        [[nodiscard]] ParseError parse_root(const Position start, Value& out, Position& next) {
            if (check_start(start) && scan_value(start, out, next))
                return {};
            return err_;
        }

        [[nodiscard]] bool check_start(const Position start) {
            if (start == 0 || start < src_.first())
                return fail(ErrorCode::InvalidPosition, start);
            return true;
        }

        [[nodiscard]] bool enter(const Position at) {
            if (depth_ >= opts_.max_depth)
                return fail(ErrorCode::DepthExceeded, at);
            ++depth_;
            return true;
        }

        void leave() noexcept {
            if (depth_)
                --depth_;
        }

        [[nodiscard]] Position skip_ws(Position pos) {
            char c {};
            while (src_.peek(pos, c) && detail::is_ws(c))
                ++pos;
            return pos;
        }

        [[nodiscard]] bool at_comment(const Position pos) {
            char a {};
            char b {};
            return src_.peek(pos, a) && a == '/' && src_.peek(pos + 1, b) && b == '*';
        }

        // pos is on the '/' of "/*"
        [[nodiscard]] bool skip_comment(const Position pos, Position& next) {
            Position p = pos + 2;
            char prev {};
            char c {};
            while (src_.peek(p, c)) {
                if (prev == '*' && c == '/') {
                    next = p + 1;
                    return true;
                }
                prev = c;
                ++p;
            }
            return fail(ErrorCode::UnterminatedComment, pos);
        }

        // whitespace and block comments
        [[nodiscard]] bool skip_blank(Position& pos) {
            while (true) {
                pos = skip_ws(pos);
                if (!opts_.allow_comments || !at_comment(pos))
                    return true;
                if (!skip_comment(pos, pos))
                    return false;
            }
        }

        [[nodiscard]] bool next_token(Position& pos, char& c) {
            if (!skip_blank(pos))
                return false;
            if (!src_.peek(pos, c))
                return fail(ErrorCode::UnexpectedEOF, pos);
            return true;
        }

        // Member separator handling; c is the token at pos.
        [[nodiscard]] bool separator(Position& pos, const char c, const bool first) {
            if (opts_.strict) {
                if (first) {
                    if (c == ',')
                        return fail(ErrorCode::UnexpectedToken, pos);
                    return true;
                }
                if (c != ',')
                    return fail(ErrorCode::UnexpectedToken, pos);
                ++pos;
                return true;
            }

            if (c == ',')
                ++pos;
            return true;
        }

        [[nodiscard]] bool expect_colon(Position& pos) {
            char c {};
            if (!next_token(pos, c))
                return false;
            if (c != ':')
                return fail(ErrorCode::ExpectedColon, pos);
            ++pos;
            return true;
        }

        [[nodiscard]] bool scan_value(Position pos, Value& out, Position& next) {
            char c {};
            if (!next_token(pos, c))
                return false;

            switch (c) {
            case '{':
                return scan_object(pos, out, next);
            case '[':
                return scan_array(pos, out, next);
            case '"': {
                std::string s;
                if (!scan_string(pos, s, next))
                    return false;
                out = Value {std::move(s)};
                return true;
            }
            default:
                break;
            }

            if (c == '-' || detail::is_digit(c)) {
                Number n;
                if (!scan_number(pos, n, next))
                    return false;
                out = Value {n};
                return true;
            }

            return scan_constant(pos, out, next);
        }

        [[nodiscard]] bool scan_object(const Position open, Value& out, Position& next) {
            if (!enter(open))
                return false;
            const bool ok = scan_members(open, out, next);
            leave();
            return ok;
        }

        [[nodiscard]] bool scan_array(const Position open, Value& out, Position& next) {
            if (!enter(open))
                return false;
            const bool ok = scan_elements(open, out, next);
            leave();
            return ok;
        }

        // Object keys are strings; the lenient grammar also takes a scalar and
        // uses its text.
        [[nodiscard]] bool scan_key(Position pos, std::string& key, Position& next) {
            char c {};
            if (!next_token(pos, c))
                return false;

            if (c == '"')
                return scan_string(pos, key, next);

            if (opts_.strict || c == '{' || c == '[')
                return fail(ErrorCode::InvalidKey, pos);

            Value k;
            if (!scan_value(pos, k, next))
                return false;

            switch (k.type()) {
            case Type::Bool:
                key = k.as_bool() ? "true" : "false";
                return true;
            case Type::Null:
                key = "null";
                return true;
            case Type::Number:
                key.clear();
                if (!detail::append_number_text(key, k.as_number()))
                    return fail(ErrorCode::InvalidKey, pos);
                return true;
            default:
                return fail(ErrorCode::InvalidKey, pos);
            }
        }

        [[nodiscard]] bool scan_string(const Position open, std::string& out, Position& next) {
            Position pos = open + 1;
            char c {};

            while (true) {
                const Position run = pos;
                while (src_.peek(pos, c) && c != '"' && c != '\\') {
                    if (opts_.strict && static_cast<unsigned char>(c) < 0x20u)
                        return fail(ErrorCode::InvalidString, pos);
                    ++pos;
                }

                if (pos > run) {
                    std::string_view literal;
                    if (!src_.slice(run, pos, literal))
                        return fail(ErrorCode::UnterminatedString, open);
                    out.append(literal);
                }

                if (!src_.peek(pos, c))
                    return fail(ErrorCode::UnterminatedString, open);

                if (c == '"') {
                    next = pos + 1;
                    return true;
                }

                if (!scan_escape(open, pos, out, pos))
                    return false;
            }
        }

        [[nodiscard]] bool scan_number(const Position pos, Number& out, Position& next) {
            Position end = pos;
            char c {};
            while (src_.peek(end, c) && detail::is_number_char(c))
                ++end;

            std::string_view run;
            if (!src_.slice(pos, end, run))
                return fail(ErrorCode::UnexpectedEOF, pos);

            if (!detail::parse_number(run, opts_.strict, out))
                return fail(ErrorCode::InvalidNumber, pos);

            next = end;
            return true;
        }

        [[nodiscard]] bool scan_constant(const Position pos, Value& out, Position& next) {
            if (matches(pos, "true")) {
                out = Value {true};
                next = pos + 4;
                return true;
            }
            if (matches(pos, "false")) {
                out = Value {false};
                next = pos + 5;
                return true;
            }
            if (matches(pos, "null")) {
                out = Value {null};
                next = pos + 4;
                return true;
            }
            return fail(ErrorCode::UnexpectedToken, pos);
        }

    private:
        [[nodiscard]] bool matches(const Position pos, const std::string_view lit) {
            char c {};
            for (std::size_t i = 0; i < lit.size(); ++i) {
                if (!src_.peek(pos + i, c) || c != lit[i])
                    return false;
            }
            return true;
        }

        [[nodiscard]] bool scan_members(const Position open, Value& out, Position& next) {
            out = Value {empty_object};
            Position pos = open + 1;
            auto first = true;

            while (true) {
                char c {};
                if (!next_token(pos, c))
                    return false;

                if (c == '}') {
                    next = pos + 1;
                    return true;
                }

                if (!separator(pos, c, first))
                    return false;

                std::string key;
                if (!scan_key(pos, key, pos))
                    return false;
                if (!expect_colon(pos))
                    return false;

                Value v;
                if (!scan_value(pos, v, pos))
                    return false;

                if (!out.is_object())
                    out = Value {Object {}};
                out.as_object().insert_or_assign(std::move(key), std::move(v));
                first = false;
            }
        }

        [[nodiscard]] bool scan_elements(const Position open, Value& out, Position& next) {
            out = Value {Array {}};
            Position pos = open + 1;
            auto first = true;

            while (true) {
                char c {};
                if (!next_token(pos, c))
                    return false;

                if (c == ']') {
                    next = pos + 1;
                    return true;
                }

                if (!separator(pos, c, first))
                    return false;

                Value v;
                if (!scan_value(pos, v, pos))
                    return false;

                out.as_array().push_back(std::move(v));
                first = false;
            }
        }

        // pos is on the backslash
        [[nodiscard]] bool scan_escape(const Position open, const Position pos, std::string& out, Position& next) {
            char esc {};
            if (!src_.peek(pos + 1, esc))
                return fail(ErrorCode::UnterminatedString, open);

            next = pos + 2;

            switch (esc) {
            case '"':
            case '\\':
            case '/':
                out.push_back(esc);
                return true;
            case 'b':
                out.push_back('\b');
                return true;
            case 'f':
                out.push_back('\f');
                return true;
            case 'n':
                out.push_back('\n');
                return true;
            case 'r':
                out.push_back('\r');
                return true;
            case 't':
                out.push_back('\t');
                return true;
            case 'u':
                return scan_unicode_escape(open, pos, out, next);
            default:
                if (opts_.strict)
                    return fail(ErrorCode::InvalidEscape, pos);
                // drop the backslash, keep the character
                out.push_back(esc);
                return true;
            }
        }

        [[nodiscard]] bool read_hex4(const Position pos, char (&digits)[4]) {
            for (std::size_t i = 0; i < 4; ++i) {
                if (!src_.peek(pos + i, digits[i]))
                    return false;
            }
            return true;
        }

        [[nodiscard]] bool low_surrogate_at(const Position pos, std::uint16_t& low) {
            char a {};
            char b {};
            if (!src_.peek(pos, a) || a != '\\' || !src_.peek(pos + 1, b) || b != 'u')
                return false;
            char digits[4];
            return read_hex4(pos + 2, digits) && detail::hex4_to_u16(digits, low) && low >= 0xDC00u && low < 0xE000u;
        }

        // pos is on the backslash of "\uXXXX"
        [[nodiscard]] bool scan_unicode_escape(const Position open, const Position pos, std::string& out, Position& next) {
            char digits[4];
            if (!read_hex4(pos + 2, digits))
                return fail(ErrorCode::UnterminatedString, open);

            std::uint16_t u1 {};
            if (!detail::hex4_to_u16(digits, u1))
                return fail(ErrorCode::InvalidUnicode, pos);

            next = pos + 6;
            std::uint32_t cp = u1;

            if (u1 >= 0xD800u && u1 < 0xDC00u) {
                std::uint16_t u2 {};
                if (!low_surrogate_at(next, u2)) {
                    if (opts_.strict)
                        return fail(ErrorCode::InvalidUnicode, pos);
                    return true; // unpaired high surrogate is dropped
                }
                cp = (static_cast<std::uint32_t>(u1) - 0xD800u) * 0x400u + (static_cast<std::uint32_t>(u2) - 0xDC00u) + 0x10000u;
                next += 6;
            } else if (u1 >= 0xDC00u && u1 < 0xE000u) {
                if (opts_.strict)
                    return fail(ErrorCode::InvalidUnicode, pos);
                return true;
            }

            char buf[4];
            const std::size_t n = detail::utf8_encode(buf, cp);
            if (!n)
                return fail(ErrorCode::InvalidUnicode, pos);
            out.append(buf, n);
            return true;
        }

        Source& src_;
        DecodeOptions opts_ {};
        ParseError err_ {};
        std::uint32_t depth_ {};
    };

    // On failure value is null and next is 0.
    template <InputSource Source>
    [[nodiscard]] Decoded decode(Source& src, const Position start = 1, const DecodeOptions& opts = {}) {
        Scanner<Source> s {src, opts};
        Decoded r {};
        if (ParseError e = s.parse_root(start, r.value, r.next); !e.ok()) {
            r.value = Value {};
            r.next = 0;
            r.err = e;
        }
        return r;
    }

    // The returned error views `text`.
    [[nodiscard]] inline Decoded decode(const std::string_view text, const Position start = 1, const DecodeOptions& opts = {}) {
        StringSource src {text};
        return decode(src, start, opts);
    }

    template <ChunkLoader L>
    [[nodiscard]] Decoded decode(L loader, const Position start = 1, const DecodeOptions& opts = {}) {
        LoaderSource<L> src {std::move(loader)};
        return decode(src, start, opts);
    }

    // ------------------------------------------------------------------
    // traversal
    // ------------------------------------------------------------------

    enum class Kind : std::uint8_t {
        Null,
        Boolean,
        Number,
        String,
        Array,
        Object
    };

    enum class Phase : std::uint8_t {
        Scalar,      // value and both positions known
        Announce,    // container seen, value null, pos_last 0
        Materialized // container decoded on request
    };

    enum class Action : std::uint8_t {
        Continue,
        Materialize,
        Stop
    };

    [[nodiscard]] constexpr const char* kind_name(const Kind k) noexcept {
        switch (k) {
        case Kind::Null:
            return "null";
        case Kind::Boolean:
            return "boolean";
        case Kind::Number:
            return "number";
        case Kind::String:
            return "string";
        case Kind::Array:
            return "array";
        case Kind::Object:
            return "object";
        }
        return "unknown";
    }

    [[nodiscard]] inline Kind kind_of(const Value& v) noexcept {
        switch (v.type()) {
        case Type::Null:
            return Kind::Null;
        case Type::Bool:
            return Kind::Boolean;
        case Type::Number:
            return Kind::Number;
        case Type::String:
            return Kind::String;
        case Type::Array:
            return Kind::Array;
        case Type::Object:
        case Type::EmptyObject:
            return Kind::Object;
        }
        return Kind::Null;
    }

    // object key or 1-based array index
    using PathItem = std::variant<std::string, std::size_t>;
    using Path = std::vector<PathItem>;

    struct Visit {
        const Path& path;
        Kind kind;
        Phase phase;
        const Value* value;
        Position pos;
        Position pos_last;
    };

    template <class F>
    concept TraverseCallback = std::invocable<F&, const Visit&> && std::same_as<std::invoke_result_t<F&, const Visit&>, Action>;

    struct Traversed {
        // past the root on success; where scanning stopped on Action::Stop
        Position next {};
        ParseError err {};
        bool stopped {};

        [[nodiscard]] bool ok() const noexcept {
            return err.ok();
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return ok();
        }
    };

    template <InputSource Source, class Callback>
        requires TraverseCallback<Callback>
    class Traverser {
    public:
        Traverser(Source& src, Callback& cb, const DecodeOptions& opts): cb_(cb), scanner_(src, opts) { }

        [[nodiscard]] Traversed run(const Position start) {
            Traversed r {};
            Position next {};

            if (!scanner_.check_start(start) || !visit_value(start, next)) {
                if (stopped_) {
                    r.stopped = true;
                    r.next = stop_at_;
                    return r;
                }
                r.err = scanner_.error();
                return r;
            }

            r.next = next;
            return r;
        }

    private:
        [[nodiscard]] bool stop(const Position at) {
            stopped_ = true;
            stop_at_ = at;
            return false;
        }

        [[nodiscard]] bool visit_value(Position pos, Position& next) {
            char c {};
            if (!scanner_.next_token(pos, c))
                return false;

            if (c == '{')
                return visit_container(pos, Kind::Object, next);
            if (c == '[')
                return visit_container(pos, Kind::Array, next);

            Value v;
            if (!scanner_.scan_value(pos, v, next))
                return false;

            if (std::invoke(cb_, Visit {path_, kind_of(v), Phase::Scalar, &v, pos, next - 1}) == Action::Stop)
                return stop(next);
            return true;
        }

        [[nodiscard]] bool visit_container(const Position pos, const Kind kind, Position& next) {
            const Action a = std::invoke(cb_, Visit {path_, kind, Phase::Announce, nullptr, pos, 0});

            if (a == Action::Stop)
                return stop(pos);

            if (a == Action::Materialize) {
                Value v;
                if (!scanner_.scan_value(pos, v, next))
                    return false;
                if (std::invoke(cb_, Visit {path_, kind, Phase::Materialized, &v, pos, next - 1}) == Action::Stop)
                    return stop(next);
                return true;
            }

            if (!scanner_.enter(pos))
                return false;
            const bool ok = kind == Kind::Object ? visit_members(pos, next) : visit_elements(pos, next);
            scanner_.leave();
            return ok;
        }

        [[nodiscard]] bool visit_members(const Position open, Position& next) {
            Position pos = open + 1;
            auto first = true;

            while (true) {
                char c {};
                if (!scanner_.next_token(pos, c))
                    return false;

                if (c == '}') {
                    next = pos + 1;
                    return true;
                }

                if (!scanner_.separator(pos, c, first))
                    return false;

                std::string key;
                if (!scanner_.scan_key(pos, key, pos))
                    return false;
                if (!scanner_.expect_colon(pos))
                    return false;

                path_.emplace_back(std::move(key));
                const bool ok = visit_value(pos, pos);
                path_.pop_back();
                if (!ok)
                    return false;

                first = false;
            }
        }

        [[nodiscard]] bool visit_elements(const Position open, Position& next) {
            Position pos = open + 1;
            std::size_t index = 0;

            while (true) {
                char c {};
                if (!scanner_.next_token(pos, c))
                    return false;

                if (c == ']') {
                    next = pos + 1;
                    return true;
                }

                if (!scanner_.separator(pos, c, index == 0))
                    return false;

                path_.emplace_back(++index);
                const bool ok = visit_value(pos, pos);
                path_.pop_back();
                if (!ok)
                    return false;
            }
        }

        Callback& cb_;
        Scanner<Source> scanner_;
        Path path_ {};
        bool stopped_ {};
        Position stop_at_ {};
    };

    template <InputSource Source, class Callback>
        requires TraverseCallback<std::remove_reference_t<Callback>>
    [[nodiscard]] Traversed traverse(Source& src, Callback&& cb, const Position start = 1, const DecodeOptions& opts = {}) {
        Traverser<Source, std::remove_reference_t<Callback>> t {src, cb, opts};
        return t.run(start);
    }

    template <class Callback>
        requires TraverseCallback<std::remove_reference_t<Callback>>
    [[nodiscard]] Traversed traverse(const std::string_view text, Callback&& cb, const Position start = 1, const DecodeOptions& opts = {}) {
        StringSource src {text};
        return traverse(src, cb, start, opts);
    }

    template <ChunkLoader L, class Callback>
        requires TraverseCallback<std::remove_reference_t<Callback>>
    [[nodiscard]] Traversed traverse(L loader, Callback&& cb, const Position start = 1, const DecodeOptions& opts = {}) {
        LoaderSource<L> src {std::move(loader)};
        return traverse(src, cb, start, opts);
    }

    // ------------------------------------------------------------------
    // dynamic values
    // ------------------------------------------------------------------

    class Table;

    // absent value
    struct Nil {
        friend constexpr bool operator==(Nil, Nil) noexcept {
            return true;
        }
    };

    // anything JSON cannot carry (functions, handles); never encoded
    struct Opaque {
        std::string name {};

        friend bool operator==(const Opaque&, const Opaque&) = default;
    };

    // Host-side dynamic value for interop with loosely typed data. Tables are
    // shared by reference, as in the scripting hosts this mirrors.
    class Dynamic {
    public:
        using Storage = std::variant<Nil, Null, EmptyObject, bool, std::int64_t, double, std::string, std::shared_ptr<Table>, Opaque>;

        Dynamic() noexcept = default;
        Dynamic(Nil) noexcept { }
        Dynamic(Null) noexcept: v_ {Null {}} { }
        Dynamic(EmptyObject) noexcept: v_ {EmptyObject {}} { }
        Dynamic(const bool b) noexcept: v_ {b} { }
        Dynamic(const double d) noexcept: v_ {d} { }

        template <std::integral T>
            requires(!std::same_as<T, bool>)
        Dynamic(const T v) noexcept: v_ {static_cast<std::int64_t>(v)} { }

        Dynamic(std::string s) noexcept: v_ {std::move(s)} { }
        Dynamic(const std::string_view s): v_ {std::string {s}} { }
        Dynamic(const char* s): v_ {std::string {s}} { }
        Dynamic(std::shared_ptr<Table> t) noexcept: v_ {std::move(t)} { }
        Dynamic(Opaque o) noexcept: v_ {std::move(o)} { }

        [[nodiscard]] bool is_nil() const noexcept {
            return std::holds_alternative<Nil>(v_);
        }
        [[nodiscard]] bool is_integer() const noexcept {
            return std::holds_alternative<std::int64_t>(v_);
        }
        [[nodiscard]] bool is_double() const noexcept {
            return std::holds_alternative<double>(v_);
        }
        [[nodiscard]] bool is_string() const noexcept {
            return std::holds_alternative<std::string>(v_);
        }
        [[nodiscard]] bool is_table() const noexcept {
            return std::holds_alternative<std::shared_ptr<Table>>(v_);
        }
        [[nodiscard]] bool is_opaque() const noexcept {
            return std::holds_alternative<Opaque>(v_);
        }

        [[nodiscard]] std::int64_t as_integer() const {
            return std::get<std::int64_t>(v_);
        }
        [[nodiscard]] double as_double() const {
            return std::get<double>(v_);
        }
        [[nodiscard]] const std::string& as_string() const {
            return std::get<std::string>(v_);
        }
        [[nodiscard]] const Table& as_table() const;

        [[nodiscard]] const Storage& storage() const noexcept {
            return v_;
        }

        // tables compare by identity
        friend bool operator==(const Dynamic& a, const Dynamic& b) {
            return a.v_ == b.v_;
        }

    private:
        Storage v_ {};
    };

    class Table {
    public:
        using IntegerEntries = std::map<std::int64_t, Dynamic>;
        using StringEntries = std::map<std::string, Dynamic, std::less<>>;
        using OtherEntries = std::vector<std::pair<Dynamic, Dynamic>>;

        // Assigning Nil removes the entry. Integer-valued doubles are integer
        // keys. Nil and NaN keys are refused.
        bool set(const Dynamic& key, Dynamic value) {
            if (key.is_nil())
                return false;

            if (key.is_integer())
                return assign(ints_, key.as_integer(), std::move(value));

            if (key.is_string())
                return assign(strings_, key.as_string(), std::move(value));

            if (key.is_double()) {
                const double d = key.as_double();
                if (std::isnan(d))
                    return false;
                if (std::floor(d) == d && d >= -9.2e18 && d <= 9.2e18)
                    return assign(ints_, static_cast<std::int64_t>(d), std::move(value));
            }

            for (auto it = others_.begin(); it != others_.end(); ++it) {
                if (it->first == key) {
                    if (value.is_nil())
                        others_.erase(it);
                    else
                        it->second = std::move(value);
                    return true;
                }
            }
            if (!value.is_nil())
                others_.emplace_back(key, std::move(value));
            return true;
        }

        // appends at the index after the highest integer key
        void push_back(Dynamic value) {
            const std::int64_t next = ints_.empty() ? 1 : std::max<std::int64_t>(ints_.rbegin()->first + 1, 1);
            set(Dynamic {next}, std::move(value));
        }

        [[nodiscard]] const Dynamic* get(const Dynamic& key) const {
            if (key.is_integer()) {
                const auto it = ints_.find(key.as_integer());
                return it == ints_.end() ? nullptr : &it->second;
            }
            if (key.is_string()) {
                const auto it = strings_.find(key.as_string());
                return it == strings_.end() ? nullptr : &it->second;
            }
            if (key.is_double()) {
                const double d = key.as_double();
                if (std::floor(d) == d && d >= -9.2e18 && d <= 9.2e18)
                    return get(Dynamic {static_cast<std::int64_t>(d)});
            }
            for (const auto& [k, v] : others_) {
                if (k == key)
                    return &v;
            }
            return nullptr;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return ints_.size() + strings_.size() + others_.size();
        }

        // highest k such that indices 1..k are all present
        [[nodiscard]] std::int64_t length() const noexcept {
            std::int64_t n = 0;
            for (auto it = ints_.lower_bound(1); it != ints_.end() && it->first == n + 1; ++it)
                ++n;
            return n;
        }

        [[nodiscard]] bool empty() const noexcept {
            return size() == 0;
        }

        [[nodiscard]] const IntegerEntries& integer_entries() const noexcept {
            return ints_;
        }
        [[nodiscard]] const StringEntries& string_entries() const noexcept {
            return strings_;
        }
        [[nodiscard]] const OtherEntries& other_entries() const noexcept {
            return others_;
        }

    private:
        template <class Map, class K>
        static bool assign(Map& m, K&& key, Dynamic value) {
            if (value.is_nil()) {
                if (const auto it = m.find(key); it != m.end())
                    m.erase(it);
                return true;
            }
            m.insert_or_assign(typename Map::key_type(std::forward<K>(key)), std::move(value));
            return true;
        }

        IntegerEntries ints_ {};
        StringEntries strings_ {};
        OtherEntries others_ {};
    };

    inline const Table& Dynamic::as_table() const {
        return *std::get<std::shared_ptr<Table>>(v_);
    }

    [[nodiscard]] inline std::shared_ptr<Table> make_table() {
        return std::make_shared<Table>();
    }

    [[nodiscard]] inline std::shared_ptr<Table> make_table(std::initializer_list<Dynamic> items) {
        auto t = std::make_shared<Table>();
        for (const auto& v : items)
            t->push_back(v);
        return t;
    }

    // ------------------------------------------------------------------
    // encoder
    // ------------------------------------------------------------------

    template <class Sink>
    class Writer {
    public:
        Writer(Sink sink, const bool pretty, const std::size_t max_depth = kWriterMaxDepth, ParseError* err = nullptr)
            : sink_(std::move(sink)), pretty_(pretty), max_depth_(max_depth), err_(err) {
            if (err_)
                *err_ = {};
        }

        [[nodiscard]] bool write(const Value& v) {
            return write_value(v);
        }

        // Top-level Opaque and non-finite values fail; nested ones are skipped.
        [[nodiscard]] bool write(const Dynamic& v) {
            if (v.is_opaque()) {
                set_err(ErrorCode::UnsupportedType);
                return false;
            }
            return write_dynamic(v);
        }

        [[nodiscard]] SJSON_FORCEINLINE auto finish() {
            return sink_.finish();
        }

    private:
        SJSON_FORCEINLINE void set_err(const ErrorCode c) const {
            if (err_ && err_->ok())
                err_->set(c);
        }

        [[nodiscard]] SJSON_FORCEINLINE bool put(const char c) {
            return sink_.put(c);
        }

        [[nodiscard]] SJSON_FORCEINLINE bool puts(const std::string_view s) {
            return sink_.puts(s);
        }

        [[nodiscard]] bool newline() {
            if (!pretty_)
                return true;

            if (!put('\n'))
                return false;

            for (auto i = 0; i < indent_; ++i) {
                if (!put(' '))
                    return false;
            }
            return true;
        }

        [[nodiscard]] bool write_string(const std::string_view s) {
            if (!put('"'))
                return false;

            const char* p = s.data();
            const char* e = p + s.size();

            while (p < e) {
                const char* q = p;
                while (q < e && !detail::CharMask256::test(detail::kEscapeMask, static_cast<unsigned char>(*q)))
                    ++q;

                if (q > p) {
                    if (!puts(std::string_view {p, static_cast<std::size_t>(q - p)}))
                        return false;
                    p = q;
                    if (p >= e)
                        break;
                }

                const auto c = static_cast<unsigned char>(*p++);

                switch (c) {
                case '"': // NOLINT(bugprone-branch-clone)
                    if (!puts("\\\""))
                        return false;
                    break;
                case '\\':
                    if (!puts("\\\\"))
                        return false;
                    break;
                case '/':
                    if (!puts("\\/"))
                        return false;
                    break;
                case '\b':
                    if (!puts("\\b"))
                        return false;
                    break;
                case '\f':
                    if (!puts("\\f"))
                        return false;
                    break;
                case '\n':
                    if (!puts("\\n"))
                        return false;
                    break;
                case '\r':
                    if (!puts("\\r"))
                        return false;
                    break;
                case '\t':
                    if (!puts("\\t"))
                        return false;
                    break;
                default: {
                    char tmp[6];
                    tmp[0] = '\\';
                    tmp[1] = 'u';
                    tmp[2] = '0';
                    tmp[3] = '0';
                    tmp[4] = detail::kHexDigits[(c >> 4) & 0xF];
                    tmp[5] = detail::kHexDigits[c & 0xF];
                    if (!puts(std::string_view {tmp, 6}))
                        return false;
                    break;
                }
                }
            }

            return put('"');
        }

        [[nodiscard]] bool write_i64(const std::int64_t v) {
            char tmp[32];
            auto [p, ec] = std::to_chars(tmp, tmp + sizeof(tmp), v);
            if (ec != std::errc {})
                return false;
            return puts(std::string_view {tmp, static_cast<std::size_t>(p - tmp)});
        }

        [[nodiscard]] bool write_double(const double d) {
            if (!std::isfinite(d)) {
                set_err(ErrorCode::NonFiniteNumber);
                return false;
            }
            char tmp[32];
            auto [p, ec] = std::to_chars(tmp, tmp + sizeof(tmp), d);
            if (ec != std::errc {})
                return false;
            return puts(std::string_view {tmp, static_cast<std::size_t>(p - tmp)});
        }

        [[nodiscard]] SJSON_FORCEINLINE bool write_number(const Number& n) {
            return n.kind == NumberKind::Integer ? write_i64(n.i) : write_double(n.d);
        }

        [[nodiscard]] bool open_container(const char c) {
            if (depth_ + 1 > max_depth_) {
                set_err(ErrorCode::EncodeDepthExceeded);
                return false;
            }
            ++depth_;
            indent_ += 2;
            return put(c);
        }

        [[nodiscard]] bool close_container(const char c, const std::size_t count) {
            indent_ -= 2;
            --depth_;

            if (count && !newline())
                return false;

            return put(c);
        }

        [[nodiscard]] bool write_key(const std::string_view key) {
            if (!write_string(key))
                return false;
            if (!put(':'))
                return false;
            return !pretty_ || put(' ');
        }

        [[nodiscard]] bool begin_item(const std::size_t count) {
            if (count && !put(','))
                return false;
            return newline();
        }

        [[nodiscard]] static bool encodable(const Value& v) noexcept {
            return !v.is_number() || v.as_number().is_finite();
        }

        [[nodiscard]] bool write_value(const Value& v) {
            switch (v.type()) {
            case Type::Null:
                return puts("null");
            case Type::EmptyObject:
                return puts("{}");
            case Type::Bool:
                return puts(v.as_bool() ? "true" : "false");
            case Type::Number:
                return write_number(v.as_number());
            case Type::String:
                return write_string(v.as_string());
            case Type::Array:
                return write_array(v.as_array());
            case Type::Object:
                return write_object(v.as_object());
            }
            return true;
        }

        [[nodiscard]] bool write_array(const Array& a) {
            if (!open_container('['))
                return false;

            std::size_t count = 0;
            for (const auto& item : a) {
                if (!begin_item(count) || !write_value(item))
                    return false;
                ++count;
            }

            return close_container(']', count);
        }

        [[nodiscard]] bool write_object(const Object& o) {
            if (!open_container('{'))
                return false;

            std::size_t count = 0;
            for (const auto& [key, item] : o) {
                if (!encodable(item))
                    continue;
                if (!begin_item(count) || !write_key(key) || !write_value(item))
                    return false;
                ++count;
            }

            return close_container('}', count);
        }

        // string, bool, finite number, nil/null/empty marker, table
        [[nodiscard]] static bool encodable(const Dynamic& v) noexcept {
            if (v.is_opaque())
                return false;
            if (v.is_double())
                return std::isfinite(v.as_double());
            return true;
        }

        // Array-like: every key that would be written is an index in
        // [1, kMaxArrayIndex] holding an encodable value, or "n" holding
        // the length.
        [[nodiscard]] static bool is_array(const Table& t, std::int64_t& max_index) {
            max_index = 0;
            for (const auto& [k, v] : t.integer_entries()) {
                if (k >= 1 && k <= kMaxArrayIndex) {
                    if (!encodable(v))
                        return false;
                    max_index = k;
                } else if (encodable(v)) {
                    return false;
                }
            }
            for (const auto& [k, v] : t.string_entries()) {
                if (k == "n" && holds_length(v, t))
                    continue;
                if (encodable(v))
                    return false;
            }
            return true;
        }

        // an "n" member equal to the table length is a count, not a member
        [[nodiscard]] static bool holds_length(const Dynamic& v, const Table& t) noexcept {
            if (v.is_integer())
                return v.as_integer() == t.length();
            if (v.is_double())
                return v.as_double() == static_cast<double>(t.length());
            return false;
        }

        [[nodiscard]] bool write_dynamic(const Dynamic& v) {
            return std::visit(
                [this](const auto& x) -> bool {
                    using T = std::decay_t<decltype(x)>;
                    if constexpr (std::is_same_v<T, Nil> || std::is_same_v<T, Null>)
                        return puts("null");
                    else if constexpr (std::is_same_v<T, EmptyObject>)
                        return puts("{}");
                    else if constexpr (std::is_same_v<T, bool>)
                        return puts(x ? "true" : "false");
                    else if constexpr (std::is_same_v<T, std::int64_t>)
                        return write_i64(x);
                    else if constexpr (std::is_same_v<T, double>)
                        return write_double(x);
                    else if constexpr (std::is_same_v<T, std::string>)
                        return write_string(x);
                    else if constexpr (std::is_same_v<T, std::shared_ptr<Table>>)
                        return x ? write_table(*x) : puts("null");
                    else {
                        set_err(ErrorCode::UnsupportedType);
                        return false;
                    }
                },
                v.storage());
        }

        [[nodiscard]] bool write_table(const Table& t) {
            std::int64_t max_index = 0;

            if (is_array(t, max_index)) {
                if (!open_container('['))
                    return false;

                std::size_t count = 0;
                for (std::int64_t i = 1; i <= max_index; ++i) {
                    if (!begin_item(count))
                        return false;
                    const auto it = t.integer_entries().find(i);
                    if (!(it == t.integer_entries().end() ? puts("null") : write_dynamic(it->second)))
                        return false;
                    ++count;
                }
                return close_container(']', count);
            }

            if (!open_container('{'))
                return false;

            std::size_t count = 0;
            for (const auto& [k, item] : t.integer_entries()) {
                if (!encodable(item))
                    continue;
                if (!begin_item(count) || !write_key(std::to_string(k)) || !write_dynamic(item))
                    return false;
                ++count;
            }
            for (const auto& [k, item] : t.string_entries()) {
                if (!encodable(item))
                    continue;
                if (!begin_item(count) || !write_key(k) || !write_dynamic(item))
                    return false;
                ++count;
            }
            // other keys are not convertible to strings

            return close_container('}', count);
        }

        Sink sink_;
        bool pretty_ {};
        int indent_ {};

        std::size_t max_depth_ {};
        std::size_t depth_ {};

        ParseError* err_ {};
    };

    struct StringSink {
        std::string out;

        [[nodiscard]] SJSON_FORCEINLINE bool put(const char c) {
            out.push_back(c);
            return true;
        }
        [[nodiscard]] SJSON_FORCEINLINE bool puts(const std::string_view s) {
            out.append(s);
            return true;
        }

        [[nodiscard]] SJSON_FORCEINLINE std::string finish() {
            return std::move(out);
        }
    };

    // Empty string and *err set on failure.
    [[nodiscard]] inline std::string encode(const Value& v, const bool pretty = false, ParseError* err = nullptr) {
        Writer w(StringSink {}, pretty, kWriterMaxDepth, err);
        if (!w.write(v))
            return {};
        return w.finish();
    }

    [[nodiscard]] inline std::string encode_dynamic(const Dynamic& v, const bool pretty = false, ParseError* err = nullptr) {
        Writer w(StringSink {}, pretty, kWriterMaxDepth, err);
        if (!w.write(v))
            return {};
        return w.finish();
    }

} // namespace sjson

#endif // SJSON_HPP
