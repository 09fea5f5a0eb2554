#pragma once

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace util {

// Minimal forward-only JSON reader. Schema-specific callers drive it token by
// token; every method reports failure through its return value and an error
// string instead of throwing. Locale independent.
class JsonCursor {
public:
    // Nesting limit for skip_value(); deeper documents are rejected.
    static constexpr int max_depth = 64;

    explicit JsonCursor(std::string_view s) noexcept : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    // Next non-whitespace character, or '\0' at end of input.
    [[nodiscard]] char peek() const noexcept {
        skip_ws();
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool expect(char c) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    std::optional<std::string> parse_string(std::string& err) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "Expected string";
            return std::nullopt;
        }
        ++pos_; // skip opening quote
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c == '\\') {
                if (pos_ >= src_.size()) {
                    err = "Invalid escape";
                    return std::nullopt;
                }
                const char esc = src_[pos_++];
                switch (esc) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u':
                        if (!parse_unicode_escape(out, err)) {
                            return std::nullopt;
                        }
                        break;
                    default:
                        err = "Unsupported escape sequence";
                        return std::nullopt;
                }
            } else {
                out.push_back(c);
            }
        }
        err = "Unterminated string";
        return std::nullopt;
    }

    // Any JSON number (sign, fraction, exponent). Non-finite results are rejected.
    std::optional<double> parse_number(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        if (pos_ < src_.size() && src_[pos_] == '-') {
            ++pos_;
        }
        const std::size_t int_start = pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        if (int_start == pos_) {
            pos_ = start;
            err = "Expected number";
            return std::nullopt;
        }
        if (pos_ < src_.size() && src_[pos_] == '.') {
            ++pos_;
            const std::size_t frac_start = pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                ++pos_;
            }
            if (frac_start == pos_) {
                err = "Invalid fraction";
                return std::nullopt;
            }
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) {
                ++pos_;
            }
            const std::size_t exp_start = pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                ++pos_;
            }
            if (exp_start == pos_) {
                err = "Invalid exponent";
                return std::nullopt;
            }
        }
        // strtod needs a terminated buffer; the literal is short.
        const std::string literal(src_.substr(start, pos_ - start));
        char* end = nullptr;
        const double value = std::strtod(literal.c_str(), &end);
        if (end == nullptr || *end != '\0' || !std::isfinite(value)) {
            err = "Invalid number";
            return std::nullopt;
        }
        return value;
    }

    bool parse_literal(std::string_view literal, std::string& err) noexcept {
        skip_ws();
        if (src_.substr(pos_).compare(0, literal.size(), literal) == 0) {
            pos_ += literal.size();
            return true;
        }
        err = "Expected literal";
        return false;
    }

    // Consumes a `null` literal if one is next.
    bool consume_null() noexcept {
        std::string ignored;
        return peek() == 'n' && parse_literal("null", ignored);
    }

    // Skips one complete value of any type.
    bool skip_value(std::string& err) noexcept {
        return skip_value_at_depth(0, err);
    }

    // Skips one complete value and returns its raw text.
    std::optional<std::string_view> capture_value(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        if (!skip_value(err)) {
            return std::nullopt;
        }
        return src_.substr(start, pos_ - start);
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    bool skip_value_at_depth(int depth, std::string& err) noexcept {
        if (depth > max_depth) {
            err = "Nesting too deep";
            return false;
        }
        const char c = peek();
        if (c == '"') {
            return parse_string(err).has_value();
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number(err).has_value();
        }
        if (c == 't') return parse_literal("true", err);
        if (c == 'f') return parse_literal("false", err);
        if (c == 'n') return parse_literal("null", err);
        if (c == '[') {
            ++pos_;
            if (consume(']')) return true;
            while (true) {
                if (!skip_value_at_depth(depth + 1, err)) return false;
                if (consume(']')) return true;
                if (!consume(',')) { err = "Expected ','"; return false; }
            }
        }
        if (c == '{') {
            ++pos_;
            if (consume('}')) return true;
            while (true) {
                if (!parse_string(err)) return false;
                if (!expect(':')) { err = "Expected ':'"; return false; }
                if (!skip_value_at_depth(depth + 1, err)) return false;
                if (consume('}')) return true;
                if (!consume(',')) { err = "Expected ','"; return false; }
            }
        }
        err = "Unexpected character";
        return false;
    }

    std::optional<std::uint32_t> parse_hex4() noexcept {
        if (src_.size() - pos_ < 4) {
            return std::nullopt;
        }
        std::uint32_t cp = 0;
        const auto* begin = src_.data() + pos_;
        const auto conv = std::from_chars(begin, begin + 4, cp, 16);
        if (conv.ec != std::errc() || conv.ptr != begin + 4) {
            return std::nullopt;
        }
        pos_ += 4;
        return cp;
    }

    // Decodes \uXXXX (with surrogate pairs) into UTF-8.
    bool parse_unicode_escape(std::string& out, std::string& err) noexcept {
        auto cp = parse_hex4();
        if (!cp) {
            err = "Invalid unicode escape";
            return false;
        }
        std::uint32_t code = *cp;
        if (code >= 0xD800 && code <= 0xDBFF) {
            if (src_.substr(pos_, 2) != "\\u") {
                err = "Unpaired surrogate";
                return false;
            }
            pos_ += 2;
            auto low = parse_hex4();
            if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                err = "Invalid surrogate pair";
                return false;
            }
            code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
        } else if (code >= 0xDC00 && code <= 0xDFFF) {
            err = "Unpaired surrogate";
            return false;
        }

        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        return true;
    }

    mutable std::size_t pos_{0};
    std::string_view src_;
};

} // namespace util
