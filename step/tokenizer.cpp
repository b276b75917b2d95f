#include "tokenizer.hpp"
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>

namespace lasercut {
namespace step {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::InstanceName: return "instance name";
        case TokenType::Keyword: return "keyword";
        case TokenType::Integer: return "integer";
        case TokenType::Real: return "real";
        case TokenType::String: return "string";
        case TokenType::Enumeration: return "enumeration";
        case TokenType::Dollar: return "'$'";
        case TokenType::Asterisk: return "'*'";
        case TokenType::LParen: return "'('";
        case TokenType::RParen: return "')'";
        case TokenType::Comma: return "','";
        case TokenType::Semicolon: return "';'";
        case TokenType::Equals: return "'='";
        case TokenType::EndOfFile: return "end of file";
        case TokenType::Unknown: return "unknown";
    }
    return "unknown";
}

namespace {

bool is_keyword_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

char Tokenizer::current() const {
    if (at_end()) return '\0';
    return input_[pos_];
}

char Tokenizer::peek_char(size_t offset) const {
    if (pos_ + offset >= input_.size()) return '\0';
    return input_[pos_ + offset];
}

void Tokenizer::advance() {
    if (!at_end()) {
        if (current() == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        pos_++;
    }
}

void Tokenizer::skip_whitespace_and_comments() {
    while (!at_end()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '/' && peek_char() == '*') {
            advance();
            advance();
            while (!at_end() && !(current() == '*' && peek_char() == '/')) {
                advance();
            }
            // Unterminated comments run to the end of input
            advance();
            advance();
        } else {
            break;
        }
    }
}

Token Tokenizer::make_token(TokenType type, std::string text, uint32_t line, uint32_t column) {
    return Token{type, std::move(text), line, column, std::nullopt, std::nullopt};
}

Token Tokenizer::peek() {
    if (!peeked_) {
        peeked_ = next();
    }
    return *peeked_;
}

Token Tokenizer::next() {
    if (peeked_) {
        Token t = *peeked_;
        peeked_.reset();
        return t;
    }
    return scan_token();
}

Token Tokenizer::scan_token() {
    skip_whitespace_and_comments();

    if (at_end()) {
        return make_token(TokenType::EndOfFile, "", line_, column_);
    }

    uint32_t start_line = line_;
    uint32_t start_column = column_;

    char c = current();

    // Single character tokens
    switch (c) {
        case '(':
            advance();
            return make_token(TokenType::LParen, "(", start_line, start_column);
        case ')':
            advance();
            return make_token(TokenType::RParen, ")", start_line, start_column);
        case ',':
            advance();
            return make_token(TokenType::Comma, ",", start_line, start_column);
        case ';':
            advance();
            return make_token(TokenType::Semicolon, ";", start_line, start_column);
        case '=':
            advance();
            return make_token(TokenType::Equals, "=", start_line, start_column);
        case '$':
            advance();
            return make_token(TokenType::Dollar, "$", start_line, start_column);
        case '*':
            advance();
            return make_token(TokenType::Asterisk, "*", start_line, start_column);
        case '#':
            return scan_instance_name();
        case '\'':
            return scan_string();
    }

    if (is_digit(c) || ((c == '-' || c == '+') && (is_digit(peek_char()) || peek_char() == '.'))) {
        return scan_number();
    }

    if (c == '.' && std::isalpha(static_cast<unsigned char>(peek_char()))) {
        return scan_enumeration();
    }

    // Standard and user-defined (!NAME) keywords
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '!') {
        return scan_keyword();
    }

    std::string text(1, c);
    advance();
    return make_token(TokenType::Unknown, text, start_line, start_column);
}

Token Tokenizer::scan_number() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;
    size_t start_pos = pos_;
    bool is_real = false;

    if (current() == '-' || current() == '+') {
        advance();
    }
    while (is_digit(current())) {
        advance();
    }
    if (current() == '.') {
        is_real = true;
        advance();
        while (is_digit(current())) {
            advance();
        }
    }
    if (current() == 'E' || current() == 'e') {
        char sign = peek_char();
        if (is_digit(sign) || ((sign == '-' || sign == '+') && is_digit(peek_char(2)))) {
            is_real = true;
            advance();
            if (current() == '-' || current() == '+') {
                advance();
            }
            while (is_digit(current())) {
                advance();
            }
        }
    }

    std::string text(input_.substr(start_pos, pos_ - start_pos));
    // from_chars does not accept a leading '+'
    const char* first = text.data() + (text[0] == '+' ? 1 : 0);
    const char* last = text.data() + text.size();
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return make_token(TokenType::Unknown, text, start_line, start_column);
    }

    Token token = make_token(is_real ? TokenType::Real : TokenType::Integer, text, start_line, start_column);
    token.number = value;
    return token;
}

Token Tokenizer::scan_keyword() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    std::string word;
    word += current();
    advance();
    while (!at_end() && is_keyword_char(current())) {
        word += static_cast<char>(std::toupper(static_cast<unsigned char>(current())));
        advance();
    }
    if (word[0] != '!') {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return make_token(TokenType::Keyword, word, start_line, start_column);
}

Token Tokenizer::scan_instance_name() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    advance();  // consume '#'
    std::string digits;
    while (is_digit(current())) {
        digits += current();
        advance();
    }
    if (digits.empty()) {
        return make_token(TokenType::Unknown, "#", start_line, start_column);
    }

    uint64_t id = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
    if (ec != std::errc()) {
        return make_token(TokenType::Unknown, "#" + digits, start_line, start_column);
    }

    Token token = make_token(TokenType::InstanceName, "#" + digits, start_line, start_column);
    token.instance = id;
    return token;
}

Token Tokenizer::scan_string() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    advance();  // opening quote
    std::string text;
    while (!at_end()) {
        char c = current();
        if (c == '\'') {
            if (peek_char() == '\'') {
                text += '\'';
                advance();
                advance();
                continue;
            }
            advance();  // closing quote
            return make_token(TokenType::String, decode_string_escapes(text), start_line, start_column);
        }
        // Line breaks inside strings are not part of the value
        if (c != '\n' && c != '\r') {
            text += c;
        }
        advance();
    }
    return make_token(TokenType::Unknown, "'" + text, start_line, start_column);
}

namespace {

void append_utf8(std::string& out, uint32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Fixed-width hex number at raw[pos]
std::optional<uint32_t> hex_at(std::string_view raw, size_t pos, size_t width) {
    if (pos + width > raw.size()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = raw[pos + i];
        uint32_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<uint32_t>(c - '0');
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<uint32_t>(c - 'A' + 10);
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<uint32_t>(c - 'a' + 10);
        } else {
            return std::nullopt;
        }
        value = value * 16 + digit;
    }
    return value;
}

// \X2\ or \X4\ run starting after the opening directive. Returns the index
// just past the closing \X0\, or nothing when the run is malformed.
std::optional<size_t> decode_wide_run(std::string_view raw, size_t pos, size_t width, std::string& out) {
    std::string decoded;
    std::optional<uint32_t> high_surrogate;
    while (pos < raw.size() && raw[pos] != '\\') {
        auto unit = hex_at(raw, pos, width);
        if (!unit) {
            return std::nullopt;
        }
        pos += width;
        if (width == 4 && *unit >= 0xD800 && *unit <= 0xDBFF) {
            high_surrogate = *unit;
            continue;
        }
        if (width == 4 && *unit >= 0xDC00 && *unit <= 0xDFFF && high_surrogate) {
            append_utf8(decoded, 0x10000 + ((*high_surrogate - 0xD800) << 10) + (*unit - 0xDC00));
        } else {
            append_utf8(decoded, *unit);
        }
        high_surrogate.reset();
    }
    if (raw.substr(pos, 4) != "\\X0\\") {
        return std::nullopt;
    }
    out += decoded;
    return pos + 4;
}

}  // namespace

std::string decode_string_escapes(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] != '\\') {
            out += raw[i++];
            continue;
        }
        std::string_view rest = raw.substr(i);
        if (rest.substr(0, 2) == "\\\\") {
            out += '\\';
            i += 2;
        } else if (rest.substr(0, 3) == "\\S\\" && rest.size() >= 4) {
            append_utf8(out, static_cast<unsigned char>(rest[3]) + 0x80u);
            i += 4;
        } else if (rest.substr(0, 3) == "\\X\\" && hex_at(raw, i + 3, 2)) {
            append_utf8(out, *hex_at(raw, i + 3, 2));
            i += 5;
        } else if (rest.substr(0, 4) == "\\X2\\" || rest.substr(0, 4) == "\\X4\\") {
            size_t width = rest[2] == '2' ? 4 : 8;
            if (auto end = decode_wide_run(raw, i + 4, width, out)) {
                i = *end;
            } else {
                out += raw[i++];
            }
        } else if (rest.size() >= 4 && rest[1] == 'P' && rest[2] >= 'A' && rest[2] <= 'I' && rest[3] == '\\') {
            i += 4;
        } else {
            out += raw[i++];
        }
    }
    return out;
}

Token Tokenizer::scan_enumeration() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    advance();  // leading '.'
    std::string name;
    while (!at_end() && (std::isalnum(static_cast<unsigned char>(current())) || current() == '_')) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(current())));
        advance();
    }
    if (current() != '.') {
        return make_token(TokenType::Unknown, "." + name, start_line, start_column);
    }
    advance();  // trailing '.'
    return make_token(TokenType::Enumeration, name, start_line, start_column);
}

}  // namespace step
}  // namespace lasercut
