#ifndef LASERCUT_STEP_TOKENIZER_HPP
#define LASERCUT_STEP_TOKENIZER_HPP

#include "token.hpp"
#include <string>
#include <string_view>

namespace lasercut {
namespace step {

// Decodes the control directives of a Part 21 string into UTF-8:
// \\ (backslash), \S\c and \X\hh (ISO 8859-1), \X2\...\X0\ (UTF-16) and
// \X4\...\X0\ (UCS-4). Code page switches \Pa\ are dropped. Malformed
// directives are kept as written.
std::string decode_string_escapes(std::string_view raw);

// Lexer for the clear-text encoding of STEP exchange files (ISO 10303-21)
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next();           // Get next token
    Token peek();           // Look ahead without consuming
    bool at_end() const;

private:
    std::string_view input_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    std::optional<Token> peeked_;

    void skip_whitespace_and_comments();
    void advance();
    char current() const;
    char peek_char(size_t offset = 1) const;

    Token scan_token();
    Token scan_number();
    Token scan_keyword();
    Token scan_instance_name();
    Token scan_string();
    Token scan_enumeration();
    Token make_token(TokenType type, std::string text, uint32_t line, uint32_t column);
};

}  // namespace step
}  // namespace lasercut

#endif // LASERCUT_STEP_TOKENIZER_HPP
