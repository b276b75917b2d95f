#ifndef LASERCUT_STEP_TOKEN_HPP
#define LASERCUT_STEP_TOKEN_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace lasercut {
namespace step {

enum class TokenType {
    // Values
    InstanceName,   // #123
    Keyword,        // ISO-10303-21, HEADER, DATA, CARTESIAN_POINT, ...
    Integer,
    Real,
    String,         // 'text' with '' unescaped
    Enumeration,    // .T., .UNSPECIFIED.

    // Special values
    Dollar,         // $ (null)
    Asterisk,       // * (derived)

    // Structure
    LParen, RParen, Comma, Semicolon, Equals,

    // Special
    EndOfFile, Unknown
};

struct Token {
    TokenType type;
    std::string text;
    uint32_t line;
    uint32_t column;
    std::optional<double> number;     // Integer and Real tokens
    std::optional<uint64_t> instance; // InstanceName tokens
};

const char* token_type_name(TokenType type);

}  // namespace step
}  // namespace lasercut

#endif // LASERCUT_STEP_TOKEN_HPP
