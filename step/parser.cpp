#include "parser.hpp"
#include <sstream>
#include <stdexcept>
#include <string>

namespace lasercut {
namespace step {

namespace {

// Nesting limit for parameter lists and typed values
constexpr int MAX_PARAMETER_DEPTH = 32;

}  // namespace

Parser::Parser(Tokenizer tokenizer) : tokenizer_(std::move(tokenizer)) {
    advance();
}

void Parser::advance() {
    current_ = tokenizer_.next();
}

bool Parser::check(TokenType type) const {
    return current_.type == type;
}

bool Parser::check_keyword(const char* keyword) const {
    return current_.type == TokenType::Keyword && current_.text == keyword;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

bool Parser::expect(TokenType type, const std::string& message) {
    if (!match(type)) {
        error(message);
        return false;
    }
    return true;
}

void Parser::error(const std::string& message) {
    std::ostringstream oss;
    oss << message << " at line " << current_.line << ", column " << current_.column;
    if (!current_.text.empty()) {
        oss << " (got '" << current_.text << "')";
    } else {
        oss << " (got " << token_type_name(current_.type) << ")";
    }
    errors_.push_back(oss.str());
}

void Parser::skip_past_semicolon() {
    while (!check(TokenType::Semicolon) && !check(TokenType::EndOfFile)) {
        advance();
    }
    match(TokenType::Semicolon);
}

EntityTable Parser::parse() {
    EntityTable table;

    if (!check_keyword("ISO-10303-21")) {
        error("Expected 'ISO-10303-21' at start of exchange file");
        return table;
    }
    advance();
    expect(TokenType::Semicolon, "Expected ';' after 'ISO-10303-21'");

    if (!parse_header()) {
        return table;
    }

    while (!check(TokenType::EndOfFile)) {
        if (check_keyword("DATA")) {
            advance();
            // Optional section name and schema list (edition 3)
            if (!check(TokenType::Semicolon)) {
                skip_past_semicolon();
            } else {
                advance();
            }
            parse_data_section(table);
        } else if (check_keyword("END-ISO-10303-21")) {
            advance();
            expect(TokenType::Semicolon, "Expected ';' after 'END-ISO-10303-21'");
            return table;
        } else {
            error("Expected 'DATA' or 'END-ISO-10303-21'");
            skip_past_semicolon();
        }
    }

    error("Missing 'END-ISO-10303-21'");
    return table;
}

bool Parser::parse_header() {
    if (!check_keyword("HEADER")) {
        error("Expected 'HEADER' section");
        return false;
    }
    advance();
    expect(TokenType::Semicolon, "Expected ';' after 'HEADER'");

    // Header entities (FILE_DESCRIPTION, FILE_NAME, FILE_SCHEMA) are not needed
    while (!check(TokenType::EndOfFile) && !check_keyword("ENDSEC")) {
        advance();
    }
    if (!check_keyword("ENDSEC")) {
        error("Unterminated HEADER section");
        return false;
    }
    advance();
    expect(TokenType::Semicolon, "Expected ';' after 'ENDSEC'");
    return true;
}

void Parser::parse_data_section(EntityTable& table) {
    while (!check(TokenType::EndOfFile)) {
        if (check_keyword("ENDSEC")) {
            advance();
            expect(TokenType::Semicolon, "Expected ';' after 'ENDSEC'");
            return;
        }
        if (!parse_instance(table)) {
            skip_past_semicolon();
        }
    }
    error("Unterminated DATA section");
}

bool Parser::parse_instance(EntityTable& table) {
    if (!check(TokenType::InstanceName)) {
        error("Expected entity instance name");
        return false;
    }
    EntityRecord record;
    record.id = *current_.instance;
    advance();

    if (!expect(TokenType::Equals, "Expected '=' after instance name")) {
        return false;
    }

    if (check(TokenType::Keyword)) {
        EntityPart part;
        if (!parse_simple_part(part)) {
            return false;
        }
        record.parts.push_back(std::move(part));
    } else if (match(TokenType::LParen)) {
        // Complex instance: (A(...) B(...) ...)
        while (check(TokenType::Keyword)) {
            EntityPart part;
            if (!parse_simple_part(part)) {
                return false;
            }
            record.parts.push_back(std::move(part));
        }
        if (!expect(TokenType::RParen, "Expected ')' to close complex instance")) {
            return false;
        }
        if (record.parts.empty()) {
            error("Empty complex instance #" + std::to_string(record.id));
            return false;
        }
    } else {
        error("Expected entity type after '='");
        return false;
    }

    if (!expect(TokenType::Semicolon, "Expected ';' after entity instance")) {
        return false;
    }

    if (table.entities.count(record.id) > 0) {
        errors_.push_back("Duplicate entity instance #" + std::to_string(record.id));
        return true;
    }
    table.entities.emplace(record.id, std::move(record));
    return true;
}

bool Parser::parse_simple_part(EntityPart& part) {
    part.type = current_.text;
    advance();
    if (!expect(TokenType::LParen, "Expected '(' after entity type " + part.type)) {
        return false;
    }
    return parse_parameter_list(part.params, 1);
}

// Parses parameters up to and including the closing ')'.
// depth counts the enclosing parentheses, the entity's own included.
bool Parser::parse_parameter_list(std::vector<Parameter>& params, int depth) {
    if (depth > MAX_PARAMETER_DEPTH) {
        error("Parameters nested deeper than " + std::to_string(MAX_PARAMETER_DEPTH) + " levels");
        return false;
    }
    if (match(TokenType::RParen)) {
        return true;
    }
    while (true) {
        Parameter param;
        if (!parse_parameter(param, depth)) {
            return false;
        }
        params.push_back(std::move(param));
        if (match(TokenType::Comma)) {
            continue;
        }
        return expect(TokenType::RParen, "Expected ',' or ')' in parameter list");
    }
}

bool Parser::parse_parameter(Parameter& param, int depth) {
    switch (current_.type) {
        case TokenType::Integer:
        case TokenType::Real:
            param.kind = Parameter::Kind::Number;
            param.number = *current_.number;
            param.text = current_.text;
            advance();
            return true;
        case TokenType::String:
            param.kind = Parameter::Kind::String;
            param.text = current_.text;
            advance();
            return true;
        case TokenType::Enumeration:
            param.kind = Parameter::Kind::Enumeration;
            param.text = current_.text;
            advance();
            return true;
        case TokenType::InstanceName:
            param.kind = Parameter::Kind::Reference;
            param.ref = *current_.instance;
            advance();
            return true;
        case TokenType::Dollar:
            param.kind = Parameter::Kind::Null;
            advance();
            return true;
        case TokenType::Asterisk:
            param.kind = Parameter::Kind::Derived;
            advance();
            return true;
        case TokenType::LParen:
            param.kind = Parameter::Kind::List;
            advance();
            return parse_parameter_list(param.items, depth + 1);
        case TokenType::Keyword:
            // Typed value such as LENGTH_MEASURE(2.5)
            param.kind = Parameter::Kind::Typed;
            param.text = current_.text;
            advance();
            if (!expect(TokenType::LParen, "Expected '(' after type name " + param.text)) {
                return false;
            }
            return parse_parameter_list(param.items, depth + 1);
        default:
            error("Unexpected token in parameter list");
            return false;
    }
}

EntityTable parse_step_text(std::string_view text) {
    Parser parser{Tokenizer(text)};
    EntityTable table = parser.parse();
    if (parser.has_errors()) {
        std::string message = "STEP parse error: " + parser.errors().front();
        if (parser.errors().size() > 1) {
            message += " (and " + std::to_string(parser.errors().size() - 1) + " more)";
        }
        throw std::runtime_error(message);
    }
    return table;
}

}  // namespace step
}  // namespace lasercut
