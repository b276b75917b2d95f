#ifndef LASERCUT_STEP_PARSER_HPP
#define LASERCUT_STEP_PARSER_HPP

#include "tokenizer.hpp"
#include "entity.hpp"
#include <string>
#include <vector>

namespace lasercut {
namespace step {

// Parses a Part 21 exchange structure into an EntityTable.
// Problems are collected in errors() and the offending instance is skipped.
class Parser {
public:
    explicit Parser(Tokenizer tokenizer);

    EntityTable parse();

    const std::vector<std::string>& errors() const { return errors_; }
    bool has_errors() const { return !errors_.empty(); }

private:
    Tokenizer tokenizer_;
    Token current_;
    std::vector<std::string> errors_;

    void advance();
    bool check(TokenType type) const;
    bool check_keyword(const char* keyword) const;
    bool match(TokenType type);
    bool expect(TokenType type, const std::string& message);
    void skip_past_semicolon();
    void error(const std::string& message);

    bool parse_header();
    void parse_data_section(EntityTable& table);
    bool parse_instance(EntityTable& table);
    bool parse_simple_part(EntityPart& part);
    bool parse_parameter_list(std::vector<Parameter>& params, int depth);
    bool parse_parameter(Parameter& param, int depth);
};

// Convenience wrapper: tokenizes and parses text, throwing
// std::runtime_error with the first collected error on failure
EntityTable parse_step_text(std::string_view text);

}  // namespace step
}  // namespace lasercut

#endif // LASERCUT_STEP_PARSER_HPP
