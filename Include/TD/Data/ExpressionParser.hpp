#pragma once

#include "TD/Expression.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace td {

struct ParseError final : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// "alice sees herself - alice meets claire + grace meets claire"
//   terms:     [[alice, sees, herself], [alice, meets, claire], [grace, meets, claire]]
//   operators: [-, +]
struct ParsedExpression {
    std::vector<std::vector<std::string>> terms;
    std::vector<Operator> operators;
};

// Operators are standalone "+" / "-" tokens between whitespace-separated words
ParsedExpression parseExpression(std::string_view text);

// Canonical text: words separated by single spaces, operators spaced out
std::string toString(const ParsedExpression& expression);

// Whitespace tokenizer for annotation and target columns
std::vector<std::string> tokenize(std::string_view text);

} // namespace td
