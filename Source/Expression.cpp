#include "TD/Expression.hpp"
#include "TD/Errors.hpp"

namespace td {

std::string toString(Operator op) {
  switch (op) {
  case Operator::Plus:
    return "+";
  case Operator::Minus:
    return "-";
  }
  throw std::logic_error("Unknown operator");
}

std::string toString(const std::vector<Operator> &ops) {
  std::string out;
  for (size_t i = 0; i < ops.size(); ++i) {
    if (i) out.push_back(' ');
    out += toString(ops[i]);
  }
  return out;
}

Operator parseOperator(char c) {
  if (c == '+') return Operator::Plus;
  if (c == '-') return Operator::Minus;
  throw PreconditionError(std::string("not an operator: '") + c + "'");
}

std::vector<Term> interleave(const std::vector<EncodingBag> &operands,
                             const std::vector<Operator> &operators) {
  if (operands.empty()) {
    throw PreconditionError("expression has no operands");
  }
  if (operators.size() + 1 != operands.size()) {
    throw PreconditionError(
        "expression with " + std::to_string(operands.size()) +
        " operand(s) needs " + std::to_string(operands.size() - 1) +
        " operator(s), got " + std::to_string(operators.size()));
  }

  std::vector<Term> terms;
  terms.reserve(operands.size() + operators.size());
  for (size_t i = 0; i < operands.size(); ++i) {
    if (i > 0) terms.emplace_back(operators[i - 1]);
    terms.emplace_back(Operand{operands[i]});
  }
  return terms;
}

} // namespace td
