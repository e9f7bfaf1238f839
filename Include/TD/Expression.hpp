#pragma once

#include "TD/EncodingBag.hpp"

#include <string>
#include <variant>
#include <vector>

namespace td {

// Arithmetic operator placed between two adjacent sub-expressions
enum class Operator { Plus, Minus };

struct Operand {
  EncodingBag bag;
};

// Operand, Operator, Operand, ... Operand
using Term = std::variant<Operand, Operator>;

std::string toString(Operator op);
std::string toString(const std::vector<Operator> &ops);

// Accepts '+' or '-'; throws PreconditionError for anything else
Operator parseOperator(char c);

// Interleaves operands with operators into a term list
std::vector<Term> interleave(const std::vector<EncodingBag> &operands,
                             const std::vector<Operator> &operators);

} // namespace td
