#pragma once

#include "TD/EncodingBag.hpp"
#include "TD/Expression.hpp"

#include <vector>

namespace td {

    /**
     * @brief Folds operand encodings left to right with + and -
     *
     * For every Arithmetic field present in the first operand the result is
     *   v1 op1 v2 op2 v3 ...
     * computed elementwise on the raw tensors (no rescaling). Tuple-valued
     * fields combine position by position. A field missing from any later
     * operand is dropped from the result. Carry fields are taken from the
     * first operand unchanged.
     *
     * Example: "alice sees herself" - "alice meets claire" + "grace meets claire"
     */
    class ArithmeticReducer {
    public:
        /**
         * @brief Reduce an alternating Operand/Operator term list
         * @throws PreconditionError if the list is empty or does not alternate
         * @throws ShapeContractError if operand values disagree in shape or kind
         */
        EncodingBag reduce(const std::vector<Term>& terms) const;

        /**
         * @brief Reduce N operands joined by N-1 operators
         */
        EncodingBag reduce(const std::vector<EncodingBag>& operands,
                           const std::vector<Operator>& operators) const;

        /**
         * @brief Combine one field value of two operands
         */
        static FieldValue combine(const FieldValue& lhs, const FieldValue& rhs,
                                  Operator op, Field field);

    private:
        static Tensor apply(const Tensor& lhs, const Tensor& rhs, Operator op,
                            Field field, const std::string& position);
    };

} // namespace td
