#include "TD/ArithmeticReducer.hpp"
#include "TD/Errors.hpp"

#include <sstream>

namespace td {

    EncodingBag ArithmeticReducer::reduce(const std::vector<Term>& terms) const {
        if (terms.empty()) {
            throw PreconditionError("cannot reduce an empty term list");
        }

        const auto* first = std::get_if<Operand>(&terms.front());
        if (!first) {
            throw PreconditionError("term list must start with an operand");
        }
        if (!std::holds_alternative<Operand>(terms.back())) {
            throw PreconditionError("term list must end with an operand");
        }

        EncodingBag result = first->bag;
        std::optional<Operator> pending;

        for (size_t i = 1; i < terms.size(); ++i) {
            if (const auto* op = std::get_if<Operator>(&terms[i])) {
                if (pending) {
                    throw PreconditionError("two consecutive operators at term " + std::to_string(i));
                }
                pending = *op;
                continue;
            }

            if (!pending) {
                throw PreconditionError("two consecutive operands at term " + std::to_string(i));
            }

            const EncodingBag& rhs = std::get<Operand>(terms[i]).bag;
            for (const auto& spec : kFieldTable) {
                if (spec.rule != CombineRule::Arithmetic || !result.has(spec.field)) {
                    continue;
                }
                const FieldValue* value = rhs.find(spec.field);
                if (!value) {
                    // Partial composition: the term does not report this field
                    result.erase(spec.field);
                    continue;
                }
                result.set(spec.field, combine(result.get(spec.field), *value, *pending, spec.field));
            }
            pending.reset();
        }

        return result;
    }

    EncodingBag ArithmeticReducer::reduce(const std::vector<EncodingBag>& operands,
                                          const std::vector<Operator>& operators) const {
        return reduce(interleave(operands, operators));
    }

    FieldValue ArithmeticReducer::combine(const FieldValue& lhs, const FieldValue& rhs,
                                          Operator op, Field field) {
        if (isTuple(lhs) != isTuple(rhs)) {
            throw ShapeContractError("field " + toString(field) +
                                     ": cannot combine a tensor with a tuple");
        }

        if (const auto* l = std::get_if<Tensor>(&lhs)) {
            return apply(*l, std::get<Tensor>(rhs), op, field, "");
        }

        const auto& lt = std::get<TensorTuple>(lhs);
        const auto& rt = std::get<TensorTuple>(rhs);
        if (lt.size() != rt.size()) {
            throw ShapeContractError("field " + toString(field) + ": tuple arity " +
                                     std::to_string(lt.size()) + " vs " + std::to_string(rt.size()));
        }

        TensorTuple out;
        out.reserve(lt.size());
        for (size_t i = 0; i < lt.size(); ++i) {
            out.push_back(apply(lt[i], rt[i], op, field, "[" + std::to_string(i) + "]"));
        }
        return out;
    }

    Tensor ArithmeticReducer::apply(const Tensor& lhs, const Tensor& rhs, Operator op,
                                    Field field, const std::string& position) {
        if (!lhs.defined() || !rhs.defined()) {
            throw ShapeContractError("field " + toString(field) + position + ": undefined tensor");
        }
        if (lhs.sizes() != rhs.sizes()) {
            std::ostringstream oss;
            oss << "field " << toString(field) << position << ": shape "
                << lhs.sizes() << " vs " << rhs.sizes();
            throw ShapeContractError(oss.str());
        }

        switch (op) {
        case Operator::Plus:
            return torch::add(lhs, rhs);
        case Operator::Minus:
            return torch::sub(lhs, rhs);
        }
        throw std::logic_error("Unknown operator");
    }

} // namespace td
