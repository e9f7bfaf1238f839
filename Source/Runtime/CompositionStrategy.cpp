#include "TD/Runtime/CompositionStrategy.hpp"
#include "TD/Errors.hpp"

namespace td {

    std::string toString(const CompositionOptions& options) {
        return "offset=" + std::to_string(options.offset) +
               " eos_aware=" + (options.eosAware ? "true" : "false");
    }

    namespace composition {

        EncodingBag sourceBag(const Tensor& source) {
            return EncodingBag{{Field::Source, source}};
        }

        void checkArity(const SubExpressionBatch& split, const std::vector<Operator>& operators) {
            if (split.arity() == 0) {
                throw PreconditionError("expression has no terms");
            }
            if (operators.size() + 1 != split.arity()) {
                throw PreconditionError(
                    "expression has " + std::to_string(split.arity()) + " term(s) but " +
                    std::to_string(operators.size()) + " operator(s)");
            }
            const int64_t batch = split.batchSize();
            for (size_t k = 0; k < split.terms.size(); ++k) {
                const Tensor& term = split.terms[k];
                if (term.dim() != 2 || term.size(1) != batch) {
                    throw PreconditionError("term " + std::to_string(k) +
                                            " is not a (time x " + std::to_string(batch) + ") tensor");
                }
            }
        }

        EncodingBag encodeAndReduce(const std::vector<Tensor>& terms,
                                    const std::vector<Operator>& operators,
                                    SequenceEncoder& encoder,
                                    const ArithmeticReducer& reducer) {
            std::vector<EncodingBag> encodings;
            encodings.reserve(terms.size());
            for (const auto& term : terms) {
                encodings.push_back(encoder.encode(sourceBag(term)));
            }
            return reducer.reduce(encodings, operators);
        }

        std::vector<int64_t> layerCounts(const FieldValue& hidden) {
            if (const auto* t = std::get_if<Tensor>(&hidden)) {
                return {t->size(0)};
            }
            std::vector<int64_t> out;
            for (const auto& part : std::get<TensorTuple>(hidden)) {
                out.push_back(part.size(0));
            }
            return out;
        }

    } // namespace composition

} // namespace td
