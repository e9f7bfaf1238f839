#include "TD/Runtime/Strategies/EncodingReductionStrategy.hpp"
#include "TD/Errors.hpp"

namespace td {

    bool EncodingReductionStrategy::canCompose(const CompositionOptions& options) const {
        return options.offset < 0 && !options.eosAware;
    }

    EncodingBag EncodingReductionStrategy::compose(const SubExpressionBatch& split,
                                                   const std::vector<Operator>& operators,
                                                   const CompositionOptions& options,
                                                   SequenceEncoder& encoder,
                                                   const ArithmeticReducer& reducer) {
        composition::checkArity(split, operators);

        const int64_t tail = -static_cast<int64_t>(options.offset);

        // Cut every term k steps before its end
        std::vector<Tensor> prefixes;
        prefixes.reserve(split.arity());
        for (size_t k = 0; k < split.terms.size(); ++k) {
            const Tensor& term = split.terms[k];
            if (term.size(0) <= tail) {
                throw PreconditionError("offset " + std::to_string(options.offset) +
                                        " leaves nothing to encode in term " + std::to_string(k) +
                                        " of length " + std::to_string(term.size(0)));
            }
            prefixes.push_back(term.narrow(0, 0, term.size(0) - tail));
        }

        EncodingBag partial = composition::encodeAndReduce(prefixes, operators, encoder, reducer);
        if (!partial.has(Field::EncHidden)) {
            throw ShapeContractError("partial encodings carry no hidden state to resume from");
        }

        // Finish encoding the first term from the reduced state
        const Tensor& first = split.terms.front();
        const Tensor suffix = first.narrow(0, first.size(0) - tail, tail);
        EncodingBag resumed = encoder.encodeResume(composition::sourceBag(suffix),
                                                   partial.get(Field::EncHidden));

        EncodingBag composite;
        composite.set(Field::EncHidden, resumed.get(Field::EncHidden));

        if (partial.has(Field::EncOutputs) && resumed.has(Field::EncOutputs)) {
            Tensor outputs = torch::cat({partial.tensor(Field::EncOutputs),
                                         resumed.tensor(Field::EncOutputs)}, 0);
            if (outputs.size(0) != first.size(0)) {
                throw ShapeContractError("composite outputs cover " + std::to_string(outputs.size(0)) +
                                         " step(s), first term has " + std::to_string(first.size(0)));
            }
            composite.set(Field::EncOutputs, outputs);
        }

        return composite;
    }

    std::string EncodingReductionStrategy::name() const {
        return "EncodingReductionStrategy";
    }

    int EncodingReductionStrategy::priority() const {
        return 50;
    }

} // namespace td
