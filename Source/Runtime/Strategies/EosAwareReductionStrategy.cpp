#include "TD/Runtime/Strategies/EosAwareReductionStrategy.hpp"
#include "TD/Errors.hpp"

#include <sstream>

namespace td {

    bool EosAwareReductionStrategy::canCompose(const CompositionOptions& options) const {
        return options.offset == 0 && options.eosAware;
    }

    EncodingBag EosAwareReductionStrategy::compose(const SubExpressionBatch& split,
                                                   const std::vector<Operator>& operators,
                                                   const CompositionOptions&,
                                                   SequenceEncoder& encoder,
                                                   const ArithmeticReducer& reducer) {
        composition::checkArity(split, operators);

        std::vector<Tensor> bodies;
        bodies.reserve(split.arity());
        for (size_t k = 0; k < split.terms.size(); ++k) {
            const Tensor& term = split.terms[k];
            if (term.size(0) < 2) {
                throw PreconditionError("term " + std::to_string(k) +
                                        " has no content before its end marker");
            }
            bodies.push_back(term.narrow(0, 0, term.size(0) - 1));
        }

        EncodingBag reduced = composition::encodeAndReduce(bodies, operators, encoder, reducer);
        if (!reduced.has(Field::EncHidden)) {
            throw ShapeContractError("reduced encodings carry no hidden state to resume from");
        }
        if (!reduced.has(Field::EncOutputs)) {
            throw ShapeContractError("reduced encodings carry no outputs to extend");
        }

        // Encode the shared <eos> from the reduced state
        const Tensor& first = split.terms.front();
        const Tensor eos = first.narrow(0, first.size(0) - 1, 1);
        EncodingBag tail = encoder.encodeResume(composition::sourceBag(eos),
                                                reduced.get(Field::EncHidden));

        Tensor outputs = torch::cat({reduced.tensor(Field::EncOutputs),
                                     tail.tensor(Field::EncOutputs)}, 0);
        const FieldValue& hidden = tail.get(Field::EncHidden);

        if (outputs.size(0) != first.size(0) || outputs.size(1) != first.size(1)) {
            std::ostringstream oss;
            oss << "computed outputs " << outputs.sizes()
                << " don't match the length of the input " << first.sizes();
            throw ShapeContractError(oss.str());
        }
        for (int64_t layers : composition::layerCounts(hidden)) {
            if (layers != 1) {
                throw ShapeContractError("hidden state should have 1 layer, got " +
                                         std::to_string(layers));
            }
        }

        EncodingBag composite;
        composite.set(Field::EncHidden, hidden);
        composite.set(Field::EncOutputs, outputs);
        return composite;
    }

    std::string EosAwareReductionStrategy::name() const {
        return "EosAwareReductionStrategy";
    }

    int EosAwareReductionStrategy::priority() const {
        return 40;
    }

} // namespace td
