#include "TD/Runtime/Strategies/BoundaryReductionStrategy.hpp"

namespace td {

    bool BoundaryReductionStrategy::canCompose(const CompositionOptions& options) const {
        return options.offset == 0 && !options.eosAware;
    }

    EncodingBag BoundaryReductionStrategy::compose(const SubExpressionBatch& split,
                                                   const std::vector<Operator>& operators,
                                                   const CompositionOptions&,
                                                   SequenceEncoder& encoder,
                                                   const ArithmeticReducer& reducer) {
        composition::checkArity(split, operators);

        EncodingBag reduced = composition::encodeAndReduce(split.terms, operators, encoder, reducer);

        EncodingBag composite;
        for (Field f : {Field::EncHidden, Field::EncOutputs}) {
            if (const FieldValue* v = reduced.find(f)) {
                composite.set(f, *v);
            }
        }
        return composite;
    }

    std::string BoundaryReductionStrategy::name() const {
        return "BoundaryReductionStrategy";
    }

    int BoundaryReductionStrategy::priority() const {
        return 50;
    }

} // namespace td
