#include "TD/Runtime/Strategies/DecodingReductionStrategy.hpp"
#include "TD/Errors.hpp"

namespace td {

    bool DecodingReductionStrategy::canCompose(const CompositionOptions& options) const {
        return options.offset > 0;
    }

    EncodingBag DecodingReductionStrategy::compose(const SubExpressionBatch&,
                                                   const std::vector<Operator>&,
                                                   const CompositionOptions& options,
                                                   SequenceEncoder&,
                                                   const ArithmeticReducer&) {
        throw NotImplementedError("reduction during decoding is not implemented (" +
                                  toString(options) + ")");
    }

    std::string DecodingReductionStrategy::name() const {
        return "DecodingReductionStrategy";
    }

    int DecodingReductionStrategy::priority() const {
        return 10; // Before every other strategy
    }

} // namespace td
