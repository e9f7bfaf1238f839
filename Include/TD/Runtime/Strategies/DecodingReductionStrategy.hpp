#pragma once

#include "TD/Runtime/CompositionStrategy.hpp"

namespace td {

    /**
     * @brief Claims positive offsets (reduce during decoding) and rejects them
     *
     * There is no defined semantics for injecting arithmetic mid-decode, so
     * compose() always throws NotImplementedError. Registered ahead of the
     * other strategies so a positive offset never reaches a different policy.
     */
    class DecodingReductionStrategy : public CompositionStrategy {
    public:
        bool canCompose(const CompositionOptions& options) const override;
        EncodingBag compose(const SubExpressionBatch& split,
                            const std::vector<Operator>& operators,
                            const CompositionOptions& options,
                            SequenceEncoder& encoder,
                            const ArithmeticReducer& reducer) override;
        std::string name() const override;
        int priority() const override;
    };

} // namespace td
