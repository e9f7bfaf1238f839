#pragma once

#include "TD/Runtime/CompositionStrategy.hpp"

namespace td {

    /**
     * @brief Reduces fully encoded terms at the encoder/decoder boundary
     *
     * Every term is encoded independently and completely; hidden states and
     * per-step outputs are reduced once, then handed to the decoder.
     *
     * Example (offset = 0):
     *   enc(<sos> alice sees herself <eos>) - enc(<sos> alice meets claire <eos>)
     *     + enc(<sos> grace meets claire <eos>)
     */
    class BoundaryReductionStrategy : public CompositionStrategy {
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
