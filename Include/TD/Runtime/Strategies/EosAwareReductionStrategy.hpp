#pragma once

#include "TD/Runtime/CompositionStrategy.hpp"

namespace td {

    /**
     * @brief Reduces before the end marker, then encodes the end marker once
     *
     *   A                        | B
     *   <sos> alice sees herself | <eos>   -
     *   <sos> alice meets claire | <eos>   +
     *   <sos> grace meets claire | <eos>
     *
     * Column A of every term is encoded and reduced; the first term's <eos>
     * row is then encoded from the reduced hidden state and its output is
     * appended. The result must cover the first term's full length and carry
     * a single-layer hidden state.
     */
    class EosAwareReductionStrategy : public CompositionStrategy {
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
