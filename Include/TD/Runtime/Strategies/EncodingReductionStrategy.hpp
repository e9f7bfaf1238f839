#pragma once

#include "TD/Runtime/CompositionStrategy.hpp"

namespace td {

    /**
     * @brief Reduces partially encoded terms, then finishes encoding the first term
     *
     * With k = -offset, each term is encoded up to k steps before its end and
     * the partial states are reduced. Encoding resumes on the last k tokens of
     * the first term, seeded with the reduced hidden state; its outputs are
     * appended to the reduced partial outputs.
     */
    class EncodingReductionStrategy : public CompositionStrategy {
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
