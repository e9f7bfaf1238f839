#pragma once

#include "TD/ArithmeticReducer.hpp"
#include "TD/EncodingBag.hpp"
#include "TD/Expression.hpp"
#include "TD/ExpressionSplitter.hpp"
#include "TD/Model/SequenceEncoder.hpp"

#include <memory>
#include <string>
#include <vector>

namespace td {

    /**
     * @brief Where arithmetic happens relative to the encoder/decoder boundary
     *
     * offset == 0: after every term is fully encoded
     * offset <  0: |offset| steps before the end of encoding
     * offset >  0: during decoding (not implemented)
     *
     * eosAware defers encoding of the shared end marker until after the
     * reduction.
     */
    struct CompositionOptions {
        int offset{0};
        bool eosAware{false};
    };

    std::string toString(const CompositionOptions& options);

    /**
     * @brief One policy for turning sub-expression terms into a composite encoding
     *
     * Strategies are selected through StrategyRegistry in priority order, the
     * first whose canCompose() accepts the options wins.
     */
    class CompositionStrategy {
    public:
        virtual ~CompositionStrategy() = default;

        /**
         * @brief Check if this strategy implements the requested policy
         */
        virtual bool canCompose(const CompositionOptions& options) const = 0;

        /**
         * @brief Encode and reduce the terms of a split batch
         * @param split one (time x batch) tensor per term
         * @param operators split.arity() - 1 operators
         * @return composite bag with Field::EncHidden and, when available,
         *         Field::EncOutputs
         * @throws PreconditionError, ShapeContractError, NotImplementedError
         */
        virtual EncodingBag compose(const SubExpressionBatch& split,
                                    const std::vector<Operator>& operators,
                                    const CompositionOptions& options,
                                    SequenceEncoder& encoder,
                                    const ArithmeticReducer& reducer) = 0;

        /**
         * @brief Get the name of this strategy (for debugging)
         */
        virtual std::string name() const = 0;

        /**
         * @brief Get priority (lower = checked first)
         */
        virtual int priority() const { return 100; }
    };

    using StrategyPtr = std::unique_ptr<CompositionStrategy>;

    namespace composition {

        /**
         * @brief Wrap a token tensor as encoder input
         */
        EncodingBag sourceBag(const Tensor& source);

        /**
         * @brief Check that term and operator counts agree
         */
        void checkArity(const SubExpressionBatch& split, const std::vector<Operator>& operators);

        /**
         * @brief Encode each token tensor from a zero state and reduce the encodings
         */
        EncodingBag encodeAndReduce(const std::vector<Tensor>& terms,
                                    const std::vector<Operator>& operators,
                                    SequenceEncoder& encoder,
                                    const ArithmeticReducer& reducer);

        /**
         * @brief Leading (layer) dimension of a hidden state, for each tuple part
         */
        std::vector<int64_t> layerCounts(const FieldValue& hidden);

    } // namespace composition

} // namespace td
