#pragma once

#include "TD/Errors.hpp"
#include "TD/Runtime/CompositionStrategy.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace td {

    /**
     * @brief Registry for managing composition strategies
     *
     * Uses the Chain of Responsibility pattern to find the strategy for a
     * reduction policy.
     */
    class StrategyRegistry {
    public:

        /**
         * @brief Register a strategy (takes ownership)
         */
        void registerStrategy(StrategyPtr strategy) {
            strategies_.push_back(std::move(strategy));
            std::stable_sort(strategies_.begin(), strategies_.end(),
                [](const StrategyPtr& a, const StrategyPtr& b) {
                    return a->priority() < b->priority();
                });
        }

        /**
         * @brief Find the strategy for a policy
         * @throws NotImplementedError if no strategy accepts the options
         */
        CompositionStrategy& select(const CompositionOptions& options) const {
            for (const auto& strategy : strategies_) {
                if (strategy->canCompose(options)) {
                    if (debug_) {
                        *err_ << "[StrategyRegistry] Using " << strategy->name()
                              << " for " << toString(options) << std::endl;
                    }
                    return *strategy;
                }
            }

            throw NotImplementedError("No composition strategy for " + toString(options));
        }

        EncodingBag compose(const SubExpressionBatch& split,
                            const std::vector<Operator>& operators,
                            const CompositionOptions& options,
                            SequenceEncoder& encoder,
                            const ArithmeticReducer& reducer) const {
            return select(options).compose(split, operators, options, encoder, reducer);
        }

        size_t size() const { return strategies_.size(); }

        void setDebug(bool debug) { debug_ = debug; }
        void setErrOut(std::ostream* err) { err_ = err; }

    private:
        std::vector<StrategyPtr> strategies_;
        bool debug_ = false;
        std::ostream* err_ = &std::cerr;
    };

    /**
     * @brief Registry holding the four built-in strategies
     */
    StrategyRegistry makeDefaultStrategyRegistry();

} // namespace td
