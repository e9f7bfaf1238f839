#include "TD/Runtime/StrategyRegistry.hpp"
#include "TD/Runtime/Strategies/BoundaryReductionStrategy.hpp"
#include "TD/Runtime/Strategies/DecodingReductionStrategy.hpp"
#include "TD/Runtime/Strategies/EncodingReductionStrategy.hpp"
#include "TD/Runtime/Strategies/EosAwareReductionStrategy.hpp"

namespace td {

    StrategyRegistry makeDefaultStrategyRegistry() {
        StrategyRegistry registry;
        registry.registerStrategy(std::make_unique<DecodingReductionStrategy>());
        registry.registerStrategy(std::make_unique<EosAwareReductionStrategy>());
        registry.registerStrategy(std::make_unique<BoundaryReductionStrategy>());
        registry.registerStrategy(std::make_unique<EncodingReductionStrategy>());
        return registry;
    }

} // namespace td
