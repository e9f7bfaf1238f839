#include <catch2/catch_test_macros.hpp>

#include "TD/Errors.hpp"
#include "TD/Runtime/StrategyRegistry.hpp"

#include <sstream>

using namespace td;

namespace {

    // Deterministic stand-in for a recurrent encoder: h_t = 0.5 * h_{t-1} + token_t
    // with a one-wide hidden state, so composite encodings can be checked by hand.
    class DecayEncoder : public SequenceEncoder {
    public:
        bool tupleState = false;
        bool reportOutputs = true;
        int64_t layers = 1;
        int encodeCalls = 0;
        int resumeCalls = 0;

        EncodingBag encode(const EncodingBag& input) override {
            ++encodeCalls;
            const Tensor& source = input.tensor(Field::Source);
            return run(source, torch::zeros({layers, source.size(1), 1}));
        }

        EncodingBag encodeResume(const EncodingBag& input, const FieldValue& hidden) override {
            ++resumeCalls;
            const Tensor& source = input.tensor(Field::Source);
            const Tensor h = tupleState ? std::get<TensorTuple>(hidden).at(0) : std::get<Tensor>(hidden);
            if (h.size(1) != source.size(1)) {
                throw ShapeContractError("DecayEncoder: batch mismatch");
            }
            return run(source, h);
        }

    private:
        EncodingBag run(const Tensor& source, Tensor h) const {
            std::vector<Tensor> steps;
            for (int64_t t = 0; t < source.size(0); ++t) {
                h = 0.5 * h + source[t].to(torch::kFloat).view({1, -1, 1});
                steps.push_back(h[-1]);
            }
            EncodingBag out;
            if (tupleState) {
                out.set(Field::EncHidden, TensorTuple{h, h * h + 1});
            } else {
                out.set(Field::EncHidden, h);
            }
            if (reportOutputs) out.set(Field::EncOutputs, torch::stack(steps, 0));
            return out;
        }
    };

    Tensor column(std::vector<int64_t> ids) {
        return torch::tensor(ids, torch::kInt64).unsqueeze(1);
    }

    // Two batch columns per term, all terms framed as <sos> ... <eos>
    SubExpressionBatch threeTerms() {
        SubExpressionBatch split;
        split.terms.push_back(torch::cat({column({2, 4, 5, 6, 3}), column({2, 7, 5, 8, 3})}, 1));
        split.terms.push_back(torch::cat({column({2, 4, 9, 8, 3}), column({2, 7, 9, 6, 3})}, 1));
        split.terms.push_back(torch::cat({column({2, 6, 9, 8, 3}), column({2, 8, 9, 4, 3})}, 1));
        return split;
    }

    const std::vector<Operator> kMinusPlus = {Operator::Minus, Operator::Plus};

    EncodingBag encodeTerm(DecayEncoder& encoder, const Tensor& term) {
        return encoder.encode(composition::sourceBag(term));
    }

} // namespace

TEST_CASE("Default registry picks the strategy for each policy", "[strategies]") {
    StrategyRegistry registry = makeDefaultStrategyRegistry();
    REQUIRE(registry.size() == 4);

    REQUIRE(registry.select({0, false}).name() == "BoundaryReductionStrategy");
    REQUIRE(registry.select({-1, false}).name() == "EncodingReductionStrategy");
    REQUIRE(registry.select({-3, false}).name() == "EncodingReductionStrategy");
    REQUIRE(registry.select({0, true}).name() == "EosAwareReductionStrategy");
    REQUIRE(registry.select({2, false}).name() == "DecodingReductionStrategy");
    REQUIRE(registry.select({2, true}).name() == "DecodingReductionStrategy");

    // No strategy combines the end-marker deferral with an earlier cut
    REQUIRE_THROWS_AS(registry.select({-1, true}), NotImplementedError);
}

TEST_CASE("Registry reports its choice in debug mode", "[strategies]") {
    StrategyRegistry registry = makeDefaultStrategyRegistry();
    std::ostringstream log;
    registry.setErrOut(&log);

    registry.select({0, false});
    REQUIRE(log.str().empty());

    registry.setDebug(true);
    registry.select({0, false});
    REQUIRE(log.str().find("[StrategyRegistry] Using BoundaryReductionStrategy for offset=0 eos_aware=false")
            != std::string::npos);
}

TEST_CASE("Boundary reduction equals arithmetic on full encodings", "[strategies]") {
    StrategyRegistry registry = makeDefaultStrategyRegistry();
    ArithmeticReducer reducer;
    DecayEncoder encoder;
    const SubExpressionBatch split = threeTerms();

    SECTION("Single tensor state") {
        const EncodingBag composite = registry.compose(split, kMinusPlus, {0, false}, encoder, reducer);

        const auto e0 = encodeTerm(encoder, split.terms[0]);
        const auto e1 = encodeTerm(encoder, split.terms[1]);
        const auto e2 = encodeTerm(encoder, split.terms[2]);

        REQUIRE(composite.fields() == std::vector<Field>{Field::EncHidden, Field::EncOutputs});
        REQUIRE(torch::allclose(composite.tensor(Field::EncHidden),
                                e0.tensor(Field::EncHidden) - e1.tensor(Field::EncHidden) + e2.tensor(Field::EncHidden)));
        REQUIRE(torch::allclose(composite.tensor(Field::EncOutputs),
                                e0.tensor(Field::EncOutputs) - e1.tensor(Field::EncOutputs) + e2.tensor(Field::EncOutputs)));
        REQUIRE(composite.tensor(Field::EncOutputs).sizes() == torch::IntArrayRef({5, 2, 1}));
    }

    SECTION("Tuple state combines each part") {
        encoder.tupleState = true;
        const EncodingBag composite = registry.compose(split, kMinusPlus, {0, false}, encoder, reducer);

        const auto part = [&](size_t k, size_t i) {
            return std::get<TensorTuple>(encodeTerm(encoder, split.terms[k]).get(Field::EncHidden)).at(i);
        };

        const auto& hidden = std::get<TensorTuple>(composite.get(Field::EncHidden));
        REQUIRE(hidden.size() == 2);
        for (size_t i = 0; i < 2; ++i) {
            REQUIRE(torch::allclose(hidden[i], part(0, i) - part(1, i) + part(2, i)));
        }
        // The second part is not a function of the first after reduction
        REQUIRE_FALSE(torch::allclose(hidden[1], hidden[0] * hidden[0] + 1));
    }

    SECTION("A single term is its own encoding") {
        SubExpressionBatch single;
        single.terms.push_back(split.terms[0]);
        const EncodingBag composite = registry.compose(single, {}, {0, false}, encoder, reducer);
        REQUIRE(torch::equal(composite.tensor(Field::EncHidden),
                             encodeTerm(encoder, split.terms[0]).tensor(Field::EncHidden)));
    }

    SECTION("Encoders without per-step outputs yield a hidden-only composite") {
        encoder.reportOutputs = false;
        const EncodingBag composite = registry.compose(split, kMinusPlus, {0, false}, encoder, reducer);
        REQUIRE(composite.has(Field::EncHidden));
        REQUIRE_FALSE(composite.has(Field::EncOutputs));
    }

    SECTION("Term and operator counts must agree") {
        REQUIRE_THROWS_AS(registry.compose(split, {Operator::Plus}, {0, false}, encoder, reducer),
                          PreconditionError);
    }
}

TEST_CASE("Negative offsets reduce before the end of encoding", "[strategies]") {
    StrategyRegistry registry = makeDefaultStrategyRegistry();
    ArithmeticReducer reducer;
    DecayEncoder encoder;
    const SubExpressionBatch split = threeTerms();

    SECTION("Offset -1 resumes on the final step of the first term") {
        const EncodingBag composite = registry.compose(split, kMinusPlus, {-1, false}, encoder, reducer);

        Tensor reduced;
        {
            const auto p0 = encodeTerm(encoder, split.terms[0].narrow(0, 0, 4));
            const auto p1 = encodeTerm(encoder, split.terms[1].narrow(0, 0, 4));
            const auto p2 = encodeTerm(encoder, split.terms[2].narrow(0, 0, 4));
            reduced = p0.tensor(Field::EncHidden) - p1.tensor(Field::EncHidden) + p2.tensor(Field::EncHidden);
        }
        const Tensor lastToken = split.terms[0][4].to(torch::kFloat).view({1, 2, 1});

        REQUIRE(torch::allclose(composite.tensor(Field::EncHidden), 0.5 * reduced + lastToken));
        REQUIRE(composite.tensor(Field::EncOutputs).size(0) == split.terms[0].size(0));
        REQUIRE(torch::allclose(composite.tensor(Field::EncOutputs)[4], (0.5 * reduced + lastToken)[0]));
    }

    SECTION("Offset -2 resumes on two steps") {
        const int calls = encoder.resumeCalls;
        const EncodingBag composite = registry.compose(split, kMinusPlus, {-2, false}, encoder, reducer);
        REQUIRE(encoder.resumeCalls == calls + 1);
        REQUIRE(composite.tensor(Field::EncOutputs).sizes() == torch::IntArrayRef({5, 2, 1}));
    }

    SECTION("The cut must leave something to encode") {
        REQUIRE_THROWS_AS(registry.compose(split, kMinusPlus, {-5, false}, encoder, reducer),
                          PreconditionError);
    }

    SECTION("Hidden-only encoders still compose") {
        encoder.reportOutputs = false;
        const EncodingBag composite = registry.compose(split, kMinusPlus, {-1, false}, encoder, reducer);
        REQUIRE(composite.has(Field::EncHidden));
        REQUIRE_FALSE(composite.has(Field::EncOutputs));
    }
}

TEST_CASE("End-marker-aware reduction encodes <eos> once", "[strategies]") {
    StrategyRegistry registry = makeDefaultStrategyRegistry();
    ArithmeticReducer reducer;
    DecayEncoder encoder;
    const SubExpressionBatch split = threeTerms();

    SECTION("Output is one step longer than boundary reduction of the stripped terms") {
        SubExpressionBatch stripped;
        for (const auto& term : split.terms) {
            stripped.terms.push_back(term.narrow(0, 0, term.size(0) - 1));
        }
        const EncodingBag boundary = registry.compose(stripped, kMinusPlus, {0, false}, encoder, reducer);
        const EncodingBag aware = registry.compose(split, kMinusPlus, {0, true}, encoder, reducer);

        const Tensor& outputs = aware.tensor(Field::EncOutputs);
        REQUIRE(outputs.size(0) == boundary.tensor(Field::EncOutputs).size(0) + 1);
        REQUIRE(outputs.size(0) == split.terms[0].size(0));
        REQUIRE(torch::allclose(outputs.narrow(0, 0, 4), boundary.tensor(Field::EncOutputs)));

        const Tensor eos = split.terms[0][4].to(torch::kFloat).view({1, 2, 1});
        REQUIRE(torch::allclose(aware.tensor(Field::EncHidden),
                                0.5 * boundary.tensor(Field::EncHidden) + eos));
    }

    SECTION("Tuple states keep their arity") {
        encoder.tupleState = true;
        const EncodingBag aware = registry.compose(split, kMinusPlus, {0, true}, encoder, reducer);
        REQUIRE(std::get<TensorTuple>(aware.get(Field::EncHidden)).size() == 2);
    }

    SECTION("Multi-layer states are rejected") {
        encoder.layers = 2;
        REQUIRE_THROWS_AS(registry.compose(split, kMinusPlus, {0, true}, encoder, reducer),
                          ShapeContractError);
    }

    SECTION("Outputs are required") {
        encoder.reportOutputs = false;
        REQUIRE_THROWS_AS(registry.compose(split, kMinusPlus, {0, true}, encoder, reducer),
                          ShapeContractError);
    }

    SECTION("Terms need content before the end marker") {
        SubExpressionBatch bare;
        bare.terms.push_back(torch::full({1, 2}, 3, torch::kInt64));
        REQUIRE_THROWS_AS(registry.compose(bare, {}, {0, true}, encoder, reducer), PreconditionError);
    }
}

TEST_CASE("Positive offsets are not implemented", "[strategies]") {
    StrategyRegistry registry = makeDefaultStrategyRegistry();
    ArithmeticReducer reducer;
    DecayEncoder encoder;

    REQUIRE_THROWS_AS(registry.compose(threeTerms(), kMinusPlus, {1, false}, encoder, reducer),
                      NotImplementedError);
    REQUIRE(encoder.encodeCalls == 0);
}
