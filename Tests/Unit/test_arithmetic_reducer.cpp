#include <catch2/catch_test_macros.hpp>

#include "TD/ArithmeticReducer.hpp"
#include "TD/Errors.hpp"

using namespace td;

static EncodingBag encoding(const FieldValue& hidden, const Tensor& outputs) {
    EncodingBag bag{{Field::EncHidden, hidden}};
    if (outputs.defined()) bag.set(Field::EncOutputs, outputs);
    return bag;
}

TEST_CASE("Left-to-right arithmetic matches direct tensor arithmetic", "[reducer]") {
    ArithmeticReducer reducer;
    torch::manual_seed(3);

    const Tensor h1 = torch::randn({1, 2, 4}), h2 = torch::randn({1, 2, 4}), h3 = torch::randn({1, 2, 4});
    const Tensor o1 = torch::randn({5, 2, 4}), o2 = torch::randn({5, 2, 4}), o3 = torch::randn({5, 2, 4});

    SECTION("Single tensor hidden state, [+, -]") {
        const EncodingBag result = reducer.reduce(
            {encoding(h1, o1), encoding(h2, o2), encoding(h3, o3)},
            {Operator::Plus, Operator::Minus});

        REQUIRE(torch::equal(result.tensor(Field::EncHidden), h1 + h2 - h3));
        REQUIRE(torch::equal(result.tensor(Field::EncOutputs), o1 + o2 - o3));
    }

    SECTION("Single tensor hidden state, [-, +]") {
        const EncodingBag result = reducer.reduce(
            {encoding(h1, o1), encoding(h2, o2), encoding(h3, o3)},
            {Operator::Minus, Operator::Plus});

        REQUIRE(torch::equal(result.tensor(Field::EncHidden), h1 - h2 + h3));
    }

    SECTION("Tuple hidden state combines position by position") {
        const Tensor c1 = torch::randn({1, 2, 4}), c2 = torch::randn({1, 2, 4}), c3 = torch::randn({1, 2, 4});
        const EncodingBag result = reducer.reduce(
            {encoding(TensorTuple{h1, c1}, o1), encoding(TensorTuple{h2, c2}, o2),
             encoding(TensorTuple{h3, c3}, o3)},
            {Operator::Plus, Operator::Minus});

        REQUIRE(isTuple(result.get(Field::EncHidden)));
        const auto& hidden = std::get<TensorTuple>(result.get(Field::EncHidden));
        REQUIRE(hidden.size() == 2);
        REQUIRE(torch::equal(hidden[0], h1 + h2 - h3));
        REQUIRE(torch::equal(hidden[1], c1 + c2 - c3));
    }

    SECTION("Term list form") {
        const std::vector<Term> terms = {
            Operand{encoding(h1, o1)}, Operator::Plus, Operand{encoding(h2, o2)},
            Operator::Minus, Operand{encoding(h3, o3)},
        };
        const EncodingBag result = reducer.reduce(terms);
        REQUIRE(torch::equal(result.tensor(Field::EncHidden), h1 + h2 - h3));
    }

    SECTION("Repeated reduction is bit-identical") {
        const auto a = reducer.reduce({encoding(h1, o1), encoding(h2, o2)}, {Operator::Minus});
        const auto b = reducer.reduce({encoding(h1, o1), encoding(h2, o2)}, {Operator::Minus});
        REQUIRE(torch::equal(a.tensor(Field::EncOutputs), b.tensor(Field::EncOutputs)));
    }
}

TEST_CASE("Single term reduces to itself", "[reducer]") {
    ArithmeticReducer reducer;
    const Tensor source = torch::tensor({1, 3, 4, 5, 2}, torch::kInt64).unsqueeze(1);
    const Tensor h = torch::randn({1, 1, 6});
    const Tensor o = torch::randn({5, 1, 6});

    EncodingBag term{{Field::Source, source}, {Field::EncHidden, h}, {Field::EncOutputs, o}};
    const EncodingBag result = reducer.reduce({term}, {});

    REQUIRE(result.fields() == term.fields());
    REQUIRE(torch::equal(result.tensor(Field::Source), source));
    REQUIRE(torch::equal(result.tensor(Field::EncHidden), h));
    REQUIRE(torch::equal(result.tensor(Field::EncOutputs), o));
}

TEST_CASE("Fields missing from a term are omitted", "[reducer]") {
    ArithmeticReducer reducer;
    const Tensor h = torch::ones({1, 1, 2});

    // The middle term reports a hidden state only
    const EncodingBag result = reducer.reduce(
        {encoding(h, torch::ones({3, 1, 2})), encoding(h, Tensor()), encoding(h, torch::ones({3, 1, 2}))},
        {Operator::Minus, Operator::Plus});

    REQUIRE(result.has(Field::EncHidden));
    REQUIRE_FALSE(result.has(Field::EncOutputs));
    REQUIRE(torch::equal(result.tensor(Field::EncHidden), h));
}

TEST_CASE("Carry fields come from the first operand", "[reducer]") {
    ArithmeticReducer reducer;
    const Tensor s1 = torch::full({3, 1}, 4, torch::kInt64);
    const Tensor s2 = torch::full({3, 1}, 7, torch::kInt64);

    const EncodingBag result = reducer.reduce(
        {EncodingBag{{Field::Source, s1}}, EncodingBag{{Field::Source, s2}}}, {Operator::Plus});
    REQUIRE(torch::equal(result.tensor(Field::Source), s1));
}

TEST_CASE("Reducer rejects malformed input", "[reducer]") {
    ArithmeticReducer reducer;
    const EncodingBag a{{Field::EncHidden, torch::zeros({1, 1, 2})}};

    SECTION("Empty term list") {
        REQUIRE_THROWS_AS(reducer.reduce(std::vector<Term>{}), PreconditionError);
    }
    SECTION("Operator count mismatch") {
        REQUIRE_THROWS_AS(reducer.reduce({a, a, a}, {Operator::Plus}), PreconditionError);
    }
    SECTION("Leading operator") {
        REQUIRE_THROWS_AS(reducer.reduce({Operator::Plus, Operand{a}}), PreconditionError);
    }
    SECTION("Consecutive operands") {
        REQUIRE_THROWS_AS(reducer.reduce({Operand{a}, Operand{a}}), PreconditionError);
    }
    SECTION("Consecutive operators") {
        REQUIRE_THROWS_AS(reducer.reduce({Operand{a}, Operator::Plus, Operator::Minus, Operand{a}}),
                          PreconditionError);
    }
    SECTION("Shape mismatch") {
        const EncodingBag b{{Field::EncHidden, torch::zeros({2, 1, 2})}};
        REQUIRE_THROWS_AS(reducer.reduce({a, b}, {Operator::Plus}), ShapeContractError);
    }
    SECTION("Tensor combined with tuple") {
        const EncodingBag b{{Field::EncHidden, TensorTuple{torch::zeros({1, 1, 2}), torch::zeros({1, 1, 2})}}};
        REQUIRE_THROWS_AS(reducer.reduce({a, b}, {Operator::Minus}), ShapeContractError);
    }
    SECTION("Tuple arity mismatch") {
        const EncodingBag b{{Field::EncHidden, TensorTuple{torch::zeros({1, 1, 2})}}};
        const EncodingBag c{{Field::EncHidden, TensorTuple{torch::zeros({1, 1, 2}), torch::zeros({1, 1, 2})}}};
        REQUIRE_THROWS_AS(reducer.reduce({b, c}, {Operator::Plus}), ShapeContractError);
    }
}
