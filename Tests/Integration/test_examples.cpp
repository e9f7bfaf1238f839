#include <catch2/catch_test_macros.hpp>
#include "TD/Config.hpp"
#include "TD/Data/Dataset.hpp"
#include "TD/Trainer.hpp"
#include "TD/TransductionModel.hpp"
#include <sstream>
#include <string>

using namespace td;

static std::string examplePath(const std::string& name) {
    return std::string(TD_SOURCE_DIR) + "/Examples/" + name;
}

TEST_CASE("Load Examples/arith_grace.ini") {
    const Config c = Config::fromFile(examplePath("arith_grace.ini"));
    REQUIRE(c.model.unit == RecurrentUnit::LSTM);
    REQUIRE(c.model.attention);
    REQUIRE(c.dataset.offset == 0);
    REQUIRE_FALSE(c.dataset.eosAware);
    CHECK(c.resolve(c.dataset.train) == examplePath("train.tsv"));
    REQUIRE(c.dataset.withholding == "^grace sees herself$");
    REQUIRE(c.dataset.tracking.count("reflexive") == 1);
}

TEST_CASE("Withhold and track with Examples/arith_grace.ini") {
    const Config c = Config::fromFile(examplePath("arith_grace.ini"));
    const Dataset train = Dataset::fromFile(c.resolve(c.dataset.train));
    const Dataset test = Dataset::fromFile(c.resolve(c.dataset.test));

    const Dataset kept = train.withholding(c.dataset.withholding);
    REQUIRE(kept.size() == train.size());
    REQUIRE(kept.matching(c.dataset.withholding).empty());

    const Dataset reflexive = test.matching(c.dataset.tracking.at("reflexive"));
    REQUIRE(reflexive.size() == 1);
    CHECK(toString(reflexive.examples()[0].source) == "grace knows herself");
}

TEST_CASE("Load Examples/arith_grace_eos.ini") {
    const Config c = Config::fromFile(examplePath("arith_grace_eos.ini"));
    REQUIRE(c.model.unit == RecurrentUnit::GRU);
    REQUIRE(c.model.numLayers == 1);
    REQUIRE(c.dataset.eosAware);
    REQUIRE(c.dataset.test.empty());
}

TEST_CASE("Load Examples/train.tsv") {
    const Dataset ds = Dataset::fromFile(examplePath("train.tsv"));
    REQUIRE(ds.size() == 26);
    for (const auto& ex : ds.examples()) {
        REQUIRE(ex.hasTarget);
        REQUIRE(ex.source.operators.empty());
        // The arithmetic target never appears in training
        CHECK_FALSE(ex.target == std::vector<std::string>{"grace", "sees", "herself"});
    }
}

TEST_CASE("Load Examples/arith.tsv") {
    const Dataset ds = Dataset::fromFile(examplePath("arith.tsv"));
    REQUIRE(ds.size() == 4);
    CHECK(ds.examples()[0].source.operators == std::vector<Operator>{Operator::Minus, Operator::Plus});
    CHECK(ds.examples()[3].source.operators == std::vector<Operator>{Operator::Plus, Operator::Minus});
}

TEST_CASE("Train and compose with Examples/arith_grace_eos.ini") {
    Config c = Config::fromFile(examplePath("arith_grace_eos.ini"));
    c.training.epochs = 2;
    torch::manual_seed(c.training.seed);

    const Dataset train = Dataset::fromFile(c.resolve(c.dataset.train));
    const Dataset arith = Dataset::fromFile(c.resolve(c.dataset.arith));

    Vocabulary source, target;
    train.extendVocabularies(source, target);
    arith.extendVocabularies(source, target);

    SplitterOptions splitter;
    splitter.delimiterId = source.add(c.dataset.delimiter);
    splitter.sosId = source.sosId();
    splitter.eosId = source.eosId();
    splitter.padId = source.padId();

    std::ostringstream out;
    TransductionModel model(c.model, source, target, splitter, &out);
    Trainer trainer(model, c.training, target, &out);

    const auto losses = trainer.train(train.batches(c.training.batchSize, source, target, splitter.delimiterId));
    REQUIRE(losses.size() == 2);

    CompositionOptions options;
    options.offset = c.dataset.offset;
    options.eosAware = c.dataset.eosAware;
    const auto result = trainer.evaluateArithmetic(arith.batches(1, source, target, splitter.delimiterId), options);
    REQUIRE(result.total == 4);
    REQUIRE(result.predictions.size() == 4);
}
