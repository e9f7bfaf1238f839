#pragma once

#include "TD/Errors.hpp"

#include <map>
#include <string>
#include <string_view>

namespace td {

enum class RecurrentUnit { GRU, LSTM };

std::string toString(RecurrentUnit unit);

struct ModelConfig {
    RecurrentUnit unit{RecurrentUnit::LSTM};
    int64_t embeddingDim{32};
    int64_t hiddenDim{64};
    int64_t numLayers{1};
    double dropout{0.0};
    bool attention{true};
    int64_t maxLength{20};
};

struct DatasetConfig {
    std::string train;
    std::string test;   // optional
    std::string arith;  // optional
    int offset{0};      // reduction offset relative to the encoder/decoder boundary
    bool eosAware{false};
    std::string delimiter{"<unk>"};
    std::string withholding;  // pattern; matching sources never reach train or test

    // Named test subsets, name -> source pattern ([tracking] section)
    std::map<std::string, std::string> tracking;
};

struct TrainingConfig {
    double learningRate{0.01};
    int epochs{10};
    int batchSize{8};
    double tfRatio{0.5};
    uint64_t seed{42};
};

// Raw "[section] key = value" entries, before typing
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse the INI text into sections; throws ConfigError on syntax errors
ConfigSections parseConfigSections(std::string_view text, const std::string& sourceName = "<config>");

struct Config {
    ModelConfig model;
    DatasetConfig dataset;
    TrainingConfig training;

    // Directory the config was read from; data paths resolve against it
    std::string baseDir;

    static Config fromString(std::string_view text, const std::string& sourceName = "<config>");
    static Config fromFile(const std::string& path);

    // Resolve a dataset path against baseDir (absolute paths pass through)
    std::string resolve(const std::string& path) const;
};

} // namespace td
