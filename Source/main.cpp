#include "TD/Config.hpp"
#include "TD/Data/Dataset.hpp"
#include "TD/Data/ExpressionParser.hpp"
#include "TD/Data/Vocabulary.hpp"
#include "TD/Errors.hpp"
#include "TD/Trainer.hpp"
#include "TD/TransductionModel.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <torch/torch.h>

namespace {

enum class Mode { Train, Arith, All };

struct Datasets {
  td::Dataset train;
  std::optional<td::Dataset> test;
  std::optional<td::Dataset> arith;
};

Datasets loadDatasets(const td::Config &config) {
  if (config.dataset.train.empty()) {
    throw td::ConfigError("dataset.train is required");
  }
  Datasets ds{td::Dataset::fromFile(config.resolve(config.dataset.train)), {}, {}};
  if (!config.dataset.test.empty()) {
    ds.test = td::Dataset::fromFile(config.resolve(config.dataset.test));
  }
  if (!config.dataset.arith.empty()) {
    ds.arith = td::Dataset::fromFile(config.resolve(config.dataset.arith));
  }
  return ds;
}

std::string join(const std::vector<std::string> &words) {
  std::string out;
  for (size_t i = 0; i < words.size(); ++i) {
    if (i) out.push_back(' ');
    out += words[i];
  }
  return out;
}

// Drops examples matching dataset.withholding from train and test
void withhold(const td::Config &config, Datasets &data) {
  const std::string &pattern = config.dataset.withholding;
  if (pattern.empty()) return;

  const size_t before = data.train.size() + (data.test ? data.test->size() : 0);
  data.train = data.train.withholding(pattern);
  if (data.test) data.test = data.test->withholding(pattern);
  const size_t after = data.train.size() + (data.test ? data.test->size() : 0);

  std::cout << "Withheld " << (before - after) << " example(s) matching '"
            << pattern << "'" << std::endl;
}

void printAccuracy(const std::string &label, const td::EvaluationResult &result) {
  std::cout << label << ": " << result.correct << " / " << result.total << " ("
            << result.accuracy() << ")" << std::endl;
}

/// Trains on the configured dataset and evaluates test and arithmetic sets
int run(const std::string &configPath, Mode mode, bool debug) {
  try {
    const td::Config config = td::Config::fromFile(configPath);
    torch::manual_seed(config.training.seed);

    Datasets data = loadDatasets(config);
    withhold(config, data);

    td::Vocabulary source, target;
    data.train.extendVocabularies(source, target);
    if (data.test) data.test->extendVocabularies(source, target);
    if (data.arith) data.arith->extendVocabularies(source, target);

    // Operators arrive as the delimiter token; <unk> unless configured otherwise
    const int64_t delimiterId = source.add(config.dataset.delimiter);
    std::cout << "Vocabulary: source=" << source.size()
              << " target=" << target.size() << " delimiter="
              << config.dataset.delimiter << " (" << delimiterId << ")"
              << std::endl;

    td::SplitterOptions splitter;
    splitter.delimiterId = delimiterId;
    splitter.sosId = source.sosId();
    splitter.eosId = source.eosId();
    splitter.padId = source.padId();

    td::TransductionModel model(config.model, source, target, splitter);
    model.setDebug(debug);

    td::Trainer trainer(model, config.training, target);

    if (mode == Mode::Train || mode == Mode::All) {
      const auto batches = data.train.batches(config.training.batchSize, source,
                                              target, delimiterId);
      std::cout << "Beginning training on " << data.train.size()
                << " example(s)" << std::endl;
      trainer.train(batches);

      if (data.test) {
        printAccuracy("Test accuracy",
                      trainer.evaluate(data.test->batches(
                          config.training.batchSize, source, target, delimiterId)));

        for (const auto &[name, pattern] : config.dataset.tracking) {
          const td::Dataset subset = data.test->matching(pattern);
          if (subset.empty()) {
            std::cout << "Tracking " << name << ": no test example matches '"
                      << pattern << "'" << std::endl;
            continue;
          }
          printAccuracy("Tracking " + name,
                        trainer.evaluate(subset.batches(config.training.batchSize,
                                                        source, target, delimiterId)));
        }
      }
    }

    if (mode == Mode::Arith || mode == Mode::All) {
      if (!data.arith) {
        throw td::ConfigError("dataset.arith is required for arithmetic evaluation");
      }
      td::CompositionOptions options;
      options.offset = config.dataset.offset;
      options.eosAware = config.dataset.eosAware;

      // One example per batch: operators may differ between lines
      const auto batches = data.arith->batches(1, source, target, delimiterId);
      const auto result = trainer.evaluateArithmetic(batches, options);

      const auto &examples = data.arith->examples();
      for (size_t i = 0; i < examples.size() && i < result.predictions.size(); ++i) {
        std::cout << "  " << td::toString(examples[i].source) << "  =>  "
                  << join(result.predictions[i]);
        if (examples[i].hasTarget) {
          std::cout << "   [expected: " << join(examples[i].target) << "]";
        }
        std::cout << std::endl;
      }
      printAccuracy("Arithmetic accuracy (" + td::toString(options) + ")", result);
    }
    return 0;
  } catch (const td::ParseError &e) {
    std::cerr << e.what() << std::endl;
  } catch (const td::ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Execution error: " << e.what() << std::endl;
  }
  return 1;
}

void printUsage() {
  std::cerr << "Usage: td [--debug|-d] <config.ini> [train|arith|all]\n";
}

} // namespace

int main(const int argc, char **argv) {

  // Parse optional flags
  bool debug = false;
  int argi = 1;
  while (argi < argc && argv[argi][0] == '-') {
    std::string opt = argv[argi];
    if (opt == "--debug" || opt == "-d") {
      debug = true;
      ++argi;
      continue;
    }
    std::cerr << "Unknown option: " << opt << "\n";
    printUsage();
    return 1;
  }

  if (argi >= argc) {
    printUsage();
    return 1;
  }
  const std::string configPath = argv[argi++];

  Mode mode = Mode::All;
  if (argi < argc) {
    const std::string m = argv[argi];
    if (m == "train") {
      mode = Mode::Train;
    } else if (m == "arith") {
      mode = Mode::Arith;
    } else if (m == "all") {
      mode = Mode::All;
    } else {
      std::cerr << "Unknown mode: " << m << "\n";
      printUsage();
      return 1;
    }
  }

  return run(configPath, mode, debug);
}
