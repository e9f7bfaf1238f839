#pragma once

#include "TD/Config.hpp"
#include "TD/Data/Dataset.hpp"
#include "TD/Data/Vocabulary.hpp"
#include "TD/Runtime/CompositionStrategy.hpp"
#include "TD/TransductionModel.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace td {

struct EvaluationResult {
    size_t correct{0};
    size_t total{0};
    // Decoded predictions, in batch order
    std::vector<std::vector<std::string>> predictions;

    double accuracy() const { return total ? static_cast<double>(correct) / static_cast<double>(total) : 0.0; }
};

// Trains a TransductionModel with SGD and cross entropy, and scores exact
// sequence matches for plain and arithmetic decoding.
class Trainer {
public:
    Trainer(TransductionModel& model, const TrainingConfig& config, const Vocabulary& target,
            std::ostream* output = &std::cout);

    // Runs config.epochs epochs; returns the mean loss of each epoch
    std::vector<double> train(const std::vector<Batch>& batches);

    double trainEpoch(const std::vector<Batch>& batches, torch::optim::Optimizer& optimizer);

    // Cross entropy over (time x batch x vocabulary) logits, ignoring <pad>
    Tensor loss(const Tensor& logits, const Tensor& target) const;

    // Plain decoding without teacher forcing
    EvaluationResult evaluate(const std::vector<Batch>& batches);

    // Arithmetic composition of each batch's sub-expressions
    EvaluationResult evaluateArithmetic(const std::vector<Batch>& batches, const CompositionOptions& options);

private:
    void score(const Tensor& logits, const Batch& batch, EvaluationResult& result) const;

    TransductionModel& model_;
    TrainingConfig config_;
    const Vocabulary& target_;
    std::ostream* output_;
};

} // namespace td
