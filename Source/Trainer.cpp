#include "TD/Trainer.hpp"
#include "TD/Errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace td {

Trainer::Trainer(TransductionModel& model, const TrainingConfig& config, const Vocabulary& target,
                 std::ostream* output)
    : model_(model), config_(config), target_(target), output_(output) {}

Tensor Trainer::loss(const Tensor& logits, const Tensor& target) const {
    if (logits.size(0) != target.size(0) || logits.size(1) != target.size(1)) {
        std::ostringstream oss;
        oss << "logits " << logits.sizes() << " do not cover target " << target.sizes();
        throw ShapeContractError(oss.str());
    }
    const int64_t vocab = logits.size(2);
    return torch::nn::functional::cross_entropy(
        logits.reshape({-1, vocab}), target.reshape({-1}),
        torch::nn::functional::CrossEntropyFuncOptions().ignore_index(target_.padId()));
}

double Trainer::trainEpoch(const std::vector<Batch>& batches, torch::optim::Optimizer& optimizer) {
    model_.train();

    double total = 0.0;
    size_t counted = 0;
    for (const auto& batch : batches) {
        if (!batch.target) {
            throw PreconditionError("training batch has no target");
        }
        optimizer.zero_grad();
        Tensor logits = model_.forward(batch, config_.tfRatio);
        Tensor l = loss(logits, *batch.target);
        l.backward();
        optimizer.step();

        total += l.item<double>();
        ++counted;
    }
    return counted ? total / static_cast<double>(counted) : 0.0;
}

std::vector<double> Trainer::train(const std::vector<Batch>& batches) {
    torch::optim::SGD optimizer(model_.parameters(), torch::optim::SGDOptions(config_.learningRate));

    std::vector<double> losses;
    losses.reserve(static_cast<size_t>(std::max(config_.epochs, 0)));
    for (int epoch = 0; epoch < config_.epochs; ++epoch) {
        const double l = trainEpoch(batches, optimizer);
        losses.push_back(l);
        if (output_) {
            *output_ << "EPOCH " << (epoch + 1) << " / " << config_.epochs
                     << "  trn_loss=" << std::fixed << std::setprecision(4) << l << std::endl;
        }
    }
    return losses;
}

void Trainer::score(const Tensor& logits, const Batch& batch, EvaluationResult& result) const {
    Tensor predicted = logits.argmax(-1).to(torch::kCPU).contiguous();
    Tensor target = batch.target ? batch.target->to(torch::kCPU).contiguous() : Tensor();

    for (int64_t b = 0; b < predicted.size(1); ++b) {
        Tensor column = predicted.select(1, b).contiguous();
        const int64_t* p = column.data_ptr<int64_t>();
        auto words = target_.decode(std::vector<int64_t>(p, p + column.numel()));

        if (target.defined()) {
            Tensor expectedColumn = target.select(1, b).contiguous();
            const int64_t* e = expectedColumn.data_ptr<int64_t>();
            const auto expected = target_.decode(std::vector<int64_t>(e, e + expectedColumn.numel()));
            ++result.total;
            if (words == expected) ++result.correct;
        }
        result.predictions.push_back(std::move(words));
    }
}

EvaluationResult Trainer::evaluate(const std::vector<Batch>& batches) {
    torch::NoGradGuard noGrad;
    model_.eval();

    EvaluationResult result;
    for (const auto& batch : batches) {
        Batch input = batch;
        input.target.reset();
        score(model_.forward(input, 0.0), batch, result);
    }
    return result;
}

EvaluationResult Trainer::evaluateArithmetic(const std::vector<Batch>& batches,
                                             const CompositionOptions& options) {
    torch::NoGradGuard noGrad;
    model_.eval();

    EvaluationResult result;
    for (const auto& batch : batches) {
        score(model_.forwardBatchExpression(batch, options), batch, result);
    }
    return result;
}

} // namespace td
