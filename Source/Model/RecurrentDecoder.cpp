#include "TD/Model/RecurrentDecoder.hpp"
#include "TD/Errors.hpp"

#include <sstream>

namespace td {

    RecurrentDecoder::RecurrentDecoder(const ModelConfig& config, const DecoderVocabulary& vocab)
        : vocab_(vocab), maxLength_(config.maxLength), useAttention_(config.attention) {
        embedding_ = register_module("embedding",
            torch::nn::Embedding(torch::nn::EmbeddingOptions(vocab.targetSize, config.embeddingDim)));
        transformEmbedding_ = register_module("transform_embedding",
            torch::nn::Embedding(torch::nn::EmbeddingOptions(vocab.sourceSize, config.embeddingDim)));
        rnn_ = register_module("rnn",
            RecurrentLayer(config.unit, config.embeddingDim, config.hiddenDim,
                           config.numLayers, config.dropout));
        if (useAttention_) {
            combine_ = register_module("combine",
                torch::nn::Linear(2 * config.hiddenDim, config.hiddenDim));
        }
        projection_ = register_module("projection",
            torch::nn::Linear(config.hiddenDim, vocab.targetSize));
    }

    EncodingBag RecurrentDecoder::decode(const EncodingBag& input, double teacherForcingRatio) {
        const Tensor& source = input.tensor(Field::Source);
        const int64_t batch = source.size(1);
        const auto tokenOptions = source.options().dtype(kTokenDtype);

        // Initial state: encoder (or composite) hidden state, else zeros
        FieldValue state = input.has(Field::EncHidden)
            ? input.get(Field::EncHidden)
            : rnn_->zeroState(batch, torch::TensorOptions().device(source.device()));
        rnn_->checkState(state, batch, "RecurrentDecoder");

        if (input.has(Field::Transform)) {
            const Tensor& tokens = input.tensor(Field::Transform);
            if (tokens.size(0) > 0) {
                auto primed = rnn_->forward(transformEmbedding_(tokens), &state);
                state = std::move(primed.second);
            }
        }

        const Tensor* encOutputs = nullptr;
        if (useAttention_ && input.has(Field::EncOutputs)) {
            encOutputs = &input.tensor(Field::EncOutputs);
            if (encOutputs->dim() != 3 || encOutputs->size(1) != batch ||
                encOutputs->size(2) != rnn_->hiddenDim()) {
                std::ostringstream oss;
                oss << "RecurrentDecoder: encoder outputs of shape " << encOutputs->sizes()
                    << " do not match batch " << batch << " and hidden size " << rnn_->hiddenDim();
                throw ShapeContractError(oss.str());
            }
        }

        const Tensor* target = input.has(Field::Target) ? &input.tensor(Field::Target) : nullptr;
        if (target && target->size(1) != batch) {
            throw ShapeContractError("RecurrentDecoder: target batch " + std::to_string(target->size(1)) +
                                     " does not match source batch " + std::to_string(batch));
        }
        const int64_t steps = target ? target->size(0) : maxLength_;

        Tensor next = torch::full({batch}, vocab_.sosId, tokenOptions);
        Tensor finished = torch::zeros({batch}, tokenOptions.dtype(torch::kBool));
        std::vector<Tensor> logits;
        logits.reserve(static_cast<size_t>(steps));

        for (int64_t t = 0; t < steps; ++t) {
            auto [outputs, nextState] = rnn_->forward(embedding_(next).unsqueeze(0), &state);
            state = std::move(nextState);

            Tensor features = outputs.squeeze(0);
            if (encOutputs) {
                features = attend(features, *encOutputs);
            }
            Tensor stepLogits = projection_(features);
            logits.push_back(stepLogits);

            Tensor predicted = stepLogits.argmax(-1);
            const bool force = target && teacherForcingRatio > 0.0 &&
                               torch::rand({1}).item<double>() < teacherForcingRatio;
            next = force ? (*target)[t] : predicted;

            if (!target) {
                finished = finished.logical_or(predicted == vocab_.eosId);
                if (finished.all().item<bool>()) break;
            }
        }

        return EncodingBag{{Field::DecOutputs, torch::stack(logits, 0)}};
    }

    Tensor RecurrentDecoder::attend(const Tensor& query, const Tensor& encOutputs) {
        // query: (batch x hidden); encOutputs: (time x batch x hidden)
        Tensor keys = encOutputs.transpose(0, 1);
        Tensor scores = torch::bmm(keys, query.unsqueeze(2)).squeeze(2);
        Tensor weights = torch::softmax(scores, 1);
        Tensor context = torch::bmm(weights.unsqueeze(1), keys).squeeze(1);
        return torch::tanh(combine_(torch::cat({query, context}, 1)));
    }

} // namespace td
