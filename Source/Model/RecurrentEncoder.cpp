#include "TD/Model/RecurrentEncoder.hpp"
#include "TD/Errors.hpp"

namespace td {

    RecurrentEncoder::RecurrentEncoder(const ModelConfig& config, int64_t vocabSize) {
        embedding_ = register_module("embedding",
            torch::nn::Embedding(torch::nn::EmbeddingOptions(vocabSize, config.embeddingDim)));
        dropout_ = register_module("dropout", torch::nn::Dropout(config.dropout));
        rnn_ = register_module("rnn",
            RecurrentLayer(config.unit, config.embeddingDim, config.hiddenDim,
                           config.numLayers, config.dropout));
    }

    EncodingBag RecurrentEncoder::encode(const EncodingBag& input) {
        return run(input.tensor(Field::Source), nullptr);
    }

    EncodingBag RecurrentEncoder::encodeResume(const EncodingBag& input, const FieldValue& hidden) {
        return run(input.tensor(Field::Source), &hidden);
    }

    EncodingBag RecurrentEncoder::run(const Tensor& source, const FieldValue* hidden) {
        if (source.dim() != 2) {
            throw ShapeContractError("RecurrentEncoder: source must be (time x batch), got " +
                                     std::to_string(source.dim()) + " dimension(s)");
        }
        if (source.size(0) == 0) {
            throw ShapeContractError("RecurrentEncoder: empty source sequence");
        }
        if (hidden) {
            rnn_->checkState(*hidden, source.size(1), "RecurrentEncoder");
        }

        Tensor embedded = dropout_(embedding_(source));
        auto [outputs, state] = rnn_->forward(embedded, hidden);

        return EncodingBag{
            {Field::EncHidden, state},
            {Field::EncOutputs, outputs},
        };
    }

} // namespace td
