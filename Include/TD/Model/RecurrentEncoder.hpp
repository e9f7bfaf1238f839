#pragma once

#include "TD/Config.hpp"
#include "TD/Model/RecurrentLayer.hpp"
#include "TD/Model/SequenceEncoder.hpp"

namespace td {

    /**
     * @brief Embedding followed by a GRU or LSTM stack
     *
     * Always reports both Field::EncHidden and Field::EncOutputs.
     */
    class RecurrentEncoder : public SequenceEncoder, public torch::nn::Module {
    public:
        RecurrentEncoder(const ModelConfig& config, int64_t vocabSize);

        EncodingBag encode(const EncodingBag& input) override;
        EncodingBag encodeResume(const EncodingBag& input, const FieldValue& hidden) override;

        RecurrentUnit unit() const { return rnn_->unit(); }
        int64_t numLayers() const { return rnn_->numLayers(); }
        int64_t hiddenDim() const { return rnn_->hiddenDim(); }

    private:
        EncodingBag run(const Tensor& source, const FieldValue* hidden);

        torch::nn::Embedding embedding_{nullptr};
        torch::nn::Dropout dropout_{nullptr};
        RecurrentLayer rnn_{nullptr};
    };

} // namespace td
