#pragma once

#include "TD/Config.hpp"
#include "TD/Model/RecurrentLayer.hpp"
#include "TD/Model/SequenceDecoder.hpp"

namespace td {

    struct DecoderVocabulary {
        int64_t sourceSize{0};  // transform tokens are drawn from the source vocabulary
        int64_t targetSize{0};
        int64_t sosId{0};
        int64_t eosId{0};
    };

    /**
     * @brief Greedy recurrent decoder with optional dot-product attention
     *
     * The transform tokens are run through the recurrent stack first, priming
     * the state handed over by the encoder; decoding then starts from <sos>.
     * With a target the decoder emits target.size(0) steps, otherwise it stops
     * after max_length steps or once every example produced <eos>.
     */
    class RecurrentDecoder : public SequenceDecoder, public torch::nn::Module {
    public:
        RecurrentDecoder(const ModelConfig& config, const DecoderVocabulary& vocab);

        EncodingBag decode(const EncodingBag& input, double teacherForcingRatio) override;

        int64_t maxLength() const { return maxLength_; }

    private:
        Tensor attend(const Tensor& query, const Tensor& encOutputs);

        DecoderVocabulary vocab_;
        int64_t maxLength_;
        bool useAttention_;

        torch::nn::Embedding embedding_{nullptr};
        torch::nn::Embedding transformEmbedding_{nullptr};
        RecurrentLayer rnn_{nullptr};
        torch::nn::Linear combine_{nullptr};
        torch::nn::Linear projection_{nullptr};
    };

} // namespace td
