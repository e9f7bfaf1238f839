#pragma once

#include "TD/EncodingBag.hpp"

namespace td {

    /**
     * @brief Encodes one token sequence (or a suffix of one) into encoder state
     *
     * Input bags carry Field::Source as (time x batch) token ids. Results carry
     * Field::EncHidden and, when the encoder reports per-step states,
     * Field::EncOutputs.
     */
    class SequenceEncoder {
    public:
        virtual ~SequenceEncoder() = default;

        /**
         * @brief Encode from a fresh (zero) state
         */
        virtual EncodingBag encode(const EncodingBag& input) = 0;

        /**
         * @brief Continue encoding from a previously computed hidden state
         * @throws ShapeContractError if hidden does not match the encoder
         */
        virtual EncodingBag encodeResume(const EncodingBag& input, const FieldValue& hidden) = 0;
    };

} // namespace td
