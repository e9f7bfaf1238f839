#pragma once

#include "TD/EncodingBag.hpp"

namespace td {

    /**
     * @brief Produces output logits from an (optionally composite) encoding
     *
     * Consumes Field::Source and Field::Transform, plus Field::EncHidden,
     * Field::EncOutputs and Field::Target when present. Returns a bag holding
     * Field::DecOutputs as (time x batch x vocabulary) logits.
     */
    class SequenceDecoder {
    public:
        virtual ~SequenceDecoder() = default;

        /**
         * @param teacherForcingRatio probability of feeding the ground truth
         *        token instead of the prediction (needs Field::Target)
         */
        virtual EncodingBag decode(const EncodingBag& input, double teacherForcingRatio) = 0;
    };

} // namespace td
