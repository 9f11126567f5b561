#pragma once
#include <vector>
#include "Types.h"

namespace proctor::vision {

// Expected-value decoding of categorical pitch/yaw bins into continuous angles.
// angle = sum_i(softmax(logits)_i * i) * bin_width - offset
class GazeDecoder {
public:
    struct BinSpec {
        int   bins          = 90;
        float bin_width_deg = 2.0f;
        float offset_deg    = 90.0f;
    };

    explicit GazeDecoder(const BinSpec& spec);

    // numerically stable softmax (max subtracted before exp)
    static std::vector<float> softmax(const std::vector<float>& logits);

    // probability-weighted mean bin index
    static float expectedIndex(const std::vector<float>& logits);

    // @throws ShapeMismatch on wrong length or non-finite logits
    float decodeAngle(const std::vector<float>& logits) const;

    // pitch/yaw from the two heads, roll is not modelled (0)
    HeadPose decode(const GazeLogits& logits) const;

private:
    BinSpec spec_;
};

} // namespace proctor::vision
