#include "proctor/vision/GazeDecoder.h"
#include "proctor/vision/Errors.h"

#include <algorithm>
#include <cmath>

namespace proctor::vision {

GazeDecoder::GazeDecoder(const BinSpec& spec)
    : spec_(spec)
{
}

std::vector<float> GazeDecoder::softmax(const std::vector<float>& x)
{
    std::vector<float> y(x.size());
    if (x.empty()) return y;
    float max_val = *std::max_element(x.begin(), x.end());

    float sum = 0.0f;
    for (size_t i = 0; i < x.size(); ++i) {
        y[i] = std::exp(x[i] - max_val);
        sum += y[i];
    }

    if (sum > 0.0f) {
        for (auto& v : y) {
            v /= sum;
        }
    }

    return y;
}

float GazeDecoder::expectedIndex(const std::vector<float>& logits)
{
    auto probs = softmax(logits);
    float idx = 0.0f;
    for (size_t i = 0; i < probs.size(); ++i) {
        idx += probs[i] * static_cast<float>(i);
    }
    return idx;
}

float GazeDecoder::decodeAngle(const std::vector<float>& logits) const
{
    if (logits.size() != static_cast<size_t>(spec_.bins)) {
        throw ShapeMismatch("gaze logits have " + std::to_string(logits.size()) +
                            " bins, expected " + std::to_string(spec_.bins));
    }
    for (float v : logits) {
        if (!std::isfinite(v)) throw ShapeMismatch("gaze logits contain a non-finite value");
    }
    return expectedIndex(logits) * spec_.bin_width_deg - spec_.offset_deg;
}

HeadPose GazeDecoder::decode(const GazeLogits& logits) const
{
    HeadPose pose;
    pose.pitch  = decodeAngle(logits.pitch);
    pose.yaw    = decodeAngle(logits.yaw);
    pose.roll   = 0.0f;
    pose.source = PoseSource::MODEL;
    return pose;
}

} // namespace proctor::vision
