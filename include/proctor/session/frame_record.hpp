#ifndef PROCTOR_FRAME_RECORD_HPP
#define PROCTOR_FRAME_RECORD_HPP

#include "proctor/vision/Types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace proctor::session {

// Everything the external model runners produced for one camera frame.
// Each part is optional; the pipeline needs at least the detection tensor.
struct FrameInference {
    int64_t ts_ms = 0;
    std::optional<vision::DetectionTensor> detections;
    std::optional<vision::GazeLogits>      gaze_logits;
    std::optional<vision::FaceLandmarks>   landmarks;
};

// External collaborator that runs the vision models.
class InferenceProvider {
public:
    virtual ~InferenceProvider() = default;

    // Latest result finished since the previous poll, or std::nullopt if inference has
    // not produced one yet (the tick is then skipped, never queued).
    virtual std::optional<FrameInference> poll() = 0;
};

// Hands out pre-recorded frames one per poll (JSONL replay, tests).
class ReplayInferenceProvider : public InferenceProvider {
public:
    explicit ReplayInferenceProvider(std::vector<FrameInference> frames);
    std::optional<FrameInference> poll() override;
    size_t remaining() const { return frames_.size(); }

private:
    std::deque<FrameInference> frames_;
};

// One line of a replay file: a frame, a discrete browser event, or both.
struct FrameRecord {
    int64_t ts_ms = 0;
    std::optional<FrameInference>            frame;
    std::optional<vision::DiscreteEventKind> event;
};

/* 解析 replay 行
{
   "ts_ms": 1700000000000,
   "detections": { "anchors": A, "x_ratio": 1.0, "y_ratio": 1.0, "data": [ (4 + C) * A floats ] },
   "gaze":       { "pitch": [N floats], "yaw": [N floats] },
   "landmarks":  [ [x, y, z], ... ],
   "event":      "tab-hidden"
}
@throws nlohmann::json::exception on malformed JSON types
@throws vision::ProctorError on an unknown event name
*/
FrameRecord parseFrameRecord(const nlohmann::json& j);

// Reads every non-empty line; bad lines are logged and skipped.
std::vector<FrameRecord> readFrameRecords(const std::string& jsonl_path);

} // namespace proctor::session

#endif
