#pragma once
#include <string>
#include <vector>
#include "Types.h"

namespace proctor::vision {

    struct RawDet {         // 原始检测框数据结构 (model space, before scaling)
        float cx, cy, w, h;
        float conf;
        int cls_id;
    };

    // Turns the detector's flat anchor tensor into labeled, scored, non-overlapping boxes.
    // Stateless apart from its options; safe to share between sessions.
    class DetectionDecoder {
    public:
        struct Options {
            std::vector<std::string> class_names = {"person", "phone", "book", "paper"};
            float conf_threshold = 0.4f;
            float iou_threshold  = 0.45f;
            bool  nms_classwise  = false;
        };

        explicit DetectionDecoder(const Options& opt);
        ~DetectionDecoder() = default;

        int numClasses() const { return static_cast<int>(opt_.class_names.size()); }

        // Full decode: threshold, scale to source frame, NMS.
        // @throws ShapeMismatch if tensor.data.size() != (4 + C) * A, A <= 0 or a ratio <= 0
        std::vector<DetectedObject> decode(const DetectionTensor& tensor) const;

        // Threshold step only (no scaling, no NMS). Same shape checks as decode().
        std::vector<RawDet> filterAnchors(const DetectionTensor& tensor) const;

    private:
        Options opt_;
        std::vector<ObjectLabel> labels_;   // class id -> label, resolved once

        void checkShape(const DetectionTensor& tensor) const;
    };

} // namespace proctor::vision
