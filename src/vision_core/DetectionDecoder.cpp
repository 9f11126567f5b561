#include "proctor/vision/DetectionDecoder.h"
#include "proctor/vision/Errors.h"
#include "proctor/vision/Nms.h"
#include <cmath>
#include <sstream>

namespace proctor::vision {

    DetectionDecoder::DetectionDecoder(const Options& opt)
        : opt_(opt)
    {
        labels_.reserve(opt_.class_names.size());
        for (const auto& name : opt_.class_names) {
            labels_.push_back(labelFromClassName(name));
        }
    }

    void DetectionDecoder::checkShape(const DetectionTensor& tensor) const {
        const int num_attrs = 4 + numClasses();
        if (tensor.num_anchors <= 0) {
            throw ShapeMismatch("detection tensor declares " + std::to_string(tensor.num_anchors) + " anchors");
        }
        const size_t expected = static_cast<size_t>(num_attrs) * static_cast<size_t>(tensor.num_anchors);
        if (tensor.data.size() != expected) {
            std::ostringstream oss;
            oss << "detection tensor has " << tensor.data.size() << " values, expected ("
                << num_attrs << " x " << tensor.num_anchors << ") = " << expected;
            throw ShapeMismatch(oss.str());
        }
        if (!std::isfinite(tensor.x_ratio) || !std::isfinite(tensor.y_ratio) ||
            tensor.x_ratio <= 0.f || tensor.y_ratio <= 0.f) {
            std::ostringstream oss;
            oss << "scale ratios must be positive, got x=" << tensor.x_ratio << " y=" << tensor.y_ratio;
            throw ShapeMismatch(oss.str());
        }
    }

    std::vector<RawDet> DetectionDecoder::filterAnchors(const DetectionTensor& tensor) const {
        checkShape(tensor);

        // attrs-first layout: row r holds attribute r for every anchor
        const int num_boxes   = tensor.num_anchors;
        const int num_classes = numClasses();
        const float* output_data = tensor.data.data();

        std::vector<RawDet> detect_results;
        for (int i = 0; i < num_boxes; ++i) {
            float best_score = 0.f; int best_cls = -1;
            for (int c = 0; c < num_classes; ++c) {
                float score = output_data[(4 + c) * num_boxes + i];
                if (score > best_score) { best_score = score; best_cls = c; }
            }
            if (best_cls < 0 || !(best_score > opt_.conf_threshold)) continue;

            float cx = output_data[i];
            float cy = output_data[num_boxes + i];
            float w  = output_data[2 * num_boxes + i];
            float h  = output_data[3 * num_boxes + i];
            detect_results.push_back(RawDet{cx, cy, w, h, best_score, best_cls});
        }
        return detect_results;
    }

    std::vector<DetectedObject> DetectionDecoder::decode(const DetectionTensor& tensor) const {
        std::vector<RawDet> raw = filterAnchors(tensor);

        // chg RawDet -> DetectedObject, scaled back to the source frame
        std::vector<DetectedObject> dets;
        dets.reserve(raw.size());
        for (const auto& r : raw) {
            float x1 = (r.cx - r.w * 0.5f) * tensor.x_ratio;
            float y1 = (r.cy - r.h * 0.5f) * tensor.y_ratio;
            float x2 = (r.cx + r.w * 0.5f) * tensor.x_ratio;
            float y2 = (r.cy + r.h * 0.5f) * tensor.y_ratio;
            if (!(x2 > x1) || !(y2 > y1)) continue;   // zero or negative extent

            DetectedObject d;
            d.label  = labels_[r.cls_id];
            d.conf   = r.conf;
            d.box    = cv::Rect2f(x1, y1, x2 - x1, y2 - y1);
            d.cls_id = r.cls_id;
            dets.push_back(d);
        }

        if (dets.empty()) return dets;
        return opt_.nms_classwise ? nmsClasswise(dets, opt_.iou_threshold)
                                  : nms(dets, opt_.iou_threshold);
    }

} // namespace proctor::vision
