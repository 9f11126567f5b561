#include "proctor/vision/Types.h"
#include "proctor/vision/Nms.h"
#include <algorithm>
#include <cmath>

namespace proctor::vision {

float iouRect(const cv::Rect2f& a, const cv::Rect2f& b) {
    float area_a = a.width * a.height;
    float area_b = b.width * b.height;
    if (area_a <= 0.f || area_b <= 0.f) return 0.f;     // degenerate box

    float inter_x = std::max(a.x, b.x);
    float inter_y = std::max(a.y, b.y);
    float inter_w = std::min(a.x + a.width, b.x + b.width) - inter_x;
    float inter_h = std::min(a.y + a.height, b.y + b.height) - inter_y;
    if (inter_w <= 0.f || inter_h <= 0.f) return 0.f;
    float inter = inter_w * inter_h;
    float ua = area_a + area_b - inter;
    return ua <= 0.f ? 0.f : inter / ua;
}

template<typename SamePredicate>
static std::vector<DetectedObject> greedyNmsImpl(std::vector<DetectedObject> boxes,
                                                 float iou_thres,
                                                 SamePredicate same_group) {
    std::stable_sort(boxes.begin(), boxes.end(), [](const DetectedObject& a, const DetectedObject& b){
        return a.conf > b.conf;
    });
    std::vector<DetectedObject> kept;
    std::vector<bool> removed(boxes.size(), false);
    for (size_t i = 0; i < boxes.size(); ++i) {
        if (removed[i]) continue;
        kept.push_back(boxes[i]);
        for (size_t j = i + 1; j < boxes.size(); ++j) {
            if (removed[j]) continue;
            if (same_group(boxes[i], boxes[j]) &&
                iouRect(boxes[i].box, boxes[j].box) > iou_thres) {
                removed[j] = true;
            }
        }
    }
    return kept;
}

std::vector<DetectedObject> nms(const std::vector<DetectedObject>& boxes, float iou_thres) {
    return greedyNmsImpl(boxes, iou_thres,
        [](const DetectedObject&, const DetectedObject&) { return true; });
}

std::vector<DetectedObject> nmsClasswise(const std::vector<DetectedObject>& boxes, float iou_thres) {
    return greedyNmsImpl(boxes, iou_thres,
        [](const DetectedObject& a, const DetectedObject& b) { return a.cls_id == b.cls_id; });
}

} // namespace proctor::vision
