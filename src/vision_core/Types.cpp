#include "proctor/vision/Types.h"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace proctor::vision {

int countLabel(const std::vector<DetectedObject>& objects, ObjectLabel label) {
    return static_cast<int>(std::count_if(objects.begin(), objects.end(),
        [label](const DetectedObject& o) { return o.label == label; }));
}

std::string detectionsToJson(const std::vector<DetectedObject>& objects) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& o : objects) {
        arr.push_back({
            {"label", toString(o.label)},
            {"cls_id", o.cls_id},
            {"conf", o.conf},
            {"x1", o.x1()}, {"y1", o.y1()},
            {"x2", o.x2()}, {"y2", o.y2()}
        });
    }
    return arr.dump();
}

} // namespace proctor::vision
