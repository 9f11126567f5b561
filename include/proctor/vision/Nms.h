#pragma once
#include <vector>
#include "Types.h"

namespace proctor::vision {

// IoU = inter / (areaA + areaB - inter); 0 when either box has zero area
float iouRect(const cv::Rect2f& a, const cv::Rect2f& b);

// 贪心 NMS: 按置信度降序 (stable, ties keep input order), 保高分抑低分
// 输入: 候选框集合
// 参数: iou_thres 重叠阈值，> 该阈值则抑制低分框
// 输出: kept boxes, highest score first
std::vector<DetectedObject> nms(const std::vector<DetectedObject>& boxes, float iou_thres);

// Same as nms() but a box only suppresses boxes of its own class id.
std::vector<DetectedObject> nmsClasswise(const std::vector<DetectedObject>& boxes, float iou_thres);

} // namespace proctor::vision
