#pragma once

#include <vector>

#include <opencv2/core/types.hpp>

#include "core/detections.hpp"

namespace fta {

// Intersection over union, 0 when the union is empty
float IoU(const BBox& a, const BBox& b);

// Even-odd ray casting with a horizontal ray towards +x. Assumes a simple polygon, results for points exactly on an
// edge or vertex are undefined. Polygons with fewer than 3 vertices contain nothing
bool PointInPolygon(const std::vector<cv::Point2f>& polygon, const cv::Point2f& p);

// Which side of the directed line a->b the point lies on: >0 one side, <0 the other, 0 collinear
float LineSide(const cv::Point2f& a, const cv::Point2f& b, const cv::Point2f& p);

// Drops non-finite or zero-extent boxes and clamps confidence into [0, 1]
DetectionList SanitizeDetections(const DetectionList& in);

} // namespace fta
