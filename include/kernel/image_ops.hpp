#pragma once

#include <opencv2/core.hpp>
#include <yaml-cpp/yaml.h>

#include "nw_types.hpp"

namespace nw {
namespace ops {

constexpr int kMaxImageDimension = 32768;
constexpr int kMaxBlurSize = 1024;

// Lanczos resize to exactly {width, height}. Both must be positive integers
// no larger than kMaxImageDimension; otherwise throws GraphError{InvalidParameter}.
NODEWEAVE_API cv::Mat resize(const cv::Mat& input, const YAML::Node& params);

// params: size (radius, default 1), blur_type ("Gaussian" | "Box", default
// "Gaussian"). size <= 0 returns a copy of the input, size above kMaxBlurSize
// throws GraphError{InvalidParameter}.
NODEWEAVE_API cv::Mat blur(const cv::Mat& input, const YAML::Node& params);

} // namespace ops
} // namespace nw
