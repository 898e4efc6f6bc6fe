#include "kernel/image_ops.hpp"

#include <string>

#include <opencv2/imgproc.hpp>

#include "kernel/param_utils.hpp"

namespace nw {
namespace ops {

namespace {

// Reads an int parameter, rejecting values above `max` before they reach
// the int conversion. Non-positive values read as 0.
int bounded_int(const YAML::Node& params, const std::string& key, int defv, int max,
                const std::string& op) {
    double raw = as_double_flexible(params, key, defv);
    if (raw <= 0) {
        return 0;
    }
    if (raw > max) {
        throw GraphError(GraphErrc::InvalidParameter,
                         op + ": " + key + " exceeds " + std::to_string(max));
    }
    return as_int_flexible(params, key, defv);
}

} // namespace

cv::Mat resize(const cv::Mat& input, const YAML::Node& params) {
    if (input.empty()) {
        throw GraphError(GraphErrc::MissingInput, "resize: empty input image");
    }
    int width = bounded_int(params, "width", 0, kMaxImageDimension, "resize");
    int height = bounded_int(params, "height", 0, kMaxImageDimension, "resize");
    if (width <= 0 || height <= 0) {
        throw GraphError(GraphErrc::InvalidParameter, "resize: missing dimensions");
    }
    cv::Mat out;
    cv::resize(input, out, cv::Size(width, height), 0, 0, cv::INTER_LANCZOS4);
    return out;
}

cv::Mat blur(const cv::Mat& input, const YAML::Node& params) {
    if (input.empty()) {
        throw GraphError(GraphErrc::MissingInput, "blur: empty input image");
    }
    int size = bounded_int(params, "size", 1, kMaxBlurSize, "blur");
    std::string type = as_str(params, "blur_type", "Gaussian");
    if (size <= 0) {
        return input.clone();
    }
    // 半径 -> 奇数核尺寸
    int ksize = 2 * size + 1;
    cv::Mat out;
    if (type == "Gaussian") {
        cv::GaussianBlur(input, out, cv::Size(ksize, ksize), static_cast<double>(size) / 2.0);
    } else if (type == "Box") {
        cv::blur(input, out, cv::Size(ksize, ksize));
    } else {
        throw GraphError(GraphErrc::InvalidParameter, "blur: unknown blur_type '" + type + "'");
    }
    return out;
}

} // namespace ops
} // namespace nw
