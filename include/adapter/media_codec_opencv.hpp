#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "nw_types.hpp"

namespace nw {

// --- base64 (OpenSSL EVP block codec) ---

NODEWEAVE_API std::string base64_encode(const std::vector<unsigned char>& bytes);
// Throws GraphError{Io} on malformed input.
NODEWEAVE_API std::vector<unsigned char> base64_decode(const std::string& text);

// --- data URL <-> cv::Mat ---

/**
 * @brief 解码 "data:<mime>;base64,<payload>" 形式的 data URL 为 cv::Mat。
 * @note 保留原始通道数与位深 (IMREAD_UNCHANGED)。格式错误或解码失败时抛出 GraphError{Io}。
 */
NODEWEAVE_API cv::Mat decode_data_url(const std::string& data_url);

/**
 * @brief 把 cv::Mat 编码为 PNG 并包装成 data URL。
 * @note 非 8/16 位的图像会先转换为 8 位。
 */
NODEWEAVE_API std::string encode_png_data_url(const cv::Mat& image);

// "image/png" for "data:image/png;base64,..."; empty when not a data URL.
NODEWEAVE_API std::string data_url_mime(const std::string& data_url);

} // namespace nw
