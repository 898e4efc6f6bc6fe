#include "adapter/media_codec_opencv.hpp"

#include <openssl/evp.h>
#include <opencv2/imgcodecs.hpp>

namespace nw {

namespace {

constexpr const char* kDataPrefix = "data:";
constexpr const char* kBase64Marker = ";base64,";

} // namespace

std::string base64_encode(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) return {};
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(),
                            static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

std::vector<unsigned char> base64_decode(const std::string& text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) {
        throw GraphError(GraphErrc::Io, "Malformed base64 payload");
    }
    std::vector<unsigned char> out(3 * (text.size() / 4));
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        throw GraphError(GraphErrc::Io, "Malformed base64 payload");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string data_url_mime(const std::string& data_url) {
    if (data_url.rfind(kDataPrefix, 0) != 0) return {};
    auto end = data_url.find_first_of(";,", 5);
    if (end == std::string::npos) return {};
    return data_url.substr(5, end - 5);
}

cv::Mat decode_data_url(const std::string& data_url) {
    if (data_url.rfind(kDataPrefix, 0) != 0) {
        throw GraphError(GraphErrc::Io, "Not a data URL");
    }
    auto marker = data_url.find(kBase64Marker);
    if (marker == std::string::npos) {
        throw GraphError(GraphErrc::Io, "Only base64 data URLs are supported");
    }
    std::vector<unsigned char> bytes = base64_decode(data_url.substr(marker + std::char_traits<char>::length(kBase64Marker)));
    if (bytes.empty()) {
        throw GraphError(GraphErrc::Io, "Empty data URL payload");
    }
    cv::Mat img = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        throw GraphError(GraphErrc::Io, "Failed to decode image from data URL");
    }
    return img;
}

std::string encode_png_data_url(const cv::Mat& image) {
    if (image.empty()) {
        throw GraphError(GraphErrc::ComputeError, "Cannot encode an empty image");
    }
    cv::Mat to_write = image;
    const int depth = image.depth();
    if (depth != CV_8U && depth != CV_16U) {
        // 浮点图像约定为 [0, 1] 范围
        image.convertTo(to_write, CV_8U, depth == CV_32F || depth == CV_64F ? 255.0 : 1.0);
    }
    std::vector<unsigned char> buf;
    if (!cv::imencode(".png", to_write, buf)) {
        throw GraphError(GraphErrc::ComputeError, "PNG encoding failed");
    }
    return std::string("data:image/png;base64,") + base64_encode(buf);
}

} // namespace nw
