#include "kernel/media_loader.hpp"

#include <opencv2/imgcodecs.hpp>

#include "adapter/media_codec_opencv.hpp"

namespace nw {

cv::Mat DefaultMediaLoader::load(const std::string& url, const CancellationToken& token) {
    token.throw_if_cancelled("Processing cancelled before load");
    if (url.empty()) {
        throw GraphError(GraphErrc::Io, "Empty media URL");
    }

    cv::Mat img;
    if (url.rfind("data:", 0) == 0) {
        img = decode_data_url(url);
    } else {
        std::string path = url;
        if (path.rfind("file://", 0) == 0) {
            path = path.substr(7);
        } else if (path.find("://") != std::string::npos) {
            throw GraphError(GraphErrc::Io, "Unsupported media URL: " + url);
        }
        if (!fs::exists(path)) {
            throw GraphError(GraphErrc::Io, "Media file not found: " + path);
        }
        img = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (img.empty()) {
            throw GraphError(GraphErrc::Io, "Failed to read image: " + path);
        }
    }
    token.throw_if_cancelled("Processing cancelled after load");
    return img;
}

} // namespace nw
