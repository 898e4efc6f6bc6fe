// Nodeweave kernel: media materialization and preview collaborators
#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "kernel/cancellation.hpp"
#include "nw_types.hpp"

namespace nw {

// Materializes an image from a URL (data URL, signed URL, local path).
class MediaLoader {
public:
    virtual ~MediaLoader() = default;
    // Throws GraphError{Io} when the URL cannot be loaded and
    // ProcessingCancelled when the token fires first.
    virtual cv::Mat load(const std::string& url, const CancellationToken& token) = 0;
};

// data: URLs, file:// URLs and plain filesystem paths. Remote URLs are
// rejected; fetching belongs to the embedding application.
class NODEWEAVE_API DefaultMediaLoader final : public MediaLoader {
public:
    cv::Mat load(const std::string& url, const CancellationToken& token) override;
};

// Surface a processor re-renders after a hit or a fresh compute.
class PreviewSurface {
public:
    virtual ~PreviewSurface() = default;
    virtual void present(const NodeId& node_id, const cv::Mat& image) = 0;
};

} // namespace nw
