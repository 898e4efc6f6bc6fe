// Shared fixtures for the nodeweave test suite
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "adapter/media_codec_opencv.hpp"
#include "kernel/cancellation.hpp"
#include "kernel/media_loader.hpp"
#include "node.hpp"

namespace nw {
namespace fixtures {

inline std::string solid_png_data_url(int width, int height, int value) {
    cv::Mat img(height, width, CV_8UC3, cv::Scalar(value, value, value));
    return encode_png_data_url(img);
}

inline Node make_node(const NodeId& id, const std::string& type,
                      YAML::Node config = YAML::Node(YAML::NodeType::Map)) {
    Node node;
    node.id = id;
    node.name = id;
    node.type = type;
    node.config = config;
    node.output_handles = {id + "-out"};
    return node;
}

// Source node without a processor whose committed result is an image.
inline Node image_source(const NodeId& id, const std::string& data_url) {
    Node node = make_node(id, "import");
    FileData file;
    file.data_url = data_url;
    node.result = make_single_item_result(ItemType::Image, file.to_yaml(), id + "-out");
    return node;
}

inline Node text_source(const NodeId& id, const std::string& text) {
    Node node = make_node(id, "text");
    node.result = make_single_item_result(ItemType::Text, YAML::Node(text), id + "-out");
    return node;
}

inline Edge make_edge(const NodeId& source, const NodeId& target,
                      const std::string& target_handle = "in") {
    Edge e;
    e.source = source;
    e.source_handle_id = source + "-out";
    e.target = target;
    e.target_handle_id = target + "-" + target_handle;
    return e;
}

struct FakeClock {
    std::atomic<int64_t> now{1000};
    std::function<int64_t()> fn() {
        return [this] { return now.load(); };
    }
};

class RecordingPreview : public PreviewSurface {
public:
    void present(const NodeId& node_id, const cv::Mat& image) override {
        std::lock_guard<std::mutex> lk(mx_);
        presented_.emplace_back(node_id, image.size());
    }
    size_t count() const {
        std::lock_guard<std::mutex> lk(mx_);
        return presented_.size();
    }
    cv::Size last_size() const {
        std::lock_guard<std::mutex> lk(mx_);
        return presented_.empty() ? cv::Size() : presented_.back().second;
    }

private:
    mutable std::mutex mx_;
    std::vector<std::pair<NodeId, cv::Size>> presented_;
};

// Decodes data URLs, but first blocks until release() while polling the
// token, so tests can hold a task in its load step.
class GatedMediaLoader : public MediaLoader {
public:
    GatedMediaLoader() : gate_(release_.get_future().share()) {}

    cv::Mat load(const std::string& url, const CancellationToken& token) override {
        entered_.fetch_add(1);
        wait_until_ready(gate_, token, "Processing cancelled during load");
        loads_.fetch_add(1);
        return decode_data_url(url);
    }

    void release() {
        std::call_once(released_, [this] { release_.set_value(); });
    }
    int entered() const { return entered_.load(); }
    int loads() const { return loads_.load(); }

private:
    std::promise<void> release_;
    std::shared_future<void> gate_;
    std::once_flag released_;
    std::atomic<int> entered_{0};
    std::atomic<int> loads_{0};
};

inline std::filesystem::path temp_path(const std::string& name) {
    auto p = std::filesystem::temp_directory_path() / ("nodeweave_" + name);
    std::error_code ec;
    std::filesystem::remove_all(p, ec);
    return p;
}

// Polls `pred` for up to `timeout_ms`.
template <typename Pred>
bool eventually(Pred pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

} // namespace fixtures
} // namespace nw
