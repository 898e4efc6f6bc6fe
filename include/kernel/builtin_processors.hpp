// Nodeweave kernel: built-in node processors
#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "kernel/node_processor.hpp"

namespace nw {

// Applies one WorkerOpTable op to the connected image input and emits a PNG
// data URL on the node's first output handle.
class NODEWEAVE_API ImageOpProcessor : public CachingNodeProcessor {
public:
    ImageOpProcessor(ProcessorServices services, std::string op_name);

protected:
    std::optional<InputSelection> select(const ProcessContext& ctx) const override;
    NodeResult compute(const ProcessContext& ctx, const InputSelection& selection,
                       const std::string& output_handle) override;
    const char* label() const override { return op_name_.c_str(); }

    // Runs the op through the worker pool when one is configured.
    cv::Mat run_op(const ProcessContext& ctx, const cv::Mat& input);

private:
    std::string op_name_;
};

// config: width, height
class NODEWEAVE_API ResizeProcessor final : public ImageOpProcessor {
public:
    explicit ResizeProcessor(ProcessorServices services) : ImageOpProcessor(services, "resize") {}
};

// config: size (default 1), blur_type Gaussian | Box
class NODEWEAVE_API BlurProcessor final : public ImageOpProcessor {
public:
    explicit BlurProcessor(ProcessorServices services) : ImageOpProcessor(services, "blur") {}
};

// Joins every connected Text input, in edge order, with config.separator
// (default " ").
class NODEWEAVE_API TextMergerProcessor final : public CachingNodeProcessor {
public:
    explicit TextMergerProcessor(ProcessorServices services) : CachingNodeProcessor(services) {}

protected:
    std::optional<InputSelection> select(const ProcessContext& ctx) const override;
    NodeResult compute(const ProcessContext& ctx, const InputSelection& selection,
                       const std::string& output_handle) override;
    const char* label() const override { return "text_merger"; }
};

// Image source URL of an input: the committed value's signed URL, else its
// data URL, else the cached value's data URL. Empty when none.
NODEWEAVE_API std::string image_url_of(const ResolvedInput& input);

// "resize", "blur", "text_merger"
NODEWEAVE_API void register_builtin_processors(ProcessorRegistry& registry, ProcessorServices services);

} // namespace nw
