// Nodeweave kernel: built-in node processors
#include "kernel/builtin_processors.hpp"

#include "adapter/media_codec_opencv.hpp"
#include "kernel/image_ops.hpp"
#include "kernel/param_utils.hpp"
#include "kernel/worker_pool.hpp"

namespace nw {

std::string image_url_of(const ResolvedInput& input) {
    if (input.value) {
        FileData file = FileData::from_yaml(input.value->data);
        if (!file.entity_id.empty() && !file.signed_url.empty()) return file.signed_url;
        if (!file.data_url.empty()) return file.data_url;
    }
    if (input.cached_value) {
        FileData file = FileData::from_yaml(input.cached_value->data);
        if (!file.data_url.empty()) return file.data_url;
    }
    return {};
}

// --- ImageOpProcessor ---

ImageOpProcessor::ImageOpProcessor(ProcessorServices services, std::string op_name)
    : CachingNodeProcessor(services), op_name_(std::move(op_name)) {}

std::optional<CachingNodeProcessor::InputSelection> ImageOpProcessor::select(
    const ProcessContext& ctx) const {
    const ResolvedInput* input = find_input(ctx.inputs, ItemType::Image);
    if (!input || image_url_of(*input).empty() || !input->result_to_use()) {
        return std::nullopt;
    }
    InputSelection sel;
    sel.inputs.push_back(input);
    sel.source_hash = services_.hashes.hash_result(*input->result_to_use());
    if (input->from_cache()) {
        sel.prior_hash = input->cached->hash;
    }
    return sel;
}

cv::Mat ImageOpProcessor::run_op(const ProcessContext& ctx, const cv::Mat& input) {
    const std::string what = cancel_message(ctx.node);
    if (services_.pool) {
        auto fut = services_.pool->process(input, op_name_, ctx.node.config);
        return wait_cancellable(fut, ctx.token, what);
    }
    if (op_name_ == "resize") return ops::resize(input, ctx.node.config);
    if (op_name_ == "blur") return ops::blur(input, ctx.node.config);
    throw GraphError(GraphErrc::NoProcessor, "Unknown image operation: " + op_name_);
}

NodeResult ImageOpProcessor::compute(const ProcessContext& ctx, const InputSelection& selection,
                                     const std::string& output_handle) {
    const std::string what = cancel_message(ctx.node);
    const std::string url = image_url_of(*selection.inputs.front());

    cv::Mat source = services_.media.load(url, ctx.token);
    ctx.token.throw_if_cancelled(what);

    cv::Mat output = run_op(ctx, source);
    ctx.token.throw_if_cancelled(what);

    FileData file;
    file.data_url = encode_png_data_url(output);
    ctx.token.throw_if_cancelled(what);

    if (ctx.preview) {
        ctx.preview->present(ctx.node.id, output);
    }
    return make_single_item_result(ItemType::Image, file.to_yaml(), output_handle);
}

// --- TextMergerProcessor ---

std::optional<CachingNodeProcessor::InputSelection> TextMergerProcessor::select(
    const ProcessContext& ctx) const {
    InputSelection sel;
    for (const auto& in : ctx.inputs) {
        const OutputItem* item = in.value ? &*in.value : (in.cached_value ? &*in.cached_value : nullptr);
        if (!item || item->type != ItemType::Text || !in.result_to_use()) continue;
        sel.inputs.push_back(&in);
        sel.source_hash += services_.hashes.hash_result(*in.result_to_use());
        if (in.from_cache()) {
            sel.prior_hash += in.cached->hash;
        }
    }
    if (sel.inputs.empty()) return std::nullopt;
    return sel;
}

NodeResult TextMergerProcessor::compute(const ProcessContext& ctx, const InputSelection& selection,
                                        const std::string& output_handle) {
    const std::string separator = as_str(ctx.node.config, "separator", " ");
    std::string merged;
    bool first = true;
    for (const ResolvedInput* in : selection.inputs) {
        const OutputItem& item = in->value ? *in->value : *in->cached_value;
        if (!item.data || !item.data.IsScalar()) continue;
        if (!first) merged += separator;
        merged += item.data.Scalar();
        first = false;
    }
    ctx.token.throw_if_cancelled(cancel_message(ctx.node));
    return make_single_item_result(ItemType::Text, YAML::Node(merged), output_handle);
}

void register_builtin_processors(ProcessorRegistry& registry, ProcessorServices services) {
    registry.register_processor("resize", std::make_shared<ResizeProcessor>(services));
    registry.register_processor("blur", std::make_shared<BlurProcessor>(services));
    registry.register_processor("text_merger", std::make_shared<TextMergerProcessor>(services));
}

} // namespace nw
