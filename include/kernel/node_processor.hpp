// Nodeweave kernel: per-node-type processing contract
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "node.hpp"
#include "kernel/cancellation.hpp"
#include "kernel/media_loader.hpp"
#include "kernel/services/hash_service.hpp"
#include "kernel/services/input_resolver.hpp"
#include "kernel/services/result_cache_service.hpp"

namespace nw {

class WorkerPool;

struct ProcessContext {
    const Node& node;
    const ResolvedInputs& inputs;
    const CancellationToken& token;
    PreviewSurface* preview = nullptr;
};

// Ordinary failures come back as Outcome::failure. ProcessingCancelled is the
// only exception that may leave process().
class NodeProcessor {
public:
    virtual ~NodeProcessor() = default;
    virtual Outcome process(const ProcessContext& ctx) = 0;
};

struct ProcessorServices {
    ResultCacheService& cache;
    const HashService& hashes;
    MediaLoader& media;
    WorkerPool* pool = nullptr;  // null -> transforms run inline
    bool quiet = true;
};

/**
 * @brief 带缓存的处理器模板。
 *
 * process() 固定执行以下步骤：
 *  1. 令牌已取消 -> 抛出 ProcessingCancelled；
 *  2. select() 找不到上游输入 -> 删除本节点缓存，返回 "no input"；
 *  3. input_hash = digest(source_hash + config_hash + prior_hash)；
 *  4. 命中缓存 -> touch、刷新预览、直接返回缓存结果；
 *  5. 未命中 -> compute()，期间在加载、计算、编码前后检查令牌；
 *  6. 写入缓存并返回新结果。
 * 子类只需实现 select() 与 compute()。
 */
class NODEWEAVE_API CachingNodeProcessor : public NodeProcessor {
public:
    explicit CachingNodeProcessor(ProcessorServices services) : services_(services) {}

    Outcome process(const ProcessContext& ctx) final;

protected:
    struct InputSelection {
        std::vector<const ResolvedInput*> inputs;
        std::string source_hash;
        std::string prior_hash;  // upstream cache hash when a value came from the cache
    };

    virtual std::optional<InputSelection> select(const ProcessContext& ctx) const = 0;

    // Cache miss path. Throws ProcessingCancelled or GraphError.
    virtual NodeResult compute(const ProcessContext& ctx, const InputSelection& selection,
                               const std::string& output_handle) = 0;

    // Re-renders a cached image result on the preview surface.
    virtual void present_cached(const ProcessContext& ctx, const CacheEntry& entry) const;

    virtual const char* label() const = 0;

    void log(const std::string& msg) const;
    std::string cancel_message(const Node& node) const;

    ProcessorServices services_;
};

// node.type -> processor. One instance per session.
class NODEWEAVE_API ProcessorRegistry {
public:
    void register_processor(const std::string& type, std::shared_ptr<NodeProcessor> processor);
    bool unregister_processor(const std::string& type);
    NodeProcessor* find(const std::string& type) const;
    std::vector<std::string> types() const;

private:
    std::unordered_map<std::string, std::shared_ptr<NodeProcessor>> table_;
};

} // namespace nw
