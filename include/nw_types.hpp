#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <memory>
#include <stdexcept>
#include <filesystem>
#include <optional>
#include <cstdint>
#include <yaml-cpp/yaml.h>

namespace nw {
namespace fs = std::filesystem;

using NodeId = std::string;

#if defined(_WIN32)
    #if defined(NODEWEAVE_LIB_BUILD)
        #define NODEWEAVE_API __declspec(dllexport)
    #else
        #define NODEWEAVE_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(NODEWEAVE_LIB_BUILD)
        #define NODEWEAVE_API __attribute__((visibility("default")))
    #else
        #define NODEWEAVE_API
    #endif
#endif

enum class GraphErrc {
    Unknown = 1, NotFound, Cycle, Io, InvalidYaml,
    MissingInput, NoProcessor, InvalidParameter, ComputeError,
    Storage, Cancelled,
};

struct NODEWEAVE_API GraphError : public std::runtime_error {
    explicit GraphError(const std::string& what)
        : std::runtime_error(what), code_(GraphErrc::Unknown) {}
    GraphError(GraphErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    GraphErrc code() const noexcept { return code_; }
private:
    GraphErrc code_;
};

// Thrown when a task observes its cancellation token. This is the only
// exception allowed to cross the NodeProcessor boundary.
struct NODEWEAVE_API ProcessingCancelled : public GraphError {
    explicit ProcessingCancelled(const std::string& what)
        : GraphError(GraphErrc::Cancelled, what) {}
};

// --- Output payloads ---

enum class ItemType {
    Image, Video, Audio, Text, Number, Boolean, Mask, Unknown
};

std::string to_string(ItemType type);
ItemType item_type_from_string(const std::string& s);

// File-like payload: a reference to a stored entity and/or an inline data URL.
struct FileData {
    std::string entity_id;
    std::string signed_url;
    std::string data_url;

    bool empty() const { return entity_id.empty() && signed_url.empty() && data_url.empty(); }

    static FileData from_yaml(const YAML::Node& n);
    YAML::Node to_yaml() const;
};

struct OutputItem {
    ItemType type = ItemType::Unknown;
    YAML::Node data;               // scalar for text/number, FileData map for media
    std::string output_handle_id;
};

struct NodeOutputSet {
    std::vector<OutputItem> items;
};

struct NodeResult {
    int selected_output_index = 0;
    std::vector<NodeOutputSet> outputs;

    const NodeOutputSet* selected() const;
    const OutputItem* find_item(const std::string& output_handle_id) const;

    static NodeResult from_yaml(const YAML::Node& n);
    YAML::Node to_yaml() const;
};

// Deep copy; YAML::Node assignment otherwise shares the underlying memory.
NodeResult clone_result(const NodeResult& r);

NodeResult make_single_item_result(ItemType type, YAML::Node data,
                                   const std::string& output_handle_id);

// --- Graph topology ---

struct Edge {
    NodeId source;
    std::string source_handle_id;
    NodeId target;
    std::string target_handle_id;

    static Edge from_yaml(const YAML::Node& n);
    YAML::Node to_yaml() const;
};

// --- Processing outcome ---

struct Outcome {
    bool success = false;
    std::string error;
    std::optional<NodeResult> new_result;

    static Outcome ok(NodeResult result) {
        Outcome o;
        o.success = true;
        o.new_result = std::move(result);
        return o;
    }
    static Outcome failure(std::string message) {
        Outcome o;
        o.error = std::move(message);
        return o;
    }
};

} // namespace nw
