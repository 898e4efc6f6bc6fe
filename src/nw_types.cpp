#include "nw_types.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace nw {

namespace {

constexpr std::array<std::pair<ItemType, const char*>, 7> kItemTypeNames = {{
    {ItemType::Image, "Image"},
    {ItemType::Video, "Video"},
    {ItemType::Audio, "Audio"},
    {ItemType::Text, "Text"},
    {ItemType::Number, "Number"},
    {ItemType::Boolean, "Boolean"},
    {ItemType::Mask, "Mask"},
}};

} // namespace

std::string to_string(ItemType type) {
    for (const auto& p : kItemTypeNames) {
        if (p.first == type) return p.second;
    }
    return "Unknown";
}

ItemType item_type_from_string(const std::string& s) {
    for (const auto& p : kItemTypeNames) {
        if (s == p.second) return p.first;
    }
    return ItemType::Unknown;
}

// --- FileData ---

FileData FileData::from_yaml(const YAML::Node& n) {
    FileData f;
    if (!n || !n.IsMap()) return f;
    if (n["entity"] && n["entity"].IsMap()) {
        f.entity_id = n["entity"]["id"].as<std::string>("");
        f.signed_url = n["entity"]["signed_url"].as<std::string>("");
    }
    f.data_url = n["data_url"].as<std::string>("");
    return f;
}

YAML::Node FileData::to_yaml() const {
    YAML::Node n(YAML::NodeType::Map);
    if (!entity_id.empty() || !signed_url.empty()) {
        YAML::Node entity;
        if (!entity_id.empty()) entity["id"] = entity_id;
        if (!signed_url.empty()) entity["signed_url"] = signed_url;
        n["entity"] = entity;
    }
    if (!data_url.empty()) n["data_url"] = data_url;
    return n;
}

// --- NodeResult ---

const NodeOutputSet* NodeResult::selected() const {
    if (selected_output_index < 0 ||
        selected_output_index >= static_cast<int>(outputs.size())) {
        return nullptr;
    }
    return &outputs[static_cast<size_t>(selected_output_index)];
}

const OutputItem* NodeResult::find_item(const std::string& output_handle_id) const {
    const NodeOutputSet* out = selected();
    if (!out) return nullptr;
    auto it = std::find_if(out->items.begin(), out->items.end(), [&](const OutputItem& item) {
        return item.output_handle_id == output_handle_id;
    });
    return it == out->items.end() ? nullptr : &*it;
}

NodeResult NodeResult::from_yaml(const YAML::Node& n) {
    NodeResult r;
    if (!n || !n.IsMap()) {
        throw GraphError(GraphErrc::InvalidYaml, "Node result must be a map.");
    }
    r.selected_output_index = n["selected_output_index"].as<int>(0);
    if (n["outputs"]) {
        for (const auto& out : n["outputs"]) {
            NodeOutputSet set;
            if (out["items"]) {
                for (const auto& it : out["items"]) {
                    OutputItem item;
                    item.type = item_type_from_string(it["type"].as<std::string>(""));
                    if (it["data"]) item.data = YAML::Clone(it["data"]);
                    item.output_handle_id = it["output_handle_id"].as<std::string>("");
                    set.items.push_back(std::move(item));
                }
            }
            r.outputs.push_back(std::move(set));
        }
    }
    return r;
}

YAML::Node NodeResult::to_yaml() const {
    YAML::Node n;
    n["selected_output_index"] = selected_output_index;
    YAML::Node outs(YAML::NodeType::Sequence);
    for (const auto& set : outputs) {
        YAML::Node o;
        YAML::Node items(YAML::NodeType::Sequence);
        for (const auto& item : set.items) {
            YAML::Node it;
            it["type"] = to_string(item.type);
            it["data"] = item.data ? YAML::Clone(item.data) : YAML::Node(YAML::NodeType::Null);
            it["output_handle_id"] = item.output_handle_id;
            items.push_back(it);
        }
        o["items"] = items;
        outs.push_back(o);
    }
    n["outputs"] = outs;
    return n;
}

NodeResult clone_result(const NodeResult& r) {
    NodeResult copy;
    copy.selected_output_index = r.selected_output_index;
    copy.outputs.reserve(r.outputs.size());
    for (const auto& set : r.outputs) {
        NodeOutputSet s;
        for (const auto& item : set.items) {
            OutputItem it;
            it.type = item.type;
            if (item.data) it.data = YAML::Clone(item.data);
            it.output_handle_id = item.output_handle_id;
            s.items.push_back(std::move(it));
        }
        copy.outputs.push_back(std::move(s));
    }
    return copy;
}

NodeResult make_single_item_result(ItemType type, YAML::Node data,
                                   const std::string& output_handle_id) {
    OutputItem item;
    item.type = type;
    item.data = std::move(data);
    item.output_handle_id = output_handle_id;
    NodeResult r;
    r.selected_output_index = 0;
    r.outputs.push_back(NodeOutputSet{{std::move(item)}});
    return r;
}

// --- Edge ---

Edge Edge::from_yaml(const YAML::Node& n) {
    Edge e;
    e.source = n["source"].as<std::string>("");
    e.source_handle_id = n["source_handle"].as<std::string>("");
    e.target = n["target"].as<std::string>("");
    e.target_handle_id = n["target_handle"].as<std::string>("");
    if (e.source.empty() || e.target.empty()) {
        throw GraphError(GraphErrc::InvalidYaml, "Edge is missing source or target.");
    }
    return e;
}

YAML::Node Edge::to_yaml() const {
    YAML::Node n;
    n["source"] = source;
    n["source_handle"] = source_handle_id;
    n["target"] = target;
    n["target_handle"] = target_handle_id;
    return n;
}

} // namespace nw
