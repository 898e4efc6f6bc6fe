#include "node.hpp"

namespace nw {

Node Node::from_yaml(const YAML::Node& n) {
    Node node;
    node.id = n["id"].as<std::string>("");
    if (node.id.empty()) {
        throw GraphError(GraphErrc::InvalidYaml, "Node is missing required field 'id'.");
    }
    node.name = n["name"].as<std::string>("");
    node.type = n["type"].as<std::string>("");

    if (n["config"]) {
        if (!n["config"].IsMap()) {
            throw GraphError(GraphErrc::InvalidYaml,
                             "Config of node " + node.id + " must be a map.");
        }
        node.config = YAML::Clone(n["config"]);
    } else {
        node.config = YAML::Node(YAML::NodeType::Map);
    }

    if (n["output_handles"]) {
        for (const auto& h : n["output_handles"]) {
            node.output_handles.push_back(h.as<std::string>());
        }
    }

    if (n["result"] && !n["result"].IsNull()) {
        node.result = NodeResult::from_yaml(n["result"]);
    }
    return node;
}

YAML::Node Node::to_yaml() const {
    YAML::Node n;
    n["id"] = id;
    n["name"] = name;
    n["type"] = type;

    if (config && config.IsMap() && config.size() > 0) {
        n["config"] = config;
    } else {
        // Ensure config is always a map, even if empty, for consistency.
        n["config"] = YAML::Node(YAML::NodeType::Map);
    }

    if (!output_handles.empty()) n["output_handles"] = output_handles;
    if (result) n["result"] = result->to_yaml();
    return n;
}

Node clone_node(const Node& node) {
    Node copy;
    copy.id = node.id;
    copy.name = node.name;
    copy.type = node.type;
    copy.config = node.config ? YAML::Clone(node.config) : YAML::Node(YAML::NodeType::Map);
    copy.output_handles = node.output_handles;
    if (node.result) copy.result = clone_result(*node.result);
    return copy;
}

} // namespace nw
