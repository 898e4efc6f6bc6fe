#pragma once
#include "nw_types.hpp"

namespace nw {

/**
 * @class Node
 * @brief 表示图中的一个节点：节点的基本属性、输出端口、处理参数以及最近一次提交的结果。
 *
 * 该类主要包含以下成员：
 * - id：节点的唯一标识符（字符串）。
 * - name：节点的名称，写入缓存条目以便调试。
 * - type：节点的类型，用于在 ProcessorRegistry 中查找对应的处理器。
 *
 * 参数部分：
 * - config：从 YAML 文件中读取的处理参数（例如 width / size）。
 *
 * 输出部分：
 * - output_handles：节点的输出端口 id 列表，处理器把结果写到第一个端口上。
 * - result：最近一次成功处理或由界面直接编辑的结果。
 *
 * 核心只通过显式调用读写 result，不会静默修改节点。
 */
class Node {
public:
    NodeId id;
    std::string name;
    std::string type;

    YAML::Node config;

    std::vector<std::string> output_handles;
    std::optional<NodeResult> result;

    const std::string* primary_output_handle() const {
        return output_handles.empty() ? nullptr : &output_handles.front();
    }

    static Node from_yaml(const YAML::Node& n);
    YAML::Node to_yaml() const;
};

// Deep copy including config and result.
Node clone_node(const Node& node);

} // namespace nw
