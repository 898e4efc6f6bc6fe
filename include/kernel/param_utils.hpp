#pragma once
#include <limits>
#include <string>
#include <yaml-cpp/yaml.h>

namespace nw {

/**
 * @brief 从 YAML 节点中安全地提取一个 double 值。
 * @param n YAML 节点 (通常是节点的 config)。
 * @param key 要查找的键。
 * @param defv 如果键不存在或类型不匹配，返回的默认值。
 * @return 提取到的值或默认值。
 */
inline double as_double_flexible(const YAML::Node& n, const std::string& key, double defv) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        if (n[key].IsScalar()) return n[key].as<double>();
        return defv;
    } catch (const YAML::Exception&) {
        return defv;
    }
}

/**
 * @brief 从 YAML 节点中安全地提取一个 int 值。接受 "12" 与 12.0 这样的写法。
 */
inline int as_int_flexible(const YAML::Node& n, const std::string& key, int defv) {
    if (!n || !n.IsMap() || !n[key] || !n[key].IsScalar()) return defv;
    try {
        return n[key].as<int>();
    } catch (const YAML::Exception&) {
        double d = as_double_flexible(n, key, defv);
        // 超出 int 范围 (含 NaN) 时返回默认值
        if (!(d >= static_cast<double>(std::numeric_limits<int>::min()) &&
              d <= static_cast<double>(std::numeric_limits<int>::max()))) {
            return defv;
        }
        return static_cast<int>(d);
    }
}

/**
 * @brief 从 YAML 节点中安全地提取一个 string 值。
 */
inline std::string as_str(const YAML::Node& n, const std::string& key, const std::string& defv = {}) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<std::string>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

} // namespace nw
