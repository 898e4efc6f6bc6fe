#include "kernel/services/hash_service.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <yaml-cpp/emitter.h>

namespace nw {

namespace {

bool is_file_like(const YAML::Node& n) {
  return n.IsMap() && (n["entity"] || n["data_url"]);
}

std::string key_string(const YAML::Node& key) {
  if (key.IsScalar()) {
    return key.Scalar();
  }
  YAML::Emitter ke;
  ke << YAML::Flow << key;
  return ke.c_str();
}

nlohmann::json canonicalize_file(const YAML::Node& n) {
  FileData file = FileData::from_yaml(n);
  nlohmann::json out = nlohmann::json::object();
  if (!file.entity_id.empty()) {
    out["entity_id"] = file.entity_id;
  }
  if (!file.data_url.empty()) {
    out["data_url_prefix"] = file.data_url.substr(0, kDataUrlPrefixLength);
  }
  return out;
}

}  // namespace

nlohmann::json canonicalize(const YAML::Node& value) {
  if (!value || value.IsNull()) {
    return nullptr;
  }
  if (value.IsScalar()) {
    return value.Scalar();
  }
  if (value.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : value) {
      arr.push_back(canonicalize(item));
    }
    return arr;
  }
  if (is_file_like(value)) {
    return canonicalize_file(value);
  }
  // nlohmann::json objects are ordered maps, so keys come out sorted.
  nlohmann::json obj = nlohmann::json::object();
  for (auto it = value.begin(); it != value.end(); ++it) {
    nlohmann::json member = canonicalize(it->second);
    if (member.is_null()) {
      continue;
    }
    obj[key_string(it->first)] = std::move(member);
  }
  return obj;
}

nlohmann::json canonicalize(const NodeResult& result) {
  nlohmann::json outputs = nlohmann::json::array();
  for (const auto& set : result.outputs) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : set.items) {
      nlohmann::json j = {{"type", to_string(item.type)},
                          {"output_handle_id", item.output_handle_id}};
      nlohmann::json data = canonicalize(item.data);
      if (!data.is_null()) {
        j["data"] = std::move(data);
      }
      items.push_back(std::move(j));
    }
    outputs.push_back({{"items", std::move(items)}});
  }
  return {{"selected_output_index", result.selected_output_index},
          {"outputs", std::move(outputs)}};
}

std::string Sha256Hasher::digest(const std::string& data) const {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
    throw GraphError(GraphErrc::Unknown, "SHA-256 digest failed");
  }
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < md_len; ++i) {
    oss << std::setw(2) << static_cast<int>(md[i]);
  }
  return oss.str();
}

std::string HashService::digest(const nlohmann::json& canonical) const {
  return hasher_.digest(
      canonical.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string HashService::hash_result(const NodeResult& result) const {
  return digest(canonicalize(result));
}

std::string HashService::hash_config(const YAML::Node& config) const {
  nlohmann::json canonical = canonicalize(config);
  if (canonical.is_null()) {
    canonical = nlohmann::json::object();
  }
  return digest(canonical);
}

std::string HashService::input_hash(const std::string& source_hash,
                                    const std::string& config_hash,
                                    const std::string& prior_cache_hash) const {
  return hasher_.digest(source_hash + config_hash + prior_cache_hash);
}

}  // namespace nw
