#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "nw_types.hpp"

namespace nw {

// Digest algorithm used for every fingerprint in one deployment.
class Hasher {
 public:
  virtual ~Hasher() = default;
  virtual std::string digest(const std::string& data) const = 0;
  virtual std::string name() const = 0;
};

// SHA-256 via OpenSSL libcrypto, lowercase hex.
class NODEWEAVE_API Sha256Hasher final : public Hasher {
 public:
  std::string digest(const std::string& data) const override;
  std::string name() const override { return "sha256"; }
};

// Number of data URL characters that stand in for an embedded file payload.
constexpr std::size_t kDataUrlPrefixLength = 100;

// Normalized form: object keys sorted, null members dropped, file-like maps
// ({entity, data_url}) replaced by {entity_id, data_url_prefix}.
nlohmann::json canonicalize(const YAML::Node& value);
nlohmann::json canonicalize(const NodeResult& result);

class NODEWEAVE_API HashService {
 public:
  explicit HashService(const Hasher& hasher) : hasher_(hasher) {}

  std::string digest(const nlohmann::json& canonical) const;

  std::string hash_result(const NodeResult& result) const;
  std::string hash_config(const YAML::Node& config) const;

  // digest(source_hash + config_hash + prior_cache_hash). The stored key is
  // the digest of the joined string, not the joined string itself, so every
  // input_hash has the fixed 64-hex-char length of a content hash.
  std::string input_hash(const std::string& source_hash,
                         const std::string& config_hash,
                         const std::string& prior_cache_hash = {}) const;

  const Hasher& hasher() const { return hasher_; }

 private:
  const Hasher& hasher_;
};

}  // namespace nw
