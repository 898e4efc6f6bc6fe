#include <gtest/gtest.h>

#include "kernel/services/hash_service.hpp"

using namespace nw;

namespace {

std::string long_data_url(char tail) {
    std::string url = "data:image/png;base64,";
    url.append(200, 'A');
    url.push_back(tail);
    return url;
}

} // namespace

TEST(HashServiceTest, Sha256KnownVector) {
    Sha256Hasher hasher;
    EXPECT_EQ(hasher.digest("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hasher.name(), "sha256");
}

TEST(HashServiceTest, KeyOrderDoesNotMatter) {
    Sha256Hasher hasher;
    HashService hashes(hasher);
    EXPECT_EQ(hashes.hash_config(YAML::Load("{a: 1, b: 2}")),
              hashes.hash_config(YAML::Load("{b: 2, a: 1}")));
    EXPECT_EQ(hashes.hash_config(YAML::Load("{outer: {x: 1, y: [1, 2]}, k: v}")),
              hashes.hash_config(YAML::Load("{k: v, outer: {y: [1, 2], x: 1}}")));
}

TEST(HashServiceTest, DifferentValuesDigestDifferently) {
    Sha256Hasher hasher;
    HashService hashes(hasher);
    EXPECT_NE(hashes.hash_config(YAML::Load("{size: 2}")), hashes.hash_config(YAML::Load("{size: 5}")));
    // Sequence order is significant.
    EXPECT_NE(hashes.hash_config(YAML::Load("{v: [1, 2]}")), hashes.hash_config(YAML::Load("{v: [2, 1]}")));
}

TEST(HashServiceTest, NullMembersAreDropped) {
    Sha256Hasher hasher;
    HashService hashes(hasher);
    EXPECT_EQ(hashes.hash_config(YAML::Load("{a: 1, b: ~}")), hashes.hash_config(YAML::Load("{a: 1}")));
    EXPECT_EQ(hashes.hash_config(YAML::Node()), hashes.hash_config(YAML::Node(YAML::NodeType::Map)));
}

TEST(HashServiceTest, FilePayloadUsesDataUrlPrefix) {
    YAML::Node a;
    a["entity"]["id"] = "e1";
    a["entity"]["signed_url"] = "https://cdn.example/one?sig=1";
    a["data_url"] = long_data_url('x');

    YAML::Node b;
    b["entity"]["id"] = "e1";
    b["entity"]["signed_url"] = "https://cdn.example/one?sig=2";
    b["data_url"] = long_data_url('y');

    nlohmann::json ca = canonicalize(a);
    EXPECT_EQ(ca["entity_id"], "e1");
    EXPECT_EQ(ca["data_url_prefix"].get<std::string>().size(), kDataUrlPrefixLength);
    EXPECT_FALSE(ca.contains("signed_url"));
    // Signed URL rotation and bytes past the prefix do not change identity.
    EXPECT_EQ(ca, canonicalize(b));

    b["entity"]["id"] = "e2";
    EXPECT_NE(ca, canonicalize(b));
}

TEST(HashServiceTest, ResultHashIsStableAcrossCopies) {
    Sha256Hasher hasher;
    HashService hashes(hasher);
    NodeResult r = make_single_item_result(ItemType::Text, YAML::Node("hello"), "out");
    EXPECT_EQ(hashes.hash_result(r), hashes.hash_result(clone_result(r)));
    EXPECT_EQ(hashes.hash_result(r), hashes.hash_result(NodeResult::from_yaml(r.to_yaml())));

    NodeResult other = make_single_item_result(ItemType::Text, YAML::Node("world"), "out");
    EXPECT_NE(hashes.hash_result(r), hashes.hash_result(other));

    NodeResult other_handle = make_single_item_result(ItemType::Text, YAML::Node("hello"), "out2");
    EXPECT_NE(hashes.hash_result(r), hashes.hash_result(other_handle));
}

TEST(HashServiceTest, ResultCanonicalForm) {
    NodeResult r = make_single_item_result(ItemType::Number, YAML::Node(42), "n");
    nlohmann::json j = canonicalize(r);
    EXPECT_EQ(j["selected_output_index"], 0);
    ASSERT_EQ(j["outputs"].size(), 1u);
    const auto& item = j["outputs"][0]["items"][0];
    EXPECT_EQ(item["type"], "Number");
    EXPECT_EQ(item["output_handle_id"], "n");
    EXPECT_EQ(item["data"], "42");
}

TEST(HashServiceTest, InputHashDigestsConcatenation) {
    Sha256Hasher hasher;
    HashService hashes(hasher);
    EXPECT_EQ(hashes.input_hash("src", "cfg"), hasher.digest("srccfg"));
    EXPECT_EQ(hashes.input_hash("src", "cfg", "prior"), hasher.digest("srccfgprior"));
    EXPECT_NE(hashes.input_hash("src", "cfg", "prior"), hashes.input_hash("src", "cfg"));

    const std::string source = hashes.hash_config(YAML::Load("{a: 1}"));
    const std::string config = hashes.hash_config(YAML::Load("{b: 2}"));
    EXPECT_EQ(hashes.input_hash(source, config).size(), 64u);
    EXPECT_EQ(hashes.input_hash(source, config, source).size(), 64u);
}
