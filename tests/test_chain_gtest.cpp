// ==============================================================================
// test_chain_gtest.cpp - Тесты цепочки хешей и дерева Меркла (GoogleTest)
// ==============================================================================

#include "warden/chain.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace warden::audit::test {

namespace {

const datetime::TimePoint AT = datetime::from_unix_millis(1705312800000);

CreateEntryInput make_input(const std::string& action_type, const std::string& actor_id) {
    CreateEntryInput input;
    input.actor.type = ActorType::User;
    input.actor.id = actor_id;
    input.action.category = ActionCategory::Git;
    input.action.type = action_type;
    input.context.tenant_id = "acme";
    return input;
}

std::vector<AuditLogEntry> build_three(HashAlgorithm algorithm = HashAlgorithm::Sha256) {
    ChainBuilder builder(algorithm);
    return builder.build_entries({make_input("git.push.created", "alice"),
                                  make_input("git.branch.deleted", "bob"),
                                  make_input("git.tag.created", "carol")},
                                 AT);
}

}  // namespace

// ==============================================================================
// Хеширование
// ==============================================================================

TEST(ChainTest, ComputeHash_Sha256KnownVector) {
    EXPECT_EQ(compute_hash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChainTest, ComputeHash_DigestLengths) {
    EXPECT_EQ(compute_hash("abc", HashAlgorithm::Sha256).size(), 64u);
    EXPECT_EQ(compute_hash("abc", HashAlgorithm::Sha384).size(), 96u);
    EXPECT_EQ(compute_hash("abc", HashAlgorithm::Sha512).size(), 128u);
}

TEST(ChainTest, ContentHash_IgnoresChainBlock) {
    auto entries = build_three();
    AuditLogEntry copy = entries[1];
    copy.chain.prev_hash = std::string("something-else");
    copy.chain.computed_at = "2030-01-01T00:00:00.000Z";
    EXPECT_EQ(compute_content_hash(copy), entries[1].chain.content_hash);
}

TEST(ChainTest, ContextHash_OnlyPresentFields) {
    AuditContext context;
    context.tenant_id = "acme";
    context.run_id = "run-42";
    auto hash = compute_context_hash(context);
    EXPECT_EQ(hash.fields, (std::vector<std::string>{"tenantId", "runId"}));
    EXPECT_EQ(hash.value.size(), 64u);

    context.run_id = "run-43";
    EXPECT_NE(compute_context_hash(context).value, hash.value);
}

// ==============================================================================
// ChainBuilder
// ==============================================================================

TEST(ChainTest, Builder_LinksSequentialEntries) {
    auto entries = build_three();
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].chain.sequence, 0u);
    EXPECT_FALSE(entries[0].chain.prev_hash.has_value());
    EXPECT_EQ(entries[1].chain.sequence, 1u);
    EXPECT_EQ(entries[1].chain.prev_hash, entries[0].chain.content_hash);
    EXPECT_EQ(entries[2].chain.prev_hash, entries[1].chain.content_hash);

    EXPECT_EQ(entries[0].timestamp, "2024-01-15T10:00:00.000Z");
    EXPECT_EQ(entries[0].id.rfind("alog-1705312800000-0-", 0), 0u);
    EXPECT_NE(entries[0].id, entries[1].id);
    ASSERT_TRUE(entries[0].context_hash.has_value());
}

TEST(ChainTest, Builder_InputTimestampWins) {
    ChainBuilder builder;
    auto input = make_input("git.push.created", "alice");
    input.timestamp = datetime::from_unix_millis(1705320000000);
    auto entry = builder.build_entry(input, AT);
    EXPECT_EQ(entry.timestamp, "2024-01-15T12:00:00.000Z");
    EXPECT_EQ(entry.chain.computed_at, "2024-01-15T10:00:00.000Z");
}

TEST(ChainTest, Builder_InitializeFromContinuesChain) {
    auto first = build_three();

    ChainBuilder builder;
    builder.initialize_from(3, first.back().chain.content_hash);
    auto next = builder.build_entry(make_input("git.push.created", "dana"), AT);
    EXPECT_EQ(next.chain.sequence, 3u);
    EXPECT_EQ(next.chain.prev_hash, first.back().chain.content_hash);

    builder.reset(HashAlgorithm::Sha512);
    EXPECT_EQ(builder.state().sequence, 0u);
    EXPECT_FALSE(builder.state().last_hash.has_value());
    EXPECT_EQ(builder.state().algorithm, HashAlgorithm::Sha512);
}

// ==============================================================================
// verify_chain
// ==============================================================================

TEST(ChainTest, Verify_ValidChain) {
    auto result = verify_chain(build_three());
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.entries_verified, 3u);
    EXPECT_EQ(result.details.size(), 3u);
    EXPECT_FALSE(result.error.has_value());
}

TEST(ChainTest, Verify_EmptyChainValid) {
    auto result = verify_chain({});
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.entries_verified, 0u);
}

TEST(ChainTest, Verify_Sha512Chain) {
    auto entries = build_three(HashAlgorithm::Sha512);
    EXPECT_EQ(entries[0].chain.content_hash.size(), 128u);
    EXPECT_TRUE(verify_chain(entries).valid);
}

TEST(ChainTest, Verify_TamperedContent_ReportsFirstInvalid) {
    auto entries = build_three();
    entries[1].actor.id = "mallory";

    auto result = verify_chain(entries);
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.first_invalid_sequence.has_value());
    EXPECT_EQ(*result.first_invalid_sequence, 1u);
    EXPECT_EQ(result.first_invalid_id, entries[1].id);
    EXPECT_EQ(result.error.value_or(""), "Content hash mismatch");
    ASSERT_EQ(result.details.size(), 2u);
    EXPECT_TRUE(result.details[0].content_hash_valid);
    EXPECT_FALSE(result.details[1].content_hash_valid);
}

TEST(ChainTest, Verify_BrokenLink) {
    auto entries = build_three();
    entries[2].chain.prev_hash = compute_hash("forged");

    auto result = verify_chain(entries);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(*result.first_invalid_sequence, 2u);
    EXPECT_EQ(result.error.value_or(""), "Chain link broken");
}

TEST(ChainTest, Verify_DeletedEntry_SequenceGap) {
    auto entries = build_three();
    entries.erase(entries.begin() + 1);

    auto result = verify_chain(entries);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error.value_or(""), "Sequence mismatch: expected 1, got 2");
    EXPECT_EQ(result.entries_verified, 1u);
}

TEST(ChainTest, Verify_FirstEntryWithPrevHashAtGenesis) {
    auto entries = build_three();
    entries[0].chain.prev_hash = compute_hash("genesis");
    EXPECT_FALSE(verify_chain(entries).valid);
}

TEST(ChainTest, Verify_SubsequenceWithExpectedPrevHash) {
    auto entries = build_three();
    std::vector<AuditLogEntry> tail(entries.begin() + 1, entries.end());

    EXPECT_TRUE(verify_chain(tail).valid);

    VerifyOptions options;
    options.expected_first_prev_hash = entries[0].chain.content_hash;
    EXPECT_TRUE(verify_chain(tail, options).valid);

    options.expected_first_prev_hash = compute_hash("other");
    EXPECT_FALSE(verify_chain(tail, options).valid);
}

TEST(ChainTest, Verify_FromGenesis_DeletedLeadingEntryDetected) {
    auto entries = build_three();
    std::vector<AuditLogEntry> tail(entries.begin() + 1, entries.end());

    VerifyOptions options;
    options.start_sequence = 0;
    auto result = verify_chain(tail, options);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.first_invalid_sequence.value_or(99), 1u);
    EXPECT_EQ(result.entries_verified, 0u);
}

TEST(ChainTest, Verify_ToValueKeys) {
    auto entries = build_three();
    entries[1].actor.id = "mallory";
    Value v = to_value(verify_chain(entries));
    EXPECT_FALSE(v.get("valid")->as_bool());
    EXPECT_TRUE(v.has("firstInvalidSequence"));
    EXPECT_TRUE(v.has("firstInvalidId"));
    EXPECT_EQ(v.get("error")->as_string(), "Content hash mismatch");
    EXPECT_EQ(v.get("details")->array_size(), 2u);
}

// ==============================================================================
// Дерево Меркла
// ==============================================================================

TEST(ChainTest, Merkle_SingleLeafRootIsLeaf) {
    auto entries = build_three();
    entries.resize(1);
    MerkleTree tree(entries);
    EXPECT_EQ(tree.root_hash(), entries[0].chain.content_hash);
    EXPECT_EQ(tree.depth(), 1u);
}

TEST(ChainTest, Merkle_EmptyTree) {
    MerkleTree tree(std::vector<AuditLogEntry>{});
    EXPECT_TRUE(tree.root_hash().empty());
    EXPECT_EQ(tree.depth(), 0u);
    EXPECT_EQ(tree.leaf_count(), 0u);
}

TEST(ChainTest, Merkle_OddLeafDuplicated) {
    auto entries = build_three();
    MerkleTree tree(entries);

    const auto& h0 = entries[0].chain.content_hash;
    const auto& h1 = entries[1].chain.content_hash;
    const auto& h2 = entries[2].chain.content_hash;
    std::string expected = compute_hash(compute_hash(h0 + h1) + compute_hash(h2 + h2));
    EXPECT_EQ(tree.root_hash(), expected);
    EXPECT_EQ(tree.depth(), 3u);
    EXPECT_EQ(tree.leaf_count(), 3u);
}

TEST(ChainTest, Merkle_ProofsVerifyForEveryLeaf) {
    auto entries = build_three();
    MerkleTree tree(entries);

    for (const auto& e : entries) {
        auto proof = tree.proof(e.id);
        ASSERT_TRUE(proof.has_value());
        EXPECT_EQ(proof->siblings.size(), 2u);
        EXPECT_TRUE(tree.verify_proof(*proof));
        EXPECT_TRUE(verify_merkle_proof(*proof));
    }

    auto last = tree.proof(entries[2].id);
    EXPECT_EQ(last->siblings[0].hash, entries[2].chain.content_hash);
    EXPECT_EQ(last->siblings[0].position, SiblingPosition::Right);
}

TEST(ChainTest, Merkle_TamperedProofRejected) {
    auto entries = build_three();
    MerkleTree tree(entries);

    auto proof = tree.proof(entries[1].id);
    ASSERT_TRUE(proof.has_value());
    proof->leaf_hash = compute_hash("forged");
    EXPECT_FALSE(tree.verify_proof(*proof));
    EXPECT_FALSE(tree.proof("alog-unknown").has_value());
}

// ==============================================================================
// Пакеты
// ==============================================================================

TEST(ChainTest, Batch_CreateAndVerify) {
    ChainBuilder builder;
    auto batch = create_batch(builder,
                              {make_input("git.push.created", "alice"),
                               make_input("git.push.created", "bob")},
                              AT);
    EXPECT_EQ(batch.start_sequence, 0u);
    EXPECT_EQ(batch.end_sequence, 1u);
    EXPECT_EQ(batch.created_at, "2024-01-15T10:00:00.000Z");
    EXPECT_EQ(builder.state().sequence, 2u);

    auto ok = verify_batch(batch.entries, batch.merkle_root);
    EXPECT_TRUE(ok.chain_valid);
    EXPECT_TRUE(ok.merkle_valid);

    // Подмена содержимого вместе с пересчётом хеша ломает корень и звено
    batch.entries[0].outcome.status = OutcomeStatus::Failure;
    batch.entries[0].chain.content_hash = compute_content_hash(batch.entries[0]);
    auto bad = verify_batch(batch.entries, batch.merkle_root);
    EXPECT_FALSE(bad.chain_valid);
    EXPECT_FALSE(bad.merkle_valid);
}

}  // namespace warden::audit::test
