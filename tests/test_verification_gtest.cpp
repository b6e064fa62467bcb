// ==============================================================================
// test_verification_gtest.cpp - Тесты отчёта о целостности журнала (GoogleTest)
// ==============================================================================

#include "warden/errors.hpp"
#include "warden/verification.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace warden::audit::test {

namespace {

constexpr std::int64_t BASE_MS = 1705312800000;  // 2024-01-15T10:00:00Z
const datetime::TimePoint AT = datetime::from_unix_millis(BASE_MS);

AuditLogConfig fixed_clock_config() {
    AuditLogConfig config;
    config.clock = [] { return datetime::from_unix_millis(BASE_MS); };
    return config;
}

CreateEntryInput make_input(const std::string& actor_id) {
    CreateEntryInput input;
    input.actor.id = actor_id;
    input.action.category = ActionCategory::Git;
    input.action.type = "git.push.created";
    input.context.tenant_id = "acme";
    return input;
}

std::vector<AuditLogEntry> build_chain(std::size_t count) {
    ChainBuilder builder;
    std::vector<AuditLogEntry> out;
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(builder.build_entry(make_input("user-" + std::to_string(i)), AT));
    }
    return out;
}

bool has_issue(const VerificationReport& report, IntegrityIssueType type) {
    return std::any_of(report.issues.begin(), report.issues.end(),
                       [type](const IntegrityIssue& i) { return i.type == type; });
}

}  // namespace

// ==============================================================================
// Проверка записей
// ==============================================================================

TEST(VerificationTest, VerifyEntries_ValidChain) {
    auto report = verify_entries("acme", build_chain(3));
    EXPECT_TRUE(report.valid);
    EXPECT_TRUE(report.issues.empty());
    EXPECT_EQ(report.summary, "Chain integrity verified: 3 entries, 100% continuity");
    EXPECT_EQ(report.stats.first_sequence.value_or(99), 0u);
    EXPECT_EQ(report.stats.last_sequence.value_or(99), 2u);
    EXPECT_EQ(report.stats.algorithms_used, std::vector<HashAlgorithm>{HashAlgorithm::Sha256});
    EXPECT_EQ(report.stats.earliest_timestamp.value_or(""), "2024-01-15T10:00:00.000Z");
}

TEST(VerificationTest, VerifyEntries_CollectsEveryIssue) {
    auto entries = build_chain(5);
    entries[1].actor.id = "eve";
    entries.erase(entries.begin() + 3);

    auto report = verify_entries("acme", entries);
    EXPECT_FALSE(report.valid);
    ASSERT_EQ(report.issues.size(), 2u);

    EXPECT_EQ(report.issues[0].type, IntegrityIssueType::ContentHashMismatch);
    EXPECT_EQ(report.issues[0].severity, IssueSeverity::Critical);
    EXPECT_EQ(report.issues[0].sequence, 1u);

    EXPECT_EQ(report.issues[1].type, IntegrityIssueType::SequenceGap);
    EXPECT_EQ(report.issues[1].severity, IssueSeverity::High);
    EXPECT_EQ(report.issues[1].sequence, 3u);
    EXPECT_EQ(report.issues[1].message, "Gap detected: missing sequences 3-3 (1 entries)");

    EXPECT_EQ(report.stats.gaps_detected, 1u);
    EXPECT_EQ(report.stats.missing_entries, 1u);
    EXPECT_EQ(report.stats.continuity_percent, 80);
    EXPECT_EQ(report.summary, "Chain integrity FAILED: 1 critical, 1 high issue(s) found");
}

TEST(VerificationTest, VerifyEntries_DroppedLeadingEntries) {
    auto entries = build_chain(3);
    entries.erase(entries.begin());

    auto report = verify_entries("acme", entries);
    EXPECT_FALSE(report.valid);
    EXPECT_TRUE(has_issue(report, IntegrityIssueType::FirstEntryInvalid));
    EXPECT_TRUE(has_issue(report, IntegrityIssueType::SequenceGap));
    EXPECT_EQ(report.issues.front().sequence, 0u);
}

TEST(VerificationTest, VerifyEntries_DuplicateSequence) {
    auto entries = build_chain(3);
    // Вторая ветка от записи 0 с тем же sequence 1
    ChainBuilder fork;
    fork.initialize_from(1, entries[0].chain.content_hash);
    AuditLogEntry forked = fork.build_entry(make_input("mallory"), AT);
    entries.insert(entries.begin() + 1, forked);

    auto report = verify_entries("acme", entries);
    ASSERT_EQ(report.issues.size(), 1u);
    const auto& issue = report.issues.front();
    EXPECT_EQ(issue.type, IntegrityIssueType::SequenceDuplicate);
    EXPECT_EQ(issue.sequence, 1u);
    EXPECT_EQ(issue.related_entries, (std::vector<std::string>{forked.id, entries[2].id}));
}

TEST(VerificationTest, VerifyEntries_TimestampRegressionOnlyWhenRequested) {
    ChainBuilder builder;
    std::vector<AuditLogEntry> entries;
    entries.push_back(
        builder.build_entry(make_input("alice"), datetime::from_unix_millis(BASE_MS + 1000)));
    entries.push_back(builder.build_entry(make_input("bob"), AT));

    EXPECT_TRUE(verify_entries("acme", entries).valid);

    VerificationOptions options;
    options.verify_timestamps = true;
    auto report = verify_entries("acme", entries, options);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].type, IntegrityIssueType::TimestampRegression);
    EXPECT_EQ(report.issues[0].severity, IssueSeverity::Medium);
    EXPECT_EQ(report.issues[0].sequence, 1u);
    EXPECT_EQ(report.summary, "Chain integrity FAILED: 1 other issue(s) found");
    EXPECT_EQ(report.stats.earliest_timestamp.value_or(""), "2024-01-15T10:00:00.000Z");
    EXPECT_EQ(report.stats.latest_timestamp.value_or(""), "2024-01-15T10:00:01.000Z");
}

TEST(VerificationTest, VerifyEntries_MixedAlgorithms) {
    auto entries = build_chain(2);
    ChainBuilder sha512(HashAlgorithm::Sha512);
    sha512.initialize_from(2, entries[1].chain.content_hash);
    entries.push_back(sha512.build_entry(make_input("carol"), AT));

    auto report = verify_entries("acme", entries);
    ASSERT_EQ(report.issues.size(), 1u);
    EXPECT_EQ(report.issues[0].type, IntegrityIssueType::AlgorithmMismatch);
    EXPECT_EQ(report.issues[0].severity, IssueSeverity::Low);
    EXPECT_EQ(report.stats.algorithms_used,
              (std::vector<HashAlgorithm>{HashAlgorithm::Sha256, HashAlgorithm::Sha512}));
}

TEST(VerificationTest, VerifyEntries_StopOnFirstErrorWithDetails) {
    auto entries = build_chain(3);
    entries[0].actor.id = "mallory";
    entries[1].actor.id = "eve";

    auto all = verify_entries("acme", entries);
    EXPECT_EQ(all.issues.size(), 2u);
    EXPECT_TRUE(all.entry_details.empty());

    VerificationOptions options;
    options.stop_on_first_error = true;
    options.include_entry_details = true;
    auto first = verify_entries("acme", entries, options);
    ASSERT_EQ(first.issues.size(), 1u);
    EXPECT_EQ(first.issues[0].sequence, 0u);
    ASSERT_EQ(first.entry_details.size(), 1u);
    EXPECT_FALSE(first.entry_details[0].content_hash_valid);
}

TEST(VerificationTest, VerifyEntries_EmptyInput) {
    auto report = verify_entries("acme", {});
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.summary, "No entries to verify");
    EXPECT_EQ(report.stats.continuity_percent, 100);
    EXPECT_FALSE(report.stats.first_sequence.has_value());
}

// ==============================================================================
// Отчёт по журналу
// ==============================================================================

TEST(VerificationTest, GenerateReport_WholeLogAndSegment) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    for (const char* actor : {"alice", "bob", "carol"}) {
        log.append("acme", make_input(actor));
    }

    auto report = generate_report(log, "acme");
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.tenant_id, "acme");
    EXPECT_EQ(report.verified_at, "2024-01-15T10:00:00.000Z");
    EXPECT_EQ(report.stats.total_entries, 3u);

    VerificationOptions options;
    options.start_sequence = 1;
    options.end_sequence = 10;
    auto segment = generate_report(log, "acme", options);
    EXPECT_TRUE(segment.valid);
    EXPECT_EQ(segment.stats.first_sequence.value_or(99), 1u);
    EXPECT_EQ(segment.stats.last_sequence.value_or(99), 2u);
}

TEST(VerificationTest, GenerateReport_UnknownTenantEmpty) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    auto report = generate_report(log, "nobody");
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.summary, "No entries to verify");
}

TEST(VerificationTest, IsChainValid_And_ChainHealth) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    EXPECT_THROW(is_chain_valid(log, "acme"), NotFoundError);
    EXPECT_FALSE(get_chain_health(log, "acme").has_value());

    log.append("acme", make_input("alice"));
    log.append("acme", make_input("bob"));
    EXPECT_TRUE(is_chain_valid(log, "acme"));

    auto health = get_chain_health(log, "acme");
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->total_entries, 2u);
    EXPECT_EQ(health->entries_verified, 0u);
    EXPECT_EQ(health->last_sequence.value_or(99), 1u);
    EXPECT_EQ(health->missing_entries, 0u);
    EXPECT_EQ(health->continuity_percent, 100);
    EXPECT_EQ(health->algorithms_used, std::vector<HashAlgorithm>{HashAlgorithm::Sha256});
}

TEST(VerificationTest, ToValue_ReportKeys) {
    auto entries = build_chain(2);
    entries[1].actor.id = "eve";
    Value v = to_value(verify_entries("acme", entries));

    EXPECT_FALSE(v.get("valid")->is_truthy());
    ASSERT_EQ(v.get("issues")->array_size(), 1u);
    const Value& issue = v.get("issues")->as_array()[0];
    EXPECT_EQ(issue.get("type")->as_string(), "content_hash_mismatch");
    EXPECT_EQ(issue.get("severity")->as_string(), "critical");
    EXPECT_TRUE(issue.has("expected"));
    EXPECT_EQ(v.get("stats")->get("continuityPercent")->to_double(), 100.0);
    EXPECT_FALSE(v.has("entryDetails"));
}

}  // namespace warden::audit::test
