// ==============================================================================
// test_audit_log_gtest.cpp - Тесты журнала аудита (GoogleTest)
// ==============================================================================

#include "warden/audit_log.hpp"
#include "warden/decision_record.hpp"
#include "warden/engine.hpp"
#include "warden/errors.hpp"
#include "warden/reader.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace warden::audit::test {

namespace {

constexpr std::int64_t BASE_MS = 1705312800000;  // 2024-01-15T10:00:00Z

AuditLogConfig fixed_clock_config() {
    AuditLogConfig config;
    config.clock = [] { return datetime::from_unix_millis(BASE_MS); };
    return config;
}

CreateEntryInput make_input(const std::string& action_type, const std::string& actor_id,
                            ActionCategory category = ActionCategory::Git) {
    CreateEntryInput input;
    input.actor.id = actor_id;
    input.action.category = category;
    input.action.type = action_type;
    return input;
}

/// Три записи из фикстуры; у записей нет timestamp, время берётся из часов
std::vector<CreateEntryInput> fixture_inputs() {
    std::vector<CreateEntryInput> out;
    auto docs = io::read_documents(std::string(CMAKE_SOURCE_DIR) +
                                   "/tests/fixtures/audit/entries.jsonl");
    for (const auto& doc : docs) {
        out.push_back(input_from_value(doc.data));
    }
    return out;
}

void append_fixture(AuditLog& log) {
    for (auto& input : fixture_inputs()) {
        log.append("acme", input);
    }
}

/// Записи журнала после выгрузки в JSONL и обратного чтения
std::vector<AuditLogEntry> exported_entries(const AuditLog& log) {
    std::stringstream jsonl;
    log.export_jsonl("acme", jsonl);
    std::vector<AuditLogEntry> out;
    std::string line;
    while (std::getline(jsonl, line)) {
        out.push_back(entry_from_value(parse_json(line)));
    }
    return out;
}

}  // namespace

// ==============================================================================
// Запись
// ==============================================================================

TEST(AuditLogTest, Append_AssignsContiguousSequence) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());

    auto first = log.append("acme", make_input("git.push.created", "alice"));
    auto second = log.append("acme", make_input("git.push.created", "bob"));

    EXPECT_EQ(first.chain.sequence, 0u);
    EXPECT_FALSE(first.chain.prev_hash.has_value());
    EXPECT_EQ(second.chain.sequence, 1u);
    EXPECT_EQ(second.chain.prev_hash, first.chain.content_hash);
    EXPECT_EQ(first.context.tenant_id, "acme");
    EXPECT_EQ(first.timestamp, "2024-01-15T10:00:00.000Z");

    auto meta = log.metadata("acme");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->latest_sequence, 1u);
    EXPECT_EQ(meta->head_hash, second.chain.content_hash);
    EXPECT_EQ(meta->entry_count, 2u);
}

TEST(AuditLogTest, Append_AutoCreatesLog) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    EXPECT_FALSE(log.metadata("globex").has_value());

    log.append("globex", make_input("git.push.created", "alice"));
    auto meta = log.metadata("globex");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->id.rfind("log-globex-tenant-", 0), 0u);
    EXPECT_EQ(store.log_count(), 1u);
}

TEST(AuditLogTest, CreateLog_Idempotent) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    auto a = log.create_log("acme", LogScope::Org, std::string("acme"));
    auto b = log.create_log("acme");
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(b.scope, LogScope::Org);
    EXPECT_THROW(log.create_log(""), ValidationError);
}

TEST(AuditLogTest, Append_InvalidInput_StateUnchanged) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    log.append("acme", make_input("git.push.created", "alice"));

    try {
        log.append("acme", make_input("Not A Type", ""));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_EQ(e.issues().size(), 2u);
        EXPECT_EQ(e.issues()[0], "actor.id: must be between 1 and 200 characters");
        EXPECT_EQ(e.issues()[1],
                  "action.type: must be dot-separated lowercase (e.g. policy.rule.evaluated)");
    }
    EXPECT_EQ(log.count_entries("acme"), 1u);
}

TEST(AuditLogTest, Append_TenantMismatch_Throws) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    auto input = make_input("git.push.created", "alice");
    input.context.tenant_id = "globex";
    EXPECT_THROW(log.append("acme", input), ValidationError);
}

TEST(AuditLogTest, Append_TooManyTags_Throws) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    auto input = make_input("git.push.created", "alice");
    input.tags.assign(MAX_TAGS + 1, "tag");
    EXPECT_THROW(log.append("acme", input), ValidationError);
}

TEST(AuditLogTest, Append_MarksHighRisk) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());

    auto forced = log.append("acme", make_input("git.push.force.main", "alice"));
    EXPECT_TRUE(forced.high_risk);

    auto sensitive = make_input("data.report.viewed", "alice", ActionCategory::Data);
    sensitive.action.sensitive = true;
    EXPECT_TRUE(log.append("acme", sensitive).high_risk);

    EXPECT_FALSE(log.append("acme", make_input("git.pushed", "alice")).high_risk);
}

TEST(AuditLogTest, HighRiskAction_PrefixOnDotBoundary) {
    EXPECT_TRUE(is_high_risk_action("secret.access"));
    EXPECT_TRUE(is_high_risk_action("secret.access.vault"));
    EXPECT_FALSE(is_high_risk_action("secret.accessor"));
    EXPECT_FALSE(is_high_risk_action("auth.login.success"));
}

TEST(AuditLogTest, AppendBatch_ReturnsMerkleRoot) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    log.append("acme", make_input("git.push.created", "alice"));

    auto batch = log.append_batch("acme", {make_input("git.push.created", "bob"),
                                           make_input("git.push.created", "carol")});
    EXPECT_EQ(batch.start_sequence, 1u);
    EXPECT_EQ(batch.end_sequence, 2u);
    EXPECT_EQ(batch.merkle_root, MerkleTree(batch.entries).root_hash());
    EXPECT_TRUE(log.verify_chain_integrity("acme").valid);

    EXPECT_THROW(log.append_batch("acme", {}), ValidationError);
}

TEST(AuditLogTest, Append_ConcurrentWriters_ContiguousChain) {
    InMemoryAuditLogStore store;
    AuditLogConfig config = fixed_clock_config();
    config.max_append_retries = 100000;
    AuditLog log(store, config);

    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 25;
    std::vector<std::thread> writers;
    for (int t = 0; t < THREADS; ++t) {
        writers.emplace_back([&log, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                log.append("acme", make_input("git.push.created", "writer-" + std::to_string(t)));
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }

    EXPECT_EQ(log.count_entries("acme"), static_cast<std::uint64_t>(THREADS * PER_THREAD));
    auto result = log.verify_chain_integrity("acme");
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.entries_verified, static_cast<std::size_t>(THREADS * PER_THREAD));
}

// ==============================================================================
// Запечатывание
// ==============================================================================

TEST(AuditLogTest, Seal_BlocksFurtherWrites) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    auto meta = log.seal("acme", "retention period closed");
    EXPECT_TRUE(meta.sealed);
    EXPECT_EQ(meta.seal_reason.value_or(""), "retention period closed");
    EXPECT_EQ(meta.sealed_at.value_or(""), "2024-01-15T10:00:00.000Z");

    EXPECT_THROW(log.append("acme", make_input("git.push.created", "alice")), SealedLogError);
    EXPECT_THROW(log.seal("acme", "again"), SealedLogError);
    EXPECT_EQ(log.count_entries("acme"), 3u);
    EXPECT_TRUE(log.verify_chain_integrity("acme").valid);
}

TEST(AuditLogTest, Seal_UnknownLog_Throws) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    EXPECT_THROW(log.seal("nobody", "x"), NotFoundError);
    EXPECT_THROW(log.verify_chain_integrity("nobody"), NotFoundError);
}

// ==============================================================================
// Запросы
// ==============================================================================

TEST(AuditLogTest, Query_FiltersAndOrder) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    AuditLogQuery q;
    q.tenant_id = "acme";
    auto all = log.query(q);
    ASSERT_EQ(all.total, 3u);
    EXPECT_EQ(all.entries.front().chain.sequence, 2u);  // по умолчанию desc

    q.order = SortOrder::Asc;
    q.categories = {ActionCategory::Git};
    auto git = log.query(q);
    ASSERT_EQ(git.entries.size(), 1u);
    EXPECT_EQ(git.entries[0].action.type, "git.push.force");
    EXPECT_TRUE(git.entries[0].high_risk);

    AuditLogQuery by_run;
    by_run.tenant_id = "acme";
    by_run.run_id = "run-42";
    EXPECT_EQ(log.query(by_run).total, 1u);

    AuditLogQuery by_tag;
    by_tag.tenant_id = "acme";
    by_tag.tags = {"CC6.1", "unused"};
    EXPECT_EQ(log.query(by_tag).total, 1u);

    AuditLogQuery denied;
    denied.tenant_id = "acme";
    denied.outcomes = {OutcomeStatus::Denied};
    EXPECT_EQ(log.query(denied).total, 1u);
}

TEST(AuditLogTest, Query_SearchTextCaseInsensitive) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    AuditLogQuery q;
    q.tenant_id = "acme";
    q.search_text = "FORCE PUSH";
    EXPECT_EQ(log.query(q).total, 1u);

    q.search_text = "k-7";
    auto by_details = log.query(q);
    ASSERT_EQ(by_details.total, 1u);
    EXPECT_EQ(by_details.entries[0].actor.id, "bob");
}

TEST(AuditLogTest, Query_Pagination) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    AuditLogQuery q;
    q.tenant_id = "acme";
    q.order = SortOrder::Asc;
    q.limit = 2;
    auto page1 = log.query(q);
    EXPECT_EQ(page1.entries.size(), 2u);
    EXPECT_TRUE(page1.has_more);

    q.offset = 2;
    auto page2 = log.query(q);
    ASSERT_EQ(page2.entries.size(), 1u);
    EXPECT_FALSE(page2.has_more);
    EXPECT_EQ(page2.entries[0].chain.sequence, 2u);
}

TEST(AuditLogTest, Query_InvalidParameters_Throws) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());

    AuditLogQuery q;
    q.tenant_id = "acme";
    q.limit = 5000;
    EXPECT_THROW(log.query(q), ValidationError);

    q.limit = 10;
    q.start_sequence = 5;
    q.end_sequence = 1;
    auto issues = validate_query(q);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0], "startSequence: must not exceed endSequence");

    AuditLogQuery no_tenant;
    EXPECT_EQ(validate_query(no_tenant).at(0), "tenantId: must not be empty");
}

TEST(AuditLogTest, Query_TimeRangeInclusive) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    AuditLogQuery q;
    q.tenant_id = "acme";
    q.start_time = datetime::from_unix_millis(BASE_MS);
    q.end_time = datetime::from_unix_millis(BASE_MS);
    EXPECT_EQ(log.query(q).total, 3u);

    q.start_time = datetime::from_unix_millis(BASE_MS + 1);
    q.end_time.reset();
    EXPECT_EQ(log.query(q).total, 0u);
}

TEST(AuditLogTest, Query_InlineChainVerification) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    AuditLogQuery q;
    q.tenant_id = "acme";
    q.start_sequence = 1;
    q.include_chain_verification = true;
    auto result = log.query(q);
    ASSERT_TRUE(result.chain_verification.has_value());
    EXPECT_TRUE(result.chain_verification->valid);
    EXPECT_EQ(result.chain_verification->entries_verified, 2u);
}

TEST(AuditLogTest, GetEntry_ById) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    auto entry = log.append("acme", make_input("git.push.created", "alice"));

    auto found = log.get_entry("acme", entry.id);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->chain.content_hash, entry.chain.content_hash);
    EXPECT_FALSE(log.get_entry("acme", "alog-missing").has_value());
    EXPECT_FALSE(log.get_entry("globex", entry.id).has_value());
}

TEST(AuditLogTest, CountEntries_Filters) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    EXPECT_EQ(log.count_entries("acme"), 3u);
    CountOptions options;
    options.high_risk_only = true;
    EXPECT_EQ(log.count_entries("acme", options), 1u);
    EXPECT_EQ(log.count_entries("nobody"), 0u);
}

// ==============================================================================
// Проверка целостности
// ==============================================================================

TEST(AuditLogTest, VerifyIntegrity_EmptyLogValid) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    log.create_log("acme");
    auto result = log.verify_chain_integrity("acme");
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.entries_verified, 0u);
}

TEST(AuditLogTest, VerifyIntegrity_Segment) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    auto result = log.verify_chain_integrity("acme", 1u, 2u);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.entries_verified, 2u);
}

// ==============================================================================
// Экспорт и импорт
// ==============================================================================

TEST(AuditLogTest, ExportImport_RoundTrip) {
    InMemoryAuditLogStore source_store;
    AuditLog source(source_store, fixed_clock_config());
    append_fixture(source);

    std::stringstream jsonl;
    EXPECT_EQ(source.export_jsonl("acme", jsonl), 3u);

    InMemoryAuditLogStore target_store;
    AuditLog target(target_store, fixed_clock_config());
    EXPECT_EQ(target.import_jsonl("acme", jsonl), 3u);

    auto src_meta = source.metadata("acme");
    auto dst_meta = target.metadata("acme");
    ASSERT_TRUE(dst_meta.has_value());
    EXPECT_EQ(dst_meta->head_hash, src_meta->head_hash);
    EXPECT_EQ(dst_meta->entry_count, 3u);
    EXPECT_TRUE(target.verify_chain_integrity("acme").valid);

    // После импорта журнал продолжается с того же места
    auto next = target.append("acme", make_input("git.push.created", "dana"));
    EXPECT_EQ(next.chain.sequence, 3u);
}

TEST(AuditLogTest, Import_TamperedLine_ChainIntegrityError) {
    InMemoryAuditLogStore source_store;
    AuditLog source(source_store, fixed_clock_config());
    append_fixture(source);

    std::stringstream exported;
    source.export_jsonl("acme", exported);

    std::string text = exported.str();
    auto pos = text.find("\"bob\"");
    ASSERT_NE(pos, std::string::npos);
    text.replace(pos, 5, "\"eve\"");
    std::istringstream tampered(text);

    InMemoryAuditLogStore target_store;
    AuditLog target(target_store, fixed_clock_config());
    try {
        target.import_jsonl("acme", tampered);
        FAIL() << "expected ChainIntegrityError";
    } catch (const ChainIntegrityError& e) {
        EXPECT_EQ(e.first_invalid_sequence(), 2u);
        EXPECT_NE(std::string(e.what()).find("Content hash mismatch"), std::string::npos);
    }
    EXPECT_EQ(target.count_entries("acme"), 0u);
}

TEST(AuditLogTest, Import_WrongTenant_Throws) {
    InMemoryAuditLogStore source_store;
    AuditLog source(source_store, fixed_clock_config());
    append_fixture(source);

    std::stringstream exported;
    source.export_jsonl("acme", exported);

    InMemoryAuditLogStore target_store;
    AuditLog target(target_store, fixed_clock_config());
    EXPECT_THROW(target.import_jsonl("globex", exported), ValidationError);
}

TEST(AuditLogTest, Import_MalformedLine_ReportsLineNumber) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    std::istringstream in("\n{not json}\n");
    try {
        log.import_jsonl("acme", in);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("line 2: ", 0), 0u);
    }
}

// ==============================================================================
// Проверка выгруженного журнала
// ==============================================================================

TEST(AuditLogTest, VerifyExported_DroppedFirstLine_Invalid) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);

    auto entries = exported_entries(log);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_TRUE(verify_exported_log(entries).valid);

    entries.erase(entries.begin());
    auto result = verify_exported_log(entries);
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.first_invalid_sequence.has_value());
    EXPECT_EQ(*result.first_invalid_sequence, 1u);
    EXPECT_EQ(to_value(result).get("firstInvalidSequence")->to_double(), 1.0);
}

TEST(AuditLogTest, VerifyExported_TruncatedTail_HeadMismatch) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);
    auto recorded = log.metadata("acme");
    ASSERT_TRUE(recorded.has_value());

    auto entries = exported_entries(log);
    EXPECT_TRUE(verify_exported_log(entries, recorded).valid);

    entries.pop_back();
    // Без метаданных обрезка хвоста не видна
    EXPECT_TRUE(verify_exported_log(entries).valid);

    auto result = verify_exported_log(entries, recorded);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.first_invalid_sequence.value_or(99), 2u);
    EXPECT_NE(result.error.value_or("").find("Head mismatch"), std::string::npos);
}

TEST(AuditLogTest, CheckHead_ImportedTruncatedLog_Throws) {
    InMemoryAuditLogStore source_store;
    AuditLog source(source_store, fixed_clock_config());
    append_fixture(source);
    auto recorded = source.metadata("acme");
    ASSERT_TRUE(recorded.has_value());

    std::stringstream exported;
    source.export_jsonl("acme", exported);
    std::string text = exported.str();
    text.erase(text.rfind('\n', text.size() - 2) + 1);
    std::istringstream truncated(text);

    InMemoryAuditLogStore target_store;
    AuditLog target(target_store, fixed_clock_config());
    EXPECT_EQ(target.import_jsonl("acme", truncated), 2u);

    try {
        check_head(head_of(*recorded), head_of(*target.metadata("acme")));
        FAIL() << "expected ChainIntegrityError";
    } catch (const ChainIntegrityError& e) {
        EXPECT_EQ(e.first_invalid_sequence(), 2u);
    }
    EXPECT_NO_THROW(check_head(head_of(*recorded), head_of(*source.metadata("acme"))));
}

TEST(AuditLogTest, CompareHeads_ExtraEntry_ReportsFirstExtra) {
    LogHead recorded{1, std::string("aa"), 2};
    LogHead actual{2, std::string("bb"), 3};
    auto mismatch = compare_heads(recorded, actual);
    ASSERT_TRUE(mismatch.has_value());
    EXPECT_EQ(mismatch->sequence, 2u);
    EXPECT_FALSE(compare_heads(recorded, recorded).has_value());
}

// ==============================================================================
// Запись решений движка
// ==============================================================================

TEST(AuditLogTest, Decision_DeniedEvaluation_ChainedPolicyEntry) {
    policy::PolicyDocument doc;
    doc.name = "force-push";
    policy::PolicyRule rule;
    rule.id = "no-force-push";
    rule.name = "No force push";
    rule.priority = 100;
    rule.action.effect = policy::Effect::Deny;
    doc.rules.push_back(rule);

    policy::PolicyEngine engine;
    engine.load_policy(doc);

    policy::EvaluationRequest request;
    request.actor.id = "coder-1";
    request.actor.type = "agent";
    request.action.name = "git.push.force";
    request.action.agent_type = "coder";
    request.resource.type = "branch";
    request.resource.repo = policy::RepoRef{"acme", "api"};
    request.resource.branch = "main";
    request.context.source = "cli";
    request.context.timestamp = datetime::from_unix_millis(BASE_MS);
    request.context.request_id = "req-7";

    policy::EvaluationResult result = engine.evaluate(request);
    ASSERT_FALSE(result.allowed);
    ASSERT_EQ(result.effect, policy::Effect::Deny);

    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    append_fixture(log);
    AuditLogEntry entry = log.append("acme", input_from_decision(request, result, "acme"));

    EXPECT_EQ(entry.action.category, ActionCategory::Policy);
    EXPECT_EQ(entry.action.type, "policy.evaluate");
    EXPECT_EQ(entry.outcome.status, OutcomeStatus::Denied);
    EXPECT_EQ(entry.actor.type, ActorType::Agent);
    EXPECT_EQ(entry.actor.agent_type.value_or(""), "coder");
    ASSERT_TRUE(entry.resource.has_value());
    EXPECT_EQ(entry.resource->type, ResourceType::Branch);
    EXPECT_EQ(entry.resource->id, "main");
    EXPECT_EQ(entry.context.request_id.value_or(""), "req-7");
    ASSERT_NE(entry.details.get("effect"), nullptr);
    EXPECT_EQ(entry.details.get("effect")->as_string(), "deny");
    EXPECT_FALSE(entry.details.get("allowed")->is_truthy());

    EXPECT_EQ(entry.chain.sequence, 3u);
    auto previous = log.entries("acme", 2, 2);
    ASSERT_EQ(previous.size(), 1u);
    EXPECT_EQ(entry.chain.prev_hash, previous.front().chain.content_hash);
    EXPECT_TRUE(log.verify_chain_integrity("acme").valid);
}

TEST(AuditLogTest, Decision_OutcomeMapping) {
    policy::EvaluationResult result;
    result.allowed = true;
    result.effect = policy::Effect::Allow;
    EXPECT_EQ(outcome_of(result), OutcomeStatus::Success);

    result.allowed = false;
    result.effect = policy::Effect::RequireApproval;
    EXPECT_EQ(outcome_of(result), OutcomeStatus::Pending);

    result.effect = policy::Effect::Deny;
    EXPECT_EQ(outcome_of(result), OutcomeStatus::Denied);
}

TEST(AuditLogTest, Export_UnknownLog_Throws) {
    InMemoryAuditLogStore store;
    AuditLog log(store, fixed_clock_config());
    std::ostringstream out;
    EXPECT_THROW(log.export_jsonl("nobody", out), NotFoundError);
}

}  // namespace warden::audit::test
