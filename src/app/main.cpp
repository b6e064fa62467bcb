// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output), загрузка конфигурации
// 3. Dispatch команды
// 4. Возврат exit code
//
// Журнал аудита хранится в JSONL файле (--log); состояние запечатывания -
// в файле метаданных рядом с ним (<log>.meta.json).
//
// ==============================================================================

#include "warden/audit_log.hpp"
#include "warden/cli.hpp"
#include "warden/config.hpp"
#include "warden/decision_record.hpp"
#include "warden/engine.hpp"
#include "warden/errors.hpp"
#include "warden/evidence.hpp"
#include "warden/inheritance.hpp"
#include "warden/output.hpp"
#include "warden/platform.hpp"
#include "warden/reader.hpp"
#include "warden/verification.hpp"

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <type_traits>
#include <variant>

namespace {

using namespace warden;

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    ██╗    ██╗ █████╗ ██████╗ ██████╗ ███████╗███╗   ██╗
    ██║    ██║██╔══██╗██╔══██╗██╔══██╗██╔════╝████╗  ██║
    ██║ █╗ ██║███████║██████╔╝██║  ██║█████╗  ██╔██╗ ██║
    ██║███╗██║██╔══██║██╔══██╗██║  ██║██╔══╝  ██║╚██╗██║
    ╚███╔███╔╝██║  ██║██║  ██║██████╔╝███████╗██║ ╚████║
     ╚══╝╚══╝ ╚═╝  ╚═╝╚═╝  ╚═╝╚═════╝ ╚══════╝╚═╝  ╚═══╝
)";

void print_banner(output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

/// Pretty JSON в stdout независимо от формата основного Writer
void write_json(output::Writer& writer, const Value& value) {
    output::OutputConfig cfg = writer.config();
    cfg.format = output::Format::Json;
    output::Writer json_out(cfg);
    json_out.write_value(value);
}

// ----------------------------------------------------------------------------
// Входные документы
// ----------------------------------------------------------------------------

/// Загрузить документы политик; ошибки выводятся через Writer
/// @return false если хотя бы один документ не загружен
bool load_policies(const std::vector<std::filesystem::path>& paths, bool validate,
                   output::Writer& writer, std::vector<policy::PolicyDocument>& out) {
    policy::LoadOptions options;
    options.validate = validate;

    bool ok = true;
    for (const auto& path : paths) {
        auto result = policy::load(path, options);
        if (!result) {
            writer.error(result.error.format());
            ok = false;
            continue;
        }
        writer.debug("Loaded policy '" + result.document.name + "' from " +
                     platform::path_to_utf8(path));
        out.push_back(std::move(result.document));
    }
    return ok;
}

/// @throw std::runtime_error, ValidationError
policy::EvaluationRequest read_request(const std::filesystem::path& path) {
    auto documents = io::read_documents(path);
    if (documents.size() != 1) {
        throw std::runtime_error("request file must contain exactly one document - " +
                                 platform::path_to_utf8(path));
    }
    return policy::parse_request(documents.front().data);
}

// ----------------------------------------------------------------------------
// LogFile - журнал аудита арендатора в файле
// ----------------------------------------------------------------------------

std::filesystem::path metadata_path(const std::filesystem::path& log) {
    return log.string() + ".meta.json";
}

/// Метаданные, сохранённые рядом с журналом; nullopt если файла нет
/// @throw std::runtime_error, ValidationError
std::optional<audit::AuditLogMetadata> read_log_metadata(const std::filesystem::path& log) {
    const std::filesystem::path path = metadata_path(log);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("could not open audit log metadata - " +
                                 platform::path_to_utf8(path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return audit::metadata_from_value(parse_json(buffer.str()));
}

class LogFile {
public:
    LogFile(std::filesystem::path path, std::string tenant, const audit::AuditLogConfig& config)
        : path_(std::move(path)),
          meta_path_(metadata_path(path_)),
          tenant_(std::move(tenant)),
          log_(store_, config) {}

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    bool exists() const {
        std::error_code ec;
        return std::filesystem::exists(path_, ec);
    }

    /// Импорт JSONL с проверкой цепочки и головы; восстановление запечатывания
    /// @throw ChainIntegrityError, ValidationError, std::runtime_error
    void load() {
        std::optional<audit::AuditLogMetadata> meta = read_log_metadata(path_);
        if (meta) {
            if (meta->tenant_id != tenant_) {
                throw ValidationError("audit log belongs to tenant '" + meta->tenant_id +
                                      "', not '" + tenant_ + "'");
            }
            log_.create_log(tenant_, meta->scope, meta->scope_id);
        }

        if (exists()) {
            std::ifstream in(path_, std::ios::binary);
            if (!in.is_open()) {
                throw std::runtime_error("could not open audit log - " +
                                         platform::path_to_utf8(path_));
            }
            log_.import_jsonl(tenant_, in);
        }

        if (meta) {
            auto actual = log_.metadata(tenant_);
            audit::check_head(audit::head_of(*meta),
                              actual ? audit::head_of(*actual) : audit::LogHead{});
        }

        if (meta && meta->sealed) {
            log_.seal(tenant_, meta->seal_reason.value_or(""));
        }
    }

    /// Записать журнал и метаданные (через временный файл)
    void save() {
        write_atomically(path_, [&](std::ostream& out) { log_.export_jsonl(tenant_, out); });

        auto meta = log_.metadata(tenant_);
        if (meta) {
            write_atomically(meta_path_, [&](std::ostream& out) {
                out << to_json(audit::to_value(*meta)) << '\n';
            });
        }
    }

    audit::AuditLog& log() { return log_; }

private:
    template <typename Fn>
    static void write_atomically(const std::filesystem::path& target, Fn&& fn) {
        std::filesystem::path tmp = target;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw std::runtime_error("could not write file - " + platform::path_to_utf8(tmp));
            }
            fn(out);
            if (!out) {
                throw std::runtime_error("failed to write file - " + platform::path_to_utf8(tmp));
            }
        }
        std::filesystem::rename(tmp, target);
    }

    std::filesystem::path path_;
    std::filesystem::path meta_path_;
    std::string tenant_;
    audit::InMemoryAuditLogStore store_;
    audit::AuditLog log_;
};

/// Открыть существующий журнал для чтения
/// @throw NotFoundError если файла нет
std::unique_ptr<LogFile> open_existing_log(const std::filesystem::path& path,
                                           const std::string& tenant,
                                           const config::Config& config) {
    auto file = std::make_unique<LogFile>(path, tenant, config.audit);
    if (!file->exists()) {
        throw NotFoundError("audit log file not found - " + platform::path_to_utf8(path));
    }
    file->load();
    return file;
}

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_lint(const cli::LintCommand& cmd, const config::Config& config, output::Writer& writer) {
    writer.info("Validating supplied policy documents...");

    auto files = io::discover_files(cmd.paths, {"yml", "yaml", "json"});

    policy::LoadOptions options;
    options.validate = config.engine.validate_on_load;

    std::size_t count = 0;
    std::size_t failed = 0;
    for (const auto& file : files) {
        auto result = policy::load(file, options);
        if (result) {
            writer.debug(platform::path_to_utf8(file) + ": " +
                         std::to_string(result.document.rules.size()) + " rules");
            ++count;
            continue;
        }

        ++failed;
        writer.warn(platform::path_to_utf8(file.filename()) + ": " + result.error.message);
        for (const auto& issue : result.error.issues) {
            writer.warn("    " + issue);
        }
    }

    writer.info("Validated " + std::to_string(count) + " policy documents out of " +
                std::to_string(count + failed));
    return failed == 0 ? cli::EXIT_OK : cli::EXIT_RUNTIME_ERROR;
}

/// Движок с загруженными политиками (или слитой цепочкой при --inherit)
/// @return nullptr если политики не загрузились
std::unique_ptr<policy::PolicyEngine> build_engine(const std::vector<std::filesystem::path>& paths,
                                                   bool inherit,
                                                   const policy::EvaluationRequest& request,
                                                   const config::Config& config,
                                                   output::Writer& writer) {
    std::vector<policy::PolicyDocument> documents;
    if (!load_policies(paths, config.engine.validate_on_load, writer, documents)) {
        return nullptr;
    }

    auto engine = std::make_unique<policy::PolicyEngine>(config.engine);

    if (!inherit) {
        for (const auto& doc : documents) {
            engine->load_policy(doc);
        }
        return engine;
    }

    policy::InMemoryPolicyStore store;
    for (const auto& doc : documents) {
        store.put(doc);
    }
    std::string org;
    std::string repo;
    if (request.resource.repo) {
        org = request.resource.repo->owner;
        repo = request.resource.repo->full_name();
    }
    policy::InheritanceResolver resolver(store);
    policy::ResolvedPolicy resolved =
        resolver.resolve_for(org, repo, request.resource.branch.value_or(""));

    writer.debug("Resolved policy chain of " + std::to_string(resolved.metadata.chain_depth) +
                 " documents (" + std::to_string(resolved.metadata.total_rules_before_merge) +
                 " rules -> " + std::to_string(resolved.metadata.total_rules_after_merge) + ")");
    engine->load_policy(resolved.document);
    return engine;
}

int run_evaluate(const cli::EvaluateCommand& cmd, const config::Config& config,
                 output::Writer& writer) {
    policy::EvaluationRequest request = read_request(cmd.request);

    auto engine = build_engine(cmd.policies, cmd.inherit, request, config, writer);
    if (!engine) {
        return cli::EXIT_RUNTIME_ERROR;
    }

    policy::EvaluationResult result = engine->evaluate(request);

    if (cmd.log && cmd.tenant) {
        LogFile file(*cmd.log, *cmd.tenant, config.audit);
        file.load();
        audit::AuditLogEntry entry =
            file.log().append(*cmd.tenant, audit::input_from_decision(request, result, *cmd.tenant));
        file.save();
        writer.debug("Recorded decision as " + entry.id + " (sequence " +
                     std::to_string(entry.chain.sequence) + ") in " +
                     platform::path_to_utf8(*cmd.log));
    }

    if (cmd.json) {
        write_json(writer, policy::to_value(result));
    } else {
        if (result.allowed) {
            writer.green_line("ALLOWED (" + policy::to_string(result.effect) + ")");
        } else if (result.effect == policy::Effect::RequireApproval) {
            writer.yellow_line("PENDING APPROVAL");
        } else {
            writer.red_line("DENIED (" + policy::to_string(result.effect) + ")");
        }
        writer.write_line(output::Stream::Stdout, "Reason: " + result.reason);
        if (result.matched_rule) {
            writer.write_line(output::Stream::Stdout,
                              "Rule:   " + result.matched_rule->rule_id + " (" +
                                  result.matched_rule->policy_id + ")");
        }
        if (result.missing_requirements && !result.missing_requirements->satisfied()) {
            const auto& missing = *result.missing_requirements;
            writer.write_line(output::Stream::Stdout,
                              "Approvals needed: " + std::to_string(missing.approvals_needed));
            for (const auto& scope : missing.missing_scopes) {
                writer.write_line(output::Stream::Stdout, "Missing scope:    " + scope);
            }
        }
        for (const auto& action : result.required_actions) {
            writer.debug("Required action: " + policy::to_string(action.type) + " " +
                         to_json(action.config));
        }
    }

    writer.info("Evaluated " + std::to_string(result.metadata.rules_evaluated) + " rules from " +
                std::to_string(result.metadata.policies_evaluated) + " policies in " +
                policy::format_number(result.metadata.evaluation_time_ms) + "ms");

    return result.allowed ? cli::EXIT_OK : cli::EXIT_NOT_ALLOWED;
}

void print_rule_evaluation(output::Writer& writer, const policy::RuleEvaluation& rule,
                           bool show_conditions) {
    std::string line = rule.rule_id + " (" + rule.policy_id + ", priority " +
                       std::to_string(rule.priority) + ") -> " + policy::to_string(rule.effect);
    if (rule.matched) {
        writer.green_line("MATCH     " + line);
    } else {
        writer.write_line(output::Stream::Stdout, "NO MATCH  " + line);
    }
    if (!show_conditions) {
        return;
    }
    for (const auto& condition : rule.conditions) {
        writer.write_line(output::Stream::Stdout, "    " + condition.explanation);
    }
}

int run_dry_run(const cli::DryRunCommand& cmd, const config::Config& config,
                output::Writer& writer) {
    policy::EvaluationRequest request = read_request(cmd.request);

    auto engine = build_engine(cmd.policies, false, request, config, writer);
    if (!engine) {
        return cli::EXIT_RUNTIME_ERROR;
    }

    policy::DryRunResult result = engine->dry_run(request);

    if (cmd.json) {
        write_json(writer, policy::to_value(result));
        return cli::EXIT_OK;
    }

    for (const auto& rule : result.matching_rules) {
        print_rule_evaluation(writer, rule, true);
    }
    const bool verbose = writer.config().verbose > 0;
    for (const auto& rule : result.non_matching_rules) {
        print_rule_evaluation(writer, rule, verbose);
    }

    writer.write_line(output::Stream::Stdout, "");
    writer.write_line(output::Stream::Stdout,
                      "Would " + std::string(result.would_allow ? "allow" : "block") + " (" +
                          policy::to_string(result.would_effect) + "): " + result.reason);

    for (const auto& warning : result.warnings) {
        writer.warn(warning);
    }
    writer.info("Matched " + std::to_string(result.summary.matching_rules) + " of " +
                std::to_string(result.summary.total_rules) + " rules from " +
                std::to_string(result.summary.total_policies) + " policies");
    return cli::EXIT_OK;
}

int run_audit_append(const cli::AuditAppendCommand& cmd, const config::Config& config,
                     output::Writer& writer) {
    std::vector<audit::CreateEntryInput> inputs;
    for (const auto& doc : io::read_documents(cmd.entry)) {
        try {
            inputs.push_back(audit::input_from_value(doc.data));
        } catch (const ValidationError& e) {
            std::string where = doc.record_id ? "entry " + std::to_string(*doc.record_id) : "entry";
            throw ValidationError(where + ": " + e.what(), e.issues());
        }
    }
    if (inputs.empty()) {
        writer.warn("No entries found in " + platform::path_to_utf8(cmd.entry));
        return cli::EXIT_OK;
    }

    LogFile file(cmd.log, cmd.tenant, config.audit);
    file.load();

    std::vector<audit::AuditLogEntry> appended;
    std::optional<std::string> merkle_root;
    if (inputs.size() == 1) {
        appended.push_back(file.log().append(cmd.tenant, std::move(inputs.front())));
    } else {
        audit::EntryBatch batch = file.log().append_batch(cmd.tenant, std::move(inputs));
        appended = std::move(batch.entries);
        merkle_root = batch.merkle_root;
    }
    file.save();

    for (const auto& entry : appended) {
        writer.debug("Appended " + entry.id + " (sequence " +
                     std::to_string(entry.chain.sequence) + ")" +
                     (entry.high_risk ? " [high risk]" : ""));
    }
    writer.info("Appended " + std::to_string(appended.size()) + " entries to " +
                platform::path_to_utf8(cmd.log) + " (sequence " +
                std::to_string(appended.front().chain.sequence) + ".." +
                std::to_string(appended.back().chain.sequence) + ")");
    writer.write_line(output::Stream::Stdout, "Head hash:   " + appended.back().chain.content_hash);
    if (merkle_root) {
        writer.write_line(output::Stream::Stdout, "Merkle root: " + *merkle_root);
    }
    return cli::EXIT_OK;
}

/// audit verify --report: все нарушения и статистика цепочки
int report_audit_log(const cli::AuditVerifyCommand& cmd,
                     const std::vector<audit::AuditLogEntry>& entries,
                     const std::optional<audit::AuditLogMetadata>& recorded,
                     output::Writer& writer) {
    audit::VerificationOptions options;
    options.verify_timestamps = true;
    audit::VerificationReport report = audit::verify_entries(cmd.tenant, entries, options);

    std::optional<audit::HeadMismatch> mismatch;
    if (recorded) {
        mismatch = audit::compare_heads(audit::head_of(*recorded), audit::head_of(entries));
    }
    const bool valid = report.valid && !mismatch;

    if (cmd.json) {
        Value value = audit::to_value(report);
        if (mismatch) {
            value.set("valid", Value(false));
            value.set("headMismatch", Value(mismatch->message));
        }
        write_json(writer, value);
        return valid ? cli::EXIT_OK : cli::EXIT_RUNTIME_ERROR;
    }

    if (report.valid) {
        writer.green_line(report.summary);
    } else {
        writer.red_line(report.summary);
    }
    for (const auto& issue : report.issues) {
        writer.write_line(output::Stream::Stdout,
                          "  [" + audit::to_string(issue.severity) + "] sequence " +
                              std::to_string(issue.sequence) + " " +
                              audit::to_string(issue.type) + ": " + issue.message);
    }
    if (mismatch) {
        writer.red_line(mismatch->message);
    }

    const audit::ChainHealthStats& stats = report.stats;
    writer.info("Continuity " + std::to_string(stats.continuity_percent) + "%, " +
                std::to_string(stats.gaps_detected) + " gaps, " +
                std::to_string(stats.missing_entries) + " missing entries");
    if (stats.earliest_timestamp && stats.latest_timestamp) {
        writer.info("Entries span " + *stats.earliest_timestamp + " .. " +
                    *stats.latest_timestamp);
    }
    return valid ? cli::EXIT_OK : cli::EXIT_RUNTIME_ERROR;
}

int run_audit_verify(const cli::AuditVerifyCommand& cmd, output::Writer& writer) {
    if (!std::filesystem::exists(cmd.log)) {
        throw NotFoundError("audit log file not found - " + platform::path_to_utf8(cmd.log));
    }

    // Проверяются записи как они лежат в файле, без импорта
    std::vector<audit::AuditLogEntry> entries;
    for (const auto& doc : io::read_documents(cmd.log)) {
        audit::AuditLogEntry entry = audit::entry_from_value(doc.data);
        if (entry.context.tenant_id != cmd.tenant) {
            throw ValidationError("line " + std::to_string(doc.record_id.value_or(0)) +
                                  ": entry tenant '" + entry.context.tenant_id +
                                  "' does not match log tenant '" + cmd.tenant + "'");
        }
        entries.push_back(std::move(entry));
    }

    std::optional<audit::AuditLogMetadata> recorded = read_log_metadata(cmd.log);
    if (recorded && recorded->tenant_id != cmd.tenant) {
        throw ValidationError("audit log belongs to tenant '" + recorded->tenant_id + "', not '" +
                              cmd.tenant + "'");
    }

    if (cmd.report) {
        return report_audit_log(cmd, entries, recorded, writer);
    }

    audit::ChainVerificationResult result = audit::verify_exported_log(entries, recorded);

    if (cmd.json) {
        write_json(writer, audit::to_value(result));
    } else if (result.valid) {
        writer.green_line("Chain valid: " + std::to_string(result.entries_verified) +
                          " entries verified");
    } else {
        writer.red_line("Chain invalid at sequence " +
                        std::to_string(result.first_invalid_sequence.value_or(0)) + " (" +
                        result.first_invalid_id.value_or("unknown") +
                        "): " + result.error.value_or("verification failed"));
    }
    return result.valid ? cli::EXIT_OK : cli::EXIT_RUNTIME_ERROR;
}

int run_audit_query(const cli::AuditQueryCommand& cmd, const config::Config& config,
                    output::Writer& writer) {
    auto file = open_existing_log(cmd.log, cmd.tenant, config);

    audit::AuditLogQuery query;
    query.tenant_id = cmd.tenant;
    query.categories = cmd.categories;
    query.action_types = cmd.action_types;
    query.search_text = cmd.search;
    query.high_risk_only = cmd.high_risk_only;
    query.limit = cmd.limit;
    query.include_chain_verification = cmd.verify;

    audit::QueryResult result = file->log().query(query);

    if (cmd.json) {
        write_json(writer, audit::to_value(result));
        return cli::EXIT_OK;
    }

    output::Table table;
    table.set_headers({"Seq", "Timestamp", "Actor", "Action", "Category", "Outcome", "Risk"});
    for (const auto& e : result.entries) {
        table.add_row({std::to_string(e.chain.sequence), e.timestamp,
                       audit::to_string(e.actor.type) + ":" + e.actor.id, e.action.type,
                       audit::to_string(e.action.category), audit::to_string(e.outcome.status),
                       e.high_risk ? "high" : ""});
    }
    if (table.row_count() > 0) {
        table.print(writer);
    }

    writer.info("Found " + std::to_string(result.total) + " matching entries (showing " +
                std::to_string(result.entries.size()) + ")");
    if (result.chain_verification) {
        const auto& chain = *result.chain_verification;
        if (chain.valid) {
            writer.info("Chain verified for " + std::to_string(chain.entries_verified) +
                        " entries");
        } else {
            writer.warn("Chain verification failed at sequence " +
                        std::to_string(chain.first_invalid_sequence.value_or(0)) + ": " +
                        chain.error.value_or(""));
        }
    }
    return cli::EXIT_OK;
}

int run_audit_seal(const cli::AuditSealCommand& cmd, const config::Config& config,
                   output::Writer& writer) {
    auto file = open_existing_log(cmd.log, cmd.tenant, config);

    audit::AuditLogMetadata meta = file->log().seal(cmd.tenant, cmd.reason);
    file->save();

    writer.info("Sealed audit log " + meta.id + " with " + std::to_string(meta.entry_count) +
                " entries at " + meta.sealed_at.value_or(""));
    if (meta.head_hash) {
        writer.write_line(output::Stream::Stdout, "Head hash: " + *meta.head_hash);
    }
    return cli::EXIT_OK;
}

int run_evidence(const cli::EvidenceCommand& cmd, const config::Config& config,
                 output::Writer& writer) {
    auto file = open_existing_log(cmd.log, cmd.tenant, config);

    evidence::InMemoryDecisionTraceStore traces;
    evidence::EvidenceCollector collector(
        config.evidence, [&writer](const std::string& message) { writer.warn(message); });
    collector.add_source(std::make_unique<evidence::AuditLogEvidenceSource>(
        file->log(), config.evidence.default_verify_chain));

    if (cmd.traces) {
        for (const auto& doc : io::read_documents(*cmd.traces)) {
            traces.add(evidence::decision_trace_from_value(doc.data));
        }
        writer.debug("Loaded " + std::to_string(traces.size()) + " decision traces");
        collector.add_source(std::make_unique<evidence::DecisionTraceEvidenceSource>(traces));
    }

    evidence::EvidenceQuery query;
    query.tenant_id = cmd.tenant;
    query.time_range = {cmd.from, cmd.to};
    query.control_id = cmd.control;
    query.control_category = cmd.category;

    evidence::CollectionResult result = collector.collect(query);
    if (cmd.min_relevance) {
        result.evidence = evidence::filter_by_relevance(result.evidence, *cmd.min_relevance);
    }

    if (cmd.json) {
        write_json(writer, evidence::to_value(result));
        return cli::EXIT_OK;
    }

    output::Table table;
    table.set_headers({"Evidence", "Source", "Relevance", "Chain", "Description"});
    for (const auto& item : result.evidence) {
        std::string chain = "-";
        if (item.evidence.chain_verified) {
            chain = *item.evidence.chain_verified ? "verified" : "FAILED";
        }
        table.add_row({item.evidence.id, evidence::to_string(item.source),
                       policy::format_number(item.relevance_score), chain,
                       output::format_field(item.evidence.description, 60)});
    }
    if (table.row_count() > 0) {
        table.print(writer);
    }

    evidence::EvidenceSummary summary = evidence::evidence_summary(result);
    writer.info("Collected " + std::to_string(summary.total) + " evidence items for " +
                cmd.control + " (audit log: " + std::to_string(summary.by_source.audit_log) +
                ", decision traces: " + std::to_string(summary.by_source.decision_trace) + ")");
    if (result.chain_verification.failed > 0) {
        writer.warn("Chain verification failed for " +
                    std::to_string(result.chain_verification.failed) + " evidence items");
    } else {
        writer.info("Chain verification: " + std::to_string(result.chain_verification.verified) +
                    " verified, " + std::to_string(result.chain_verification.skipped) +
                    " skipped");
    }
    return cli::EXIT_OK;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (const auto* help = std::get_if<cli::HelpCommand>(&parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        return cli::EXIT_OK;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return cli::EXIT_OK;
    }

    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);

    // 4. Конфигурация
    config::Config cfg;
    if (parse_result.global.config) {
        auto loaded = config::load(*parse_result.global.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return cli::EXIT_RUNTIME_ERROR;
        }
        cfg = std::move(loaded.config);
        writer.debug("Loaded configuration from " +
                     platform::path_to_utf8(*parse_result.global.config));
    }

    // 5. Dispatch команды
    try {
        return std::visit(
            [&](auto&& cmd) -> int {
                using T = std::decay_t<decltype(cmd)>;

                if constexpr (std::is_same_v<T, cli::LintCommand>) {
                    return run_lint(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::EvaluateCommand>) {
                    return run_evaluate(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::DryRunCommand>) {
                    return run_dry_run(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::AuditAppendCommand>) {
                    return run_audit_append(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::AuditVerifyCommand>) {
                    return run_audit_verify(cmd, writer);
                } else if constexpr (std::is_same_v<T, cli::AuditQueryCommand>) {
                    return run_audit_query(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::AuditSealCommand>) {
                    return run_audit_seal(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::EvidenceCommand>) {
                    return run_evidence(cmd, cfg, writer);
                } else {
                    // Help и Version обработаны выше
                    return cli::EXIT_OK;
                }
            },
            parse_result.command);
    } catch (const ValidationError& e) {
        writer.error(e.what());
        for (const auto& issue : e.issues()) {
            writer.write_line(output::Stream::Stderr, "    " + issue);
        }
        return cli::EXIT_RUNTIME_ERROR;
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
