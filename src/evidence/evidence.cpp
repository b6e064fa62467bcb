// ==============================================================================
// evidence.cpp - Источники доказательств и сборщик
// ==============================================================================

#include "warden/evidence.hpp"

#include "warden/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <set>
#include <stdexcept>

namespace warden::evidence {

// ============================================================================
// Строковые преобразования
// ============================================================================

std::string to_string(EvidenceType type) {
    switch (type) {
    case EvidenceType::AuditLog:
        return "audit_log";
    case EvidenceType::PolicyDocument:
        return "policy_document";
    case EvidenceType::Configuration:
        return "configuration";
    case EvidenceType::TestResult:
        return "test_result";
    case EvidenceType::Report:
        return "report";
    case EvidenceType::Other:
        return "other";
    }
    return "other";
}

std::string to_string(SourceKind kind) {
    switch (kind) {
    case SourceKind::AuditLog:
        return "audit_log";
    case SourceKind::DecisionTrace:
        return "decision_trace";
    case SourceKind::PolicyEvaluation:
        return "policy_evaluation";
    case SourceKind::Document:
        return "document";
    }
    return "audit_log";
}

std::string to_string(TraceResult result) {
    switch (result) {
    case TraceResult::Success:
        return "success";
    case TraceResult::Failure:
        return "failure";
    case TraceResult::Override:
        return "override";
    }
    return "success";
}

TraceResult parse_trace_result(std::string_view s) {
    if (s == "success") {
        return TraceResult::Success;
    }
    if (s == "failure") {
        return TraceResult::Failure;
    }
    if (s == "override") {
        return TraceResult::Override;
    }
    throw std::invalid_argument("unknown trace result, must be: success, failure, or override");
}

// ============================================================================
// Разрешение категорий
// ============================================================================

namespace {

const std::vector<ActionCategory>* lookup(const CategoryMap& map, const std::string& key) {
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// "Logical Access" -> "logical_access"
std::string normalize_category(const std::string& category) {
    std::string out;
    bool in_space = false;
    for (unsigned char c : category) {
        if (std::isspace(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) {
            out.push_back('_');
        }
        in_space = false;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool contains(const std::vector<ActionCategory>& items, ActionCategory c) {
    return std::find(items.begin(), items.end(), c) != items.end();
}

}  // namespace

std::vector<ActionCategory> resolve_action_categories(const EvidenceQuery& query) {
    if (!query.action_categories.empty()) {
        return query.action_categories;
    }

    if (query.control_id) {
        const std::string& id = *query.control_id;
        if (const auto* c = lookup(SOC2_CRITERIA_MAPPINGS, id)) {
            return *c;
        }
        if (const auto* c = lookup(ISO27001_CONTROL_MAPPINGS, id)) {
            return *c;
        }

        // CC6.1 -> CC6, A.9.2 -> A
        const std::string parent = id.substr(0, id.find('.'));
        if (const auto* c = lookup(SOC2_CRITERIA_MAPPINGS, parent)) {
            return *c;
        }
        if (const auto* c = lookup(ISO27001_CONTROL_MAPPINGS, parent)) {
            return *c;
        }
    }

    if (query.control_category) {
        if (const auto* c = lookup(CONTROL_CATEGORY_MAPPINGS, to_lower(*query.control_category))) {
            return *c;
        }
    }

    return DEFAULT_CATEGORIES;
}

std::vector<std::string> resolve_agent_types(const EvidenceQuery& query) {
    const std::string category = query.control_category.value_or("");
    if (category == "change_management") {
        return {"coder", "resolver", "reviewer"};
    }
    if (category == "risk_assessment") {
        return {"triage", "reviewer"};
    }
    return DEFAULT_AGENT_TYPES;
}

// ============================================================================
// Релевантность
// ============================================================================

double audit_relevance(const audit::AuditLogEntry& entry, const EvidenceQuery& query) {
    double score = 0.5;
    const ActionCategory category = entry.action.category;

    if (entry.action.sensitive) {
        score += 0.2;
    }
    if (entry.outcome.status == audit::OutcomeStatus::Failure) {
        score += 0.1;
    }
    if (category == ActionCategory::Policy || category == ActionCategory::Approval) {
        score += 0.15;
    }
    if (category == ActionCategory::Security) {
        score += 0.15;
    }

    if (query.control_id) {
        const auto* soc2 = lookup(SOC2_CRITERIA_MAPPINGS, *query.control_id);
        const auto* iso = lookup(ISO27001_CONTROL_MAPPINGS, *query.control_id);
        if ((soc2 != nullptr && contains(*soc2, category)) ||
            (iso != nullptr && contains(*iso, category))) {
            score += 0.2;
        }
    }

    return std::min(1.0, score);
}

double trace_relevance(const DecisionTrace& trace) {
    double score = 0.6;
    if (trace.decision.confidence > 0.9) {
        score += 0.1;
    }
    if (trace.outcome && trace.outcome->human_override) {
        score += 0.2;
    }
    if (trace.outcome && trace.outcome->result == TraceResult::Failure) {
        score += 0.1;
    }
    return std::min(1.0, score);
}

std::vector<std::string> related_controls(ActionCategory category,
                                          const std::optional<std::string>& control_id) {
    std::vector<std::string> ids;
    if (control_id) {
        ids.push_back(*control_id);
    }
    auto collect = [&](const CategoryMap& map) {
        for (const auto& [id, categories] : map) {
            if (contains(categories, category) &&
                std::find(ids.begin(), ids.end(), id) == ids.end()) {
                ids.push_back(id);
            }
        }
    };
    collect(SOC2_CRITERIA_MAPPINGS);
    collect(ISO27001_CONTROL_MAPPINGS);
    return ids;
}

// ============================================================================
// Трассы решений
// ============================================================================

void InMemoryDecisionTraceStore::add(DecisionTrace trace) {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(trace));
}

std::size_t InMemoryDecisionTraceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_.size();
}

std::vector<DecisionTrace> InMemoryDecisionTraceStore::query(
    const DecisionTraceFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DecisionTrace> out;
    for (const auto& t : traces_) {
        if (filter.limit && out.size() >= *filter.limit) {
            break;
        }
        if (filter.tenant_id && t.tenant_id != *filter.tenant_id) {
            continue;
        }
        if (filter.run_id && t.run_id != *filter.run_id) {
            continue;
        }
        if (filter.agent_type && t.agent_type != *filter.agent_type) {
            continue;
        }
        if (filter.start_time && t.timestamp < *filter.start_time) {
            continue;
        }
        if (filter.end_time && t.timestamp > *filter.end_time) {
            continue;
        }
        out.push_back(t);
    }
    return out;
}

namespace {

/// Чтение полей трассы со сбором нарушений
struct TraceFields {
    std::vector<std::string> issues;

    std::string req_string(const Value& obj, const char* key, const std::string& path) {
        const Value* v = obj.get(key);
        if (v == nullptr || !v->is_string()) {
            issues.push_back(path + key + ": required string");
            return {};
        }
        return v->as_string();
    }

    std::string opt_string(const Value& obj, const char* key, const std::string& path) {
        const Value* v = obj.get(key);
        if (v == nullptr || v->is_null()) {
            return {};
        }
        if (!v->is_string()) {
            issues.push_back(path + key + ": expected a string");
            return {};
        }
        return v->as_string();
    }

    std::vector<std::string> strings(const Value& obj, const char* key, const std::string& path) {
        std::vector<std::string> out;
        const Value* v = obj.get(key);
        if (v == nullptr || v->is_null()) {
            return out;
        }
        const auto* arr = v->get_array();
        if (arr == nullptr) {
            issues.push_back(path + key + ": expected an array of strings");
            return out;
        }
        for (const auto& item : *arr) {
            if (item.is_string()) {
                out.push_back(item.as_string());
            } else {
                issues.push_back(path + key + ": expected an array of strings");
                break;
            }
        }
        return out;
    }
};

}  // namespace

DecisionTrace decision_trace_from_value(const Value& value) {
    if (!value.is_object()) {
        throw ValidationError("decision trace must be an object");
    }

    TraceFields f;
    DecisionTrace t;
    t.id = f.req_string(value, "id", "");
    t.run_id = f.opt_string(value, "runId", "");
    t.agent_type = f.req_string(value, "agentType", "");
    t.tenant_id = f.req_string(value, "tenantId", "");

    const std::string ts = f.req_string(value, "timestamp", "");
    if (!ts.empty()) {
        if (auto tp = datetime::parse_rfc3339(ts)) {
            t.timestamp = *tp;
        } else {
            f.issues.push_back("timestamp: invalid RFC 3339 timestamp '" + ts + "'");
        }
    }

    if (const Value* in = value.get("inputs"); in != nullptr && in->is_object()) {
        t.inputs.prompt = f.opt_string(*in, "prompt", "inputs.");
        t.inputs.context_window = f.strings(*in, "contextWindow", "inputs.");
        if (const Value* c = in->get("complexity"); c != nullptr && c->is_number()) {
            t.inputs.complexity = static_cast<int>(c->to_double());
        }
    }

    const Value* decision = value.get("decision");
    if (decision == nullptr || !decision->is_object()) {
        f.issues.push_back("decision: required object");
    } else {
        t.decision.action = f.req_string(*decision, "action", "decision.");
        t.decision.reasoning = f.opt_string(*decision, "reasoning", "decision.");
        t.decision.alternatives = f.strings(*decision, "alternatives", "decision.");
        const Value* conf = decision->get("confidence");
        if (conf == nullptr || !conf->is_number()) {
            f.issues.push_back("decision.confidence: required number");
        } else {
            t.decision.confidence = conf->to_double();
            if (t.decision.confidence < 0.0 || t.decision.confidence > 1.0) {
                f.issues.push_back("decision.confidence: must be between 0 and 1");
            }
        }
    }

    if (const Value* out = value.get("outcome"); out != nullptr && out->is_object()) {
        DecisionTrace::Outcome outcome;
        try {
            outcome.result = parse_trace_result(f.req_string(*out, "result", "outcome."));
        } catch (const std::invalid_argument& e) {
            f.issues.push_back(std::string("outcome.result: ") + e.what());
        }
        if (const Value* ho = out->get("humanOverride"); ho != nullptr && ho->is_object()) {
            outcome.human_override = HumanOverride{
                f.req_string(*ho, "userId", "outcome.humanOverride."),
                f.opt_string(*ho, "reason", "outcome.humanOverride.")};
        }
        t.outcome = std::move(outcome);
    }

    if (!f.issues.empty()) {
        throw ValidationError("invalid decision trace: " + f.issues.front(), std::move(f.issues));
    }
    return t;
}

// ============================================================================
// Источник: журнал аудита
// ============================================================================

AuditLogEvidenceSource::AuditLogEvidenceSource(const audit::AuditLog& log,
                                               bool verify_chain_by_default,
                                               datetime::Clock clock)
    : log_(log), verify_chain_by_default_(verify_chain_by_default), clock_(std::move(clock)) {}

std::vector<CollectedEvidence> AuditLogEvidenceSource::collect(const EvidenceQuery& query) const {
    const std::size_t limit =
        std::clamp<std::size_t>(query.max_per_source.value_or(audit::DEFAULT_QUERY_LIMIT), 1,
                                audit::MAX_QUERY_LIMIT);

    audit::AuditLogQuery base;
    base.tenant_id = query.tenant_id;
    base.start_time = query.time_range.start;
    base.end_time = query.time_range.end;
    base.high_risk_only = query.high_risk_only;
    base.resource_type = query.resource_type;
    base.actor_type = query.actor_type;
    base.limit = limit;
    base.order = audit::SortOrder::Desc;

    audit::AuditLogQuery by_category = base;
    by_category.categories = resolve_action_categories(query);

    std::vector<audit::AuditLogEntry> entries = log_.query(by_category).entries;

    // Записи, явно помеченные идентификатором контроля
    if (query.control_id) {
        audit::AuditLogQuery by_tag = base;
        by_tag.tags = {*query.control_id};

        std::set<std::string> seen;
        for (const auto& e : entries) {
            seen.insert(e.id);
        }
        for (auto& e : log_.query(by_tag).entries) {
            if (seen.insert(e.id).second) {
                entries.push_back(std::move(e));
            }
        }
    }

    if (entries.empty()) {
        return {};
    }

    std::optional<audit::ChainVerificationResult> verification;
    if (query.verify_chain.value_or(verify_chain_by_default_)) {
        std::uint64_t lo = entries.front().chain.sequence;
        std::uint64_t hi = lo;
        for (const auto& e : entries) {
            lo = std::min(lo, e.chain.sequence);
            hi = std::max(hi, e.chain.sequence);
        }
        verification = log_.verify_chain_integrity(query.tenant_id, lo, hi);
    }

    const std::string now = datetime::format_rfc3339(clock_());
    std::vector<CollectedEvidence> out;
    out.reserve(entries.size());

    for (const auto& entry : entries) {
        CollectedEvidence item;
        item.source = SourceKind::AuditLog;

        EvidenceReference& ref = item.evidence;
        ref.id = "ev-audit-" + entry.id;
        ref.type = EvidenceType::AuditLog;
        ref.description = audit::to_string(entry.action.category) + ":" + entry.action.type +
                          " by " + audit::to_string(entry.actor.type) + ":" + entry.actor.id;
        if (entry.outcome.status != audit::OutcomeStatus::Success) {
            ref.description += " (" + audit::to_string(entry.outcome.status) + ")";
        }
        ref.audit_log_entry_ids = {entry.id};
        ref.chain_verified = verification && verification->valid;
        if (verification && verification->valid) {
            ref.verified_at = now;
        }
        ref.collected_at = now;
        ref.metadata.set("sequence", Value(entry.chain.sequence));
        ref.metadata.set("timestamp", Value(entry.timestamp));

        item.relevance_score = audit_relevance(entry, query);
        item.related_control_ids = related_controls(entry.action.category, query.control_id);
        item.chain_verification = verification;
        out.push_back(std::move(item));
    }
    return out;
}

// ============================================================================
// Источник: трассы решений
// ============================================================================

DecisionTraceEvidenceSource::DecisionTraceEvidenceSource(const DecisionTraceStore& store,
                                                         datetime::Clock clock)
    : store_(store), clock_(std::move(clock)) {}

bool DecisionTraceEvidenceSource::is_available() const {
    try {
        DecisionTraceFilter sample;
        sample.limit = 1;
        store_.query(sample);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

namespace {

std::vector<std::string> trace_controls(const DecisionTrace& trace,
                                        const std::optional<std::string>& control_id) {
    std::vector<std::string> ids;
    if (control_id) {
        ids.push_back(*control_id);
    }
    if (trace.agent_type == "coder" || trace.agent_type == "resolver") {
        ids.insert(ids.end(), {"CC8.1", "CC5.2"});
    } else if (trace.agent_type == "triage") {
        ids.insert(ids.end(), {"CC3.2", "CC3.3"});
    } else if (trace.agent_type == "reviewer") {
        ids.insert(ids.end(), {"CC7.1", "CC7.4"});
    }
    return ids;
}

}  // namespace

std::vector<CollectedEvidence> DecisionTraceEvidenceSource::collect(
    const EvidenceQuery& query) const {
    const std::string now = datetime::format_rfc3339(clock_());
    std::vector<CollectedEvidence> out;

    for (const auto& agent : resolve_agent_types(query)) {
        DecisionTraceFilter filter;
        filter.tenant_id = query.tenant_id;
        filter.agent_type = agent;
        filter.start_time = query.time_range.start;
        filter.end_time = query.time_range.end;
        filter.limit = query.max_per_source.value_or(50);

        for (const auto& trace : store_.query(filter)) {
            CollectedEvidence item;
            item.source = SourceKind::DecisionTrace;

            char confidence[16];
            std::snprintf(confidence, sizeof(confidence), "%.0f",
                          trace.decision.confidence * 100.0);

            EvidenceReference& ref = item.evidence;
            ref.id = "dt-" + trace.id;
            ref.type = EvidenceType::AuditLog;
            ref.description = trace.agent_type + " agent: " + trace.decision.action +
                              " (confidence: " + confidence + "%)";
            const bool overridden = trace.outcome && trace.outcome->human_override;
            if (overridden) {
                ref.description += " [overridden]";
            }
            ref.audit_log_entry_ids = {trace.id};
            ref.chain_verified = false;
            ref.collected_at = now;
            ref.metadata.set("runId", Value(trace.run_id));
            ref.metadata.set("agentType", Value(trace.agent_type));
            ref.metadata.set("reasoning", Value(trace.decision.reasoning));
            ref.metadata.set("confidence", Value(trace.decision.confidence));
            ref.metadata.set("alternatives", Value::make_string_array(trace.decision.alternatives));
            if (trace.outcome) {
                ref.metadata.set("outcome", Value(to_string(trace.outcome->result)));
            }
            if (overridden) {
                Value ho = Value::make_object();
                ho.set("userId", Value(trace.outcome->human_override->user_id));
                ho.set("reason", Value(trace.outcome->human_override->reason));
                ref.metadata.set("humanOverride", std::move(ho));
            }

            item.relevance_score = trace_relevance(trace);
            item.related_control_ids = trace_controls(trace, query.control_id);
            out.push_back(std::move(item));
        }
    }
    return out;
}

// ============================================================================
// EvidenceCollector
// ============================================================================

EvidenceCollector::EvidenceCollector(CollectorConfig config, WarningSink warn,
                                     datetime::Clock clock)
    : config_(config), warn_(std::move(warn)), clock_(std::move(clock)) {}

void EvidenceCollector::add_source(std::unique_ptr<EvidenceSource> source) {
    if (source) {
        sources_.push_back(std::move(source));
    }
}

void EvidenceCollector::warn(const std::string& message) const {
    if (warn_) {
        warn_(message);
    }
}

std::vector<std::string> EvidenceCollector::available_sources() const {
    std::vector<std::string> names;
    for (const auto& source : sources_) {
        try {
            if (source->is_available()) {
                names.push_back(source->name());
            }
        } catch (const std::exception& e) {
            warn("evidence source " + source->name() + " availability check failed: " + e.what());
        }
    }
    return names;
}

CollectionResult EvidenceCollector::collect(const EvidenceQuery& query) const {
    const auto start = std::chrono::steady_clock::now();

    CollectionResult result;
    result.query = query;
    if (!result.query.max_per_source) {
        result.query.max_per_source = config_.default_max_per_source;
    }
    if (!result.query.verify_chain) {
        result.query.verify_chain = config_.default_verify_chain;
    }

    for (const auto& source : sources_) {
        try {
            if (!source->is_available()) {
                warn("evidence source " + source->name() + " is not available");
                continue;
            }
            auto items = source->collect(result.query);
            result.evidence.insert(result.evidence.end(), std::make_move_iterator(items.begin()),
                                   std::make_move_iterator(items.end()));
        } catch (const std::exception& e) {
            warn("failed to collect evidence from " + source->name() + ": " + e.what());
        }
    }

    std::stable_sort(result.evidence.begin(), result.evidence.end(),
                     [](const CollectedEvidence& a, const CollectedEvidence& b) {
                         return a.relevance_score > b.relevance_score;
                     });

    for (const auto& e : result.evidence) {
        switch (e.source) {
        case SourceKind::AuditLog:
            ++result.by_source.audit_log;
            break;
        case SourceKind::DecisionTrace:
            ++result.by_source.decision_trace;
            break;
        case SourceKind::PolicyEvaluation:
            ++result.by_source.policy_evaluation;
            break;
        case SourceKind::Document:
            ++result.by_source.document;
            break;
        }

        for (const auto& id : e.related_control_ids) {
            ++result.by_control[id];
        }

        if (!e.chain_verification) {
            ++result.chain_verification.skipped;
        } else if (e.chain_verification->valid) {
            ++result.chain_verification.verified;
        } else {
            ++result.chain_verification.failed;
        }
    }

    result.metadata.collected_at = datetime::format_rfc3339(clock_());
    result.metadata.duration_ms = datetime::elapsed_ms(start);
    result.metadata.tenant_id = query.tenant_id;
    result.metadata.time_range = query.time_range;
    return result;
}

std::vector<CollectedEvidence> EvidenceCollector::collect_for_control(
    const std::string& tenant_id, const ControlDefinition& control, const TimeRange& range) const {
    EvidenceQuery query;
    query.tenant_id = tenant_id;
    query.time_range = range;
    query.control_id = control.control_id;
    if (!control.category.empty()) {
        query.control_category = normalize_category(control.category);
    }

    std::vector<CollectedEvidence> out;
    for (auto& e : collect(query).evidence) {
        const auto& ids = e.related_control_ids;
        if (std::find(ids.begin(), ids.end(), control.control_id) != ids.end()) {
            out.push_back(std::move(e));
        }
    }
    return out;
}

std::map<std::string, std::vector<CollectedEvidence>> EvidenceCollector::collect_for_controls(
    const std::string& tenant_id, const std::vector<ControlDefinition>& controls,
    const TimeRange& range) const {
    EvidenceQuery query;
    query.tenant_id = tenant_id;
    query.time_range = range;

    const CollectionResult result = collect(query);

    std::map<std::string, std::vector<CollectedEvidence>> grouped;
    for (const auto& control : controls) {
        auto& bucket = grouped[control.control_id];
        for (const auto& e : result.evidence) {
            const auto& ids = e.related_control_ids;
            if (std::find(ids.begin(), ids.end(), control.control_id) != ids.end()) {
                bucket.push_back(e);
            }
        }
    }
    return grouped;
}

// ============================================================================
// Помощники
// ============================================================================

ControlDefinition link_evidence_to_control(const ControlDefinition& control,
                                           const std::vector<CollectedEvidence>& evidence) {
    ControlDefinition linked = control;
    std::set<std::string> ids;
    for (const auto& ref : control.evidence) {
        ids.insert(ref.id);
    }
    for (const auto& e : evidence) {
        if (ids.insert(e.evidence.id).second) {
            linked.evidence.push_back(e.evidence);
        }
    }
    return linked;
}

EvidenceSummary evidence_summary(const CollectionResult& result) {
    EvidenceSummary summary;
    summary.total = result.evidence.size();
    summary.by_source = result.by_source;
    summary.by_control = result.by_control;

    if (summary.total > 0) {
        double sum = 0.0;
        for (const auto& e : result.evidence) {
            sum += e.relevance_score;
        }
        summary.average_relevance = sum / static_cast<double>(summary.total);
    }

    const std::size_t verifiable =
        result.chain_verification.verified + result.chain_verification.failed;
    summary.chain_verification_rate =
        verifiable > 0 ? static_cast<double>(result.chain_verification.verified) /
                             static_cast<double>(verifiable)
                       : 1.0;
    return summary;
}

std::vector<CollectedEvidence> filter_by_relevance(const std::vector<CollectedEvidence>& evidence,
                                                   double min_score) {
    std::vector<CollectedEvidence> out;
    std::copy_if(evidence.begin(), evidence.end(), std::back_inserter(out),
                 [&](const CollectedEvidence& e) { return e.relevance_score >= min_score; });
    return out;
}

std::vector<CollectedEvidence> top_evidence(const std::vector<CollectedEvidence>& evidence,
                                            std::size_t count) {
    std::vector<CollectedEvidence> sorted = evidence;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CollectedEvidence& a, const CollectedEvidence& b) {
                         return a.relevance_score > b.relevance_score;
                     });
    if (sorted.size() > count) {
        sorted.resize(count);
    }
    return sorted;
}

// ============================================================================
// Сериализация
// ============================================================================

namespace {

Value counts_value(const SourceCounts& c) {
    Value v = Value::make_object();
    v.set("auditLog", Value(static_cast<std::uint64_t>(c.audit_log)));
    v.set("decisionTrace", Value(static_cast<std::uint64_t>(c.decision_trace)));
    v.set("policyEvaluation", Value(static_cast<std::uint64_t>(c.policy_evaluation)));
    v.set("document", Value(static_cast<std::uint64_t>(c.document)));
    return v;
}

Value control_counts_value(const std::map<std::string, std::size_t>& counts) {
    Value v = Value::make_object();
    for (const auto& [id, n] : counts) {
        v.set(id, Value(static_cast<std::uint64_t>(n)));
    }
    return v;
}

/// Оценки округляются до 4 знаков для стабильного вывода
double round_score(double score) {
    return std::round(score * 10000.0) / 10000.0;
}

}  // namespace

Value to_value(const EvidenceReference& ref) {
    Value v = Value::make_object();
    v.set("id", Value(ref.id));
    v.set("type", Value(to_string(ref.type)));
    v.set("description", Value(ref.description));
    v.set("auditLogEntryIds", Value::make_string_array(ref.audit_log_entry_ids));
    if (ref.chain_verified) {
        v.set("chainVerified", Value(*ref.chain_verified));
    }
    if (ref.verified_at) {
        v.set("verifiedAt", Value(*ref.verified_at));
    }
    v.set("collectedAt", Value(ref.collected_at));
    v.set("collectedBy", Value(ref.collected_by));
    v.set("metadata", ref.metadata);
    return v;
}

Value to_value(const CollectedEvidence& item) {
    Value v = Value::make_object();
    v.set("evidence", to_value(item.evidence));
    v.set("source", Value(to_string(item.source)));
    v.set("relevanceScore", Value(round_score(item.relevance_score)));
    v.set("relatedControlIds", Value::make_string_array(item.related_control_ids));
    if (item.chain_verification) {
        v.set("chainVerification", audit::to_value(*item.chain_verification));
    }
    return v;
}

Value to_value(const CollectionResult& result) {
    Value v = Value::make_object();

    Value evidence = Value::make_array();
    for (const auto& e : result.evidence) {
        evidence.push_back(to_value(e));
    }
    v.set("evidence", std::move(evidence));
    v.set("bySource", counts_value(result.by_source));
    v.set("byControl", control_counts_value(result.by_control));

    Value chain = Value::make_object();
    chain.set("verified", Value(static_cast<std::uint64_t>(result.chain_verification.verified)));
    chain.set("failed", Value(static_cast<std::uint64_t>(result.chain_verification.failed)));
    chain.set("skipped", Value(static_cast<std::uint64_t>(result.chain_verification.skipped)));
    v.set("chainVerification", std::move(chain));

    Value meta = Value::make_object();
    meta.set("collectedAt", Value(result.metadata.collected_at));
    meta.set("durationMs", Value(result.metadata.duration_ms));
    meta.set("tenantId", Value(result.metadata.tenant_id));
    Value range = Value::make_object();
    range.set("startDate", Value(datetime::format_rfc3339(result.metadata.time_range.start)));
    range.set("endDate", Value(datetime::format_rfc3339(result.metadata.time_range.end)));
    meta.set("timeRange", std::move(range));
    v.set("metadata", std::move(meta));
    return v;
}

Value to_value(const EvidenceSummary& summary) {
    Value v = Value::make_object();
    v.set("totalEvidence", Value(static_cast<std::uint64_t>(summary.total)));
    v.set("bySource", counts_value(summary.by_source));
    v.set("byControl", control_counts_value(summary.by_control));
    v.set("averageRelevance", Value(round_score(summary.average_relevance)));
    v.set("chainVerificationRate", Value(round_score(summary.chain_verification_rate)));
    return v;
}

}  // namespace warden::evidence
