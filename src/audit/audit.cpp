// ==============================================================================
// audit.cpp - Схема записей журнала аудита
// ==============================================================================

#include "warden/audit.hpp"

#include "warden/errors.hpp"
#include "warden/platform.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace warden::audit {

// ============================================================================
// Строковые преобразования
// ============================================================================

namespace {

constexpr const char* HASH_ALGORITHM_NAMES[] = {"sha256", "sha384", "sha512"};
constexpr const char* ACTOR_TYPE_NAMES[] = {"user",    "agent",     "service", "system",
                                            "webhook", "scheduler", "api_key"};
constexpr const char* ACTION_CATEGORY_NAMES[] = {"policy",   "auth",   "data",  "git",
                                                 "agent",    "approval", "config", "admin",
                                                 "security", "billing"};
constexpr const char* RESOURCE_TYPE_NAMES[] = {
    "policy", "policy_rule", "repository", "branch", "pull_request",
    "commit", "run",         "approval",   "tenant", "user",
    "agent",  "secret",      "api_key",    "config", "artifact"};
constexpr const char* OUTCOME_STATUS_NAMES[] = {"success", "failure", "denied", "blocked",
                                                "pending", "partial", "skipped"};
constexpr const char* COMPLIANCE_NAMES[] = {"soc2", "gdpr",     "hipaa",
                                            "pci",  "iso27001", "fedramp"};
constexpr const char* ENVIRONMENT_NAMES[] = {"production", "staging", "development"};
constexpr const char* LOG_SCOPE_NAMES[] = {"tenant", "org", "repo"};

/// Разбор по таблице имён; порядок таблицы совпадает с порядком enum
template <typename E, std::size_t N>
E parse_enum(std::string_view s, const char* const (&names)[N], const char* what) {
    for (std::size_t i = 0; i < N; ++i) {
        if (s == names[i]) {
            return static_cast<E>(i);
        }
    }
    std::string message = std::string("unknown ") + what + ", must be: ";
    for (std::size_t i = 0; i < N; ++i) {
        if (i > 0) {
            message += (i + 1 == N) ? ", or " : ", ";
        }
        message += names[i];
    }
    throw std::invalid_argument(message);
}

template <typename E, std::size_t N>
std::string enum_name(E value, const char* const (&names)[N]) {
    auto index = static_cast<std::size_t>(value);
    return index < N ? names[index] : names[0];
}

}  // namespace

HashAlgorithm parse_hash_algorithm(std::string_view s) {
    return parse_enum<HashAlgorithm>(s, HASH_ALGORITHM_NAMES, "hash algorithm");
}
ActorType parse_actor_type(std::string_view s) {
    return parse_enum<ActorType>(s, ACTOR_TYPE_NAMES, "actor type");
}
ActionCategory parse_action_category(std::string_view s) {
    return parse_enum<ActionCategory>(s, ACTION_CATEGORY_NAMES, "action category");
}
ResourceType parse_resource_type(std::string_view s) {
    return parse_enum<ResourceType>(s, RESOURCE_TYPE_NAMES, "resource type");
}
OutcomeStatus parse_outcome_status(std::string_view s) {
    return parse_enum<OutcomeStatus>(s, OUTCOME_STATUS_NAMES, "outcome status");
}
ComplianceFramework parse_compliance_framework(std::string_view s) {
    return parse_enum<ComplianceFramework>(s, COMPLIANCE_NAMES, "compliance framework");
}
Environment parse_environment(std::string_view s) {
    return parse_enum<Environment>(s, ENVIRONMENT_NAMES, "environment");
}
LogScope parse_log_scope(std::string_view s) {
    return parse_enum<LogScope>(s, LOG_SCOPE_NAMES, "log scope");
}

std::string to_string(HashAlgorithm a) { return enum_name(a, HASH_ALGORITHM_NAMES); }
std::string to_string(ActorType t) { return enum_name(t, ACTOR_TYPE_NAMES); }
std::string to_string(ActionCategory c) { return enum_name(c, ACTION_CATEGORY_NAMES); }
std::string to_string(ResourceType t) { return enum_name(t, RESOURCE_TYPE_NAMES); }
std::string to_string(OutcomeStatus s) { return enum_name(s, OUTCOME_STATUS_NAMES); }
std::string to_string(ComplianceFramework f) { return enum_name(f, COMPLIANCE_NAMES); }
std::string to_string(Environment e) { return enum_name(e, ENVIRONMENT_NAMES); }
std::string to_string(LogScope s) { return enum_name(s, LOG_SCOPE_NAMES); }

// ============================================================================
// Высокий риск
// ============================================================================

const std::vector<std::string> HIGH_RISK_ACTIONS = {
    "git.push.force",       "git.branch.delete",      "git.push.main",
    "policy.rule.delete",   "policy.document.delete", "secret.access",
    "secret.delete",        "secret.rotate",          "data.export",
    "data.delete.bulk",     "admin.user.delete",      "admin.role.revoke",
    "approval.bypass",      "config.security.update", "agent.execute.destructive",
};

const std::vector<std::string> CONTEXT_HASH_FIELDS = {"tenantId", "orgId", "repoId", "runId",
                                                      "traceId"};

bool is_high_risk_action(std::string_view action_type) {
    for (const auto& pattern : HIGH_RISK_ACTIONS) {
        if (action_type == pattern) {
            return true;
        }
        if (action_type.size() > pattern.size() &&
            action_type.compare(0, pattern.size(), pattern) == 0 &&
            action_type[pattern.size()] == '.') {
            return true;
        }
    }
    return false;
}

void mark_high_risk(CreateEntryInput& input) {
    if (input.action.sensitive || is_high_risk_action(input.action.type)) {
        input.high_risk = true;
    }
}

// ============================================================================
// Идентификаторы
// ============================================================================

std::string generate_entry_id(std::uint64_t sequence, datetime::TimePoint at) {
    return "alog-" + std::to_string(datetime::unix_millis(at)) + "-" + std::to_string(sequence) +
           "-" + platform::random_string(6);
}

std::string generate_log_id(const std::string& tenant_id, LogScope scope) {
    std::string tenant = tenant_id;
    std::transform(tenant.begin(), tenant.end(), tenant.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "log-" + tenant + "-" + to_string(scope) + "-" + platform::random_string(8);
}

// ============================================================================
// Сериализация в Value
// ============================================================================

namespace {

void set_opt(Value& v, const char* key, const std::optional<std::string>& s) {
    if (s) {
        v.set(key, Value(*s));
    }
}

Value actor_value(const AuditActor& a) {
    Value v = Value::make_object();
    v.set("type", Value(to_string(a.type)));
    v.set("id", Value(a.id));
    set_opt(v, "displayName", a.display_name);
    set_opt(v, "email", a.email);
    set_opt(v, "agentType", a.agent_type);
    set_opt(v, "ip", a.ip);
    set_opt(v, "userAgent", a.user_agent);
    return v;
}

Value action_value(const AuditAction& a) {
    Value v = Value::make_object();
    v.set("category", Value(to_string(a.category)));
    v.set("type", Value(a.type));
    set_opt(v, "description", a.description);
    v.set("sensitive", Value(a.sensitive));
    return v;
}

Value resource_value(const AuditResource& r) {
    Value v = Value::make_object();
    v.set("type", Value(to_string(r.type)));
    v.set("id", Value(r.id));
    set_opt(v, "name", r.name);
    if (r.parent) {
        Value p = Value::make_object();
        p.set("type", Value(to_string(r.parent->type)));
        p.set("id", Value(r.parent->id));
        v.set("parent", std::move(p));
    }
    if (r.attributes) {
        v.set("attributes", *r.attributes);
    }
    return v;
}

Value outcome_value(const AuditOutcome& o) {
    Value v = Value::make_object();
    v.set("status", Value(to_string(o.status)));
    set_opt(v, "errorCode", o.error_code);
    set_opt(v, "errorMessage", o.error_message);
    if (o.duration_ms) {
        v.set("durationMs", Value::make_int(*o.duration_ms));
    }
    if (o.data) {
        v.set("data", *o.data);
    }
    return v;
}

Value compliance_value(const std::vector<ComplianceFramework>& items) {
    Value arr = Value::make_array();
    for (auto f : items) {
        arr.push_back(Value(to_string(f)));
    }
    return arr;
}

}  // namespace

Value to_value(const AuditContext& c) {
    Value v = Value::make_object();
    v.set("tenantId", Value(c.tenant_id));
    set_opt(v, "orgId", c.org_id);
    set_opt(v, "repoId", c.repo_id);
    set_opt(v, "traceId", c.trace_id);
    set_opt(v, "spanId", c.span_id);
    set_opt(v, "requestId", c.request_id);
    set_opt(v, "runId", c.run_id);
    set_opt(v, "candidateId", c.candidate_id);
    set_opt(v, "sessionId", c.session_id);
    set_opt(v, "causationId", c.causation_id);
    if (c.environment) {
        v.set("environment", Value(to_string(*c.environment)));
    }
    set_opt(v, "service", c.service);
    return v;
}

Value content_value(const AuditLogEntry& entry) {
    Value v = Value::make_object();
    v.set("id", Value(entry.id));
    v.set("schemaVersion", Value(entry.schema_version));
    v.set("timestamp", Value(entry.timestamp));
    v.set("actor", actor_value(entry.actor));
    v.set("action", action_value(entry.action));
    if (entry.resource) {
        v.set("resource", resource_value(*entry.resource));
    }
    v.set("outcome", outcome_value(entry.outcome));
    v.set("context", to_value(entry.context));
    v.set("tags", Value::make_string_array(entry.tags));
    v.set("highRisk", Value(entry.high_risk));
    v.set("compliance", compliance_value(entry.compliance));
    v.set("details", entry.details);
    return v;
}

Value to_value(const AuditLogEntry& entry) {
    Value v = content_value(entry);
    set_opt(v, "receivedAt", entry.received_at);

    Value chain = Value::make_object();
    chain.set("sequence", Value::make_uint(entry.chain.sequence));
    chain.set("prevHash", entry.chain.prev_hash ? Value(*entry.chain.prev_hash) : Value());
    chain.set("contentHash", Value(entry.chain.content_hash));
    chain.set("algorithm", Value(to_string(entry.chain.algorithm)));
    chain.set("computedAt", Value(entry.chain.computed_at));
    v.set("chain", std::move(chain));

    if (entry.context_hash) {
        Value ch = Value::make_object();
        ch.set("algorithm", Value(to_string(entry.context_hash->algorithm)));
        ch.set("value", Value(entry.context_hash->value));
        ch.set("fields", Value::make_string_array(entry.context_hash->fields));
        v.set("contextHash", std::move(ch));
    }
    return v;
}

// ============================================================================
// Разбор из Value
// ============================================================================

namespace {

/// Чтение полей объекта со сбором нарушений
class Fields {
public:
    std::vector<std::string> issues;

    const Value* object(const Value& parent, const char* key, const std::string& path,
                        bool required) {
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            if (required) {
                issues.push_back(path + key + ": required");
            }
            return nullptr;
        }
        if (!v->is_object()) {
            issues.push_back(path + key + ": expected an object");
            return nullptr;
        }
        return v;
    }

    std::optional<std::string> opt_string(const Value& parent, const char* key,
                                          const std::string& path) {
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            return std::nullopt;
        }
        if (!v->is_string()) {
            issues.push_back(path + key + ": expected a string");
            return std::nullopt;
        }
        return v->as_string();
    }

    std::string req_string(const Value& parent, const char* key, const std::string& path) {
        auto s = opt_string(parent, key, path);
        if (!s || s->empty()) {
            const Value* v = parent.get(key);
            if (v == nullptr || v->is_null() || (v->is_string() && v->as_string().empty())) {
                issues.push_back(path + key + ": required");
            }
            return {};
        }
        return *s;
    }

    bool opt_bool(const Value& parent, const char* key, const std::string& path, bool fallback) {
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            return fallback;
        }
        if (!v->is_bool()) {
            issues.push_back(path + key + ": expected a boolean");
            return fallback;
        }
        return v->as_bool();
    }

    std::vector<std::string> strings(const Value& parent, const char* key,
                                     const std::string& path) {
        std::vector<std::string> out;
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            return out;
        }
        if (!v->is_array()) {
            issues.push_back(path + key + ": expected a list");
            return out;
        }
        for (const auto& item : v->as_array()) {
            if (item.is_string()) {
                out.push_back(item.as_string());
            } else {
                issues.push_back(path + key + ": expected a list of strings");
            }
        }
        return out;
    }

    template <typename E, typename ParseFn>
    std::optional<E> opt_enum(const Value& parent, const char* key, const std::string& path,
                              ParseFn parse) {
        auto s = opt_string(parent, key, path);
        if (!s) {
            return std::nullopt;
        }
        try {
            return parse(*s);
        } catch (const std::invalid_argument& e) {
            issues.push_back(path + key + ": " + e.what());
            return std::nullopt;
        }
    }

    template <typename E, typename ParseFn>
    E req_enum(const Value& parent, const char* key, const std::string& path, ParseFn parse,
               E fallback) {
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            issues.push_back(path + key + ": required");
            return fallback;
        }
        return opt_enum<E>(parent, key, path, parse).value_or(fallback);
    }

    std::optional<Value> opt_object(const Value& parent, const char* key,
                                    const std::string& path) {
        if (const Value* v = object(parent, key, path, false)) {
            return *v;
        }
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Части записи
    // -------------------------------------------------------------------------

    AuditActor actor(const Value& root) {
        AuditActor a;
        const Value* v = object(root, "actor", "", true);
        if (v == nullptr) {
            return a;
        }
        a.type = req_enum(*v, "type", "actor.", parse_actor_type, ActorType::User);
        a.id = req_string(*v, "id", "actor.");
        a.display_name = opt_string(*v, "displayName", "actor.");
        a.email = opt_string(*v, "email", "actor.");
        a.agent_type = opt_string(*v, "agentType", "actor.");
        a.ip = opt_string(*v, "ip", "actor.");
        a.user_agent = opt_string(*v, "userAgent", "actor.");
        return a;
    }

    AuditAction action(const Value& root) {
        AuditAction a;
        const Value* v = object(root, "action", "", true);
        if (v == nullptr) {
            return a;
        }
        a.category =
            req_enum(*v, "category", "action.", parse_action_category, ActionCategory::Policy);
        a.type = req_string(*v, "type", "action.");
        a.description = opt_string(*v, "description", "action.");
        a.sensitive = opt_bool(*v, "sensitive", "action.", false);
        return a;
    }

    std::optional<AuditResource> resource(const Value& root) {
        const Value* v = object(root, "resource", "", false);
        if (v == nullptr) {
            return std::nullopt;
        }
        AuditResource r;
        r.type = req_enum(*v, "type", "resource.", parse_resource_type, ResourceType::Repository);
        r.id = req_string(*v, "id", "resource.");
        r.name = opt_string(*v, "name", "resource.");
        if (const Value* p = object(*v, "parent", "resource.", false)) {
            ResourceParent parent;
            parent.type = req_enum(*p, "type", "resource.parent.", parse_resource_type,
                                   ResourceType::Repository);
            parent.id = req_string(*p, "id", "resource.parent.");
            r.parent = std::move(parent);
        }
        r.attributes = opt_object(*v, "attributes", "resource.");
        return r;
    }

    AuditOutcome outcome(const Value& root) {
        AuditOutcome o;
        const Value* v = object(root, "outcome", "", true);
        if (v == nullptr) {
            return o;
        }
        o.status = req_enum(*v, "status", "outcome.", parse_outcome_status, OutcomeStatus::Success);
        o.error_code = opt_string(*v, "errorCode", "outcome.");
        o.error_message = opt_string(*v, "errorMessage", "outcome.");
        if (const Value* d = v->get("durationMs")) {
            if (d->is_int() && d->as_int() >= 0) {
                o.duration_ms = d->as_int();
            } else if (d->is_uint()) {
                o.duration_ms = static_cast<std::int64_t>(d->as_uint());
            } else if (!d->is_null()) {
                issues.push_back("outcome.durationMs: expected a non-negative integer");
            }
        }
        o.data = opt_object(*v, "data", "outcome.");
        return o;
    }

    AuditContext context(const Value& root) {
        AuditContext c;
        const Value* v = object(root, "context", "", true);
        if (v == nullptr) {
            return c;
        }
        c.tenant_id = req_string(*v, "tenantId", "context.");
        c.org_id = opt_string(*v, "orgId", "context.");
        c.repo_id = opt_string(*v, "repoId", "context.");
        c.trace_id = opt_string(*v, "traceId", "context.");
        c.span_id = opt_string(*v, "spanId", "context.");
        c.request_id = opt_string(*v, "requestId", "context.");
        c.run_id = opt_string(*v, "runId", "context.");
        c.candidate_id = opt_string(*v, "candidateId", "context.");
        c.session_id = opt_string(*v, "sessionId", "context.");
        c.causation_id = opt_string(*v, "causationId", "context.");
        c.environment = opt_enum<Environment>(*v, "environment", "context.", parse_environment);
        c.service = opt_string(*v, "service", "context.");
        return c;
    }

    std::vector<ComplianceFramework> compliance(const Value& root) {
        std::vector<ComplianceFramework> out;
        for (const auto& name : strings(root, "compliance", "")) {
            try {
                out.push_back(parse_compliance_framework(name));
            } catch (const std::invalid_argument& e) {
                issues.push_back(std::string("compliance: ") + e.what());
            }
        }
        return out;
    }

    Value details(const Value& root) {
        return opt_object(root, "details", "").value_or(Value::make_object());
    }
};

void throw_if_issues(Fields& f, const char* what) {
    if (!f.issues.empty()) {
        throw ValidationError(std::string("invalid ") + what + ": " + f.issues.front(),
                              std::move(f.issues));
    }
}

}  // namespace

AuditLogEntry entry_from_value(const Value& value) {
    if (!value.is_object()) {
        throw ValidationError("audit log entry must be an object");
    }

    Fields f;
    AuditLogEntry e;
    e.id = f.req_string(value, "id", "");
    e.schema_version = f.opt_string(value, "schemaVersion", "").value_or(CURRENT_SCHEMA_VERSION);
    e.timestamp = f.req_string(value, "timestamp", "");
    e.received_at = f.opt_string(value, "receivedAt", "");
    e.actor = f.actor(value);
    e.action = f.action(value);
    e.resource = f.resource(value);
    e.outcome = f.outcome(value);
    e.context = f.context(value);
    e.tags = f.strings(value, "tags", "");
    e.high_risk = f.opt_bool(value, "highRisk", "", false);
    e.compliance = f.compliance(value);
    e.details = f.details(value);

    if (const Value* chain = f.object(value, "chain", "", true)) {
        const Value* seq = chain->get("sequence");
        if (seq != nullptr && seq->is_uint()) {
            e.chain.sequence = seq->as_uint();
        } else if (seq != nullptr && seq->is_int() && seq->as_int() >= 0) {
            e.chain.sequence = static_cast<std::uint64_t>(seq->as_int());
        } else {
            f.issues.push_back("chain.sequence: expected a non-negative integer");
        }
        e.chain.prev_hash = f.opt_string(*chain, "prevHash", "chain.");
        e.chain.content_hash = f.req_string(*chain, "contentHash", "chain.");
        e.chain.algorithm = f.opt_enum<HashAlgorithm>(*chain, "algorithm", "chain.",
                                                      parse_hash_algorithm)
                                .value_or(HashAlgorithm::Sha256);
        e.chain.computed_at = f.opt_string(*chain, "computedAt", "chain.").value_or("");
    }

    if (const Value* ch = f.object(value, "contextHash", "", false)) {
        ContextHash hash;
        hash.algorithm =
            f.opt_enum<HashAlgorithm>(*ch, "algorithm", "contextHash.", parse_hash_algorithm)
                .value_or(HashAlgorithm::Sha256);
        hash.value = f.req_string(*ch, "value", "contextHash.");
        hash.fields = f.strings(*ch, "fields", "contextHash.");
        e.context_hash = std::move(hash);
    }

    throw_if_issues(f, "audit log entry");
    return e;
}

CreateEntryInput input_from_value(const Value& value) {
    if (!value.is_object()) {
        throw ValidationError("audit log entry input must be an object");
    }

    Fields f;
    CreateEntryInput in;
    if (auto ts = f.opt_string(value, "timestamp", "")) {
        in.timestamp = datetime::parse_rfc3339(*ts);
        if (!in.timestamp) {
            f.issues.push_back("timestamp: invalid RFC 3339 timestamp '" + *ts + "'");
        }
    }
    in.actor = f.actor(value);
    in.action = f.action(value);
    in.resource = f.resource(value);
    in.outcome = f.outcome(value);
    in.context = f.context(value);
    in.tags = f.strings(value, "tags", "");
    in.high_risk = f.opt_bool(value, "highRisk", "", false);
    in.compliance = f.compliance(value);
    in.details = f.details(value);

    throw_if_issues(f, "audit log entry input");
    return in;
}

std::vector<std::string> validate_input(const CreateEntryInput& input) {
    static const std::regex action_type("^[a-z]+(\\.[a-z_]+)+$");

    std::vector<std::string> issues;
    if (input.actor.id.empty() || input.actor.id.size() > 200) {
        issues.push_back("actor.id: must be between 1 and 200 characters");
    }
    if (input.action.type.size() > 100 || !std::regex_match(input.action.type, action_type)) {
        issues.push_back("action.type: must be dot-separated lowercase (e.g. policy.rule.evaluated)");
    }
    if (input.context.tenant_id.empty() || input.context.tenant_id.size() > 100) {
        issues.push_back("context.tenantId: must be between 1 and 100 characters");
    }
    if (input.resource && input.resource->id.empty()) {
        issues.push_back("resource.id: must not be empty");
    }
    if (input.tags.size() > MAX_TAGS) {
        issues.push_back("tags: at most " + std::to_string(MAX_TAGS) + " tags are allowed");
    }
    for (const auto& tag : input.tags) {
        if (tag.size() > 100) {
            issues.push_back("tags: tag longer than 100 characters");
            break;
        }
    }
    if (input.outcome.duration_ms && *input.outcome.duration_ms < 0) {
        issues.push_back("outcome.durationMs: must be non-negative");
    }
    if (!input.details.is_object()) {
        issues.push_back("details: expected an object");
    }
    return issues;
}

}  // namespace warden::audit
