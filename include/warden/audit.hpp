// ==============================================================================
// warden/audit.hpp - Схема записей журнала аудита
// ==============================================================================
//
// Назначение:
// - Типы неизменяемой записи AuditLogEntry (кто, что, над чем, результат,
//   контекст, звено цепочки)
// - Вход для создания записи (CreateEntryInput) и его валидация
// - Сериализация в Value / разбор из Value (camelCase ключи, JSONL формат)
// - Классификация действий высокого риска
//
// ==============================================================================

#ifndef WARDEN_AUDIT_HPP
#define WARDEN_AUDIT_HPP

#include <warden/datetime.hpp>
#include <warden/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::audit {

// ============================================================================
// Enums
// ============================================================================

enum class HashAlgorithm { Sha256, Sha384, Sha512 };

enum class ActorType { User, Agent, Service, System, Webhook, Scheduler, ApiKey };

enum class ActionCategory {
    Policy,
    Auth,
    Data,
    Git,
    Agent,
    Approval,
    Config,
    Admin,
    Security,
    Billing
};

enum class ResourceType {
    Policy,
    PolicyRule,
    Repository,
    Branch,
    PullRequest,
    Commit,
    Run,
    Approval,
    Tenant,
    User,
    Agent,
    Secret,
    ApiKey,
    Config,
    Artifact
};

enum class OutcomeStatus { Success, Failure, Denied, Blocked, Pending, Partial, Skipped };

enum class ComplianceFramework { Soc2, Gdpr, Hipaa, Pci, Iso27001, Fedramp };

enum class Environment { Production, Staging, Development };

/// Область журнала
enum class LogScope { Tenant, Org, Repo };

// ============================================================================
// Части записи
// ============================================================================

struct AuditActor {
    ActorType type = ActorType::User;
    std::string id;
    std::optional<std::string> display_name;
    std::optional<std::string> email;
    std::optional<std::string> agent_type;
    std::optional<std::string> ip;
    std::optional<std::string> user_agent;
};

struct AuditAction {
    ActionCategory category = ActionCategory::Policy;
    std::string type;  // "policy.rule.evaluated"
    std::optional<std::string> description;
    bool sensitive = false;
};

struct ResourceParent {
    ResourceType type = ResourceType::Repository;
    std::string id;
};

struct AuditResource {
    ResourceType type = ResourceType::Repository;
    std::string id;
    std::optional<std::string> name;
    std::optional<ResourceParent> parent;
    std::optional<Value> attributes;
};

struct AuditOutcome {
    OutcomeStatus status = OutcomeStatus::Success;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
    std::optional<std::int64_t> duration_ms;
    std::optional<Value> data;
};

struct AuditContext {
    std::string tenant_id;
    std::optional<std::string> org_id;
    std::optional<std::string> repo_id;
    std::optional<std::string> trace_id;
    std::optional<std::string> span_id;
    std::optional<std::string> request_id;
    std::optional<std::string> run_id;
    std::optional<std::string> candidate_id;
    std::optional<std::string> session_id;
    std::optional<std::string> causation_id;
    std::optional<Environment> environment;
    std::optional<std::string> service;
};

/// Звено цепочки; prev_hash пуст только у записи с sequence 0
struct ChainLink {
    std::uint64_t sequence = 0;
    std::optional<std::string> prev_hash;
    std::string content_hash;
    HashAlgorithm algorithm = HashAlgorithm::Sha256;
    std::string computed_at;
};

struct ContextHash {
    HashAlgorithm algorithm = HashAlgorithm::Sha256;
    std::string value;
    std::vector<std::string> fields;
};

// ============================================================================
// Запись
// ============================================================================

constexpr const char* CURRENT_SCHEMA_VERSION = "1.0";
constexpr std::size_t MAX_TAGS = 50;

struct AuditLogEntry {
    std::string id;
    std::string schema_version = CURRENT_SCHEMA_VERSION;
    std::string timestamp;  // RFC 3339, UTC, миллисекунды
    std::optional<std::string> received_at;
    AuditActor actor;
    AuditAction action;
    std::optional<AuditResource> resource;
    AuditOutcome outcome;
    AuditContext context;
    ChainLink chain;
    std::optional<ContextHash> context_hash;
    std::vector<std::string> tags;
    bool high_risk = false;
    std::vector<ComplianceFramework> compliance;
    Value details = Value::make_object();
};

/// Вход для создания записи: без id, chain и contextHash
struct CreateEntryInput {
    std::optional<datetime::TimePoint> timestamp;  // по умолчанию - текущее время
    AuditActor actor;
    AuditAction action;
    std::optional<AuditResource> resource;
    AuditOutcome outcome;
    AuditContext context;
    std::vector<std::string> tags;
    bool high_risk = false;
    std::vector<ComplianceFramework> compliance;
    Value details = Value::make_object();
};

// ============================================================================
// Сериализация
// ============================================================================

/// Полная запись (включая chain и contextHash)
Value to_value(const AuditLogEntry& entry);

/// Только поля содержимого (без chain, contextHash, receivedAt);
/// каноническая JSON форма этого значения хешируется
Value content_value(const AuditLogEntry& entry);

Value to_value(const AuditContext& context);

/// @throw ValidationError
AuditLogEntry entry_from_value(const Value& value);

/// @throw ValidationError
CreateEntryInput input_from_value(const Value& value);

/// Нарушения входа: формат типа действия, количество тегов, пустые id
std::vector<std::string> validate_input(const CreateEntryInput& input);

// ============================================================================
// Высокий риск
// ============================================================================

extern const std::vector<std::string> HIGH_RISK_ACTIONS;

/// Тип совпадает с элементом списка или начинается с "<элемент>."
bool is_high_risk_action(std::string_view action_type);

/// Пометить вход как high_risk для чувствительных и рискованных действий
void mark_high_risk(CreateEntryInput& input);

// ============================================================================
// Идентификаторы
// ============================================================================

/// "alog-{unixMillis}-{sequence}-{6 символов [a-z0-9]}"
std::string generate_entry_id(std::uint64_t sequence, datetime::TimePoint at);

/// "log-{tenant}-{scope}-{8 символов [a-z0-9]}"
std::string generate_log_id(const std::string& tenant_id, LogScope scope);

/// Поля контекста, входящие в contextHash
extern const std::vector<std::string> CONTEXT_HASH_FIELDS;

// ============================================================================
// Строковые преобразования
// ============================================================================

/// @throw std::invalid_argument если строка не распознана
HashAlgorithm parse_hash_algorithm(std::string_view s);
ActorType parse_actor_type(std::string_view s);
ActionCategory parse_action_category(std::string_view s);
ResourceType parse_resource_type(std::string_view s);
OutcomeStatus parse_outcome_status(std::string_view s);
ComplianceFramework parse_compliance_framework(std::string_view s);
Environment parse_environment(std::string_view s);
LogScope parse_log_scope(std::string_view s);

std::string to_string(HashAlgorithm a);
std::string to_string(ActorType t);
std::string to_string(ActionCategory c);
std::string to_string(ResourceType t);
std::string to_string(OutcomeStatus s);
std::string to_string(ComplianceFramework f);
std::string to_string(Environment e);
std::string to_string(LogScope s);

}  // namespace warden::audit

#endif  // WARDEN_AUDIT_HPP
