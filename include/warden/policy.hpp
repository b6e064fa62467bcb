// ==============================================================================
// warden/policy.hpp - Схема документов политик
// ==============================================================================
//
// Назначение:
// - Типы документа политики: PolicyDocument, PolicyRule, PolicyAction
// - Условия как закрытый sum type (std::variant), по одному варианту на вид
// - Разбор документов из YAML/JSON (yaml-cpp) со сбором нарушений схемы
// - Валидация диапазонов и идентификаторов
// - Сериализация в Value (JSON) для вывода и round-trip
//
// ==============================================================================

#ifndef WARDEN_POLICY_HPP
#define WARDEN_POLICY_HPP

#include <warden/value.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace warden::policy {

// ============================================================================
// Enums
// ============================================================================

/// Решение, которое выдаёт сработавшее правило
enum class Effect { Allow, Deny, RequireApproval, Notify, LogOnly, Warn };

/// Уровень, к которому привязан документ
enum class PolicyScope { Global, Org, Repo, Branch };

/// Режим слияния с родительской политикой
enum class InheritanceMode { Replace, Extend, Override };

/// Логический оператор группы условий
enum class LogicalOperator { And, Or, Not };

/// Оператор сравнения для complexity/confidence
enum class ComparisonOperator { Gt, Gte, Lt, Lte, Eq };

enum class FileMatchType { Include, Exclude };
enum class WindowMatchType { During, Outside };
enum class LabelMatchType { Any, All, None };

/// День недели (порядок совпадает с tm_wday)
enum class Weekday { Sun, Mon, Tue, Wed, Thu, Fri, Sat };

/// Тип автономного агента
enum class AgentType { Triage, Coder, Resolver, Reviewer, Orchestrator };

/// Оператор custom условия
enum class CustomOperator { Eq, Ne, Gt, Gte, Lt, Lte, In, Nin, Contains, Matches, Exists };

enum class NotificationChannel { Email, Slack, Webhook, GithubComment };
enum class Severity { Info, Warning, Error, Critical };

// ============================================================================
// Условия
// ============================================================================

struct ComplexityCondition {
    ComparisonOperator op = ComparisonOperator::Gte;
    double threshold = 0;
};

struct FilePatternCondition {
    std::vector<std::string> patterns;
    FileMatchType match_type = FileMatchType::Include;
};

/// Пустые authors/roles/teams одновременно - условие истинно
struct AuthorCondition {
    std::vector<std::string> authors;
    std::vector<std::string> roles;
    std::vector<std::string> teams;
};

/// Окно: пустой days - любой день; часы [start_hour, end_hour)
struct TimeWindow {
    std::vector<Weekday> days;
    std::optional<int> start_hour;
    std::optional<int> end_hour;
};

struct TimeWindowCondition {
    std::string timezone = "UTC";
    std::vector<TimeWindow> windows;
    WindowMatchType match_type = WindowMatchType::During;
};

struct RepositoryCondition {
    std::vector<std::string> repos;
    std::vector<std::string> patterns;
};

struct BranchCondition {
    std::vector<std::string> branches;
    std::vector<std::string> patterns;
    std::optional<bool> is_protected;
};

struct LabelCondition {
    std::vector<std::string> labels;
    LabelMatchType match_type = LabelMatchType::Any;
};

struct ConfidenceThreshold {
    ComparisonOperator op = ComparisonOperator::Gte;
    double threshold = 0;
};

struct AgentCondition {
    std::vector<AgentType> agents;
    std::optional<ConfidenceThreshold> confidence;
};

struct CustomCondition {
    std::string field;
    CustomOperator op = CustomOperator::Eq;
    Value value;
};

/// Условие нераспознанного типа; сохраняется только при отключённой
/// валидации и всегда вычисляется в false
struct UnknownCondition {
    std::string type;
    Value raw;
};

using Condition =
    std::variant<ComplexityCondition, FilePatternCondition, AuthorCondition, TimeWindowCondition,
                 RepositoryCondition, BranchCondition, LabelCondition, AgentCondition,
                 CustomCondition, UnknownCondition>;

/// Имя вида условия ("complexity", "file_pattern", ...)
std::string condition_kind(const Condition& condition);

struct ConditionGroup;

/// Узел дерева условий: лист или вложенная группа
using ConditionNode = std::variant<Condition, std::shared_ptr<ConditionGroup>>;

/// Группа условий; NOT отрицает первый дочерний узел
struct ConditionGroup {
    LogicalOperator op = LogicalOperator::And;
    std::vector<ConditionNode> conditions;
};

// ============================================================================
// Действия
// ============================================================================

struct ApprovalConfig {
    int min_approvers = 1;
    std::vector<std::string> required_roles;
    std::vector<std::string> required_teams;
    std::vector<std::string> required_scopes;
    std::optional<int> timeout_hours;
    bool allow_self_approval = false;
    std::vector<std::string> escalate_to;
};

struct NotificationConfig {
    std::vector<NotificationChannel> channels;
    std::vector<std::string> recipients;
    std::optional<std::string> template_name;
    Severity severity = Severity::Info;
};

struct PolicyAction {
    Effect effect = Effect::Deny;
    std::optional<std::string> reason;
    std::optional<ApprovalConfig> approval;
    std::optional<NotificationConfig> notification;
    bool continue_on_match = false;
};

// ============================================================================
// Правила и документ
// ============================================================================

struct PolicyRule {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    bool enabled = true;
    int priority = 0;  // больше - раньше
    std::vector<Condition> conditions;
    std::optional<ConditionGroup> condition_logic;  // заменяет неявный AND conditions
    PolicyAction action;
    std::vector<std::string> tags;
};

struct DefaultAction {
    Effect effect = Effect::Deny;
    std::string reason = "No matching policy rule";
};

struct PolicyDocument {
    std::string version = "2.0";
    std::string name;
    std::optional<std::string> description;
    PolicyScope scope = PolicyScope::Repo;
    std::optional<std::string> scope_target;
    InheritanceMode inheritance = InheritanceMode::Override;
    std::optional<std::string> parent_policy_id;
    DefaultAction default_action;
    std::vector<PolicyRule> rules;
    Value variables = Value::make_object();
};

/// Поддерживаемые версии схемы
constexpr const char* SUPPORTED_VERSIONS[] = {"1.0", "1.1", "2.0"};

// ============================================================================
// Разбор и валидация
// ============================================================================

/// Разобрать документ из YAML узла (JSON также является YAML).
/// Неизвестные типы условий сохраняются как UnknownCondition.
/// @throw ValidationError со списком нарушений структуры
PolicyDocument parse_policy_document(const YAML::Node& root);

/// Разобрать документ из текста YAML/JSON
/// @throw ValidationError, YAML::Exception
PolicyDocument parse_policy_string(const std::string& text);

/// Проверить ограничения значений (идентификаторы, длины, диапазоны,
/// неизвестные условия). Возвращает список нарушений "путь: сообщение".
std::vector<std::string> validate_policy(const PolicyDocument& doc);

/// Проверить уникальность id правил
/// @throw PolicyConflictError
void check_rule_ids(const PolicyDocument& doc, const std::string& policy_id);

/// Документ в JSON-модель (camelCase ключи, как во входном формате)
Value to_value(const PolicyDocument& doc);
Value to_value(const Condition& condition);
Value to_value(const ConditionGroup& group);
Value to_value(const ApprovalConfig& approval);
Value to_value(const NotificationConfig& notification);

// ============================================================================
// Загрузка из файлов
// ============================================================================

/// Ошибка загрузки документа
struct Error {
    std::string message;
    std::string path;
    std::vector<std::string> issues;

    std::string format() const;
};

struct LoadOptions {
    bool validate = true;  // прогонять validate_policy и check_rule_ids
};

/// Результат загрузки документа
struct LoadResult {
    bool ok = false;
    PolicyDocument document;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить документ из файла (.yml, .yaml, .json)
LoadResult load(const std::filesystem::path& path, const LoadOptions& options = {});

/// Проверить, что путь имеет расширение документа политики
bool is_policy_extension(const std::filesystem::path& path);

// ============================================================================
// Строковые преобразования
// ============================================================================

/// @throw std::invalid_argument если строка не распознана
Effect parse_effect(std::string_view s);
PolicyScope parse_scope(std::string_view s);
InheritanceMode parse_inheritance_mode(std::string_view s);
LogicalOperator parse_logical_operator(std::string_view s);
ComparisonOperator parse_comparison_operator(std::string_view s);
FileMatchType parse_file_match_type(std::string_view s);
WindowMatchType parse_window_match_type(std::string_view s);
LabelMatchType parse_label_match_type(std::string_view s);
Weekday parse_weekday(std::string_view s);
AgentType parse_agent_type(std::string_view s);
CustomOperator parse_custom_operator(std::string_view s);
NotificationChannel parse_notification_channel(std::string_view s);
Severity parse_severity(std::string_view s);

std::string to_string(Effect e);
std::string to_string(PolicyScope s);
std::string to_string(InheritanceMode m);
std::string to_string(LogicalOperator op);
std::string to_string(ComparisonOperator op);
std::string to_string(FileMatchType m);
std::string to_string(WindowMatchType m);
std::string to_string(LabelMatchType m);
std::string to_string(Weekday d);
std::string to_string(AgentType a);
std::string to_string(CustomOperator op);
std::string to_string(NotificationChannel c);
std::string to_string(Severity s);

/// Разрешает ли эффект действие сам по себе (allow, warn, log_only, notify)
bool effect_allows(Effect e);

}  // namespace warden::policy

#endif  // WARDEN_POLICY_HPP
