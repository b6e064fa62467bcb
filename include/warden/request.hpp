// ==============================================================================
// warden/request.hpp - Запрос на оценку и результат решения
// ==============================================================================
//
// Назначение:
// - EvaluationRequest: кто (actor), что (action), над чем (resource),
//   контекст, существующие одобрения и произвольные атрибуты
// - EvaluationResult: решение движка политик
// - Разбор запроса из Value (JSON/YAML) и сериализация результата
//
// ==============================================================================

#ifndef WARDEN_REQUEST_HPP
#define WARDEN_REQUEST_HPP

#include <warden/datetime.hpp>
#include <warden/policy.hpp>
#include <warden/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace warden::policy {

// ============================================================================
// Запрос
// ============================================================================

struct Actor {
    std::string id;
    std::string type = "human";  // human | agent | service | ...
    std::vector<std::string> roles;
    std::vector<std::string> teams;
};

struct RequestAction {
    std::string name;
    std::optional<std::string> agent_type;
    std::optional<double> confidence;  // 0..1
};

struct RepoRef {
    std::string owner;
    std::string name;

    /// "owner/name"
    std::string full_name() const { return owner + "/" + name; }
};

struct Resource {
    std::string type;
    std::optional<RepoRef> repo;
    std::optional<std::string> branch;
    std::optional<bool> branch_protected;
    std::vector<std::string> files;
    std::vector<std::string> labels;
    std::optional<double> complexity;
};

struct RequestContext {
    std::string source;
    datetime::TimePoint timestamp;
    std::optional<std::string> request_id;
    std::optional<std::string> trace_id;
};

struct ExistingApproval {
    std::string approver_id;
    std::string approver_type = "human";
    std::vector<std::string> scopes;
};

struct EvaluationRequest {
    Actor actor;
    RequestAction action;
    Resource resource;
    RequestContext context;
    std::vector<ExistingApproval> approvals;
    ValueObject attributes;
};

/// Разобрать запрос из JSON-модели (camelCase ключи)
/// @throw ValidationError со списком нарушений
EvaluationRequest parse_request(const Value& value);

Value to_value(const EvaluationRequest& request);

// ============================================================================
// Результат
// ============================================================================

struct MatchedRule {
    std::string rule_id;
    std::string rule_name;
    std::string policy_id;
};

enum class RequiredActionType { Approval, Notification, Review };

std::string to_string(RequiredActionType t);

struct RequiredAction {
    RequiredActionType type = RequiredActionType::Approval;
    Value config;
};

struct MissingRequirements {
    int approvals_needed = 0;
    std::vector<std::string> missing_scopes;

    bool satisfied() const { return approvals_needed == 0 && missing_scopes.empty(); }
};

struct EvaluationMetadata {
    datetime::TimePoint evaluated_at;
    double evaluation_time_ms = 0;
    int rules_evaluated = 0;
    int policies_evaluated = 0;
};

struct EvaluationResult {
    bool allowed = false;
    Effect effect = Effect::Deny;
    std::string reason;
    std::optional<MatchedRule> matched_rule;
    std::vector<RequiredAction> required_actions;
    std::optional<MissingRequirements> missing_requirements;
    EvaluationMetadata metadata;
};

Value to_value(const EvaluationResult& result);

}  // namespace warden::policy

#endif  // WARDEN_REQUEST_HPP
