// ==============================================================================
// engine.cpp - Движок политик
// ==============================================================================

#include "warden/engine.hpp"

#include "warden/errors.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>

namespace warden::policy {

namespace {

constexpr const char* DEFAULT_REASON = "No matching policy rule";

/// Условия правила с защитой от ошибок regex во время сопоставления
bool rule_matches(const CompiledRule& rule, const EvaluationRequest& request) {
    try {
        return rule.matches(request);
    } catch (const std::regex_error&) {
        return false;
    }
}

std::string rule_reason(const PolicyRule& rule) {
    return rule.action.reason.value_or("Matched rule: " + rule.name);
}

/// Оценка требований одобрения по сработавшим правилам require_approval
MissingRequirements approval_requirements(const std::vector<const CompiledRule*>& rules,
                                          const EvaluationRequest& request) {
    bool is_protected = request.resource.branch_protected.value_or(false);
    int required = 0;
    bool allow_self = true;
    std::set<std::string> required_scopes;

    for (const auto* compiled : rules) {
        const auto& approval = compiled->rule->action.approval;
        int min_approvers = approval ? approval->min_approvers : 1;
        required = std::max(required, std::max(min_approvers, is_protected ? 2 : 1));
        if (approval) {
            allow_self = allow_self && approval->allow_self_approval;
            required_scopes.insert(approval->required_scopes.begin(),
                                   approval->required_scopes.end());
        } else {
            allow_self = false;
        }
    }

    std::set<std::string> approvers;
    std::set<std::string> granted;
    for (const auto& a : request.approvals) {
        if (a.approver_type != "human") {
            continue;
        }
        if (a.approver_id == request.actor.id && !allow_self) {
            continue;
        }
        approvers.insert(a.approver_id);
        granted.insert(a.scopes.begin(), a.scopes.end());
    }

    MissingRequirements missing;
    missing.approvals_needed = std::max(0, required - static_cast<int>(approvers.size()));
    for (const auto& scope : required_scopes) {
        if (granted.count(scope) == 0) {
            missing.missing_scopes.push_back(scope);
        }
    }
    return missing;
}

void add_notification(const PolicyRule& rule, std::vector<RequiredAction>& out) {
    if (rule.action.notification) {
        out.push_back({RequiredActionType::Notification, to_value(*rule.action.notification)});
    }
}

}  // namespace

// ============================================================================
// PolicyEngine
// ============================================================================

PolicyEngine::PolicyEngine(EngineConfig config)
    : config_(config), snapshot_(std::make_shared<Snapshot>()) {}

std::shared_ptr<const PolicyEngine::Snapshot> PolicyEngine::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return snapshot_;
}

void PolicyEngine::publish(std::vector<std::shared_ptr<const CompiledPolicy>> policies) {
    auto next = std::make_shared<Snapshot>();
    next->policies = std::move(policies);
    for (const auto& p : next->policies) {
        for (const auto& rule : p->rules) {
            if (rule.rule->enabled) {
                next->ordered.push_back(&rule);
            }
        }
    }
    std::stable_sort(next->ordered.begin(), next->ordered.end(),
                     [](const CompiledRule* a, const CompiledRule* b) {
                         return a->rule->priority > b->rule->priority;
                     });
    snapshot_ = std::move(next);
}

std::string PolicyEngine::load_policy(const PolicyDocument& document,
                                      const std::optional<std::string>& id) {
    std::string policy_id = id.value_or(document.name);

    if (config_.validate_on_load) {
        auto issues = validate_policy(document);
        if (!issues.empty()) {
            throw ValidationError("policy '" + policy_id + "' failed validation: " + issues.front(),
                                  std::move(issues));
        }
    }
    check_rule_ids(document, policy_id);

    // Компиляция вне блокировки; правила ссылаются на документ внутри CompiledPolicy
    auto compiled = std::make_shared<CompiledPolicy>();
    compiled->id = policy_id;
    compiled->document = document;
    compiled->rules.reserve(compiled->document.rules.size());
    for (const auto& rule : compiled->document.rules) {
        compiled->rules.push_back({&rule, policy_id, compile_rule(rule)});
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto policies = snapshot_->policies;
    auto it = std::find_if(policies.begin(), policies.end(),
                           [&](const auto& p) { return p->id == policy_id; });
    if (it != policies.end()) {
        *it = std::move(compiled);
    } else {
        policies.push_back(std::move(compiled));
    }
    publish(std::move(policies));
    return policy_id;
}

void PolicyEngine::unload_policy(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto policies = snapshot_->policies;
    auto it = std::find_if(policies.begin(), policies.end(),
                           [&](const auto& p) { return p->id == id; });
    if (it == policies.end()) {
        throw NotFoundError("policy not loaded: " + id);
    }
    policies.erase(it);
    publish(std::move(policies));
}

void PolicyEngine::clear_policies() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    publish({});
}

std::vector<PolicyInfo> PolicyEngine::loaded_policies() const {
    auto snap = snapshot();
    std::vector<PolicyInfo> out;
    out.reserve(snap->policies.size());
    for (const auto& p : snap->policies) {
        PolicyInfo info;
        info.id = p->id;
        info.name = p->document.name;
        info.version = p->document.version;
        info.rule_count = p->document.rules.size();
        info.enabled_rules = static_cast<std::size_t>(
            std::count_if(p->document.rules.begin(), p->document.rules.end(),
                          [](const PolicyRule& r) { return r.enabled; }));
        out.push_back(std::move(info));
    }
    return out;
}

std::shared_ptr<const CompiledPolicy> PolicyEngine::policy(const std::string& id) const {
    auto snap = snapshot();
    for (const auto& p : snap->policies) {
        if (p->id == id) {
            return p;
        }
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// evaluate
// ----------------------------------------------------------------------------

EvaluationResult PolicyEngine::evaluate(const EvaluationRequest& request) const {
    auto start = std::chrono::steady_clock::now();
    auto snap = snapshot();

    EvaluationResult result;
    result.metadata.evaluated_at = request.context.timestamp;
    result.metadata.policies_evaluated = static_cast<int>(snap->policies.size());

    std::vector<const CompiledRule*> approval_rules;
    const CompiledRule* first_other = nullptr;
    int evaluated = 0;

    for (const auto* compiled : snap->ordered) {
        ++evaluated;
        if (!rule_matches(*compiled, request)) {
            continue;
        }
        const PolicyRule& rule = *compiled->rule;

        if (rule.action.effect == Effect::Deny) {
            result.allowed = false;
            result.effect = Effect::Deny;
            result.reason = rule_reason(rule);
            result.matched_rule = MatchedRule{rule.id, rule.name, compiled->policy_id};
            add_notification(rule, result.required_actions);
            result.metadata.rules_evaluated = evaluated;
            result.metadata.evaluation_time_ms = datetime::elapsed_ms(start);
            return result;
        }

        if (rule.action.effect == Effect::RequireApproval) {
            approval_rules.push_back(compiled);
        } else if (first_other == nullptr) {
            first_other = compiled;
        }

        if (config_.stop_on_first_match && !rule.action.continue_on_match) {
            break;
        }
    }
    result.metadata.rules_evaluated = evaluated;

    if (!approval_rules.empty()) {
        const PolicyRule& primary = *approval_rules.front()->rule;
        result.effect = Effect::RequireApproval;
        result.reason = rule_reason(primary);
        result.matched_rule =
            MatchedRule{primary.id, primary.name, approval_rules.front()->policy_id};
        for (const auto* compiled : approval_rules) {
            const auto& approval = compiled->rule->action.approval;
            result.required_actions.push_back(
                {RequiredActionType::Approval,
                 approval ? to_value(*approval) : to_value(ApprovalConfig{})});
            add_notification(*compiled->rule, result.required_actions);
        }
        if (first_other != nullptr) {
            add_notification(*first_other->rule, result.required_actions);
        }
        MissingRequirements missing = approval_requirements(approval_rules, request);
        result.allowed = missing.satisfied();
        result.missing_requirements = std::move(missing);
    } else if (first_other != nullptr) {
        const PolicyRule& rule = *first_other->rule;
        result.effect = rule.action.effect;
        result.allowed = effect_allows(rule.action.effect);
        result.reason = rule_reason(rule);
        result.matched_rule = MatchedRule{rule.id, rule.name, first_other->policy_id};
        add_notification(rule, result.required_actions);
    } else {
        result.effect = config_.default_effect;
        result.allowed = effect_allows(config_.default_effect);
        result.reason = DEFAULT_REASON;
    }

    result.metadata.evaluation_time_ms = datetime::elapsed_ms(start);
    return result;
}

// ----------------------------------------------------------------------------
// dry_run
// ----------------------------------------------------------------------------

DryRunResult PolicyEngine::dry_run(const EvaluationRequest& request) const {
    auto start = std::chrono::steady_clock::now();
    auto snap = snapshot();

    DryRunResult result;

    for (const auto& p : snap->policies) {
        for (const auto& compiled : p->rules) {
            const PolicyRule& rule = *compiled.rule;
            if (!rule.enabled) {
                result.warnings.push_back("Rule \"" + rule.name + "\" (" + rule.id +
                                          ") is disabled");
                continue;
            }

            RuleEvaluation ev;
            ev.rule_id = rule.id;
            ev.rule_name = rule.name;
            ev.policy_id = p->id;
            ev.priority = rule.priority;
            ev.enabled = rule.enabled;
            ev.effect = rule.action.effect;

            if (rule.condition_logic) {
                ev.matched = explain(*rule.condition_logic, request, ev.conditions);
            } else {
                ev.matched = true;
                for (const auto& c : rule.conditions) {
                    ConditionEvaluation ce = explain(c, request);
                    ev.matched = ev.matched && ce.matched;
                    ev.conditions.push_back(std::move(ce));
                }
            }
            ++result.summary.total_rules;

            if (ev.matched) {
                result.matching_rules.push_back(std::move(ev));
            } else {
                result.non_matching_rules.push_back(std::move(ev));
            }
        }
    }

    auto by_priority = [](const RuleEvaluation& a, const RuleEvaluation& b) {
        return a.priority > b.priority;
    };
    std::stable_sort(result.matching_rules.begin(), result.matching_rules.end(), by_priority);
    std::stable_sort(result.non_matching_rules.begin(), result.non_matching_rules.end(),
                     by_priority);

    // Итог совпадает с evaluate на том же запросе
    EvaluationResult outcome = evaluate(request);
    result.would_effect = outcome.effect;
    result.would_allow = outcome.allowed;
    result.reason = outcome.reason;
    if (outcome.matched_rule) {
        for (const auto& ev : result.matching_rules) {
            if (ev.rule_id == outcome.matched_rule->rule_id &&
                ev.policy_id == outcome.matched_rule->policy_id) {
                result.primary_match = ev;
                break;
            }
        }
    }

    if (result.matching_rules.empty()) {
        result.warnings.push_back("No rules matched - default effect \"" +
                                  to_string(config_.default_effect) + "\" would apply");
    }
    if (result.matching_rules.size() > 1) {
        result.warnings.push_back("Multiple rules matched (" +
                                  std::to_string(result.matching_rules.size()) +
                                  ") - highest priority rule would apply");
    }
    if (snap->policies.empty()) {
        result.warnings.push_back("No policies loaded - evaluation based on default settings only");
    }

    result.summary.total_policies = snap->policies.size();
    result.summary.matching_rules = result.matching_rules.size();
    result.summary.evaluation_time_ms = datetime::elapsed_ms(start);
    return result;
}

// ============================================================================
// Сериализация
// ============================================================================

Value to_value(const RuleEvaluation& evaluation) {
    Value v = Value::make_object();
    v.set("ruleId", Value(evaluation.rule_id));
    v.set("ruleName", Value(evaluation.rule_name));
    v.set("policyId", Value(evaluation.policy_id));
    v.set("priority", Value::make_int(evaluation.priority));
    v.set("enabled", Value(evaluation.enabled));
    v.set("matched", Value(evaluation.matched));
    v.set("effect", Value(to_string(evaluation.effect)));
    Value conds = Value::make_array();
    for (const auto& c : evaluation.conditions) {
        conds.push_back(to_value(c));
    }
    v.set("conditions", std::move(conds));
    return v;
}

Value to_value(const DryRunResult& result) {
    Value v = Value::make_object();
    v.set("dryRun", Value(true));
    v.set("wouldAllow", Value(result.would_allow));
    v.set("wouldEffect", Value(to_string(result.would_effect)));
    v.set("reason", Value(result.reason));
    if (result.primary_match) {
        v.set("primaryMatch", to_value(*result.primary_match));
    }

    Value matching = Value::make_array();
    for (const auto& r : result.matching_rules) {
        matching.push_back(to_value(r));
    }
    v.set("matchingRules", std::move(matching));

    Value non_matching = Value::make_array();
    for (const auto& r : result.non_matching_rules) {
        non_matching.push_back(to_value(r));
    }
    v.set("nonMatchingRules", std::move(non_matching));

    v.set("warnings", Value::make_string_array(result.warnings));

    Value summary = Value::make_object();
    summary.set("totalPolicies", Value::make_uint(result.summary.total_policies));
    summary.set("totalRules", Value::make_uint(result.summary.total_rules));
    summary.set("matchingRules", Value::make_uint(result.summary.matching_rules));
    summary.set("evaluationTimeMs", Value(result.summary.evaluation_time_ms));
    v.set("summary", std::move(summary));
    return v;
}

}  // namespace warden::policy
