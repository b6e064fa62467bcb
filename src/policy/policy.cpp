// ==============================================================================
// policy.cpp - Схема документов политик: разбор, валидация, сериализация
// ==============================================================================

#include "warden/policy.hpp"

#include "warden/errors.hpp"
#include "warden/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace warden::policy {

// ============================================================================
// Строковые преобразования
// ============================================================================

Effect parse_effect(std::string_view s) {
    if (s == "allow") return Effect::Allow;
    if (s == "deny") return Effect::Deny;
    if (s == "require_approval") return Effect::RequireApproval;
    if (s == "notify") return Effect::Notify;
    if (s == "log_only") return Effect::LogOnly;
    if (s == "warn") return Effect::Warn;
    throw std::invalid_argument(
        "unknown effect, must be: allow, deny, require_approval, notify, log_only, or warn");
}

PolicyScope parse_scope(std::string_view s) {
    if (s == "global") return PolicyScope::Global;
    if (s == "org") return PolicyScope::Org;
    if (s == "repo") return PolicyScope::Repo;
    if (s == "branch") return PolicyScope::Branch;
    throw std::invalid_argument("unknown scope, must be: global, org, repo, or branch");
}

InheritanceMode parse_inheritance_mode(std::string_view s) {
    if (s == "replace") return InheritanceMode::Replace;
    if (s == "extend") return InheritanceMode::Extend;
    if (s == "override") return InheritanceMode::Override;
    throw std::invalid_argument("unknown inheritance mode, must be: replace, extend, or override");
}

LogicalOperator parse_logical_operator(std::string_view s) {
    if (s == "and" || s == "AND") return LogicalOperator::And;
    if (s == "or" || s == "OR") return LogicalOperator::Or;
    if (s == "not" || s == "NOT") return LogicalOperator::Not;
    throw std::invalid_argument("unknown logical operator, must be: and, or, or not");
}

ComparisonOperator parse_comparison_operator(std::string_view s) {
    if (s == "gt") return ComparisonOperator::Gt;
    if (s == "gte") return ComparisonOperator::Gte;
    if (s == "lt") return ComparisonOperator::Lt;
    if (s == "lte") return ComparisonOperator::Lte;
    if (s == "eq") return ComparisonOperator::Eq;
    throw std::invalid_argument("unknown operator, must be: gt, gte, lt, lte, or eq");
}

FileMatchType parse_file_match_type(std::string_view s) {
    if (s == "include") return FileMatchType::Include;
    if (s == "exclude") return FileMatchType::Exclude;
    throw std::invalid_argument("unknown match type, must be: include, or exclude");
}

WindowMatchType parse_window_match_type(std::string_view s) {
    if (s == "during") return WindowMatchType::During;
    if (s == "outside") return WindowMatchType::Outside;
    throw std::invalid_argument("unknown match type, must be: during, or outside");
}

LabelMatchType parse_label_match_type(std::string_view s) {
    if (s == "any") return LabelMatchType::Any;
    if (s == "all") return LabelMatchType::All;
    if (s == "none") return LabelMatchType::None;
    throw std::invalid_argument("unknown match type, must be: any, all, or none");
}

Weekday parse_weekday(std::string_view s) {
    if (s == "sun") return Weekday::Sun;
    if (s == "mon") return Weekday::Mon;
    if (s == "tue") return Weekday::Tue;
    if (s == "wed") return Weekday::Wed;
    if (s == "thu") return Weekday::Thu;
    if (s == "fri") return Weekday::Fri;
    if (s == "sat") return Weekday::Sat;
    throw std::invalid_argument("unknown day, must be: sun, mon, tue, wed, thu, fri, or sat");
}

AgentType parse_agent_type(std::string_view s) {
    if (s == "triage") return AgentType::Triage;
    if (s == "coder") return AgentType::Coder;
    if (s == "resolver") return AgentType::Resolver;
    if (s == "reviewer") return AgentType::Reviewer;
    if (s == "orchestrator") return AgentType::Orchestrator;
    throw std::invalid_argument(
        "unknown agent, must be: triage, coder, resolver, reviewer, or orchestrator");
}

CustomOperator parse_custom_operator(std::string_view s) {
    if (s == "eq") return CustomOperator::Eq;
    if (s == "ne") return CustomOperator::Ne;
    if (s == "gt") return CustomOperator::Gt;
    if (s == "gte") return CustomOperator::Gte;
    if (s == "lt") return CustomOperator::Lt;
    if (s == "lte") return CustomOperator::Lte;
    if (s == "in") return CustomOperator::In;
    if (s == "nin") return CustomOperator::Nin;
    if (s == "contains") return CustomOperator::Contains;
    if (s == "matches") return CustomOperator::Matches;
    if (s == "exists") return CustomOperator::Exists;
    throw std::invalid_argument(
        "unknown operator, must be: eq, ne, gt, gte, lt, lte, in, nin, contains, matches, or "
        "exists");
}

NotificationChannel parse_notification_channel(std::string_view s) {
    if (s == "email") return NotificationChannel::Email;
    if (s == "slack") return NotificationChannel::Slack;
    if (s == "webhook") return NotificationChannel::Webhook;
    if (s == "github_comment") return NotificationChannel::GithubComment;
    throw std::invalid_argument(
        "unknown channel, must be: email, slack, webhook, or github_comment");
}

Severity parse_severity(std::string_view s) {
    if (s == "info") return Severity::Info;
    if (s == "warning") return Severity::Warning;
    if (s == "error") return Severity::Error;
    if (s == "critical") return Severity::Critical;
    throw std::invalid_argument("unknown severity, must be: info, warning, error, or critical");
}

std::string to_string(Effect e) {
    switch (e) {
    case Effect::Allow:
        return "allow";
    case Effect::Deny:
        return "deny";
    case Effect::RequireApproval:
        return "require_approval";
    case Effect::Notify:
        return "notify";
    case Effect::LogOnly:
        return "log_only";
    case Effect::Warn:
        return "warn";
    }
    return "deny";
}

std::string to_string(PolicyScope s) {
    switch (s) {
    case PolicyScope::Global:
        return "global";
    case PolicyScope::Org:
        return "org";
    case PolicyScope::Repo:
        return "repo";
    case PolicyScope::Branch:
        return "branch";
    }
    return "repo";
}

std::string to_string(InheritanceMode m) {
    switch (m) {
    case InheritanceMode::Replace:
        return "replace";
    case InheritanceMode::Extend:
        return "extend";
    case InheritanceMode::Override:
        return "override";
    }
    return "override";
}

std::string to_string(LogicalOperator op) {
    switch (op) {
    case LogicalOperator::And:
        return "and";
    case LogicalOperator::Or:
        return "or";
    case LogicalOperator::Not:
        return "not";
    }
    return "and";
}

std::string to_string(ComparisonOperator op) {
    switch (op) {
    case ComparisonOperator::Gt:
        return "gt";
    case ComparisonOperator::Gte:
        return "gte";
    case ComparisonOperator::Lt:
        return "lt";
    case ComparisonOperator::Lte:
        return "lte";
    case ComparisonOperator::Eq:
        return "eq";
    }
    return "eq";
}

std::string to_string(FileMatchType m) {
    return m == FileMatchType::Include ? "include" : "exclude";
}

std::string to_string(WindowMatchType m) {
    return m == WindowMatchType::During ? "during" : "outside";
}

std::string to_string(LabelMatchType m) {
    switch (m) {
    case LabelMatchType::Any:
        return "any";
    case LabelMatchType::All:
        return "all";
    case LabelMatchType::None:
        return "none";
    }
    return "any";
}

std::string to_string(Weekday d) {
    static const char* names[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
    return names[static_cast<int>(d)];
}

std::string to_string(AgentType a) {
    switch (a) {
    case AgentType::Triage:
        return "triage";
    case AgentType::Coder:
        return "coder";
    case AgentType::Resolver:
        return "resolver";
    case AgentType::Reviewer:
        return "reviewer";
    case AgentType::Orchestrator:
        return "orchestrator";
    }
    return "coder";
}

std::string to_string(CustomOperator op) {
    switch (op) {
    case CustomOperator::Eq:
        return "eq";
    case CustomOperator::Ne:
        return "ne";
    case CustomOperator::Gt:
        return "gt";
    case CustomOperator::Gte:
        return "gte";
    case CustomOperator::Lt:
        return "lt";
    case CustomOperator::Lte:
        return "lte";
    case CustomOperator::In:
        return "in";
    case CustomOperator::Nin:
        return "nin";
    case CustomOperator::Contains:
        return "contains";
    case CustomOperator::Matches:
        return "matches";
    case CustomOperator::Exists:
        return "exists";
    }
    return "eq";
}

std::string to_string(NotificationChannel c) {
    switch (c) {
    case NotificationChannel::Email:
        return "email";
    case NotificationChannel::Slack:
        return "slack";
    case NotificationChannel::Webhook:
        return "webhook";
    case NotificationChannel::GithubComment:
        return "github_comment";
    }
    return "email";
}

std::string to_string(Severity s) {
    switch (s) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    case Severity::Critical:
        return "critical";
    }
    return "info";
}

bool effect_allows(Effect e) {
    return e == Effect::Allow || e == Effect::Warn || e == Effect::LogOnly ||
           e == Effect::Notify;
}

std::string condition_kind(const Condition& condition) {
    return std::visit(
        [](const auto& c) -> std::string {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, ComplexityCondition>) {
                return "complexity";
            } else if constexpr (std::is_same_v<T, FilePatternCondition>) {
                return "file_pattern";
            } else if constexpr (std::is_same_v<T, AuthorCondition>) {
                return "author";
            } else if constexpr (std::is_same_v<T, TimeWindowCondition>) {
                return "time_window";
            } else if constexpr (std::is_same_v<T, RepositoryCondition>) {
                return "repository";
            } else if constexpr (std::is_same_v<T, BranchCondition>) {
                return "branch";
            } else if constexpr (std::is_same_v<T, LabelCondition>) {
                return "label";
            } else if constexpr (std::is_same_v<T, AgentCondition>) {
                return "agent";
            } else if constexpr (std::is_same_v<T, CustomCondition>) {
                return "custom";
            } else {
                return c.type;
            }
        },
        condition);
}

// ============================================================================
// Разбор YAML
// ============================================================================

namespace {

/// Контекст разбора: копит нарушения вместо остановки на первом
class Parser {
public:
    std::vector<std::string> issues;

    void issue(const std::string& path, const std::string& message) {
        issues.push_back(path + ": " + message);
    }

    static std::string join(const std::string& base, const std::string& key) {
        return base.empty() ? key : base + "." + key;
    }

    static std::string index(const std::string& base, std::size_t i) {
        return base + "[" + std::to_string(i) + "]";
    }

    // -------------------------------------------------------------------------
    // Примитивы
    // -------------------------------------------------------------------------

    std::optional<std::string> opt_string(const YAML::Node& node, const std::string& key,
                                          const std::string& path) {
        YAML::Node v = node[key];
        if (!v || v.IsNull()) {
            return std::nullopt;
        }
        if (!v.IsScalar()) {
            issue(join(path, key), "expected a string");
            return std::nullopt;
        }
        return v.as<std::string>();
    }

    std::string req_string(const YAML::Node& node, const std::string& key,
                           const std::string& path) {
        auto v = opt_string(node, key, path);
        if (!v) {
            if (!node[key] || node[key].IsNull()) {
                issue(join(path, key), "required");
            }
            return {};
        }
        return *v;
    }

    bool opt_bool(const YAML::Node& node, const std::string& key, const std::string& path,
                  bool fallback) {
        YAML::Node v = node[key];
        if (!v || v.IsNull()) {
            return fallback;
        }
        try {
            return v.as<bool>();
        } catch (const YAML::Exception&) {
            issue(join(path, key), "expected a boolean");
            return fallback;
        }
    }

    std::optional<double> opt_number(const YAML::Node& node, const std::string& key,
                                     const std::string& path) {
        YAML::Node v = node[key];
        if (!v || v.IsNull()) {
            return std::nullopt;
        }
        try {
            return v.as<double>();
        } catch (const YAML::Exception&) {
            issue(join(path, key), "expected a number");
            return std::nullopt;
        }
    }

    std::optional<int> opt_int(const YAML::Node& node, const std::string& key,
                               const std::string& path) {
        YAML::Node v = node[key];
        if (!v || v.IsNull()) {
            return std::nullopt;
        }
        try {
            return v.as<int>();
        } catch (const YAML::Exception&) {
            issue(join(path, key), "expected an integer");
            return std::nullopt;
        }
    }

    std::vector<std::string> string_list(const YAML::Node& node, const std::string& key,
                                         const std::string& path) {
        std::vector<std::string> out;
        YAML::Node v = node[key];
        if (!v || v.IsNull()) {
            return out;
        }
        if (!v.IsSequence()) {
            issue(join(path, key), "expected a list");
            return out;
        }
        std::size_t i = 0;
        for (const auto& item : v) {
            if (!item.IsScalar()) {
                issue(index(join(path, key), i), "expected a string");
            } else {
                out.push_back(item.as<std::string>());
            }
            ++i;
        }
        return out;
    }

    /// Разобрать перечисление; при ошибке - нарушение и значение по умолчанию
    template <typename E, typename ParseFn>
    E enum_field(const YAML::Node& node, const std::string& key, const std::string& path,
                 ParseFn parse, E fallback, bool required = false) {
        auto s = opt_string(node, key, path);
        if (!s) {
            if (required && (!node[key] || node[key].IsNull())) {
                issue(join(path, key), "required");
            }
            return fallback;
        }
        try {
            return parse(*s);
        } catch (const std::invalid_argument& e) {
            issue(join(path, key), e.what());
            return fallback;
        }
    }

    template <typename E, typename ParseFn>
    std::vector<E> enum_list(const YAML::Node& node, const std::string& key,
                             const std::string& path, ParseFn parse) {
        std::vector<E> out;
        auto names = string_list(node, key, path);
        for (std::size_t i = 0; i < names.size(); ++i) {
            try {
                out.push_back(parse(names[i]));
            } catch (const std::invalid_argument& e) {
                issue(index(join(path, key), i), e.what());
            }
        }
        return out;
    }

    // -------------------------------------------------------------------------
    // Условия
    // -------------------------------------------------------------------------

    Condition parse_condition(const YAML::Node& node, const std::string& path) {
        std::string type = req_string(node, "type", path);

        if (type == "complexity") {
            ComplexityCondition c;
            c.op = enum_field(node, "operator", path, parse_comparison_operator,
                              ComparisonOperator::Gte, true);
            auto t = opt_number(node, "threshold", path);
            if (!t && !node["threshold"]) {
                issue(join(path, "threshold"), "required");
            }
            c.threshold = t.value_or(0);
            return c;
        }
        if (type == "file_pattern") {
            FilePatternCondition c;
            c.patterns = string_list(node, "patterns", path);
            c.match_type = enum_field(node, "matchType", path, parse_file_match_type,
                                      FileMatchType::Include);
            return c;
        }
        if (type == "author") {
            AuthorCondition c;
            c.authors = string_list(node, "authors", path);
            c.roles = string_list(node, "roles", path);
            c.teams = string_list(node, "teams", path);
            return c;
        }
        if (type == "time_window") {
            TimeWindowCondition c;
            c.timezone = opt_string(node, "timezone", path).value_or("UTC");
            c.match_type = enum_field(node, "matchType", path, parse_window_match_type,
                                      WindowMatchType::During);
            YAML::Node windows = node["windows"];
            if (windows && windows.IsSequence()) {
                std::size_t i = 0;
                for (const auto& w : windows) {
                    std::string wpath = index(join(path, "windows"), i++);
                    if (!w.IsMap()) {
                        issue(wpath, "expected a mapping");
                        continue;
                    }
                    TimeWindow tw;
                    tw.days = enum_list<Weekday>(w, "days", wpath, parse_weekday);
                    tw.start_hour = opt_int(w, "startHour", wpath);
                    tw.end_hour = opt_int(w, "endHour", wpath);
                    c.windows.push_back(std::move(tw));
                }
            } else if (windows && !windows.IsNull()) {
                issue(join(path, "windows"), "expected a list");
            }
            return c;
        }
        if (type == "repository") {
            RepositoryCondition c;
            c.repos = string_list(node, "repos", path);
            c.patterns = string_list(node, "patterns", path);
            return c;
        }
        if (type == "branch") {
            BranchCondition c;
            c.branches = string_list(node, "branches", path);
            c.patterns = string_list(node, "patterns", path);
            if (node["protected"] && !node["protected"].IsNull()) {
                c.is_protected = opt_bool(node, "protected", path, false);
            }
            return c;
        }
        if (type == "label") {
            LabelCondition c;
            c.labels = string_list(node, "labels", path);
            c.match_type = enum_field(node, "matchType", path, parse_label_match_type,
                                      LabelMatchType::Any);
            return c;
        }
        if (type == "agent") {
            AgentCondition c;
            c.agents = enum_list<AgentType>(node, "agents", path, parse_agent_type);
            YAML::Node conf = node["confidence"];
            if (conf && conf.IsMap()) {
                std::string cpath = join(path, "confidence");
                ConfidenceThreshold ct;
                ct.op = enum_field(conf, "operator", cpath, parse_comparison_operator,
                                   ComparisonOperator::Gte, true);
                auto t = opt_number(conf, "threshold", cpath);
                if (!t && !conf["threshold"]) {
                    issue(join(cpath, "threshold"), "required");
                }
                ct.threshold = t.value_or(0);
                c.confidence = ct;
            } else if (conf && !conf.IsNull()) {
                issue(join(path, "confidence"), "expected a mapping");
            }
            return c;
        }
        if (type == "custom") {
            CustomCondition c;
            c.field = req_string(node, "field", path);
            c.op = enum_field(node, "operator", path, parse_custom_operator, CustomOperator::Eq,
                              true);
            c.value = from_yaml(node["value"]);
            return c;
        }

        UnknownCondition u;
        u.type = type;
        u.raw = from_yaml(node);
        return u;
    }

    ConditionNode parse_node(const YAML::Node& node, const std::string& path) {
        if (node.IsMap() && node["operator"] && node["conditions"] && !node["type"]) {
            return std::make_shared<ConditionGroup>(parse_group(node, path));
        }
        return parse_condition(node, path);
    }

    ConditionGroup parse_group(const YAML::Node& node, const std::string& path) {
        ConditionGroup group;
        group.op = enum_field(node, "operator", path, parse_logical_operator,
                              LogicalOperator::And, true);
        YAML::Node conds = node["conditions"];
        if (!conds || !conds.IsSequence()) {
            issue(join(path, "conditions"), "expected a list");
            return group;
        }
        std::size_t i = 0;
        for (const auto& c : conds) {
            std::string cpath = index(join(path, "conditions"), i++);
            if (!c.IsMap()) {
                issue(cpath, "expected a mapping");
                continue;
            }
            group.conditions.push_back(parse_node(c, cpath));
        }
        return group;
    }

    // -------------------------------------------------------------------------
    // Действия
    // -------------------------------------------------------------------------

    ApprovalConfig parse_approval(const YAML::Node& node, const std::string& path) {
        ApprovalConfig a;
        a.min_approvers = opt_int(node, "minApprovers", path).value_or(1);
        a.required_roles = string_list(node, "requiredRoles", path);
        a.required_teams = string_list(node, "requiredTeams", path);
        a.required_scopes = string_list(node, "requiredScopes", path);
        a.timeout_hours = opt_int(node, "timeoutHours", path);
        a.allow_self_approval = opt_bool(node, "allowSelfApproval", path, false);
        a.escalate_to = string_list(node, "escalateTo", path);
        return a;
    }

    NotificationConfig parse_notification(const YAML::Node& node, const std::string& path) {
        NotificationConfig n;
        n.channels =
            enum_list<NotificationChannel>(node, "channels", path, parse_notification_channel);
        n.recipients = string_list(node, "recipients", path);
        n.template_name = opt_string(node, "template", path);
        n.severity = enum_field(node, "severity", path, parse_severity, Severity::Info);
        return n;
    }

    PolicyAction parse_action(const YAML::Node& node, const std::string& path) {
        PolicyAction a;
        a.effect = enum_field(node, "effect", path, parse_effect, Effect::Deny, true);
        a.reason = opt_string(node, "reason", path);
        if (node["approval"] && node["approval"].IsMap()) {
            a.approval = parse_approval(node["approval"], join(path, "approval"));
        }
        if (node["notification"] && node["notification"].IsMap()) {
            a.notification = parse_notification(node["notification"], join(path, "notification"));
        }
        a.continue_on_match = opt_bool(node, "continueOnMatch", path, false);
        return a;
    }

    // -------------------------------------------------------------------------
    // Правила и документ
    // -------------------------------------------------------------------------

    PolicyRule parse_rule(const YAML::Node& node, const std::string& path) {
        PolicyRule rule;
        rule.id = req_string(node, "id", path);
        rule.name = req_string(node, "name", path);
        rule.description = opt_string(node, "description", path);
        rule.enabled = opt_bool(node, "enabled", path, true);
        rule.priority = opt_int(node, "priority", path).value_or(0);
        rule.tags = string_list(node, "tags", path);

        YAML::Node conds = node["conditions"];
        if (conds && conds.IsSequence()) {
            std::size_t i = 0;
            for (const auto& c : conds) {
                std::string cpath = index(join(path, "conditions"), i++);
                if (!c.IsMap()) {
                    issue(cpath, "expected a mapping");
                    continue;
                }
                rule.conditions.push_back(parse_condition(c, cpath));
            }
        } else if (conds && !conds.IsNull()) {
            issue(join(path, "conditions"), "expected a list");
        }

        if (node["conditionLogic"] && node["conditionLogic"].IsMap()) {
            rule.condition_logic = parse_group(node["conditionLogic"], join(path, "conditionLogic"));
        }

        if (node["action"] && node["action"].IsMap()) {
            rule.action = parse_action(node["action"], join(path, "action"));
        } else {
            issue(join(path, "action"), "required");
        }
        return rule;
    }

    PolicyDocument parse_document(const YAML::Node& root) {
        PolicyDocument doc;
        if (!root.IsMap()) {
            issue("$", "policy document must be a mapping");
            return doc;
        }

        doc.version = opt_string(root, "version", "").value_or("2.0");
        doc.name = req_string(root, "name", "");
        doc.description = opt_string(root, "description", "");
        doc.scope = enum_field(root, "scope", "", parse_scope, PolicyScope::Repo);
        doc.scope_target = opt_string(root, "scopeTarget", "");
        doc.inheritance =
            enum_field(root, "inheritance", "", parse_inheritance_mode, InheritanceMode::Override);
        doc.parent_policy_id = opt_string(root, "parentPolicyId", "");

        YAML::Node def = root["defaultAction"];
        if (def && def.IsMap()) {
            doc.default_action.effect =
                enum_field(def, "effect", "defaultAction", parse_effect, Effect::Deny);
            doc.default_action.reason = opt_string(def, "reason", "defaultAction")
                                            .value_or("No matching policy rule");
        }

        YAML::Node rules = root["rules"];
        if (rules && rules.IsSequence()) {
            std::size_t i = 0;
            for (const auto& r : rules) {
                std::string rpath = index("rules", i++);
                if (!r.IsMap()) {
                    issue(rpath, "expected a mapping");
                    continue;
                }
                doc.rules.push_back(parse_rule(r, rpath));
            }
        } else if (rules && !rules.IsNull()) {
            issue("rules", "expected a list");
        }

        YAML::Node vars = root["variables"];
        if (vars && vars.IsMap()) {
            doc.variables = from_yaml(vars);
        } else if (vars && !vars.IsNull()) {
            issue("variables", "expected a mapping");
        }
        return doc;
    }
};

}  // namespace

PolicyDocument parse_policy_document(const YAML::Node& root) {
    Parser parser;
    PolicyDocument doc = parser.parse_document(root);
    if (!parser.issues.empty()) {
        throw ValidationError("invalid policy document: " + parser.issues.front(),
                              std::move(parser.issues));
    }
    return doc;
}

PolicyDocument parse_policy_string(const std::string& text) {
    return parse_policy_document(YAML::Load(text));
}

// ============================================================================
// Валидация значений
// ============================================================================

namespace {

bool valid_rule_id(const std::string& id) {
    static const std::regex pattern("^[a-z0-9-]+$", std::regex::icase);
    return std::regex_match(id, pattern);
}

void validate_condition(const Condition& condition, const std::string& path,
                        std::vector<std::string>& issues) {
    auto add = [&](const std::string& field, const std::string& msg) {
        issues.push_back(path + (field.empty() ? "" : "." + field) + ": " + msg);
    };

    std::visit(
        [&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, ComplexityCondition>) {
                if (c.threshold < 0 || c.threshold > 10) {
                    add("threshold", "must be between 0 and 10");
                }
            } else if constexpr (std::is_same_v<T, FilePatternCondition>) {
                if (c.patterns.empty()) {
                    add("patterns", "at least one pattern is required");
                }
            } else if constexpr (std::is_same_v<T, TimeWindowCondition>) {
                if (c.windows.empty()) {
                    add("windows", "at least one window is required");
                }
                if (c.timezone != "UTC") {
                    add("timezone", "only UTC is supported");
                }
                for (std::size_t i = 0; i < c.windows.size(); ++i) {
                    const auto& w = c.windows[i];
                    std::string wp = "windows[" + std::to_string(i) + "]";
                    if (w.start_hour && (*w.start_hour < 0 || *w.start_hour > 23)) {
                        add(wp + ".startHour", "must be between 0 and 23");
                    }
                    if (w.end_hour && (*w.end_hour < 0 || *w.end_hour > 23)) {
                        add(wp + ".endHour", "must be between 0 and 23");
                    }
                }
            } else if constexpr (std::is_same_v<T, LabelCondition>) {
                if (c.labels.empty()) {
                    add("labels", "at least one label is required");
                }
            } else if constexpr (std::is_same_v<T, AgentCondition>) {
                if (c.agents.empty()) {
                    add("agents", "at least one agent is required");
                }
                if (c.confidence) {
                    if (c.confidence->op == ComparisonOperator::Eq) {
                        add("confidence.operator", "must be one of: gt, gte, lt, lte");
                    }
                    if (c.confidence->threshold < 0 || c.confidence->threshold > 1) {
                        add("confidence.threshold", "must be between 0 and 1");
                    }
                }
            } else if constexpr (std::is_same_v<T, CustomCondition>) {
                if (c.field.empty()) {
                    add("field", "must not be empty");
                }
                if ((c.op == CustomOperator::In || c.op == CustomOperator::Nin) &&
                    !c.value.is_array()) {
                    add("value", "must be a list for operator " + to_string(c.op));
                }
                if (c.op == CustomOperator::Matches) {
                    if (!c.value.is_string()) {
                        add("value", "must be a regular expression string");
                    } else {
                        try {
                            std::regex re(c.value.as_string());
                            (void)re;
                        } catch (const std::regex_error& e) {
                            add("value", std::string("invalid regular expression: ") + e.what());
                        }
                    }
                }
            } else if constexpr (std::is_same_v<T, UnknownCondition>) {
                add("type", "unknown condition type '" + c.type + "'");
            }
        },
        condition);
}

void validate_group(const ConditionGroup& group, const std::string& path,
                    std::vector<std::string>& issues) {
    if (group.conditions.empty()) {
        issues.push_back(path + ".conditions: at least one condition is required");
    }
    if (group.op == LogicalOperator::Not && group.conditions.size() != 1) {
        issues.push_back(path + ".conditions: operator 'not' takes exactly one condition");
    }
    for (std::size_t i = 0; i < group.conditions.size(); ++i) {
        std::string cpath = path + ".conditions[" + std::to_string(i) + "]";
        const auto& node = group.conditions[i];
        if (const auto* c = std::get_if<Condition>(&node)) {
            validate_condition(*c, cpath, issues);
        } else {
            validate_group(*std::get<std::shared_ptr<ConditionGroup>>(node), cpath, issues);
        }
    }
}

}  // namespace

std::vector<std::string> validate_policy(const PolicyDocument& doc) {
    std::vector<std::string> issues;

    if (std::find(std::begin(SUPPORTED_VERSIONS), std::end(SUPPORTED_VERSIONS), doc.version) ==
        std::end(SUPPORTED_VERSIONS)) {
        issues.push_back("version: unsupported version '" + doc.version +
                         "', must be: 1.0, 1.1, or 2.0");
    }
    if (doc.name.empty() || doc.name.size() > 100) {
        issues.push_back("name: must be between 1 and 100 characters");
    }

    for (std::size_t i = 0; i < doc.rules.size(); ++i) {
        const auto& rule = doc.rules[i];
        std::string path = "rules[" + std::to_string(i) + "]";

        if (!valid_rule_id(rule.id)) {
            issues.push_back(path + ".id: must match ^[a-z0-9-]+$");
        }
        if (rule.name.empty() || rule.name.size() > 100) {
            issues.push_back(path + ".name: must be between 1 and 100 characters");
        }
        for (std::size_t j = 0; j < rule.conditions.size(); ++j) {
            validate_condition(rule.conditions[j],
                               path + ".conditions[" + std::to_string(j) + "]", issues);
        }
        if (rule.condition_logic) {
            validate_group(*rule.condition_logic, path + ".conditionLogic", issues);
        }

        const auto& action = rule.action;
        if (action.approval) {
            if (action.approval->min_approvers < 1) {
                issues.push_back(path + ".action.approval.minApprovers: must be at least 1");
            }
            if (action.approval->timeout_hours &&
                (*action.approval->timeout_hours < 1 || *action.approval->timeout_hours > 168)) {
                issues.push_back(path + ".action.approval.timeoutHours: must be between 1 and 168");
            }
        }
        if (action.notification && action.notification->channels.empty()) {
            issues.push_back(path + ".action.notification.channels: at least one channel is required");
        }
    }

    return issues;
}

void check_rule_ids(const PolicyDocument& doc, const std::string& policy_id) {
    std::set<std::string> seen;
    for (const auto& rule : doc.rules) {
        if (!seen.insert(rule.id).second) {
            throw PolicyConflictError(policy_id, rule.id);
        }
    }
}

// ============================================================================
// Сериализация в Value
// ============================================================================

namespace {

Value number_value(double d) {
    // Целые значения в диапазоне int64 сохраняем целыми для стабильного JSON
    if (std::isfinite(d) && std::fabs(d) < 9.2e18 && d == std::trunc(d)) {
        return Value::make_int(static_cast<std::int64_t>(d));
    }
    return Value(d);
}

template <typename E>
Value enum_array(const std::vector<E>& items) {
    Value arr = Value::make_array();
    for (const auto& item : items) {
        arr.push_back(Value(to_string(item)));
    }
    return arr;
}

Value node_to_value(const ConditionNode& node) {
    if (const auto* c = std::get_if<Condition>(&node)) {
        return to_value(*c);
    }
    return to_value(*std::get<std::shared_ptr<ConditionGroup>>(node));
}

}  // namespace

Value to_value(const Condition& condition) {
    return std::visit(
        [](const auto& c) -> Value {
            using T = std::decay_t<decltype(c)>;
            Value v = Value::make_object();
            if constexpr (std::is_same_v<T, UnknownCondition>) {
                return c.raw.is_object() ? c.raw : v;
            } else {
                v.set("type", Value(condition_kind(Condition(c))));
                if constexpr (std::is_same_v<T, ComplexityCondition>) {
                    v.set("operator", Value(to_string(c.op)));
                    v.set("threshold", number_value(c.threshold));
                } else if constexpr (std::is_same_v<T, FilePatternCondition>) {
                    v.set("patterns", Value::make_string_array(c.patterns));
                    v.set("matchType", Value(to_string(c.match_type)));
                } else if constexpr (std::is_same_v<T, AuthorCondition>) {
                    v.set("authors", Value::make_string_array(c.authors));
                    v.set("roles", Value::make_string_array(c.roles));
                    v.set("teams", Value::make_string_array(c.teams));
                } else if constexpr (std::is_same_v<T, TimeWindowCondition>) {
                    v.set("timezone", Value(c.timezone));
                    v.set("matchType", Value(to_string(c.match_type)));
                    Value windows = Value::make_array();
                    for (const auto& w : c.windows) {
                        Value wv = Value::make_object();
                        wv.set("days", enum_array(w.days));
                        if (w.start_hour) {
                            wv.set("startHour", Value::make_int(*w.start_hour));
                        }
                        if (w.end_hour) {
                            wv.set("endHour", Value::make_int(*w.end_hour));
                        }
                        windows.push_back(std::move(wv));
                    }
                    v.set("windows", std::move(windows));
                } else if constexpr (std::is_same_v<T, RepositoryCondition>) {
                    v.set("repos", Value::make_string_array(c.repos));
                    v.set("patterns", Value::make_string_array(c.patterns));
                } else if constexpr (std::is_same_v<T, BranchCondition>) {
                    v.set("branches", Value::make_string_array(c.branches));
                    v.set("patterns", Value::make_string_array(c.patterns));
                    if (c.is_protected) {
                        v.set("protected", Value(*c.is_protected));
                    }
                } else if constexpr (std::is_same_v<T, LabelCondition>) {
                    v.set("labels", Value::make_string_array(c.labels));
                    v.set("matchType", Value(to_string(c.match_type)));
                } else if constexpr (std::is_same_v<T, AgentCondition>) {
                    v.set("agents", enum_array(c.agents));
                    if (c.confidence) {
                        Value conf = Value::make_object();
                        conf.set("operator", Value(to_string(c.confidence->op)));
                        conf.set("threshold", number_value(c.confidence->threshold));
                        v.set("confidence", std::move(conf));
                    }
                } else if constexpr (std::is_same_v<T, CustomCondition>) {
                    v.set("field", Value(c.field));
                    v.set("operator", Value(to_string(c.op)));
                    v.set("value", c.value);
                }
                return v;
            }
        },
        condition);
}

Value to_value(const ConditionGroup& group) {
    Value v = Value::make_object();
    v.set("operator", Value(to_string(group.op)));
    Value conds = Value::make_array();
    for (const auto& node : group.conditions) {
        conds.push_back(node_to_value(node));
    }
    v.set("conditions", std::move(conds));
    return v;
}

Value to_value(const ApprovalConfig& approval) {
    Value v = Value::make_object();
    v.set("minApprovers", Value::make_int(approval.min_approvers));
    v.set("requiredRoles", Value::make_string_array(approval.required_roles));
    v.set("requiredTeams", Value::make_string_array(approval.required_teams));
    v.set("requiredScopes", Value::make_string_array(approval.required_scopes));
    if (approval.timeout_hours) {
        v.set("timeoutHours", Value::make_int(*approval.timeout_hours));
    }
    v.set("allowSelfApproval", Value(approval.allow_self_approval));
    v.set("escalateTo", Value::make_string_array(approval.escalate_to));
    return v;
}

Value to_value(const NotificationConfig& notification) {
    Value v = Value::make_object();
    v.set("channels", enum_array(notification.channels));
    v.set("recipients", Value::make_string_array(notification.recipients));
    if (notification.template_name) {
        v.set("template", Value(*notification.template_name));
    }
    v.set("severity", Value(to_string(notification.severity)));
    return v;
}

Value to_value(const PolicyDocument& doc) {
    Value v = Value::make_object();
    v.set("version", Value(doc.version));
    v.set("name", Value(doc.name));
    if (doc.description) {
        v.set("description", Value(*doc.description));
    }
    v.set("scope", Value(to_string(doc.scope)));
    if (doc.scope_target) {
        v.set("scopeTarget", Value(*doc.scope_target));
    }
    v.set("inheritance", Value(to_string(doc.inheritance)));
    if (doc.parent_policy_id) {
        v.set("parentPolicyId", Value(*doc.parent_policy_id));
    }

    Value def = Value::make_object();
    def.set("effect", Value(to_string(doc.default_action.effect)));
    def.set("reason", Value(doc.default_action.reason));
    v.set("defaultAction", std::move(def));

    Value rules = Value::make_array();
    for (const auto& rule : doc.rules) {
        Value r = Value::make_object();
        r.set("id", Value(rule.id));
        r.set("name", Value(rule.name));
        if (rule.description) {
            r.set("description", Value(*rule.description));
        }
        r.set("enabled", Value(rule.enabled));
        r.set("priority", Value::make_int(rule.priority));

        Value conds = Value::make_array();
        for (const auto& c : rule.conditions) {
            conds.push_back(to_value(c));
        }
        r.set("conditions", std::move(conds));
        if (rule.condition_logic) {
            r.set("conditionLogic", to_value(*rule.condition_logic));
        }

        Value action = Value::make_object();
        action.set("effect", Value(to_string(rule.action.effect)));
        if (rule.action.reason) {
            action.set("reason", Value(*rule.action.reason));
        }
        if (rule.action.approval) {
            action.set("approval", to_value(*rule.action.approval));
        }
        if (rule.action.notification) {
            action.set("notification", to_value(*rule.action.notification));
        }
        action.set("continueOnMatch", Value(rule.action.continue_on_match));
        r.set("action", std::move(action));
        r.set("tags", Value::make_string_array(rule.tags));
        rules.push_back(std::move(r));
    }
    v.set("rules", std::move(rules));
    v.set("variables", doc.variables);
    return v;
}

// ============================================================================
// Загрузка из файлов
// ============================================================================

std::string Error::format() const {
    std::string out = "failed to load policy '" + path + "' - " + message;
    for (const auto& i : issues) {
        out += "\n    " + i;
    }
    return out;
}

bool is_policy_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yml" || ext == ".yaml" || ext == ".json";
}

LoadResult load(const std::filesystem::path& path, const LoadOptions& options) {
    LoadResult result;
    std::string path_str = platform::path_to_utf8(path);

    if (!is_policy_extension(path)) {
        result.error = Error{"policy must have a yaml or json file extension", path_str, {}};
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_str);
        result.document = parse_policy_document(root);

        if (options.validate) {
            auto issues = validate_policy(result.document);
            if (!issues.empty()) {
                result.error = Error{"policy failed validation", path_str, std::move(issues)};
                return result;
            }
            check_rule_ids(result.document, result.document.name);
        }
        result.ok = true;
    } catch (const ValidationError& e) {
        result.error = Error{"policy failed schema validation", path_str, e.issues()};
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path_str, {}};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), path_str, {}};
    }

    return result;
}

}  // namespace warden::policy
