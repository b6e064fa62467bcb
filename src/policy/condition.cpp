// ==============================================================================
// condition.cpp - Библиотека условий
// ==============================================================================

#include "warden/condition.hpp"

#include "warden/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>

namespace warden::policy {

// ============================================================================
// Glob
// ============================================================================

std::string glob_to_regex(std::string_view glob) {
    std::string out = "^";
    out.reserve(glob.size() * 2 + 2);

    for (std::size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];
        switch (c) {
        case '*':
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                out += ".*";
                ++i;
            } else {
                out += "[^/]*";
            }
            break;
        case '?':
            out += '.';
            break;
        case '.':
        case '+':
        case '^':
        case '$':
        case '{':
        case '}':
        case '(':
        case ')':
        case '|':
        case '[':
        case ']':
        case '\\':
            out += '\\';
            out += c;
            break;
        default:
            out += c;
        }
    }

    out += '$';
    return out;
}

bool glob_match(std::string_view glob, const std::string& text) {
    std::regex re(glob_to_regex(glob));
    return std::regex_match(text, re);
}

std::string format_number(double value) {
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    return buf;
}

// ============================================================================
// Компиляция
// ============================================================================

namespace {

bool compare(ComparisonOperator op, double actual, double threshold) {
    switch (op) {
    case ComparisonOperator::Gt:
        return actual > threshold;
    case ComparisonOperator::Gte:
        return actual >= threshold;
    case ComparisonOperator::Lt:
        return actual < threshold;
    case ComparisonOperator::Lte:
        return actual <= threshold;
    case ComparisonOperator::Eq:
        return actual == threshold;
    }
    return false;
}

bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

bool any_common(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    for (const auto& item : a) {
        if (contains(b, item)) {
            return true;
        }
    }
    return false;
}

using RegexList = std::shared_ptr<const std::vector<std::regex>>;

RegexList compile_globs(const std::vector<std::string>& globs) {
    auto out = std::make_shared<std::vector<std::regex>>();
    out->reserve(globs.size());
    for (const auto& g : globs) {
        out->emplace_back(glob_to_regex(g));
    }
    return out;
}

bool any_glob(const RegexList& regexes, const std::string& text) {
    for (const auto& re : *regexes) {
        if (std::regex_match(text, re)) {
            return true;
        }
    }
    return false;
}

bool window_matches(const TimeWindow& window, int weekday, int hour) {
    if (!window.days.empty()) {
        bool day_ok = std::any_of(window.days.begin(), window.days.end(), [&](Weekday d) {
            return static_cast<int>(d) == weekday;
        });
        if (!day_ok) {
            return false;
        }
    }
    if (window.start_hour && hour < *window.start_hour) {
        return false;
    }
    if (window.end_hour && hour >= *window.end_hour) {
        return false;
    }
    return true;
}

/// Атрибут запроса по имени или по пути через точку ("ticket.priority");
/// ключ, совпадающий с полем целиком, имеет приоритет
const Value* lookup_attribute(const EvaluationRequest& request, const std::string& field) {
    auto it = request.attributes.find(field);
    if (it != request.attributes.end()) {
        return &it->second;
    }

    std::size_t dot_pos = field.find('.');
    if (dot_pos == std::string::npos) {
        return nullptr;
    }
    it = request.attributes.find(field.substr(0, dot_pos));
    if (it == request.attributes.end()) {
        return nullptr;
    }

    const Value* current = &it->second;
    std::size_t start = dot_pos + 1;
    while (start <= field.size()) {
        dot_pos = field.find('.', start);
        std::string part;
        if (dot_pos == std::string::npos) {
            part = field.substr(start);
            start = field.size() + 1;
        } else {
            part = field.substr(start, dot_pos - start);
            start = dot_pos + 1;
        }

        if (!current->is_object()) {
            return nullptr;
        }
        current = current->get(part);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

bool array_contains(const Value& array, const Value& item) {
    if (const auto* arr = array.get_array()) {
        for (const auto& v : *arr) {
            if (v == item) {
                return true;
            }
        }
    }
    return false;
}

/// Компиляция листового условия; std::regex_error пробрасывается наружу
Predicate compile_leaf(const Condition& condition) {
    return std::visit(
        [](const auto& c) -> Predicate {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, ComplexityCondition>) {
                return [c](const EvaluationRequest& req) {
                    if (!req.resource.complexity) {
                        return false;
                    }
                    return compare(c.op, *req.resource.complexity, c.threshold);
                };
            } else if constexpr (std::is_same_v<T, FilePatternCondition>) {
                RegexList regexes = compile_globs(c.patterns);
                bool include = c.match_type == FileMatchType::Include;
                return [regexes, include](const EvaluationRequest& req) {
                    const auto& files = req.resource.files;
                    if (files.empty()) {
                        return false;
                    }
                    bool any = std::any_of(files.begin(), files.end(), [&](const std::string& f) {
                        return any_glob(regexes, f);
                    });
                    return include ? any : !any;
                };
            } else if constexpr (std::is_same_v<T, AuthorCondition>) {
                return [c](const EvaluationRequest& req) {
                    if (c.authors.empty() && c.roles.empty() && c.teams.empty()) {
                        return true;
                    }
                    return contains(c.authors, req.actor.id) ||
                           any_common(c.roles, req.actor.roles) ||
                           any_common(c.teams, req.actor.teams);
                };
            } else if constexpr (std::is_same_v<T, TimeWindowCondition>) {
                return [c](const EvaluationRequest& req) {
                    int weekday = datetime::weekday_utc(req.context.timestamp);
                    int hour = datetime::hour_utc(req.context.timestamp);
                    bool any = std::any_of(c.windows.begin(), c.windows.end(),
                                           [&](const TimeWindow& w) {
                                               return window_matches(w, weekday, hour);
                                           });
                    return c.match_type == WindowMatchType::During ? any : !any;
                };
            } else if constexpr (std::is_same_v<T, RepositoryCondition>) {
                RegexList regexes = compile_globs(c.patterns);
                return [c, regexes](const EvaluationRequest& req) {
                    if (!req.resource.repo) {
                        return false;
                    }
                    if (c.repos.empty() && c.patterns.empty()) {
                        return true;
                    }
                    std::string full = req.resource.repo->full_name();
                    if (contains(c.repos, full) || contains(c.repos, req.resource.repo->name)) {
                        return true;
                    }
                    return any_glob(regexes, full);
                };
            } else if constexpr (std::is_same_v<T, BranchCondition>) {
                RegexList regexes = compile_globs(c.patterns);
                return [c, regexes](const EvaluationRequest& req) {
                    if (!req.resource.branch) {
                        return false;
                    }
                    if (c.is_protected &&
                        *c.is_protected != req.resource.branch_protected.value_or(false)) {
                        return false;
                    }
                    if (c.branches.empty() && c.patterns.empty()) {
                        return true;
                    }
                    return contains(c.branches, *req.resource.branch) ||
                           any_glob(regexes, *req.resource.branch);
                };
            } else if constexpr (std::is_same_v<T, LabelCondition>) {
                return [c](const EvaluationRequest& req) {
                    const auto& labels = req.resource.labels;
                    switch (c.match_type) {
                    case LabelMatchType::Any:
                        return any_common(c.labels, labels);
                    case LabelMatchType::All:
                        return std::all_of(c.labels.begin(), c.labels.end(),
                                           [&](const std::string& l) { return contains(labels, l); });
                    case LabelMatchType::None:
                        return !any_common(c.labels, labels);
                    }
                    return false;
                };
            } else if constexpr (std::is_same_v<T, AgentCondition>) {
                std::vector<std::string> names;
                for (auto a : c.agents) {
                    names.push_back(to_string(a));
                }
                return [names, confidence = c.confidence](const EvaluationRequest& req) {
                    if (!req.action.agent_type || !contains(names, *req.action.agent_type)) {
                        return false;
                    }
                    if (confidence && req.action.confidence) {
                        return compare(confidence->op, *req.action.confidence,
                                       confidence->threshold);
                    }
                    return true;
                };
            } else if constexpr (std::is_same_v<T, CustomCondition>) {
                std::shared_ptr<const std::regex> re;
                if (c.op == CustomOperator::Matches && c.value.is_string()) {
                    re = std::make_shared<const std::regex>(c.value.as_string());
                }
                return [c, re](const EvaluationRequest& req) {
                    const Value* actual = lookup_attribute(req, c.field);
                    if (c.op == CustomOperator::Exists) {
                        return (actual != nullptr) == c.value.is_truthy();
                    }
                    if (actual == nullptr) {
                        return false;
                    }
                    switch (c.op) {
                    case CustomOperator::Eq:
                        return *actual == c.value;
                    case CustomOperator::Ne:
                        return *actual != c.value;
                    case CustomOperator::Gt:
                    case CustomOperator::Gte:
                    case CustomOperator::Lt:
                    case CustomOperator::Lte: {
                        if (!actual->is_number() || !c.value.is_number()) {
                            return false;
                        }
                        double a = actual->to_double();
                        double b = c.value.to_double();
                        if (c.op == CustomOperator::Gt) return a > b;
                        if (c.op == CustomOperator::Gte) return a >= b;
                        if (c.op == CustomOperator::Lt) return a < b;
                        return a <= b;
                    }
                    case CustomOperator::In:
                        return c.value.is_array() && array_contains(c.value, *actual);
                    case CustomOperator::Nin:
                        return c.value.is_array() && !array_contains(c.value, *actual);
                    case CustomOperator::Contains:
                        return actual->is_string() && c.value.is_string() &&
                               actual->as_string().find(c.value.as_string()) != std::string::npos;
                    case CustomOperator::Matches:
                        return re && actual->is_string() &&
                               std::regex_search(actual->as_string(), *re);
                    case CustomOperator::Exists:
                        return true;
                    }
                    return false;
                };
            } else {
                return [](const EvaluationRequest&) { return false; };
            }
        },
        condition);
}

Predicate compile_group(const ConditionGroup& group) {
    std::vector<Predicate> children;
    children.reserve(group.conditions.size());
    for (const auto& node : group.conditions) {
        if (const auto* c = std::get_if<Condition>(&node)) {
            children.push_back(compile_leaf(*c));
        } else {
            children.push_back(compile_group(*std::get<std::shared_ptr<ConditionGroup>>(node)));
        }
    }

    switch (group.op) {
    case LogicalOperator::And:
        return [children](const EvaluationRequest& req) {
            for (const auto& p : children) {
                if (!p(req)) {
                    return false;
                }
            }
            return true;
        };
    case LogicalOperator::Or:
        return [children](const EvaluationRequest& req) {
            for (const auto& p : children) {
                if (p(req)) {
                    return true;
                }
            }
            return false;
        };
    case LogicalOperator::Not:
        return [children](const EvaluationRequest& req) {
            return children.empty() ? true : !children.front()(req);
        };
    }
    return [](const EvaluationRequest&) { return false; };
}

}  // namespace

Predicate compile(const Condition& condition) {
    try {
        return compile_leaf(condition);
    } catch (const std::regex_error& e) {
        throw ValidationError(condition_kind(condition) + " condition has an invalid pattern: " +
                              e.what());
    }
}

Predicate compile(const ConditionGroup& group) {
    try {
        return compile_group(group);
    } catch (const std::regex_error& e) {
        throw ValidationError(std::string("condition group has an invalid pattern: ") + e.what());
    }
}

Predicate compile_rule(const PolicyRule& rule) {
    if (rule.condition_logic) {
        return compile(*rule.condition_logic);
    }
    std::vector<Predicate> all;
    all.reserve(rule.conditions.size());
    for (const auto& c : rule.conditions) {
        all.push_back(compile(c));
    }
    return [all](const EvaluationRequest& req) {
        for (const auto& p : all) {
            if (!p(req)) {
                return false;
            }
        }
        return true;
    };
}

// ============================================================================
// Вычисление
// ============================================================================

bool evaluate(const Condition& condition, const EvaluationRequest& request) {
    try {
        return compile_leaf(condition)(request);
    } catch (const std::regex_error&) {
        return false;
    }
}

bool evaluate(const ConditionGroup& group, const EvaluationRequest& request) {
    try {
        return compile_group(group)(request);
    } catch (const std::regex_error&) {
        return false;
    }
}

// ============================================================================
// Пояснения
// ============================================================================

namespace {

std::string verdict(bool matched) {
    return matched ? "MATCH" : "NO MATCH";
}

std::string quoted_list(const std::vector<std::string>& items) {
    return to_json(Value::make_string_array(items));
}

}  // namespace

ConditionEvaluation explain(const Condition& condition, const EvaluationRequest& request) {
    ConditionEvaluation ev;
    ev.kind = condition_kind(condition);
    ev.matched = evaluate(condition, request);

    std::visit(
        [&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            const auto& res = request.resource;

            if constexpr (std::is_same_v<T, ComplexityCondition>) {
                double actual = res.complexity.value_or(0);
                ev.actual = res.complexity ? Value(actual) : Value();
                ev.expected = Value(c.threshold);
                ev.explanation = "Complexity " +
                                 (res.complexity ? format_number(actual) : std::string("unknown")) +
                                 " " + to_string(c.op) + " " + format_number(c.threshold);
            } else if constexpr (std::is_same_v<T, FilePatternCondition>) {
                ev.actual = Value::make_string_array(res.files);
                ev.expected = Value::make_string_array(c.patterns);
                ev.explanation = "Patterns " + quoted_list(c.patterns) + " matched against " +
                                 std::to_string(res.files.size()) + " files (" +
                                 to_string(c.match_type) + ")";
            } else if constexpr (std::is_same_v<T, AuthorCondition>) {
                Value actual = Value::make_object();
                actual.set("id", Value(request.actor.id));
                actual.set("roles", Value::make_string_array(request.actor.roles));
                actual.set("teams", Value::make_string_array(request.actor.teams));
                ev.actual = std::move(actual);
                ev.expected = to_value(condition);

                std::string criteria;
                auto add = [&](const char* name, const std::vector<std::string>& items) {
                    if (items.empty()) {
                        return;
                    }
                    if (!criteria.empty()) {
                        criteria += ", ";
                    }
                    criteria += std::string(name) + ": " + quoted_list(items);
                };
                add("authors", c.authors);
                add("roles", c.roles);
                add("teams", c.teams);
                ev.explanation = "Author \"" + request.actor.id + "\" (roles: " +
                                 quoted_list(request.actor.roles) + ") checked against " +
                                 (criteria.empty() ? std::string("no criteria") : criteria);
            } else if constexpr (std::is_same_v<T, TimeWindowCondition>) {
                int hour = datetime::hour_utc(request.context.timestamp);
                Weekday day = static_cast<Weekday>(datetime::weekday_utc(request.context.timestamp));
                Value actual = Value::make_object();
                actual.set("hour", Value::make_int(hour));
                actual.set("day", Value(to_string(day)));
                ev.actual = std::move(actual);
                ev.expected = to_value(condition);
                ev.explanation = "Time " + std::to_string(hour) + ":00 " + to_string(day) +
                                 " UTC against " + std::to_string(c.windows.size()) +
                                 " windows (" + to_string(c.match_type) + ")";
            } else if constexpr (std::is_same_v<T, RepositoryCondition>) {
                std::string name = res.repo ? res.repo->full_name() : "unknown";
                ev.actual = res.repo ? Value(name) : Value();
                ev.expected = to_value(condition);
                ev.explanation = "Repository \"" + name + "\" matches repos/patterns";
            } else if constexpr (std::is_same_v<T, BranchCondition>) {
                std::string branch = res.branch.value_or("unknown");
                ev.actual = res.branch ? Value(branch) : Value();
                ev.expected = to_value(condition);
                ev.explanation = "Branch \"" + branch + "\"" +
                                 (res.branch_protected.value_or(false) ? " (protected)" : "") +
                                 " matches branches/patterns";
            } else if constexpr (std::is_same_v<T, LabelCondition>) {
                ev.actual = Value::make_string_array(res.labels);
                ev.expected = Value::make_string_array(c.labels);
                ev.explanation = "Labels " + quoted_list(res.labels) +
                                 " matchType=" + to_string(c.match_type) + " " +
                                 quoted_list(c.labels);
            } else if constexpr (std::is_same_v<T, AgentCondition>) {
                std::string agent = request.action.agent_type.value_or("none");
                ev.actual = request.action.agent_type ? Value(agent) : Value();
                ev.expected = to_value(condition);
                ev.explanation = "Agent type \"" + agent + "\" matches " +
                                 to_json(ev.expected.get("agents") ? *ev.expected.get("agents")
                                                                   : Value::make_array());
                if (c.confidence && request.action.confidence) {
                    ev.explanation += " with confidence " +
                                      format_number(*request.action.confidence) + " " +
                                      to_string(c.confidence->op) + " " +
                                      format_number(c.confidence->threshold);
                }
            } else if constexpr (std::is_same_v<T, CustomCondition>) {
                const Value* actual = lookup_attribute(request, c.field);
                ev.actual = actual ? *actual : Value();
                ev.expected = c.value;
                ev.explanation = "Custom condition \"" + c.field + "\" " + to_string(c.op) + " " +
                                 to_json(c.value);
            } else {
                ev.expected = c.raw;
                ev.explanation = "Unknown condition type \"" + c.type + "\"";
            }
        },
        condition);

    ev.explanation += " -> " + verdict(ev.matched);
    return ev;
}

bool explain(const ConditionGroup& group, const EvaluationRequest& request,
             std::vector<ConditionEvaluation>& out) {
    std::vector<bool> results;
    results.reserve(group.conditions.size());
    for (const auto& node : group.conditions) {
        if (const auto* c = std::get_if<Condition>(&node)) {
            ConditionEvaluation ev = explain(*c, request);
            results.push_back(ev.matched);
            out.push_back(std::move(ev));
        } else {
            results.push_back(
                explain(*std::get<std::shared_ptr<ConditionGroup>>(node), request, out));
        }
    }

    switch (group.op) {
    case LogicalOperator::And:
        return std::all_of(results.begin(), results.end(), [](bool b) { return b; });
    case LogicalOperator::Or:
        return std::any_of(results.begin(), results.end(), [](bool b) { return b; });
    case LogicalOperator::Not:
        return results.empty() ? true : !results.front();
    }
    return false;
}

Value to_value(const ConditionEvaluation& evaluation) {
    Value v = Value::make_object();
    v.set("type", Value(evaluation.kind));
    v.set("matched", Value(evaluation.matched));
    v.set("actualValue", evaluation.actual);
    v.set("expectedValue", evaluation.expected);
    v.set("explanation", Value(evaluation.explanation));
    return v;
}

}  // namespace warden::policy
