// ==============================================================================
// request.cpp - Разбор запроса и сериализация результата
// ==============================================================================

#include "warden/request.hpp"

#include "warden/errors.hpp"

namespace warden::policy {

namespace {

class RequestParser {
public:
    std::vector<std::string> issues;

    const Value* object(const Value& parent, const std::string& key, const std::string& path,
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

    std::optional<std::string> opt_string(const Value& parent, const std::string& key,
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

    std::string req_string(const Value& parent, const std::string& key, const std::string& path) {
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            issues.push_back(path + key + ": required");
            return {};
        }
        return opt_string(parent, key, path).value_or("");
    }

    std::optional<double> opt_number(const Value& parent, const std::string& key,
                                     const std::string& path) {
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            return std::nullopt;
        }
        if (!v->is_number()) {
            issues.push_back(path + key + ": expected a number");
            return std::nullopt;
        }
        return v->to_double();
    }

    std::optional<bool> opt_bool(const Value& parent, const std::string& key,
                                 const std::string& path) {
        const Value* v = parent.get(key);
        if (v == nullptr || v->is_null()) {
            return std::nullopt;
        }
        if (!v->is_bool()) {
            issues.push_back(path + key + ": expected a boolean");
            return std::nullopt;
        }
        return v->as_bool();
    }

    std::vector<std::string> strings(const Value& parent, const std::string& key,
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
            if (!item.is_string()) {
                issues.push_back(path + key + ": expected a list of strings");
                continue;
            }
            out.push_back(item.as_string());
        }
        return out;
    }
};

}  // namespace

EvaluationRequest parse_request(const Value& value) {
    RequestParser p;
    EvaluationRequest req;

    if (!value.is_object()) {
        throw ValidationError("request must be an object");
    }

    if (const Value* actor = p.object(value, "actor", "", true)) {
        req.actor.id = p.req_string(*actor, "id", "actor.");
        req.actor.type = p.opt_string(*actor, "type", "actor.").value_or("human");
        req.actor.roles = p.strings(*actor, "roles", "actor.");
        req.actor.teams = p.strings(*actor, "teams", "actor.");
    }

    if (const Value* action = p.object(value, "action", "", true)) {
        req.action.name = p.req_string(*action, "name", "action.");
        req.action.agent_type = p.opt_string(*action, "agentType", "action.");
        req.action.confidence = p.opt_number(*action, "confidence", "action.");
    }

    if (const Value* resource = p.object(value, "resource", "", true)) {
        req.resource.type = p.req_string(*resource, "type", "resource.");
        if (const Value* repo = p.object(*resource, "repo", "resource.", false)) {
            RepoRef ref;
            ref.owner = p.req_string(*repo, "owner", "resource.repo.");
            ref.name = p.req_string(*repo, "name", "resource.repo.");
            req.resource.repo = std::move(ref);
        }
        req.resource.branch = p.opt_string(*resource, "branch", "resource.");
        req.resource.branch_protected = p.opt_bool(*resource, "branchProtected", "resource.");
        req.resource.files = p.strings(*resource, "files", "resource.");
        req.resource.labels = p.strings(*resource, "labels", "resource.");
        req.resource.complexity = p.opt_number(*resource, "complexity", "resource.");
    }

    if (const Value* ctx = p.object(value, "context", "", true)) {
        req.context.source = p.opt_string(*ctx, "source", "context.").value_or("api");
        std::string ts = p.req_string(*ctx, "timestamp", "context.");
        if (!ts.empty()) {
            auto tp = datetime::parse_rfc3339(ts);
            if (tp) {
                req.context.timestamp = *tp;
            } else {
                p.issues.push_back("context.timestamp: invalid RFC 3339 timestamp '" + ts + "'");
            }
        }
        req.context.request_id = p.opt_string(*ctx, "requestId", "context.");
        req.context.trace_id = p.opt_string(*ctx, "traceId", "context.");
    }

    if (const Value* approvals = value.get("approvals")) {
        if (approvals->is_array()) {
            std::size_t i = 0;
            for (const auto& a : approvals->as_array()) {
                std::string path = "approvals[" + std::to_string(i++) + "].";
                if (!a.is_object()) {
                    p.issues.push_back(path.substr(0, path.size() - 1) + ": expected an object");
                    continue;
                }
                ExistingApproval ea;
                ea.approver_id = p.req_string(a, "approverId", path);
                ea.approver_type = p.opt_string(a, "approverType", path).value_or("human");
                ea.scopes = p.strings(a, "scopes", path);
                req.approvals.push_back(std::move(ea));
            }
        } else if (!approvals->is_null()) {
            p.issues.push_back("approvals: expected a list");
        }
    }

    if (const Value* attrs = value.get("attributes")) {
        if (attrs->is_object()) {
            req.attributes = attrs->as_object();
        } else if (!attrs->is_null()) {
            p.issues.push_back("attributes: expected an object");
        }
    }

    if (!p.issues.empty()) {
        throw ValidationError("invalid evaluation request: " + p.issues.front(),
                              std::move(p.issues));
    }
    return req;
}

Value to_value(const EvaluationRequest& request) {
    Value v = Value::make_object();

    Value actor = Value::make_object();
    actor.set("id", Value(request.actor.id));
    actor.set("type", Value(request.actor.type));
    actor.set("roles", Value::make_string_array(request.actor.roles));
    actor.set("teams", Value::make_string_array(request.actor.teams));
    v.set("actor", std::move(actor));

    Value action = Value::make_object();
    action.set("name", Value(request.action.name));
    if (request.action.agent_type) {
        action.set("agentType", Value(*request.action.agent_type));
    }
    if (request.action.confidence) {
        action.set("confidence", Value(*request.action.confidence));
    }
    v.set("action", std::move(action));

    Value resource = Value::make_object();
    resource.set("type", Value(request.resource.type));
    if (request.resource.repo) {
        Value repo = Value::make_object();
        repo.set("owner", Value(request.resource.repo->owner));
        repo.set("name", Value(request.resource.repo->name));
        resource.set("repo", std::move(repo));
    }
    if (request.resource.branch) {
        resource.set("branch", Value(*request.resource.branch));
    }
    if (request.resource.branch_protected) {
        resource.set("branchProtected", Value(*request.resource.branch_protected));
    }
    resource.set("files", Value::make_string_array(request.resource.files));
    resource.set("labels", Value::make_string_array(request.resource.labels));
    if (request.resource.complexity) {
        resource.set("complexity", Value(*request.resource.complexity));
    }
    v.set("resource", std::move(resource));

    Value ctx = Value::make_object();
    ctx.set("source", Value(request.context.source));
    ctx.set("timestamp", Value(datetime::format_rfc3339(request.context.timestamp)));
    if (request.context.request_id) {
        ctx.set("requestId", Value(*request.context.request_id));
    }
    if (request.context.trace_id) {
        ctx.set("traceId", Value(*request.context.trace_id));
    }
    v.set("context", std::move(ctx));

    Value approvals = Value::make_array();
    for (const auto& a : request.approvals) {
        Value av = Value::make_object();
        av.set("approverId", Value(a.approver_id));
        av.set("approverType", Value(a.approver_type));
        av.set("scopes", Value::make_string_array(a.scopes));
        approvals.push_back(std::move(av));
    }
    v.set("approvals", std::move(approvals));
    v.set("attributes", Value(request.attributes));
    return v;
}

std::string to_string(RequiredActionType t) {
    switch (t) {
    case RequiredActionType::Approval:
        return "approval";
    case RequiredActionType::Notification:
        return "notification";
    case RequiredActionType::Review:
        return "review";
    }
    return "approval";
}

Value to_value(const EvaluationResult& result) {
    Value v = Value::make_object();
    v.set("allowed", Value(result.allowed));
    v.set("effect", Value(to_string(result.effect)));
    v.set("reason", Value(result.reason));

    if (result.matched_rule) {
        Value m = Value::make_object();
        m.set("ruleId", Value(result.matched_rule->rule_id));
        m.set("ruleName", Value(result.matched_rule->rule_name));
        m.set("policyId", Value(result.matched_rule->policy_id));
        v.set("matchedRule", std::move(m));
    }

    Value actions = Value::make_array();
    for (const auto& a : result.required_actions) {
        Value av = Value::make_object();
        av.set("type", Value(to_string(a.type)));
        av.set("config", a.config);
        actions.push_back(std::move(av));
    }
    v.set("requiredActions", std::move(actions));

    if (result.missing_requirements) {
        Value m = Value::make_object();
        m.set("approvalsNeeded", Value::make_int(result.missing_requirements->approvals_needed));
        m.set("missingScopes",
              Value::make_string_array(result.missing_requirements->missing_scopes));
        v.set("missingRequirements", std::move(m));
    }

    Value meta = Value::make_object();
    meta.set("evaluatedAt", Value(datetime::format_rfc3339(result.metadata.evaluated_at)));
    meta.set("evaluationTimeMs", Value(result.metadata.evaluation_time_ms));
    meta.set("rulesEvaluated", Value::make_int(result.metadata.rules_evaluated));
    meta.set("policiesEvaluated", Value::make_int(result.metadata.policies_evaluated));
    v.set("metadata", std::move(meta));
    return v;
}

}  // namespace warden::policy
