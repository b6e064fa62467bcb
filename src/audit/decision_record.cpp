// ==============================================================================
// decision_record.cpp - Запись решений движка в журнал аудита
// ==============================================================================

#include "warden/decision_record.hpp"

#include <cmath>

namespace warden::audit {

namespace {

ActorType actor_type_of(const std::string& type) {
    if (type == "human" || type == "user") {
        return ActorType::User;
    }
    if (type == "agent") {
        return ActorType::Agent;
    }
    if (type == "service") {
        return ActorType::Service;
    }
    if (type == "webhook") {
        return ActorType::Webhook;
    }
    return ActorType::System;
}

}  // namespace

OutcomeStatus outcome_of(const policy::EvaluationResult& result) {
    if (result.allowed) {
        return OutcomeStatus::Success;
    }
    if (result.effect == policy::Effect::RequireApproval) {
        return OutcomeStatus::Pending;
    }
    return OutcomeStatus::Denied;
}

CreateEntryInput input_from_decision(const policy::EvaluationRequest& request,
                                     const policy::EvaluationResult& result,
                                     const std::string& tenant_id) {
    CreateEntryInput input;

    input.actor.type = actor_type_of(request.actor.type);
    input.actor.id = request.actor.id;
    if (input.actor.type == ActorType::Agent) {
        input.actor.agent_type = request.action.agent_type;
    }

    input.action.category = ActionCategory::Policy;
    input.action.type = POLICY_EVALUATE_ACTION;
    input.action.description = request.action.name + ": " + result.reason;

    const policy::Resource& target = request.resource;
    if (target.repo) {
        AuditResource resource;
        if (target.branch && !target.branch->empty()) {
            resource.type = ResourceType::Branch;
            resource.id = *target.branch;
            resource.parent = ResourceParent{ResourceType::Repository, target.repo->full_name()};
        } else {
            resource.type = ResourceType::Repository;
            resource.id = target.repo->full_name();
        }
        input.resource = std::move(resource);
    }

    input.outcome.status = outcome_of(result);
    if (input.outcome.status != OutcomeStatus::Success) {
        input.outcome.error_message = result.reason;
    }
    if (std::isfinite(result.metadata.evaluation_time_ms)) {
        input.outcome.duration_ms =
            static_cast<std::int64_t>(std::llround(result.metadata.evaluation_time_ms));
    }

    input.context.tenant_id = tenant_id;
    input.context.request_id = request.context.request_id;
    input.context.trace_id = request.context.trace_id;

    input.details = policy::to_value(result);
    return input;
}

}  // namespace warden::audit
