// ==============================================================================
// warden/decision_record.hpp - Запись решений движка в журнал аудита
// ==============================================================================
//
// Решение движка превращается в запись категории policy (policy.evaluate):
// запрос -> движок -> решение -> журнал аудита.
//
// ==============================================================================

#ifndef WARDEN_DECISION_RECORD_HPP
#define WARDEN_DECISION_RECORD_HPP

#include <warden/audit.hpp>
#include <warden/request.hpp>

#include <string>

namespace warden::audit {

constexpr const char* POLICY_EVALUATE_ACTION = "policy.evaluate";

/// Исход решения: allowed -> success, require_approval -> pending, иначе denied
OutcomeStatus outcome_of(const policy::EvaluationResult& result);

/// Вход записи аудита для решения; details - сериализованный результат
CreateEntryInput input_from_decision(const policy::EvaluationRequest& request,
                                     const policy::EvaluationResult& result,
                                     const std::string& tenant_id);

}  // namespace warden::audit

#endif  // WARDEN_DECISION_RECORD_HPP
