// ==============================================================================
// mappings.cpp - Соответствие контролей категориям действий аудита
// ==============================================================================

#include "warden/evidence.hpp"

namespace warden::evidence {

using C = ActionCategory;

const CategoryMap CONTROL_CATEGORY_MAPPINGS = {
    // Доступ
    {"access_control", {C::Auth, C::Security, C::Admin}},
    {"logical_access", {C::Auth, C::Security, C::Admin}},
    {"identity_management", {C::Auth, C::Admin}},

    // Изменения
    {"change_management", {C::Git, C::Config, C::Approval}},
    {"system_changes", {C::Config, C::Admin}},
    {"configuration_management", {C::Config}},

    // Безопасность
    {"incident_response", {C::Security, C::Agent}},
    {"security_monitoring", {C::Security, C::Policy}},
    {"vulnerability_management", {C::Security}},

    // Риски
    {"risk_assessment", {C::Policy, C::Agent, C::Approval}},
    {"risk_management", {C::Policy, C::Security}},

    // Данные
    {"data_protection", {C::Data, C::Security}},
    {"encryption", {C::Security, C::Config}},
    {"data_retention", {C::Data, C::Admin}},

    // Эксплуатация
    {"availability", {C::Config, C::Admin}},
    {"backup_recovery", {C::Data, C::Admin}},
    {"capacity_management", {C::Config, C::Admin}},

    // Агенты
    {"ai_operations", {C::Agent, C::Approval}},
    {"ai_governance", {C::Agent, C::Policy, C::Approval}},

    {"billing", {C::Billing}},
    {"compliance", {C::Policy, C::Approval, C::Security}},
};

const CategoryMap SOC2_CRITERIA_MAPPINGS = {
    // CC6 - Logical and Physical Access
    {"CC6", {C::Auth, C::Security, C::Admin}},
    {"CC6.1", {C::Auth, C::Security}},
    {"CC6.2", {C::Auth, C::Admin}},
    {"CC6.3", {C::Auth, C::Security}},
    {"CC6.4", {C::Security, C::Config}},
    {"CC6.5", {C::Security, C::Config}},
    {"CC6.6", {C::Auth, C::Security}},
    {"CC6.7", {C::Security, C::Config}},
    {"CC6.8", {C::Data, C::Security}},

    // CC7 - System Operations
    {"CC7", {C::Config, C::Security, C::Agent}},
    {"CC7.1", {C::Security, C::Agent}},
    {"CC7.2", {C::Security, C::Config}},
    {"CC7.3", {C::Security, C::Admin}},
    {"CC7.4", {C::Security, C::Agent}},
    {"CC7.5", {C::Admin, C::Security}},

    // CC8 - Change Management
    {"CC8", {C::Git, C::Config, C::Approval}},
    {"CC8.1", {C::Git, C::Approval, C::Agent}},

    // CC3 - Risk Assessment
    {"CC3", {C::Policy, C::Security, C::Agent}},
    {"CC3.1", {C::Policy, C::Security}},
    {"CC3.2", {C::Policy, C::Agent}},
    {"CC3.3", {C::Policy, C::Agent}},
    {"CC3.4", {C::Policy, C::Security}},

    // CC5 - Control Activities
    {"CC5", {C::Policy, C::Approval, C::Security}},
    {"CC5.1", {C::Policy, C::Approval}},
    {"CC5.2", {C::Git, C::Agent, C::Approval}},
    {"CC5.3", {C::Config, C::Admin}},
};

const CategoryMap ISO27001_CONTROL_MAPPINGS = {
    // A.5 - Information Security Policies
    {"A.5", {C::Policy, C::Admin}},
    {"A.5.1", {C::Policy, C::Admin}},

    // A.6 - Organization of Information Security
    {"A.6", {C::Admin, C::Security}},
    {"A.6.1", {C::Admin, C::Security}},
    {"A.6.2", {C::Admin, C::Config}},

    // A.8 - Asset Management
    {"A.8", {C::Data, C::Config, C::Admin}},
    {"A.8.1", {C::Data, C::Admin}},
    {"A.8.2", {C::Data, C::Security}},
    {"A.8.3", {C::Data, C::Config}},

    // A.9 - Access Control
    {"A.9", {C::Auth, C::Security, C::Admin}},
    {"A.9.1", {C::Auth, C::Policy}},
    {"A.9.2", {C::Auth, C::Admin}},
    {"A.9.3", {C::Auth, C::Security}},
    {"A.9.4", {C::Auth, C::Security}},

    // A.12 - Operations Security
    {"A.12", {C::Config, C::Security, C::Admin}},
    {"A.12.1", {C::Config, C::Admin}},
    {"A.12.2", {C::Security, C::Config}},
    {"A.12.3", {C::Data, C::Admin}},
    {"A.12.4", {C::Security, C::Config}},
    {"A.12.5", {C::Config, C::Admin}},
    {"A.12.6", {C::Security, C::Config}},

    // A.14 - System Acquisition, Development, Maintenance
    {"A.14", {C::Git, C::Config, C::Approval}},
    {"A.14.1", {C::Git, C::Security}},
    {"A.14.2", {C::Git, C::Approval, C::Agent}},
    {"A.14.3", {C::Data, C::Security}},
};

const std::vector<ActionCategory> DEFAULT_CATEGORIES = {C::Auth,  C::Security, C::Policy,
                                                        C::Git,   C::Agent,    C::Approval,
                                                        C::Config, C::Admin};

const std::vector<std::string> DEFAULT_AGENT_TYPES = {"triage", "coder", "resolver", "reviewer",
                                                      "orchestrator"};

}  // namespace warden::evidence
