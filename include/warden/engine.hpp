// ==============================================================================
// warden/engine.hpp - Движок политик
// ==============================================================================
//
// Назначение:
// - Загрузка документов политик: валидация, компиляция условий
// - Оценка запросов: приоритеты, deny абсолютен, накопление одобрений
// - Dry-run: вычисление всех включённых правил с пояснениями
//
// Конкурентность: скомпилированный набор правил - неизменяемый снимок
// (shared_ptr), подменяемый под std::shared_mutex. Оценка берёт разделяемую
// блокировку только на копирование указателя.
//
// ==============================================================================

#ifndef WARDEN_ENGINE_HPP
#define WARDEN_ENGINE_HPP

#include <warden/condition.hpp>
#include <warden/policy.hpp>
#include <warden/request.hpp>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace warden::policy {

// ============================================================================
// Конфигурация
// ============================================================================

struct EngineConfig {
    bool stop_on_first_match = true;
    Effect default_effect = Effect::Deny;
    bool validate_on_load = true;
};

// ============================================================================
// Скомпилированные политики
// ============================================================================

/// Правило с готовым предикатом
struct CompiledRule {
    const PolicyRule* rule = nullptr;  // указывает в CompiledPolicy::document
    std::string policy_id;
    Predicate matches;
};

/// Документ и его скомпилированные правила (порядок документа)
struct CompiledPolicy {
    std::string id;
    PolicyDocument document;
    std::vector<CompiledRule> rules;
};

/// Краткие сведения о загруженной политике
struct PolicyInfo {
    std::string id;
    std::string name;
    std::string version;
    std::size_t rule_count = 0;
    std::size_t enabled_rules = 0;
};

// ============================================================================
// Dry-run
// ============================================================================

struct RuleEvaluation {
    std::string rule_id;
    std::string rule_name;
    std::string policy_id;
    int priority = 0;
    bool enabled = true;
    bool matched = false;
    Effect effect = Effect::Deny;
    std::vector<ConditionEvaluation> conditions;
};

struct DryRunSummary {
    std::size_t total_policies = 0;
    std::size_t total_rules = 0;
    std::size_t matching_rules = 0;
    double evaluation_time_ms = 0;
};

struct DryRunResult {
    std::vector<RuleEvaluation> matching_rules;
    std::vector<RuleEvaluation> non_matching_rules;
    std::optional<RuleEvaluation> primary_match;
    Effect would_effect = Effect::Deny;
    bool would_allow = false;
    std::string reason;
    std::vector<std::string> warnings;
    DryRunSummary summary;
};

Value to_value(const RuleEvaluation& evaluation);
Value to_value(const DryRunResult& result);

// ============================================================================
// PolicyEngine
// ============================================================================

class PolicyEngine {
public:
    explicit PolicyEngine(EngineConfig config = {});

    PolicyEngine(const PolicyEngine&) = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;

    /// Загрузить документ (id по умолчанию - имя документа).
    /// Повторная загрузка с тем же id заменяет политику на месте.
    /// @return id политики
    /// @throw ValidationError, PolicyConflictError; состояние не меняется
    std::string load_policy(const PolicyDocument& document,
                            const std::optional<std::string>& id = std::nullopt);

    /// @throw NotFoundError если политика не загружена
    void unload_policy(const std::string& id);

    void clear_policies();

    std::vector<PolicyInfo> loaded_policies() const;

    /// Документ загруженной политики (nullptr если нет)
    std::shared_ptr<const CompiledPolicy> policy(const std::string& id) const;

    /// Оценить запрос. Не бросает исключений для загруженного набора правил.
    EvaluationResult evaluate(const EvaluationRequest& request) const;

    /// Вычислить все включённые правила без побочных эффектов
    DryRunResult dry_run(const EvaluationRequest& request) const;

    const EngineConfig& config() const { return config_; }

private:
    /// Неизменяемый снимок набора правил
    struct Snapshot {
        std::vector<std::shared_ptr<const CompiledPolicy>> policies;  // порядок загрузки
        std::vector<const CompiledRule*> ordered;  // включённые, по убыванию priority
    };

    std::shared_ptr<const Snapshot> snapshot() const;
    void publish(std::vector<std::shared_ptr<const CompiledPolicy>> policies);

    EngineConfig config_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace warden::policy

#endif  // WARDEN_ENGINE_HPP
