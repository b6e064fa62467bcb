// ==============================================================================
// warden/evidence.hpp - Сбор доказательств для контролей соответствия
// ==============================================================================
//
// Назначение:
// - Таблицы соответствия контролей категориям действий (SOC2, ISO 27001,
//   категории контролей)
// - Источники доказательств: журнал аудита и трассы решений агентов
// - EvidenceCollector: опрос источников, оценка релевантности, сводка
//
// Отказ отдельного источника не прерывает сбор: предупреждение уходит в
// WarningSink, остальные источники опрашиваются дальше.
//
// ==============================================================================

#ifndef WARDEN_EVIDENCE_HPP
#define WARDEN_EVIDENCE_HPP

#include <warden/audit.hpp>
#include <warden/audit_log.hpp>
#include <warden/chain.hpp>
#include <warden/datetime.hpp>
#include <warden/value.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::evidence {

using audit::ActionCategory;

// ============================================================================
// Таблицы соответствия
// ============================================================================

using CategoryMap = std::map<std::string, std::vector<ActionCategory>>;

/// Категория контроля ("access_control") -> категории действий
extern const CategoryMap CONTROL_CATEGORY_MAPPINGS;

/// SOC2 Trust Service Criteria ("CC6.1") -> категории действий
extern const CategoryMap SOC2_CRITERIA_MAPPINGS;

/// ISO 27001 Annex A ("A.9.2") -> категории действий
extern const CategoryMap ISO27001_CONTROL_MAPPINGS;

/// Категории по умолчанию, если контроль не распознан
extern const std::vector<ActionCategory> DEFAULT_CATEGORIES;

/// Агенты, чьи трассы запрашиваются по умолчанию
extern const std::vector<std::string> DEFAULT_AGENT_TYPES;

// ============================================================================
// Типы
// ============================================================================

enum class EvidenceType { AuditLog, PolicyDocument, Configuration, TestResult, Report, Other };

enum class SourceKind { AuditLog, DecisionTrace, PolicyEvaluation, Document };

std::string to_string(EvidenceType type);
std::string to_string(SourceKind kind);

struct TimeRange {
    datetime::TimePoint start;
    datetime::TimePoint end;
};

struct EvidenceQuery {
    std::string tenant_id;
    TimeRange time_range;
    std::optional<std::string> control_id;
    std::optional<std::string> control_category;
    std::vector<ActionCategory> action_categories;
    std::optional<audit::ResourceType> resource_type;
    std::optional<audit::ActorType> actor_type;
    bool high_risk_only = false;
    std::optional<std::size_t> max_per_source;
    std::optional<bool> verify_chain;
};

struct EvidenceReference {
    std::string id;
    EvidenceType type = EvidenceType::AuditLog;
    std::string description;
    std::vector<std::string> audit_log_entry_ids;
    std::optional<bool> chain_verified;
    std::optional<std::string> verified_at;
    std::string collected_at;
    std::string collected_by = "evidence-collector";
    Value metadata = Value::make_object();
};

struct CollectedEvidence {
    EvidenceReference evidence;
    SourceKind source = SourceKind::AuditLog;
    double relevance_score = 0.0;  // 0..1
    std::vector<std::string> related_control_ids;
    std::optional<audit::ChainVerificationResult> chain_verification;
};

/// Контроль соответствия, к которому привязываются доказательства
struct ControlDefinition {
    std::string control_id;
    std::string title;
    std::string category;  // "Logical Access"
    std::vector<EvidenceReference> evidence;
};

// ============================================================================
// Трассы решений
// ============================================================================

enum class TraceResult { Success, Failure, Override };

struct HumanOverride {
    std::string user_id;
    std::string reason;
};

struct DecisionTrace {
    std::string id;
    std::string run_id;
    std::string agent_type;
    datetime::TimePoint timestamp;
    std::string tenant_id;

    struct Inputs {
        std::string prompt;
        std::vector<std::string> context_window;
        std::optional<int> complexity;
    } inputs;

    struct Decision {
        std::string action;
        std::string reasoning;
        double confidence = 0.0;
        std::vector<std::string> alternatives;
    } decision;

    struct Outcome {
        TraceResult result = TraceResult::Success;
        std::optional<HumanOverride> human_override;
    };
    std::optional<Outcome> outcome;
};

struct DecisionTraceFilter {
    std::optional<std::string> tenant_id;
    std::optional<std::string> run_id;
    std::optional<std::string> agent_type;
    std::optional<datetime::TimePoint> start_time;
    std::optional<datetime::TimePoint> end_time;
    std::optional<std::size_t> limit;
};

class DecisionTraceStore {
public:
    virtual ~DecisionTraceStore() = default;
    virtual std::vector<DecisionTrace> query(const DecisionTraceFilter& filter) const = 0;
};

class InMemoryDecisionTraceStore : public DecisionTraceStore {
public:
    void add(DecisionTrace trace);
    std::size_t size() const;

    /// Трассы в порядке добавления, отфильтрованные и усечённые до limit
    std::vector<DecisionTrace> query(const DecisionTraceFilter& filter) const override;

private:
    mutable std::mutex mutex_;
    std::vector<DecisionTrace> traces_;
};

/// @throw ValidationError
DecisionTrace decision_trace_from_value(const Value& value);

// ============================================================================
// Источники
// ============================================================================

class EvidenceSource {
public:
    virtual ~EvidenceSource() = default;

    virtual SourceKind kind() const = 0;
    virtual std::string name() const { return to_string(kind()); }
    virtual bool is_available() const = 0;

    /// @throw std::exception при отказе хранилища
    virtual std::vector<CollectedEvidence> collect(const EvidenceQuery& query) const = 0;
};

/// Источник: неизменяемый журнал аудита
class AuditLogEvidenceSource : public EvidenceSource {
public:
    explicit AuditLogEvidenceSource(const audit::AuditLog& log, bool verify_chain_by_default = true,
                                    datetime::Clock clock = datetime::system_clock());

    SourceKind kind() const override { return SourceKind::AuditLog; }
    bool is_available() const override { return true; }
    std::vector<CollectedEvidence> collect(const EvidenceQuery& query) const override;

private:
    const audit::AuditLog& log_;
    bool verify_chain_by_default_;
    datetime::Clock clock_;
};

/// Источник: трассы решений агентов
class DecisionTraceEvidenceSource : public EvidenceSource {
public:
    explicit DecisionTraceEvidenceSource(const DecisionTraceStore& store,
                                         datetime::Clock clock = datetime::system_clock());

    SourceKind kind() const override { return SourceKind::DecisionTrace; }

    /// Пробный запрос с limit 1; false если хранилище бросает исключение
    bool is_available() const override;
    std::vector<CollectedEvidence> collect(const EvidenceQuery& query) const override;

private:
    const DecisionTraceStore& store_;
    datetime::Clock clock_;
};

// ============================================================================
// Разрешение категорий и релевантность
// ============================================================================

/// Порядок: явные категории, SOC2 id, ISO id, родитель id (до первой '.'),
/// категория контроля, набор по умолчанию
std::vector<ActionCategory> resolve_action_categories(const EvidenceQuery& query);

/// Агенты для категории контроля
std::vector<std::string> resolve_agent_types(const EvidenceQuery& query);

/// База 0.5, надбавки за чувствительность, отказ, категорию; не более 1.0
double audit_relevance(const audit::AuditLogEntry& entry, const EvidenceQuery& query);

/// База 0.6, надбавки за уверенность > 0.9, ручное вмешательство, отказ
double trace_relevance(const DecisionTrace& trace);

/// Запрошенный контроль и все контроли, в отображении которых есть категория
std::vector<std::string> related_controls(ActionCategory category,
                                          const std::optional<std::string>& control_id);

// ============================================================================
// Сборщик
// ============================================================================

using WarningSink = std::function<void(const std::string&)>;

struct CollectorConfig {
    std::size_t default_max_per_source = 100;
    bool default_verify_chain = true;
};

struct SourceCounts {
    std::size_t audit_log = 0;
    std::size_t decision_trace = 0;
    std::size_t policy_evaluation = 0;
    std::size_t document = 0;
};

struct ChainVerificationSummary {
    std::size_t verified = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

struct CollectionMetadata {
    std::string collected_at;
    double duration_ms = 0.0;
    std::string tenant_id;
    TimeRange time_range;
};

struct CollectionResult {
    EvidenceQuery query;  // с применёнными значениями по умолчанию
    std::vector<CollectedEvidence> evidence;  // по убыванию релевантности
    SourceCounts by_source;
    std::map<std::string, std::size_t> by_control;
    ChainVerificationSummary chain_verification;
    CollectionMetadata metadata;
};

class EvidenceCollector {
public:
    explicit EvidenceCollector(CollectorConfig config = {}, WarningSink warn = nullptr,
                               datetime::Clock clock = datetime::system_clock());

    EvidenceCollector(const EvidenceCollector&) = delete;
    EvidenceCollector& operator=(const EvidenceCollector&) = delete;

    void add_source(std::unique_ptr<EvidenceSource> source);

    /// Имена доступных источников
    std::vector<std::string> available_sources() const;

    CollectionResult collect(const EvidenceQuery& query) const;

    /// Доказательства, связанные с контролем
    std::vector<CollectedEvidence> collect_for_control(const std::string& tenant_id,
                                                       const ControlDefinition& control,
                                                       const TimeRange& range) const;

    /// Один сбор, сгруппированный по контролям
    std::map<std::string, std::vector<CollectedEvidence>> collect_for_controls(
        const std::string& tenant_id, const std::vector<ControlDefinition>& controls,
        const TimeRange& range) const;

private:
    void warn(const std::string& message) const;

    CollectorConfig config_;
    WarningSink warn_;
    datetime::Clock clock_;
    std::vector<std::unique_ptr<EvidenceSource>> sources_;
};

// ============================================================================
// Помощники
// ============================================================================

struct EvidenceSummary {
    std::size_t total = 0;
    SourceCounts by_source;
    std::map<std::string, std::size_t> by_control;
    double average_relevance = 0.0;
    double chain_verification_rate = 1.0;  // verified / (verified + failed)
};

/// Добавить к контролю новые доказательства (без повторов по id)
ControlDefinition link_evidence_to_control(const ControlDefinition& control,
                                           const std::vector<CollectedEvidence>& evidence);

EvidenceSummary evidence_summary(const CollectionResult& result);

std::vector<CollectedEvidence> filter_by_relevance(const std::vector<CollectedEvidence>& evidence,
                                                   double min_score);

std::vector<CollectedEvidence> top_evidence(const std::vector<CollectedEvidence>& evidence,
                                            std::size_t count);

// ============================================================================
// Сериализация
// ============================================================================

Value to_value(const EvidenceReference& ref);
Value to_value(const CollectedEvidence& item);
Value to_value(const CollectionResult& result);
Value to_value(const EvidenceSummary& summary);

std::string to_string(TraceResult result);

/// @throw std::invalid_argument
TraceResult parse_trace_result(std::string_view s);

}  // namespace warden::evidence

#endif  // WARDEN_EVIDENCE_HPP
