// ==============================================================================
// warden/audit_store.hpp - Хранилище журнала аудита
// ==============================================================================
//
// Назначение:
// - Контракт хранилища (AuditLogStorage): условная запись, запросы, метаданные
// - Фильтр запроса AuditLogQuery и результат с пагинацией
// - In-memory реализация с блокировкой на арендатора
//
// Условная запись (compare-and-swap): append принимает ожидаемую голову
// журнала и отказывает (Conflict), если её уже продвинул другой писатель.
//
// ==============================================================================

#ifndef WARDEN_AUDIT_STORE_HPP
#define WARDEN_AUDIT_STORE_HPP

#include <warden/audit.hpp>
#include <warden/chain.hpp>
#include <warden/datetime.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace warden::audit {

// ============================================================================
// Запрос
// ============================================================================

enum class SortOrder { Asc, Desc };

constexpr std::size_t DEFAULT_QUERY_LIMIT = 100;
constexpr std::size_t MAX_QUERY_LIMIT = 1000;

struct AuditLogQuery {
    std::string tenant_id;

    std::vector<ActionCategory> categories;
    std::vector<std::string> action_types;
    std::vector<OutcomeStatus> outcomes;
    std::optional<std::string> actor_id;
    std::optional<ActorType> actor_type;
    std::optional<ResourceType> resource_type;
    std::optional<std::string> resource_id;

    std::optional<std::string> trace_id;
    std::optional<std::string> run_id;
    std::optional<std::string> request_id;

    std::optional<datetime::TimePoint> start_time;  // включительно
    std::optional<datetime::TimePoint> end_time;    // включительно
    std::optional<std::uint64_t> start_sequence;
    std::optional<std::uint64_t> end_sequence;

    bool high_risk_only = false;
    std::vector<std::string> tags;           // любой из тегов
    std::optional<std::string> search_text;  // без учёта регистра

    std::size_t limit = DEFAULT_QUERY_LIMIT;
    std::size_t offset = 0;
    SortOrder order = SortOrder::Desc;

    bool include_chain_verification = false;
};

struct QueryResult {
    std::vector<AuditLogEntry> entries;
    std::size_t total = 0;  // до пагинации
    bool has_more = false;
    double query_time_ms = 0.0;
    std::optional<ChainVerificationResult> chain_verification;
};

/// Запись удовлетворяет всем фильтрам запроса (без пагинации)
bool matches_query(const AuditLogEntry& entry, const AuditLogQuery& query);

/// Нарушения параметров запроса (пустой tenant, limit вне 1..1000)
std::vector<std::string> validate_query(const AuditLogQuery& query);

Value to_value(const QueryResult& result);

SortOrder parse_sort_order(std::string_view s);
std::string to_string(SortOrder order);

// ============================================================================
// Метаданные
// ============================================================================

struct AuditLogMetadata {
    std::string id;  // "log-{tenant}-{scope}-{8 символов}"
    std::string tenant_id;
    LogScope scope = LogScope::Tenant;
    std::optional<std::string> scope_id;
    std::string created_at;
    std::optional<std::uint64_t> latest_sequence;  // пусто у нового журнала
    std::optional<std::string> latest_timestamp;
    std::optional<std::string> head_hash;
    std::uint64_t entry_count = 0;
    bool sealed = false;
    std::optional<std::string> sealed_at;
    std::optional<std::string> seal_reason;

    /// Номер следующей записи
    std::uint64_t next_sequence() const { return latest_sequence ? *latest_sequence + 1 : 0; }
};

Value to_value(const AuditLogMetadata& meta);

/// @throw ValidationError
AuditLogMetadata metadata_from_value(const Value& value);

// ============================================================================
// Контракт хранилища
// ============================================================================

/// Ожидаемая голова журнала для условной записи
struct ExpectedHead {
    std::optional<std::uint64_t> latest_sequence;
    std::optional<std::string> head_hash;
};

enum class AppendStatus { Appended, Conflict, Sealed };

std::string to_string(AppendStatus status);

class AuditLogStorage {
public:
    virtual ~AuditLogStorage() = default;

    /// Создать журнал; существующий журнал возвращается без изменений
    virtual AuditLogMetadata create_log(const std::string& tenant_id, LogScope scope,
                                        const std::optional<std::string>& scope_id,
                                        datetime::TimePoint at) = 0;

    virtual std::optional<AuditLogMetadata> get_metadata(const std::string& tenant_id) const = 0;

    /// Атомарно дописать записи, если голова совпадает с ожидаемой
    /// @throw NotFoundError если журнала нет
    virtual AppendStatus append(const std::string& tenant_id,
                                const std::vector<AuditLogEntry>& entries,
                                const ExpectedHead& expected) = 0;

    virtual QueryResult query(const AuditLogQuery& query) const = 0;

    virtual std::optional<AuditLogEntry> get_entry(const std::string& tenant_id,
                                                   const std::string& entry_id) const = 0;

    virtual std::optional<AuditLogEntry> get_entry_by_sequence(const std::string& tenant_id,
                                                               std::uint64_t sequence) const = 0;

    /// Записи с sequence в [start, end] по возрастанию
    virtual std::vector<AuditLogEntry> get_chain_segment(const std::string& tenant_id,
                                                         std::uint64_t start,
                                                         std::uint64_t end) const = 0;

    /// Запечатать журнал
    /// @throw NotFoundError если журнала нет
    /// @throw SealedLogError если журнал уже запечатан
    virtual AuditLogMetadata seal(const std::string& tenant_id, const std::string& reason,
                                  datetime::TimePoint at) = 0;
};

// ============================================================================
// In-memory хранилище
// ============================================================================

class InMemoryAuditLogStore : public AuditLogStorage {
public:
    InMemoryAuditLogStore() = default;
    InMemoryAuditLogStore(const InMemoryAuditLogStore&) = delete;
    InMemoryAuditLogStore& operator=(const InMemoryAuditLogStore&) = delete;

    AuditLogMetadata create_log(const std::string& tenant_id, LogScope scope,
                                const std::optional<std::string>& scope_id,
                                datetime::TimePoint at) override;
    std::optional<AuditLogMetadata> get_metadata(const std::string& tenant_id) const override;
    AppendStatus append(const std::string& tenant_id, const std::vector<AuditLogEntry>& entries,
                        const ExpectedHead& expected) override;
    QueryResult query(const AuditLogQuery& query) const override;
    std::optional<AuditLogEntry> get_entry(const std::string& tenant_id,
                                           const std::string& entry_id) const override;
    std::optional<AuditLogEntry> get_entry_by_sequence(const std::string& tenant_id,
                                                       std::uint64_t sequence) const override;
    std::vector<AuditLogEntry> get_chain_segment(const std::string& tenant_id,
                                                 std::uint64_t start,
                                                 std::uint64_t end) const override;
    AuditLogMetadata seal(const std::string& tenant_id, const std::string& reason,
                          datetime::TimePoint at) override;

    /// Количество журналов
    std::size_t log_count() const;

private:
    struct TenantLog {
        mutable std::mutex mutex;
        AuditLogMetadata metadata;
        std::vector<AuditLogEntry> entries;  // entries[i].chain.sequence == i
        std::unordered_map<std::string, std::size_t> by_id;
    };

    std::shared_ptr<TenantLog> find(const std::string& tenant_id) const;

    mutable std::shared_mutex logs_mutex_;
    std::map<std::string, std::shared_ptr<TenantLog>> logs_;
};

}  // namespace warden::audit

#endif  // WARDEN_AUDIT_STORE_HPP
