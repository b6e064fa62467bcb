// ==============================================================================
// warden/audit_log.hpp - Неизменяемый журнал аудита
// ==============================================================================
//
// Назначение:
// - Дописывание записей с цепочкой хешей поверх AuditLogStorage
// - Оптимистичная конкурентность: чтение головы -> построение записи ->
//   условная запись -> повтор при конфликте
// - Запечатывание, проверка целостности, запросы
// - Экспорт / импорт JSONL с проверкой цепочки
//
// Жизненный цикл журнала: active -> seal -> sealed (терминальное состояние).
//
// ==============================================================================

#ifndef WARDEN_AUDIT_LOG_HPP
#define WARDEN_AUDIT_LOG_HPP

#include <warden/audit.hpp>
#include <warden/audit_store.hpp>
#include <warden/chain.hpp>
#include <warden/datetime.hpp>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace warden::audit {

struct AuditLogConfig {
    HashAlgorithm algorithm = HashAlgorithm::Sha256;
    int max_append_retries = 100;
    datetime::Clock clock = datetime::system_clock();
};

struct CountOptions {
    std::optional<datetime::TimePoint> start_time;
    std::optional<datetime::TimePoint> end_time;
    bool high_risk_only = false;
};

class AuditLog {
public:
    explicit AuditLog(AuditLogStorage& storage, AuditLogConfig config = {});

    /// Создать журнал арендатора (существующий возвращается как есть)
    AuditLogMetadata create_log(const std::string& tenant_id, LogScope scope = LogScope::Tenant,
                                const std::optional<std::string>& scope_id = std::nullopt);

    /// Дописать запись; журнал создаётся при первой записи
    /// @throw ValidationError некорректный вход (состояние не меняется)
    /// @throw SealedLogError журнал запечатан
    /// @throw AppendConflictError исчерпаны повторы
    AuditLogEntry append(const std::string& tenant_id, CreateEntryInput input);

    /// Атомарно дописать пакет; возвращает записи и корень Меркла
    EntryBatch append_batch(const std::string& tenant_id, std::vector<CreateEntryInput> inputs);

    /// @throw ValidationError некорректные параметры запроса
    QueryResult query(const AuditLogQuery& query) const;

    std::optional<AuditLogEntry> get_entry(const std::string& tenant_id,
                                           const std::string& entry_id) const;

    /// Проверить отрезок [start, end] (по умолчанию весь журнал)
    /// @throw NotFoundError если журнала нет
    ChainVerificationResult verify_chain_integrity(
        const std::string& tenant_id, std::optional<std::uint64_t> start_sequence = std::nullopt,
        std::optional<std::uint64_t> end_sequence = std::nullopt) const;

    /// @throw NotFoundError если журнала нет
    /// @throw SealedLogError если журнал уже запечатан
    AuditLogMetadata seal(const std::string& tenant_id, const std::string& reason);

    std::optional<AuditLogMetadata> metadata(const std::string& tenant_id) const;

    std::uint64_t count_entries(const std::string& tenant_id, const CountOptions& options = {}) const;

    /// Записи с sequence в [start, end] по возрастанию
    std::vector<AuditLogEntry> entries(const std::string& tenant_id, std::uint64_t start,
                                       std::uint64_t end) const;

    /// Записать журнал построчно (JSONL), по возрастанию sequence
    /// @return число записей
    std::size_t export_jsonl(const std::string& tenant_id, std::ostream& out) const;

    /// Прочитать JSONL и дописать записи после проверки цепочки
    /// @throw ChainIntegrityError с первым нарушенным sequence
    /// @return число импортированных записей
    std::size_t import_jsonl(const std::string& tenant_id, std::istream& in);

    const AuditLogConfig& config() const { return config_; }

private:
    AuditLogMetadata ensure_log(const std::string& tenant_id);
    void prepare(const std::string& tenant_id, CreateEntryInput& input) const;
    ChainVerificationResult verify_segment(const std::string& tenant_id, std::uint64_t start,
                                           std::uint64_t end) const;

    AuditLogStorage& storage_;
    AuditLogConfig config_;
};

// ============================================================================
// Голова журнала
// ============================================================================

/// Последняя запись и число записей журнала
struct LogHead {
    std::optional<std::uint64_t> latest_sequence;
    std::optional<std::string> head_hash;
    std::uint64_t entry_count = 0;
};

LogHead head_of(const AuditLogMetadata& meta);

/// Голова по записям в порядке sequence
LogHead head_of(const std::vector<AuditLogEntry>& entries);

struct HeadMismatch {
    std::string message;
    std::uint64_t sequence = 0;  // первая отсутствующая или лишняя запись
};

/// Сравнить сохранённую голову с фактической
std::optional<HeadMismatch> compare_heads(const LogHead& recorded, const LogHead& actual);

/// @throw ChainIntegrityError если головы не совпадают
void check_head(const LogHead& recorded, const LogHead& actual);

/// Проверить выгруженный журнал целиком: цепочка от sequence 0 и,
/// если метаданные сохранены, совпадение головы (обрезанный хвост)
ChainVerificationResult verify_exported_log(
    const std::vector<AuditLogEntry>& entries,
    const std::optional<AuditLogMetadata>& recorded = std::nullopt);

}  // namespace warden::audit

#endif  // WARDEN_AUDIT_LOG_HPP
