// ==============================================================================
// warden/verification.hpp - Отчёт о целостности журнала аудита
// ==============================================================================
//
// Назначение:
// - Полная проверка журнала без остановки на первой ошибке
// - Типизированные нарушения с уровнем серьёзности
// - Статистика здоровья цепочки: пропуски, непрерывность, алгоритмы, период
//
// ==============================================================================

#ifndef WARDEN_VERIFICATION_HPP
#define WARDEN_VERIFICATION_HPP

#include <warden/audit.hpp>
#include <warden/audit_log.hpp>
#include <warden/chain.hpp>
#include <warden/datetime.hpp>
#include <warden/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::audit {

// ============================================================================
// Нарушения
// ============================================================================

enum class IntegrityIssueType {
    ContentHashMismatch,  // содержимое записи изменено
    ChainLinkBroken,      // prevHash не совпадает с предыдущей записью
    SequenceGap,          // пропущенные sequence
    SequenceDuplicate,    // повторяющиеся sequence
    FirstEntryInvalid,    // у первой записи журнала есть prevHash
    TimestampRegression,  // время записи раньше предыдущей
    AlgorithmMismatch     // в цепочке несколько алгоритмов хеширования
};

enum class IssueSeverity { Critical, High, Medium, Low };

std::string to_string(IntegrityIssueType type);
std::string to_string(IssueSeverity severity);

IssueSeverity severity_of(IntegrityIssueType type);

struct IntegrityIssue {
    IntegrityIssueType type = IntegrityIssueType::ContentHashMismatch;
    IssueSeverity severity = IssueSeverity::Critical;
    std::uint64_t sequence = 0;
    std::string entry_id;
    std::string message;
    std::optional<std::string> expected;
    std::optional<std::string> actual;
    std::vector<std::string> related_entries;
};

// ============================================================================
// Отчёт
// ============================================================================

struct ChainHealthStats {
    std::uint64_t total_entries = 0;
    std::uint64_t entries_verified = 0;
    std::optional<std::uint64_t> first_sequence;  // пусто у пустого журнала
    std::optional<std::uint64_t> last_sequence;
    std::optional<std::string> earliest_timestamp;
    std::optional<std::string> latest_timestamp;
    std::uint64_t gaps_detected = 0;
    std::uint64_t missing_entries = 0;
    std::vector<HashAlgorithm> algorithms_used;
    int continuity_percent = 100;
};

struct VerificationOptions {
    /// По умолчанию 0: проверяется и prevHash первой записи журнала
    std::optional<std::uint64_t> start_sequence;
    std::optional<std::uint64_t> end_sequence;
    /// prevHash записи start_sequence, если start_sequence > 0
    std::optional<std::string> expected_first_prev_hash;
    bool include_entry_details = false;
    bool stop_on_first_error = false;
    bool verify_timestamps = false;
    std::optional<std::size_t> max_entries;
};

struct VerificationReport {
    std::string tenant_id;
    bool valid = true;
    std::string verified_at;
    double duration_ms = 0.0;
    ChainHealthStats stats;
    std::vector<IntegrityIssue> issues;  // по серьёзности, затем по sequence
    std::string summary;
    std::vector<EntryVerification> entry_details;  // при include_entry_details
};

/// Проверить записи и собрать все нарушения
VerificationReport verify_entries(const std::string& tenant_id, std::vector<AuditLogEntry> entries,
                                  const VerificationOptions& options = {},
                                  const datetime::Clock& clock = datetime::system_clock());

/// Отчёт по журналу арендатора; для отсутствующего журнала - пустой отчёт
VerificationReport generate_report(const AuditLog& log, const std::string& tenant_id,
                                   const VerificationOptions& options = {});

/// @throw NotFoundError если журнала нет
bool is_chain_valid(const AuditLog& log, const std::string& tenant_id);

/// Статистика по метаданным без проверки хешей; nullopt если журнала нет
std::optional<ChainHealthStats> get_chain_health(const AuditLog& log,
                                                 const std::string& tenant_id);

Value to_value(const IntegrityIssue& issue);
Value to_value(const ChainHealthStats& stats);
Value to_value(const VerificationReport& report);

}  // namespace warden::audit

#endif  // WARDEN_VERIFICATION_HPP
