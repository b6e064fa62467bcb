// ==============================================================================
// verification.cpp - Отчёт о целостности журнала аудита
// ==============================================================================

#include "warden/verification.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>

namespace warden::audit {

// ----------------------------------------------------------------------------
// Типы нарушений
// ----------------------------------------------------------------------------

std::string to_string(IntegrityIssueType type) {
    switch (type) {
    case IntegrityIssueType::ContentHashMismatch:
        return "content_hash_mismatch";
    case IntegrityIssueType::ChainLinkBroken:
        return "chain_link_broken";
    case IntegrityIssueType::SequenceGap:
        return "sequence_gap";
    case IntegrityIssueType::SequenceDuplicate:
        return "sequence_duplicate";
    case IntegrityIssueType::FirstEntryInvalid:
        return "first_entry_invalid";
    case IntegrityIssueType::TimestampRegression:
        return "timestamp_regression";
    case IntegrityIssueType::AlgorithmMismatch:
        return "algorithm_mismatch";
    }
    return "unknown";
}

std::string to_string(IssueSeverity severity) {
    switch (severity) {
    case IssueSeverity::Critical:
        return "critical";
    case IssueSeverity::High:
        return "high";
    case IssueSeverity::Medium:
        return "medium";
    case IssueSeverity::Low:
        return "low";
    }
    return "unknown";
}

IssueSeverity severity_of(IntegrityIssueType type) {
    switch (type) {
    case IntegrityIssueType::ContentHashMismatch:
    case IntegrityIssueType::ChainLinkBroken:
        return IssueSeverity::Critical;
    case IntegrityIssueType::SequenceGap:
    case IntegrityIssueType::SequenceDuplicate:
    case IntegrityIssueType::FirstEntryInvalid:
        return IssueSeverity::High;
    case IntegrityIssueType::TimestampRegression:
        return IssueSeverity::Medium;
    case IntegrityIssueType::AlgorithmMismatch:
        return IssueSeverity::Low;
    }
    return IssueSeverity::Medium;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

IntegrityIssue make_issue(IntegrityIssueType type, const AuditLogEntry& entry,
                          std::string message) {
    IntegrityIssue issue;
    issue.type = type;
    issue.severity = severity_of(type);
    issue.sequence = entry.chain.sequence;
    issue.entry_id = entry.id;
    issue.message = std::move(message);
    return issue;
}

struct Gap {
    std::uint64_t first_missing = 0;
    std::uint64_t count = 0;
    std::size_t next_index = 0;  // запись сразу после пропуска
};

std::vector<Gap> detect_gaps(const std::vector<AuditLogEntry>& entries, std::uint64_t start) {
    std::vector<Gap> gaps;
    if (entries.empty()) {
        return gaps;
    }
    if (entries.front().chain.sequence > start) {
        gaps.push_back({start, entries.front().chain.sequence - start, 0});
    }
    for (std::size_t i = 1; i < entries.size(); ++i) {
        const std::uint64_t expected = entries[i - 1].chain.sequence + 1;
        if (entries[i].chain.sequence > expected) {
            gaps.push_back({expected, entries[i].chain.sequence - expected, i});
        }
    }
    return gaps;
}

std::string build_summary(bool valid, const std::vector<IntegrityIssue>& issues,
                          const ChainHealthStats& stats) {
    if (valid) {
        return "Chain integrity verified: " + std::to_string(stats.entries_verified) +
               " entries, " + std::to_string(stats.continuity_percent) + "% continuity";
    }

    std::size_t critical = 0;
    std::size_t high = 0;
    for (const auto& issue : issues) {
        if (issue.severity == IssueSeverity::Critical) {
            ++critical;
        } else if (issue.severity == IssueSeverity::High) {
            ++high;
        }
    }
    const std::size_t other = issues.size() - critical - high;

    std::string parts;
    auto add = [&parts](std::size_t count, const char* label) {
        if (count == 0) {
            return;
        }
        if (!parts.empty()) {
            parts += ", ";
        }
        parts += std::to_string(count) + " " + label;
    };
    add(critical, "critical");
    add(high, "high");
    add(other, "other");
    return "Chain integrity FAILED: " + parts + " issue(s) found";
}

int continuity(std::uint64_t present, std::uint64_t expected) {
    if (expected == 0) {
        return 100;
    }
    return static_cast<int>(
        std::lround(static_cast<double>(present) / static_cast<double>(expected) * 100.0));
}

void add_algorithm(std::vector<HashAlgorithm>& algorithms, HashAlgorithm algorithm) {
    if (std::find(algorithms.begin(), algorithms.end(), algorithm) == algorithms.end()) {
        algorithms.push_back(algorithm);
    }
}

VerificationReport empty_report(const std::string& tenant_id,
                                std::chrono::steady_clock::time_point started,
                                const datetime::Clock& clock) {
    VerificationReport report;
    report.tenant_id = tenant_id;
    report.verified_at = datetime::format_rfc3339(clock());
    report.summary = "No entries to verify";
    report.duration_ms = datetime::elapsed_ms(started);
    return report;
}

}  // namespace

// ----------------------------------------------------------------------------
// Проверка записей
// ----------------------------------------------------------------------------

VerificationReport verify_entries(const std::string& tenant_id, std::vector<AuditLogEntry> entries,
                                  const VerificationOptions& options,
                                  const datetime::Clock& clock) {
    const auto started = std::chrono::steady_clock::now();
    const std::uint64_t start = options.start_sequence.value_or(0);

    std::stable_sort(entries.begin(), entries.end(),
                     [](const AuditLogEntry& a, const AuditLogEntry& b) {
                         return a.chain.sequence < b.chain.sequence;
                     });
    if (options.max_entries && entries.size() > *options.max_entries) {
        entries.resize(*options.max_entries);
    }
    if (entries.empty()) {
        return empty_report(tenant_id, started, clock);
    }

    VerificationReport report;
    report.tenant_id = tenant_id;
    std::vector<IntegrityIssue>& issues = report.issues;

    // --- Хеши и звенья ---
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const AuditLogEntry& entry = entries[i];

        EntryVerification detail;
        detail.entry_id = entry.id;
        detail.sequence = entry.chain.sequence;
        detail.expected_content_hash = entry.chain.content_hash;
        detail.actual_content_hash = compute_content_hash(entry, entry.chain.algorithm);
        detail.content_hash_valid = detail.actual_content_hash == detail.expected_content_hash;
        detail.chain_link_valid = true;

        if (i > 0) {
            const AuditLogEntry& prev = entries[i - 1];
            if (prev.chain.sequence + 1 == entry.chain.sequence) {
                detail.chain_link_valid = entry.chain.prev_hash == prev.chain.content_hash;
            }
        } else if (start > 0 && entry.chain.sequence == start && options.expected_first_prev_hash) {
            detail.chain_link_valid = entry.chain.prev_hash == options.expected_first_prev_hash;
        }

        bool failed = false;
        if (!detail.content_hash_valid) {
            detail.error = "Content hash mismatch";
            IntegrityIssue issue =
                make_issue(IntegrityIssueType::ContentHashMismatch, entry,
                           "Content hash mismatch at sequence " +
                               std::to_string(entry.chain.sequence));
            issue.expected = detail.expected_content_hash;
            issue.actual = detail.actual_content_hash;
            issues.push_back(std::move(issue));
            failed = true;
        }
        if (!detail.chain_link_valid) {
            detail.error = detail.error ? *detail.error + "; Chain link broken" : "Chain link broken";
            IntegrityIssue issue = make_issue(
                IntegrityIssueType::ChainLinkBroken, entry,
                "Chain link broken at sequence " + std::to_string(entry.chain.sequence) +
                    ": prevHash does not match previous entry");
            issue.expected = i > 0 ? entries[i - 1].chain.content_hash
                                   : options.expected_first_prev_hash.value_or("");
            issue.actual = entry.chain.prev_hash.value_or("null");
            issues.push_back(std::move(issue));
            failed = true;
        }

        if (options.include_entry_details) {
            report.entry_details.push_back(std::move(detail));
        }
        if (failed && options.stop_on_first_error) {
            break;
        }
    }

    // --- Пропуски и повторы ---
    const std::vector<Gap> gaps = detect_gaps(entries, start);
    std::uint64_t missing = 0;
    for (const auto& gap : gaps) {
        missing += gap.count;
        const AuditLogEntry& next = entries[gap.next_index];
        const std::uint64_t last_missing = gap.first_missing + gap.count - 1;
        IntegrityIssue issue =
            make_issue(IntegrityIssueType::SequenceGap, next,
                       "Gap detected: missing sequences " + std::to_string(gap.first_missing) +
                           "-" + std::to_string(last_missing) + " (" +
                           std::to_string(gap.count) + " entries)");
        issue.sequence = gap.first_missing;
        issue.expected = "sequence " + std::to_string(gap.first_missing);
        issue.actual = "sequence " + std::to_string(next.chain.sequence);
        if (gap.next_index > 0) {
            issue.related_entries.push_back(entries[gap.next_index - 1].id);
        }
        issues.push_back(std::move(issue));
    }

    std::map<std::uint64_t, std::vector<std::string>> by_sequence;
    for (const auto& entry : entries) {
        by_sequence[entry.chain.sequence].push_back(entry.id);
    }
    for (const auto& [sequence, ids] : by_sequence) {
        if (ids.size() < 2) {
            continue;
        }
        IntegrityIssue issue;
        issue.type = IntegrityIssueType::SequenceDuplicate;
        issue.severity = severity_of(issue.type);
        issue.sequence = sequence;
        issue.entry_id = ids.front();
        issue.message = "Duplicate sequence " + std::to_string(sequence) + " found in " +
                        std::to_string(ids.size()) + " entries";
        issue.related_entries = ids;
        issues.push_back(std::move(issue));
    }

    // --- Начало журнала ---
    if (start == 0 && entries.front().chain.prev_hash) {
        IntegrityIssue issue = make_issue(IntegrityIssueType::FirstEntryInvalid, entries.front(),
                                          "First entry in chain should have null prevHash");
        issue.expected = "null";
        issue.actual = *entries.front().chain.prev_hash;
        issues.push_back(std::move(issue));
    }

    // --- Время ---
    std::optional<datetime::TimePoint> earliest;
    std::optional<datetime::TimePoint> latest;
    std::optional<datetime::TimePoint> prev_time;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        auto at = datetime::parse_rfc3339(entries[i].timestamp);
        if (!at) {
            prev_time.reset();
            continue;
        }
        if (!earliest || *at < *earliest) {
            earliest = at;
        }
        if (!latest || *at > *latest) {
            latest = at;
        }
        if (options.verify_timestamps && prev_time && *at < *prev_time) {
            IntegrityIssue issue = make_issue(
                IntegrityIssueType::TimestampRegression, entries[i],
                "Timestamp regression: entry " + std::to_string(entries[i].chain.sequence) +
                    " is earlier than entry " + std::to_string(entries[i - 1].chain.sequence));
            issue.expected = ">= " + entries[i - 1].timestamp;
            issue.actual = entries[i].timestamp;
            issue.related_entries.push_back(entries[i - 1].id);
            issues.push_back(std::move(issue));
        }
        prev_time = at;
    }

    // --- Алгоритмы ---
    ChainHealthStats& stats = report.stats;
    for (const auto& entry : entries) {
        add_algorithm(stats.algorithms_used, entry.chain.algorithm);
    }
    if (stats.algorithms_used.size() > 1) {
        std::string list;
        for (auto algorithm : stats.algorithms_used) {
            list += (list.empty() ? "" : ", ") + to_string(algorithm);
        }
        IntegrityIssue issue = make_issue(IntegrityIssueType::AlgorithmMismatch, entries.front(),
                                          "Multiple hash algorithms used in chain: " + list);
        issue.expected = "single consistent algorithm";
        issue.actual = list;
        issues.push_back(std::move(issue));
    }

    std::stable_sort(issues.begin(), issues.end(),
                     [](const IntegrityIssue& a, const IntegrityIssue& b) {
                         if (a.severity != b.severity) {
                             return static_cast<int>(a.severity) < static_cast<int>(b.severity);
                         }
                         return a.sequence < b.sequence;
                     });

    stats.total_entries = entries.size();
    stats.entries_verified = entries.size();
    stats.first_sequence = entries.front().chain.sequence;
    stats.last_sequence = entries.back().chain.sequence;
    if (earliest) {
        stats.earliest_timestamp = datetime::format_rfc3339(*earliest);
        stats.latest_timestamp = datetime::format_rfc3339(*latest);
    }
    stats.gaps_detected = gaps.size();
    stats.missing_entries = missing;
    stats.continuity_percent = continuity(entries.size(), entries.size() + missing);

    report.valid = issues.empty();
    report.summary = build_summary(report.valid, issues, stats);
    report.verified_at = datetime::format_rfc3339(clock());
    report.duration_ms = datetime::elapsed_ms(started);
    return report;
}

// ----------------------------------------------------------------------------
// Отчёт по журналу
// ----------------------------------------------------------------------------

VerificationReport generate_report(const AuditLog& log, const std::string& tenant_id,
                                   const VerificationOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    const datetime::Clock& clock = log.config().clock;

    auto meta = log.metadata(tenant_id);
    if (!meta || !meta->latest_sequence) {
        return empty_report(tenant_id, started, clock);
    }

    const std::uint64_t start = options.start_sequence.value_or(0);
    const std::uint64_t end =
        std::min(options.end_sequence.value_or(*meta->latest_sequence), *meta->latest_sequence);
    if (start > end) {
        return empty_report(tenant_id, started, clock);
    }

    VerificationOptions effective = options;
    effective.start_sequence = start;
    if (start > 0 && !effective.expected_first_prev_hash) {
        auto prev = log.entries(tenant_id, start - 1, start - 1);
        if (!prev.empty()) {
            effective.expected_first_prev_hash = prev.front().chain.content_hash;
        }
    }
    return verify_entries(tenant_id, log.entries(tenant_id, start, end), effective, clock);
}

bool is_chain_valid(const AuditLog& log, const std::string& tenant_id) {
    return log.verify_chain_integrity(tenant_id).valid;
}

std::optional<ChainHealthStats> get_chain_health(const AuditLog& log,
                                                 const std::string& tenant_id) {
    auto meta = log.metadata(tenant_id);
    if (!meta) {
        return std::nullopt;
    }

    ChainHealthStats stats;
    stats.total_entries = meta->entry_count;
    if (!meta->latest_sequence) {
        return stats;
    }

    constexpr std::uint64_t SAMPLE_SIZE = 100;
    for (const auto& entry :
         log.entries(tenant_id, 0, std::min(*meta->latest_sequence, SAMPLE_SIZE - 1))) {
        add_algorithm(stats.algorithms_used, entry.chain.algorithm);
    }

    const std::uint64_t expected = *meta->latest_sequence + 1;
    stats.first_sequence = 0;
    stats.last_sequence = meta->latest_sequence;
    stats.earliest_timestamp = meta->created_at;
    stats.latest_timestamp = meta->latest_timestamp;
    stats.missing_entries = expected > meta->entry_count ? expected - meta->entry_count : 0;
    stats.gaps_detected = stats.missing_entries;
    stats.continuity_percent = continuity(meta->entry_count, expected);
    return stats;
}

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

Value to_value(const IntegrityIssue& issue) {
    Value v = Value::make_object();
    v.set("type", Value(to_string(issue.type)));
    v.set("severity", Value(to_string(issue.severity)));
    v.set("sequence", Value(issue.sequence));
    v.set("entryId", Value(issue.entry_id));
    v.set("message", Value(issue.message));
    if (issue.expected) {
        v.set("expected", Value(*issue.expected));
    }
    if (issue.actual) {
        v.set("actual", Value(*issue.actual));
    }
    if (!issue.related_entries.empty()) {
        v.set("relatedEntries", Value::make_string_array(issue.related_entries));
    }
    return v;
}

Value to_value(const ChainHealthStats& stats) {
    Value v = Value::make_object();
    v.set("totalEntries", Value(stats.total_entries));
    v.set("entriesVerified", Value(stats.entries_verified));
    if (stats.first_sequence && stats.last_sequence) {
        Value range = Value::make_object();
        range.set("start", Value(*stats.first_sequence));
        range.set("end", Value(*stats.last_sequence));
        v.set("sequenceRange", std::move(range));
    }
    if (stats.earliest_timestamp && stats.latest_timestamp) {
        Value range = Value::make_object();
        range.set("start", Value(*stats.earliest_timestamp));
        range.set("end", Value(*stats.latest_timestamp));
        v.set("timeRange", std::move(range));
    }
    v.set("gapsDetected", Value(stats.gaps_detected));
    v.set("missingEntries", Value(stats.missing_entries));
    Value algorithms = Value::make_array();
    for (auto algorithm : stats.algorithms_used) {
        algorithms.push_back(Value(to_string(algorithm)));
    }
    v.set("algorithmsUsed", std::move(algorithms));
    v.set("continuityPercent", Value::make_int(stats.continuity_percent));
    return v;
}

Value to_value(const VerificationReport& report) {
    Value v = Value::make_object();
    v.set("tenantId", Value(report.tenant_id));
    v.set("valid", Value(report.valid));
    v.set("verifiedAt", Value(report.verified_at));
    v.set("durationMs", Value(report.duration_ms));
    v.set("stats", to_value(report.stats));
    Value issues = Value::make_array();
    for (const auto& issue : report.issues) {
        issues.push_back(to_value(issue));
    }
    v.set("issues", std::move(issues));
    v.set("summary", Value(report.summary));
    if (!report.entry_details.empty()) {
        Value details = Value::make_array();
        for (const auto& d : report.entry_details) {
            Value item = Value::make_object();
            item.set("entryId", Value(d.entry_id));
            item.set("sequence", Value(d.sequence));
            item.set("contentHashValid", Value(d.content_hash_valid));
            item.set("chainLinkValid", Value(d.chain_link_valid));
            if (d.error) {
                item.set("error", Value(*d.error));
            }
            details.push_back(std::move(item));
        }
        v.set("entryDetails", std::move(details));
    }
    return v;
}

}  // namespace warden::audit
