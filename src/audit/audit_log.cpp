// ==============================================================================
// audit_log.cpp - Неизменяемый журнал аудита
// ==============================================================================

#include "warden/audit_log.hpp"

#include "warden/errors.hpp"

#include <algorithm>
#include <istream>
#include <ostream>
#include <thread>

namespace warden::audit {

AuditLog::AuditLog(AuditLogStorage& storage, AuditLogConfig config)
    : storage_(storage), config_(std::move(config)) {
    if (!config_.clock) {
        config_.clock = datetime::system_clock();
    }
    if (config_.max_append_retries < 1) {
        config_.max_append_retries = 1;
    }
}

AuditLogMetadata AuditLog::create_log(const std::string& tenant_id, LogScope scope,
                                      const std::optional<std::string>& scope_id) {
    if (tenant_id.empty()) {
        throw ValidationError("tenant id must not be empty");
    }
    return storage_.create_log(tenant_id, scope, scope_id, config_.clock());
}

AuditLogMetadata AuditLog::ensure_log(const std::string& tenant_id) {
    if (auto meta = storage_.get_metadata(tenant_id)) {
        return *meta;
    }
    return create_log(tenant_id);
}

void AuditLog::prepare(const std::string& tenant_id, CreateEntryInput& input) const {
    if (input.context.tenant_id.empty()) {
        input.context.tenant_id = tenant_id;
    }

    auto issues = validate_input(input);
    if (input.context.tenant_id != tenant_id) {
        issues.push_back("context.tenantId: '" + input.context.tenant_id +
                         "' does not match log tenant '" + tenant_id + "'");
    }
    if (!issues.empty()) {
        throw ValidationError("invalid audit log entry: " + issues.front(), std::move(issues));
    }

    mark_high_risk(input);
}

// ----------------------------------------------------------------------------
// Запись
// ----------------------------------------------------------------------------

AuditLogEntry AuditLog::append(const std::string& tenant_id, CreateEntryInput input) {
    prepare(tenant_id, input);

    for (int attempt = 0; attempt < config_.max_append_retries; ++attempt) {
        AuditLogMetadata head = ensure_log(tenant_id);
        if (head.sealed) {
            throw SealedLogError(tenant_id);
        }

        ChainBuilder builder(config_.algorithm);
        builder.initialize_from(head.next_sequence(), head.head_hash);
        AuditLogEntry entry = builder.build_entry(input, config_.clock());

        switch (storage_.append(tenant_id, {entry}, {head.latest_sequence, head.head_hash})) {
        case AppendStatus::Appended:
            return entry;
        case AppendStatus::Sealed:
            throw SealedLogError(tenant_id);
        case AppendStatus::Conflict:
            std::this_thread::yield();
            break;
        }
    }

    throw AppendConflictError(tenant_id, config_.max_append_retries);
}

EntryBatch AuditLog::append_batch(const std::string& tenant_id,
                                  std::vector<CreateEntryInput> inputs) {
    if (inputs.empty()) {
        throw ValidationError("cannot append an empty batch");
    }
    for (auto& input : inputs) {
        prepare(tenant_id, input);
    }

    for (int attempt = 0; attempt < config_.max_append_retries; ++attempt) {
        AuditLogMetadata head = ensure_log(tenant_id);
        if (head.sealed) {
            throw SealedLogError(tenant_id);
        }

        ChainBuilder builder(config_.algorithm);
        builder.initialize_from(head.next_sequence(), head.head_hash);
        EntryBatch batch = create_batch(builder, inputs, config_.clock());

        switch (storage_.append(tenant_id, batch.entries, {head.latest_sequence, head.head_hash})) {
        case AppendStatus::Appended:
            return batch;
        case AppendStatus::Sealed:
            throw SealedLogError(tenant_id);
        case AppendStatus::Conflict:
            std::this_thread::yield();
            break;
        }
    }

    throw AppendConflictError(tenant_id, config_.max_append_retries);
}

// ----------------------------------------------------------------------------
// Чтение
// ----------------------------------------------------------------------------

QueryResult AuditLog::query(const AuditLogQuery& q) const {
    auto issues = validate_query(q);
    if (!issues.empty()) {
        throw ValidationError("invalid audit log query: " + issues.front(), std::move(issues));
    }

    QueryResult result = storage_.query(q);
    if (q.include_chain_verification && !result.entries.empty()) {
        // Проверяется непрерывный отрезок, покрывающий окно результата
        std::uint64_t lo = result.entries.front().chain.sequence;
        std::uint64_t hi = lo;
        for (const auto& e : result.entries) {
            lo = std::min(lo, e.chain.sequence);
            hi = std::max(hi, e.chain.sequence);
        }
        result.chain_verification = verify_segment(q.tenant_id, lo, hi);
    }
    return result;
}

std::optional<AuditLogEntry> AuditLog::get_entry(const std::string& tenant_id,
                                                 const std::string& entry_id) const {
    return storage_.get_entry(tenant_id, entry_id);
}

std::optional<AuditLogMetadata> AuditLog::metadata(const std::string& tenant_id) const {
    return storage_.get_metadata(tenant_id);
}

std::uint64_t AuditLog::count_entries(const std::string& tenant_id,
                                      const CountOptions& options) const {
    auto meta = storage_.get_metadata(tenant_id);
    if (!meta) {
        return 0;
    }
    if (!options.start_time && !options.end_time && !options.high_risk_only) {
        return meta->entry_count;
    }

    AuditLogQuery filter;
    filter.tenant_id = tenant_id;
    filter.start_time = options.start_time;
    filter.end_time = options.end_time;
    filter.high_risk_only = options.high_risk_only;

    std::uint64_t count = 0;
    if (meta->latest_sequence) {
        for (const auto& e : storage_.get_chain_segment(tenant_id, 0, *meta->latest_sequence)) {
            if (matches_query(e, filter)) {
                ++count;
            }
        }
    }
    return count;
}

std::vector<AuditLogEntry> AuditLog::entries(const std::string& tenant_id, std::uint64_t start,
                                             std::uint64_t end) const {
    return storage_.get_chain_segment(tenant_id, start, end);
}

// ----------------------------------------------------------------------------
// Проверка и запечатывание
// ----------------------------------------------------------------------------

ChainVerificationResult AuditLog::verify_segment(const std::string& tenant_id,
                                                 std::uint64_t start, std::uint64_t end) const {
    VerifyOptions options;
    options.start_sequence = start;
    if (start > 0) {
        if (auto prev = storage_.get_entry_by_sequence(tenant_id, start - 1)) {
            options.expected_first_prev_hash = prev->chain.content_hash;
        }
    }
    return verify_chain(storage_.get_chain_segment(tenant_id, start, end), options);
}

ChainVerificationResult AuditLog::verify_chain_integrity(
    const std::string& tenant_id, std::optional<std::uint64_t> start_sequence,
    std::optional<std::uint64_t> end_sequence) const {
    auto meta = storage_.get_metadata(tenant_id);
    if (!meta) {
        throw NotFoundError("audit log not found: " + tenant_id);
    }
    if (!meta->latest_sequence) {
        return {};
    }

    const std::uint64_t start = start_sequence.value_or(0);
    const std::uint64_t end = std::min(end_sequence.value_or(*meta->latest_sequence),
                                       *meta->latest_sequence);
    if (start > end) {
        return {};
    }
    return verify_segment(tenant_id, start, end);
}

AuditLogMetadata AuditLog::seal(const std::string& tenant_id, const std::string& reason) {
    return storage_.seal(tenant_id, reason, config_.clock());
}

// ----------------------------------------------------------------------------
// JSONL
// ----------------------------------------------------------------------------

std::size_t AuditLog::export_jsonl(const std::string& tenant_id, std::ostream& out) const {
    auto meta = storage_.get_metadata(tenant_id);
    if (!meta) {
        throw NotFoundError("audit log not found: " + tenant_id);
    }
    if (!meta->latest_sequence) {
        return 0;
    }

    auto entries = storage_.get_chain_segment(tenant_id, 0, *meta->latest_sequence);
    for (const auto& e : entries) {
        out << to_json(to_value(e)) << '\n';
    }
    out.flush();
    return entries.size();
}

std::size_t AuditLog::import_jsonl(const std::string& tenant_id, std::istream& in) {
    std::vector<AuditLogEntry> entries;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        AuditLogEntry entry;
        try {
            entry = entry_from_value(parse_json(line));
        } catch (const ValidationError& e) {
            throw ValidationError("line " + std::to_string(line_no) + ": " + e.what(), e.issues());
        } catch (const std::runtime_error& e) {
            throw ValidationError("line " + std::to_string(line_no) + ": " + e.what());
        }
        if (entry.context.tenant_id != tenant_id) {
            throw ValidationError("line " + std::to_string(line_no) + ": entry tenant '" +
                                  entry.context.tenant_id + "' does not match log tenant '" +
                                  tenant_id + "'");
        }
        entries.push_back(std::move(entry));
    }

    if (entries.empty()) {
        return 0;
    }

    AuditLogMetadata head = ensure_log(tenant_id);
    if (head.sealed) {
        throw SealedLogError(tenant_id);
    }

    VerifyOptions options;
    options.start_sequence = head.next_sequence();
    options.expected_first_prev_hash = head.head_hash;
    ChainVerificationResult check = verify_chain(entries, options);
    if (!check.valid) {
        throw ChainIntegrityError(check.error.value_or("chain verification failed"),
                                  check.first_invalid_sequence.value_or(0));
    }

    switch (storage_.append(tenant_id, entries, {head.latest_sequence, head.head_hash})) {
    case AppendStatus::Appended:
        break;
    case AppendStatus::Sealed:
        throw SealedLogError(tenant_id);
    case AppendStatus::Conflict:
        throw AppendConflictError(tenant_id, 1);
    }
    return entries.size();
}

// ----------------------------------------------------------------------------
// Голова журнала
// ----------------------------------------------------------------------------

namespace {

std::uint64_t next_sequence(const LogHead& head) {
    return head.latest_sequence ? *head.latest_sequence + 1 : 0;
}

std::string describe(const LogHead& head) {
    if (!head.latest_sequence) {
        return std::to_string(head.entry_count) + " entries, no head";
    }
    return std::to_string(head.entry_count) + " entries ending at sequence " +
           std::to_string(*head.latest_sequence) + " (" + head.head_hash.value_or("no hash") + ")";
}

}  // namespace

LogHead head_of(const AuditLogMetadata& meta) {
    return {meta.latest_sequence, meta.head_hash, meta.entry_count};
}

LogHead head_of(const std::vector<AuditLogEntry>& entries) {
    LogHead head;
    head.entry_count = entries.size();
    if (!entries.empty()) {
        head.latest_sequence = entries.back().chain.sequence;
        head.head_hash = entries.back().chain.content_hash;
    }
    return head;
}

std::optional<HeadMismatch> compare_heads(const LogHead& recorded, const LogHead& actual) {
    if (recorded.latest_sequence == actual.latest_sequence &&
        recorded.head_hash == actual.head_hash && recorded.entry_count == actual.entry_count) {
        return std::nullopt;
    }

    HeadMismatch mismatch;
    mismatch.message = "Head mismatch: recorded " + describe(recorded) + ", found " +
                       describe(actual);
    const std::uint64_t expected_next = next_sequence(recorded);
    const std::uint64_t actual_next = next_sequence(actual);
    if (actual_next != expected_next) {
        mismatch.sequence = std::min(actual_next, expected_next);
    } else {
        mismatch.sequence = actual.latest_sequence.value_or(0);
    }
    return mismatch;
}

void check_head(const LogHead& recorded, const LogHead& actual) {
    if (auto mismatch = compare_heads(recorded, actual)) {
        throw ChainIntegrityError(mismatch->message, mismatch->sequence);
    }
}

ChainVerificationResult verify_exported_log(const std::vector<AuditLogEntry>& entries,
                                            const std::optional<AuditLogMetadata>& recorded) {
    VerifyOptions options;
    options.start_sequence = 0;
    ChainVerificationResult result = verify_chain(entries, options);
    if (!result.valid || !recorded) {
        return result;
    }

    if (auto mismatch = compare_heads(head_of(*recorded), head_of(entries))) {
        result.valid = false;
        result.first_invalid_sequence = mismatch->sequence;
        if (mismatch->sequence < entries.size()) {
            result.first_invalid_id = entries[mismatch->sequence].id;
        }
        result.error = mismatch->message;
    }
    return result;
}

}  // namespace warden::audit
