// ==============================================================================
// store.cpp - Фильтры запросов и in-memory хранилище журнала аудита
// ==============================================================================

#include "warden/audit_store.hpp"

#include "warden/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace warden::audit {

// ============================================================================
// Фильтры
// ============================================================================

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename T>
bool contains(const std::vector<T>& items, const T& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

bool matches_text(const AuditLogEntry& entry, const std::string& needle) {
    const std::string lowered = to_lower(needle);
    auto has = [&](const std::string& haystack) {
        return to_lower(haystack).find(lowered) != std::string::npos;
    };
    if (has(entry.action.type) || has(to_json(entry.details))) {
        return true;
    }
    if (entry.action.description && has(*entry.action.description)) {
        return true;
    }
    return entry.outcome.error_message && has(*entry.outcome.error_message);
}

}  // namespace

bool matches_query(const AuditLogEntry& entry, const AuditLogQuery& q) {
    if (!q.tenant_id.empty() && entry.context.tenant_id != q.tenant_id) {
        return false;
    }
    if (!q.categories.empty() && !contains(q.categories, entry.action.category)) {
        return false;
    }
    if (!q.action_types.empty() && !contains(q.action_types, entry.action.type)) {
        return false;
    }
    if (!q.outcomes.empty() && !contains(q.outcomes, entry.outcome.status)) {
        return false;
    }
    if (q.actor_id && entry.actor.id != *q.actor_id) {
        return false;
    }
    if (q.actor_type && entry.actor.type != *q.actor_type) {
        return false;
    }
    if (q.resource_type && (!entry.resource || entry.resource->type != *q.resource_type)) {
        return false;
    }
    if (q.resource_id && (!entry.resource || entry.resource->id != *q.resource_id)) {
        return false;
    }
    if (q.trace_id && entry.context.trace_id != q.trace_id) {
        return false;
    }
    if (q.run_id && entry.context.run_id != q.run_id) {
        return false;
    }
    if (q.request_id && entry.context.request_id != q.request_id) {
        return false;
    }

    if (q.start_time || q.end_time) {
        auto ts = datetime::parse_rfc3339(entry.timestamp);
        if (!ts) {
            return false;
        }
        if (q.start_time && *ts < *q.start_time) {
            return false;
        }
        if (q.end_time && *ts > *q.end_time) {
            return false;
        }
    }

    if (q.start_sequence && entry.chain.sequence < *q.start_sequence) {
        return false;
    }
    if (q.end_sequence && entry.chain.sequence > *q.end_sequence) {
        return false;
    }
    if (q.high_risk_only && !entry.high_risk) {
        return false;
    }
    if (!q.tags.empty()) {
        bool any = std::any_of(q.tags.begin(), q.tags.end(),
                               [&](const std::string& t) { return contains(entry.tags, t); });
        if (!any) {
            return false;
        }
    }
    if (q.search_text && !q.search_text->empty() && !matches_text(entry, *q.search_text)) {
        return false;
    }
    return true;
}

std::vector<std::string> validate_query(const AuditLogQuery& q) {
    std::vector<std::string> issues;
    if (q.tenant_id.empty()) {
        issues.push_back("tenantId: must not be empty");
    }
    if (q.limit < 1 || q.limit > MAX_QUERY_LIMIT) {
        issues.push_back("limit: must be between 1 and " + std::to_string(MAX_QUERY_LIMIT));
    }
    if (q.start_sequence && q.end_sequence && *q.start_sequence > *q.end_sequence) {
        issues.push_back("startSequence: must not exceed endSequence");
    }
    return issues;
}

Value to_value(const QueryResult& result) {
    Value v = Value::make_object();
    Value entries = Value::make_array();
    for (const auto& e : result.entries) {
        entries.push_back(to_value(e));
    }
    v.set("entries", std::move(entries));
    v.set("total", Value(static_cast<std::uint64_t>(result.total)));
    v.set("hasMore", Value(result.has_more));
    v.set("queryTimeMs", Value(result.query_time_ms));
    if (result.chain_verification) {
        v.set("chainVerification", to_value(*result.chain_verification));
    }
    return v;
}

SortOrder parse_sort_order(std::string_view s) {
    if (s == "asc") {
        return SortOrder::Asc;
    }
    if (s == "desc") {
        return SortOrder::Desc;
    }
    throw std::invalid_argument("unknown sort order, must be: asc, or desc");
}

std::string to_string(SortOrder order) {
    return order == SortOrder::Asc ? "asc" : "desc";
}

std::string to_string(AppendStatus status) {
    switch (status) {
    case AppendStatus::Appended:
        return "appended";
    case AppendStatus::Conflict:
        return "conflict";
    case AppendStatus::Sealed:
        return "sealed";
    }
    return "appended";
}

// ============================================================================
// Метаданные
// ============================================================================

Value to_value(const AuditLogMetadata& m) {
    Value v = Value::make_object();
    v.set("id", Value(m.id));
    v.set("tenantId", Value(m.tenant_id));
    v.set("scope", Value(to_string(m.scope)));
    if (m.scope_id) {
        v.set("scopeId", Value(*m.scope_id));
    }
    v.set("createdAt", Value(m.created_at));
    if (m.latest_sequence) {
        v.set("latestSequence", Value(*m.latest_sequence));
    }
    if (m.latest_timestamp) {
        v.set("latestTimestamp", Value(*m.latest_timestamp));
    }
    if (m.head_hash) {
        v.set("headHash", Value(*m.head_hash));
    }
    v.set("entryCount", Value(m.entry_count));
    v.set("sealed", Value(m.sealed));
    if (m.sealed_at) {
        v.set("sealedAt", Value(*m.sealed_at));
    }
    if (m.seal_reason) {
        v.set("sealReason", Value(*m.seal_reason));
    }
    return v;
}

AuditLogMetadata metadata_from_value(const Value& value) {
    if (!value.is_object()) {
        throw ValidationError("audit log metadata must be an object");
    }

    std::vector<std::string> issues;
    auto str = [&](const char* key) -> std::optional<std::string> {
        const Value* v = value.get(key);
        if (v == nullptr || v->is_null()) {
            return std::nullopt;
        }
        if (!v->is_string()) {
            issues.push_back(std::string(key) + ": expected a string");
            return std::nullopt;
        }
        return v->as_string();
    };
    auto uint = [&](const char* key) -> std::optional<std::uint64_t> {
        const Value* v = value.get(key);
        if (v == nullptr || v->is_null()) {
            return std::nullopt;
        }
        if (v->is_uint()) {
            return v->as_uint();
        }
        if (v->is_int() && v->as_int() >= 0) {
            return static_cast<std::uint64_t>(v->as_int());
        }
        issues.push_back(std::string(key) + ": expected a non-negative integer");
        return std::nullopt;
    };

    AuditLogMetadata m;
    m.id = str("id").value_or("");
    m.tenant_id = str("tenantId").value_or("");
    if (m.tenant_id.empty()) {
        issues.push_back("tenantId: required");
    }
    if (auto scope = str("scope")) {
        try {
            m.scope = parse_log_scope(*scope);
        } catch (const std::invalid_argument& e) {
            issues.push_back(std::string("scope: ") + e.what());
        }
    }
    m.scope_id = str("scopeId");
    m.created_at = str("createdAt").value_or("");
    m.latest_sequence = uint("latestSequence");
    m.latest_timestamp = str("latestTimestamp");
    m.head_hash = str("headHash");
    m.entry_count = uint("entryCount").value_or(0);
    if (const Value* sealed = value.get("sealed")) {
        if (sealed->is_bool()) {
            m.sealed = sealed->as_bool();
        } else {
            issues.push_back("sealed: expected a boolean");
        }
    }
    m.sealed_at = str("sealedAt");
    m.seal_reason = str("sealReason");

    if (!issues.empty()) {
        throw ValidationError("invalid audit log metadata: " + issues.front(), std::move(issues));
    }
    return m;
}

// ============================================================================
// InMemoryAuditLogStore
// ============================================================================

std::shared_ptr<InMemoryAuditLogStore::TenantLog> InMemoryAuditLogStore::find(
    const std::string& tenant_id) const {
    std::shared_lock<std::shared_mutex> lock(logs_mutex_);
    auto it = logs_.find(tenant_id);
    return it == logs_.end() ? nullptr : it->second;
}

AuditLogMetadata InMemoryAuditLogStore::create_log(const std::string& tenant_id, LogScope scope,
                                                   const std::optional<std::string>& scope_id,
                                                   datetime::TimePoint at) {
    std::unique_lock<std::shared_mutex> lock(logs_mutex_);
    auto& slot = logs_[tenant_id];
    if (!slot) {
        auto log = std::make_shared<TenantLog>();
        log->metadata.id = generate_log_id(tenant_id, scope);
        log->metadata.tenant_id = tenant_id;
        log->metadata.scope = scope;
        log->metadata.scope_id = scope_id;
        log->metadata.created_at = datetime::format_rfc3339(at);
        slot = std::move(log);
    }
    std::lock_guard<std::mutex> guard(slot->mutex);
    return slot->metadata;
}

std::optional<AuditLogMetadata> InMemoryAuditLogStore::get_metadata(
    const std::string& tenant_id) const {
    auto log = find(tenant_id);
    if (!log) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(log->mutex);
    return log->metadata;
}

AppendStatus InMemoryAuditLogStore::append(const std::string& tenant_id,
                                           const std::vector<AuditLogEntry>& entries,
                                           const ExpectedHead& expected) {
    auto log = find(tenant_id);
    if (!log) {
        throw NotFoundError("audit log not found: " + tenant_id);
    }

    std::lock_guard<std::mutex> guard(log->mutex);
    AuditLogMetadata& meta = log->metadata;
    if (meta.sealed) {
        return AppendStatus::Sealed;
    }
    if (meta.latest_sequence != expected.latest_sequence || meta.head_hash != expected.head_hash) {
        return AppendStatus::Conflict;
    }
    if (entries.empty()) {
        return AppendStatus::Appended;
    }

    // Записи должны продолжать текущую голову без пропусков
    std::uint64_t next = meta.next_sequence();
    std::optional<std::string> prev = meta.head_hash;
    for (const auto& e : entries) {
        if (e.chain.sequence != next || e.chain.prev_hash != prev) {
            return AppendStatus::Conflict;
        }
        next += 1;
        prev = e.chain.content_hash;
    }

    for (const auto& e : entries) {
        log->by_id[e.id] = log->entries.size();
        log->entries.push_back(e);
    }

    const AuditLogEntry& last = log->entries.back();
    meta.latest_sequence = last.chain.sequence;
    meta.latest_timestamp = last.timestamp;
    meta.head_hash = last.chain.content_hash;
    meta.entry_count += entries.size();
    return AppendStatus::Appended;
}

QueryResult InMemoryAuditLogStore::query(const AuditLogQuery& q) const {
    const auto start = std::chrono::steady_clock::now();
    QueryResult result;

    auto log = find(q.tenant_id);
    if (!log) {
        result.query_time_ms = datetime::elapsed_ms(start);
        return result;
    }

    std::vector<AuditLogEntry> matched;
    {
        std::lock_guard<std::mutex> guard(log->mutex);
        for (const auto& e : log->entries) {
            if (matches_query(e, q)) {
                matched.push_back(e);
            }
        }
    }

    // Записи хранятся по возрастанию sequence
    if (q.order == SortOrder::Desc) {
        std::reverse(matched.begin(), matched.end());
    }

    result.total = matched.size();
    const std::size_t begin = std::min(q.offset, matched.size());
    const std::size_t end = std::min(begin + q.limit, matched.size());
    result.entries.assign(std::make_move_iterator(matched.begin() + begin),
                          std::make_move_iterator(matched.begin() + end));
    result.has_more = end < result.total;
    result.query_time_ms = datetime::elapsed_ms(start);
    return result;
}

std::optional<AuditLogEntry> InMemoryAuditLogStore::get_entry(const std::string& tenant_id,
                                                              const std::string& entry_id) const {
    auto log = find(tenant_id);
    if (!log) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(log->mutex);
    auto it = log->by_id.find(entry_id);
    if (it == log->by_id.end()) {
        return std::nullopt;
    }
    return log->entries[it->second];
}

std::optional<AuditLogEntry> InMemoryAuditLogStore::get_entry_by_sequence(
    const std::string& tenant_id, std::uint64_t sequence) const {
    auto log = find(tenant_id);
    if (!log) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(log->mutex);
    if (sequence >= log->entries.size()) {
        return std::nullopt;
    }
    return log->entries[static_cast<std::size_t>(sequence)];
}

std::vector<AuditLogEntry> InMemoryAuditLogStore::get_chain_segment(const std::string& tenant_id,
                                                                    std::uint64_t start,
                                                                    std::uint64_t end) const {
    std::vector<AuditLogEntry> out;
    auto log = find(tenant_id);
    if (!log || start > end) {
        return out;
    }
    std::lock_guard<std::mutex> guard(log->mutex);
    for (std::uint64_t seq = start; seq <= end && seq < log->entries.size(); ++seq) {
        out.push_back(log->entries[static_cast<std::size_t>(seq)]);
    }
    return out;
}

AuditLogMetadata InMemoryAuditLogStore::seal(const std::string& tenant_id,
                                             const std::string& reason, datetime::TimePoint at) {
    auto log = find(tenant_id);
    if (!log) {
        throw NotFoundError("audit log not found: " + tenant_id);
    }
    std::lock_guard<std::mutex> guard(log->mutex);
    if (log->metadata.sealed) {
        throw SealedLogError(tenant_id);
    }
    log->metadata.sealed = true;
    log->metadata.sealed_at = datetime::format_rfc3339(at);
    log->metadata.seal_reason = reason;
    return log->metadata;
}

std::size_t InMemoryAuditLogStore::log_count() const {
    std::shared_lock<std::shared_mutex> lock(logs_mutex_);
    return logs_.size();
}

}  // namespace warden::audit
