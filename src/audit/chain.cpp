// ==============================================================================
// chain.cpp - Хеширование, построение и проверка цепочки
// ==============================================================================

#include "warden/chain.hpp"

#include <openssl/evp.h>

#include <chrono>
#include <memory>
#include <stdexcept>

namespace warden::audit {

// ----------------------------------------------------------------------------
// Хеширование
// ----------------------------------------------------------------------------

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

const EVP_MD* digest_for(HashAlgorithm algorithm) {
    switch (algorithm) {
    case HashAlgorithm::Sha256:
        return EVP_sha256();
    case HashAlgorithm::Sha384:
        return EVP_sha384();
    case HashAlgorithm::Sha512:
        return EVP_sha512();
    }
    return EVP_sha256();
}

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hex[(data[i] >> 4) & 0xF]);
        out.push_back(hex[data[i] & 0xF]);
    }
    return out;
}

}  // namespace

std::string compute_hash(const std::string& data, HashAlgorithm algorithm) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), digest_for(algorithm), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(out, out_len);
}

std::string compute_content_hash(const AuditLogEntry& entry, HashAlgorithm algorithm) {
    return compute_hash(to_canonical_json(content_value(entry)), algorithm);
}

ContextHash compute_context_hash(const AuditContext& context, HashAlgorithm algorithm) {
    Value all = to_value(context);
    Value hashed = Value::make_object();
    ContextHash result;
    result.algorithm = algorithm;

    for (const auto& field : CONTEXT_HASH_FIELDS) {
        if (const Value* v = all.get(field)) {
            hashed.set(field, *v);
            result.fields.push_back(field);
        }
    }
    result.value = compute_hash(to_canonical_json(hashed), algorithm);
    return result;
}

// ----------------------------------------------------------------------------
// ChainBuilder
// ----------------------------------------------------------------------------

ChainBuilder::ChainBuilder(HashAlgorithm algorithm) {
    state_.algorithm = algorithm;
}

AuditLogEntry ChainBuilder::build_entry(const CreateEntryInput& input, datetime::TimePoint at) {
    const std::string at_str = datetime::format_rfc3339(at);

    AuditLogEntry entry;
    entry.id = generate_entry_id(state_.sequence, at);
    entry.timestamp = input.timestamp ? datetime::format_rfc3339(*input.timestamp) : at_str;
    entry.actor = input.actor;
    entry.action = input.action;
    entry.resource = input.resource;
    entry.outcome = input.outcome;
    entry.context = input.context;
    entry.tags = input.tags;
    entry.high_risk = input.high_risk;
    entry.compliance = input.compliance;
    entry.details = input.details;

    const std::string content_hash = compute_content_hash(entry, state_.algorithm);

    entry.chain.sequence = state_.sequence;
    entry.chain.prev_hash = state_.last_hash;
    entry.chain.content_hash = content_hash;
    entry.chain.algorithm = state_.algorithm;
    entry.chain.computed_at = at_str;
    entry.context_hash = compute_context_hash(entry.context, state_.algorithm);
    entry.received_at = at_str;

    state_.sequence += 1;
    state_.last_hash = content_hash;
    return entry;
}

std::vector<AuditLogEntry> ChainBuilder::build_entries(const std::vector<CreateEntryInput>& inputs,
                                                       datetime::TimePoint at) {
    std::vector<AuditLogEntry> out;
    out.reserve(inputs.size());
    for (const auto& input : inputs) {
        out.push_back(build_entry(input, at));
    }
    return out;
}

void ChainBuilder::initialize_from(std::uint64_t next_sequence,
                                   std::optional<std::string> last_hash) {
    state_.sequence = next_sequence;
    state_.last_hash = std::move(last_hash);
}

void ChainBuilder::reset(std::optional<HashAlgorithm> algorithm) {
    state_.sequence = 0;
    state_.last_hash.reset();
    if (algorithm) {
        state_.algorithm = *algorithm;
    }
}

// ----------------------------------------------------------------------------
// Проверка
// ----------------------------------------------------------------------------

namespace {

EntryVerification verify_content(const AuditLogEntry& entry) {
    EntryVerification v;
    v.entry_id = entry.id;
    v.sequence = entry.chain.sequence;
    v.expected_content_hash = entry.chain.content_hash;
    v.actual_content_hash = compute_content_hash(entry, entry.chain.algorithm);
    v.content_hash_valid = v.actual_content_hash == v.expected_content_hash;
    if (!v.content_hash_valid) {
        v.error = "Content hash mismatch";
    }
    return v;
}

}  // namespace

ChainVerificationResult verify_chain(const std::vector<AuditLogEntry>& entries,
                                     const VerifyOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    ChainVerificationResult result;

    if (entries.empty()) {
        result.duration_ms = datetime::elapsed_ms(start);
        return result;
    }

    const std::uint64_t start_sequence =
        options.start_sequence.value_or(entries.front().chain.sequence);

    auto fail = [&](const AuditLogEntry& entry, std::size_t verified, std::string error) {
        result.valid = false;
        result.entries_verified = verified;
        result.first_invalid_sequence = entry.chain.sequence;
        result.first_invalid_id = entry.id;
        result.error = std::move(error);
        result.duration_ms = datetime::elapsed_ms(start);
        return result;
    };

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const AuditLogEntry& entry = entries[i];
        const std::uint64_t expected = start_sequence + i;

        if (entry.chain.sequence != expected) {
            return fail(entry, i,
                        "Sequence mismatch: expected " + std::to_string(expected) + ", got " +
                            std::to_string(entry.chain.sequence));
        }

        EntryVerification v = verify_content(entry);

        bool link_valid = true;
        if (i == 0) {
            if (start_sequence == 0) {
                link_valid = !entry.chain.prev_hash.has_value();
            } else if (options.expected_first_prev_hash) {
                link_valid = entry.chain.prev_hash == options.expected_first_prev_hash;
            }
        } else {
            link_valid = entry.chain.prev_hash == entries[i - 1].chain.content_hash;
        }

        v.chain_link_valid = link_valid;
        if (!link_valid) {
            v.error = v.error ? *v.error + "; Chain link broken" : "Chain link broken";
        }

        const bool ok = v.content_hash_valid && v.chain_link_valid;
        std::optional<std::string> error = v.error;
        result.details.push_back(std::move(v));

        if (!ok) {
            return fail(entry, i + 1, error.value_or("verification failed"));
        }
    }

    result.entries_verified = entries.size();
    result.duration_ms = datetime::elapsed_ms(start);
    return result;
}

Value to_value(const ChainVerificationResult& result) {
    Value v = Value::make_object();
    v.set("valid", Value(result.valid));
    v.set("entriesVerified", Value(static_cast<std::uint64_t>(result.entries_verified)));
    if (result.first_invalid_sequence) {
        v.set("firstInvalidSequence", Value(*result.first_invalid_sequence));
    }
    if (result.first_invalid_id) {
        v.set("firstInvalidId", Value(*result.first_invalid_id));
    }
    if (result.error) {
        v.set("error", Value(*result.error));
    }

    Value details = Value::make_array();
    for (const auto& d : result.details) {
        Value item = Value::make_object();
        item.set("entryId", Value(d.entry_id));
        item.set("sequence", Value(d.sequence));
        item.set("contentHashValid", Value(d.content_hash_valid));
        item.set("chainLinkValid", Value(d.chain_link_valid));
        item.set("expectedContentHash", Value(d.expected_content_hash));
        item.set("actualContentHash", Value(d.actual_content_hash));
        if (d.error) {
            item.set("error", Value(*d.error));
        }
        details.push_back(std::move(item));
    }
    v.set("details", std::move(details));
    v.set("durationMs", Value(result.duration_ms));
    return v;
}

}  // namespace warden::audit
