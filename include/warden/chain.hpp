// ==============================================================================
// warden/chain.hpp - Криптографическая цепочка записей аудита
// ==============================================================================
//
// Назначение:
// - Хеширование (OpenSSL EVP: sha256 / sha384 / sha512, hex в нижнем регистре)
// - Построение цепочки: sequence, prevHash, contentHash
// - Проверка цепочки и поиск первой нарушенной записи
// - Дерево Меркла для пакетной записи и доказательства включения
//
// ==============================================================================

#ifndef WARDEN_CHAIN_HPP
#define WARDEN_CHAIN_HPP

#include <warden/audit.hpp>
#include <warden/datetime.hpp>
#include <warden/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::audit {

// ============================================================================
// Хеширование
// ============================================================================

/// Hex-дайджест строки
/// @throw std::runtime_error при ошибке OpenSSL
std::string compute_hash(const std::string& data, HashAlgorithm algorithm = HashAlgorithm::Sha256);

/// Хеш канонического JSON полей содержимого записи
std::string compute_content_hash(const AuditLogEntry& entry,
                                 HashAlgorithm algorithm = HashAlgorithm::Sha256);

/// Хеш полей контекста из CONTEXT_HASH_FIELDS, присутствующих в записи
ContextHash compute_context_hash(const AuditContext& context,
                                 HashAlgorithm algorithm = HashAlgorithm::Sha256);

// ============================================================================
// Построение цепочки
// ============================================================================

struct ChainState {
    std::uint64_t sequence = 0;            // номер следующей записи
    std::optional<std::string> last_hash;  // contentHash последней записи
    HashAlgorithm algorithm = HashAlgorithm::Sha256;
};

class ChainBuilder {
public:
    explicit ChainBuilder(HashAlgorithm algorithm = HashAlgorithm::Sha256);

    /// Построить следующую запись и продвинуть состояние
    AuditLogEntry build_entry(const CreateEntryInput& input, datetime::TimePoint at);

    /// Построить несколько последовательных записей
    std::vector<AuditLogEntry> build_entries(const std::vector<CreateEntryInput>& inputs,
                                             datetime::TimePoint at);

    /// Продолжить существующую цепочку
    void initialize_from(std::uint64_t next_sequence, std::optional<std::string> last_hash);

    void reset(std::optional<HashAlgorithm> algorithm = std::nullopt);

    const ChainState& state() const { return state_; }

private:
    ChainState state_;
};

// ============================================================================
// Проверка
// ============================================================================

struct VerifyOptions {
    /// По умолчанию - sequence первой записи
    std::optional<std::uint64_t> start_sequence;
    /// prevHash первой записи, если она не первая в журнале
    std::optional<std::string> expected_first_prev_hash;
};

struct EntryVerification {
    std::string entry_id;
    std::uint64_t sequence = 0;
    bool content_hash_valid = false;
    bool chain_link_valid = false;
    std::string expected_content_hash;
    std::string actual_content_hash;
    std::optional<std::string> error;
};

struct ChainVerificationResult {
    bool valid = true;
    std::size_t entries_verified = 0;
    std::optional<std::uint64_t> first_invalid_sequence;
    std::optional<std::string> first_invalid_id;
    std::optional<std::string> error;
    std::vector<EntryVerification> details;
    double duration_ms = 0.0;
};

/// Проверить записи в порядке sequence; останавливается на первой ошибке
ChainVerificationResult verify_chain(const std::vector<AuditLogEntry>& entries,
                                     const VerifyOptions& options = {});

Value to_value(const ChainVerificationResult& result);

// ============================================================================
// Дерево Меркла
// ============================================================================

enum class SiblingPosition { Left, Right };

struct MerkleSibling {
    std::string hash;
    SiblingPosition position = SiblingPosition::Left;
};

struct MerkleProof {
    std::string entry_id;
    std::string leaf_hash;
    std::vector<MerkleSibling> siblings;
    std::string root_hash;
};

/// Листья - contentHash записей; нечётный узел уровня дублируется
class MerkleTree {
public:
    explicit MerkleTree(const std::vector<AuditLogEntry>& entries,
                        HashAlgorithm algorithm = HashAlgorithm::Sha256);

    /// Пустая строка для пустого дерева
    const std::string& root_hash() const { return root_; }

    /// Доказательство включения; nullopt если записи нет в дереве
    std::optional<MerkleProof> proof(const std::string& entry_id) const;

    /// Высота дерева: 0 для пустого, иначе ceil(log2(n)) + 1
    std::size_t depth() const { return levels_.size(); }

    std::size_t leaf_count() const { return ids_.size(); }

    bool verify_proof(const MerkleProof& proof) const;

private:
    HashAlgorithm algorithm_;
    std::vector<std::string> ids_;
    std::vector<std::vector<std::string>> levels_;  // levels_[0] - листья
    std::string root_;
};

/// Проверить доказательство без дерева
bool verify_merkle_proof(const MerkleProof& proof, HashAlgorithm algorithm = HashAlgorithm::Sha256);

// ============================================================================
// Пакеты
// ============================================================================

struct EntryBatch {
    std::vector<AuditLogEntry> entries;
    std::string merkle_root;
    std::uint64_t start_sequence = 0;
    std::uint64_t end_sequence = 0;
    std::string created_at;
};

/// Построить пакет записей через builder и посчитать корень Меркла
EntryBatch create_batch(ChainBuilder& builder, const std::vector<CreateEntryInput>& inputs,
                        datetime::TimePoint at);

struct BatchVerification {
    bool chain_valid = false;
    bool merkle_valid = false;
    ChainVerificationResult chain_result;
};

/// Проверить цепочку пакета и совпадение корня (по пересчитанным хешам)
BatchVerification verify_batch(const std::vector<AuditLogEntry>& entries,
                               const std::string& expected_root,
                               const VerifyOptions& options = {});

}  // namespace warden::audit

#endif  // WARDEN_CHAIN_HPP
