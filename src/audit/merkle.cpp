// ==============================================================================
// merkle.cpp - Дерево Меркла и пакеты записей
// ==============================================================================

#include "warden/chain.hpp"

namespace warden::audit {

MerkleTree::MerkleTree(const std::vector<AuditLogEntry>& entries, HashAlgorithm algorithm)
    : algorithm_(algorithm) {
    if (entries.empty()) {
        return;
    }

    std::vector<std::string> leaves;
    leaves.reserve(entries.size());
    for (const auto& e : entries) {
        ids_.push_back(e.id);
        leaves.push_back(e.chain.content_hash);
    }
    levels_.push_back(std::move(leaves));

    while (levels_.back().size() > 1) {
        const auto& level = levels_.back();
        std::vector<std::string> next;
        next.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i < level.size(); i += 2) {
            const std::string& left = level[i];
            const std::string& right = i + 1 < level.size() ? level[i + 1] : level[i];
            next.push_back(compute_hash(left + right, algorithm_));
        }
        levels_.push_back(std::move(next));
    }

    root_ = levels_.back().front();
}

std::optional<MerkleProof> MerkleTree::proof(const std::string& entry_id) const {
    std::size_t index = ids_.size();
    for (std::size_t i = 0; i < ids_.size(); ++i) {
        if (ids_[i] == entry_id) {
            index = i;
            break;
        }
    }
    if (index == ids_.size()) {
        return std::nullopt;
    }

    MerkleProof p;
    p.entry_id = entry_id;
    p.leaf_hash = levels_.front()[index];
    p.root_hash = root_;

    for (std::size_t l = 0; l + 1 < levels_.size(); ++l) {
        const auto& level = levels_[l];
        if (index % 2 == 0) {
            // Последний нечётный узел хешировался сам с собой
            const std::string& sibling = index + 1 < level.size() ? level[index + 1] : level[index];
            p.siblings.push_back({sibling, SiblingPosition::Right});
        } else {
            p.siblings.push_back({level[index - 1], SiblingPosition::Left});
        }
        index /= 2;
    }
    return p;
}

bool MerkleTree::verify_proof(const MerkleProof& proof) const {
    return proof.root_hash == root_ && verify_merkle_proof(proof, algorithm_);
}

bool verify_merkle_proof(const MerkleProof& proof, HashAlgorithm algorithm) {
    std::string current = proof.leaf_hash;
    for (const auto& sibling : proof.siblings) {
        current = sibling.position == SiblingPosition::Left
                      ? compute_hash(sibling.hash + current, algorithm)
                      : compute_hash(current + sibling.hash, algorithm);
    }
    return current == proof.root_hash;
}

// ----------------------------------------------------------------------------
// Пакеты
// ----------------------------------------------------------------------------

EntryBatch create_batch(ChainBuilder& builder, const std::vector<CreateEntryInput>& inputs,
                        datetime::TimePoint at) {
    EntryBatch batch;
    batch.start_sequence = builder.state().sequence;
    batch.entries = builder.build_entries(inputs, at);
    batch.end_sequence = batch.entries.empty() ? batch.start_sequence
                                               : batch.entries.back().chain.sequence;
    batch.merkle_root = MerkleTree(batch.entries, builder.state().algorithm).root_hash();
    batch.created_at = datetime::format_rfc3339(at);
    return batch;
}

BatchVerification verify_batch(const std::vector<AuditLogEntry>& entries,
                               const std::string& expected_root, const VerifyOptions& options) {
    BatchVerification out;
    out.chain_result = verify_chain(entries, options);
    out.chain_valid = out.chain_result.valid;

    // Корень строится по пересчитанным хешам, а не по сохранённым
    std::vector<AuditLogEntry> recomputed = entries;
    HashAlgorithm algorithm = HashAlgorithm::Sha256;
    for (auto& e : recomputed) {
        e.chain.content_hash = compute_content_hash(e, e.chain.algorithm);
        algorithm = e.chain.algorithm;
    }
    out.merkle_valid = MerkleTree(recomputed, algorithm).root_hash() == expected_root;
    return out;
}

}  // namespace warden::audit
