#include "memory_store.hpp"

namespace fairdraw {

WriteStatus MemoryStore::create_commitment(const SeedCommitment& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = commitments_.emplace(record.giveaway_id, record);
    if (!inserted) return WriteStatus::EXISTS;
    it->second.revealed = false;
    it->second.revealed_at.reset();
    return WriteStatus::OK;
}

std::optional<SeedCommitment> MemoryStore::get_commitment(const std::string& giveaway_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = commitments_.find(giveaway_id);
    if (it == commitments_.end()) return std::nullopt;
    return it->second;
}

WriteStatus MemoryStore::mark_revealed(const std::string& giveaway_id, Timestamp revealed_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = commitments_.find(giveaway_id);
    if (it == commitments_.end()) return WriteStatus::MISSING;
    if (it->second.revealed) return WriteStatus::EXISTS;

    it->second.revealed = true;
    it->second.revealed_at = revealed_at;
    return WriteStatus::OK;
}

WriteStatus MemoryStore::create_proof(const FairnessProof& proof) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = proofs_.emplace(proof.giveaway_id, proof).second;
    return inserted ? WriteStatus::OK : WriteStatus::EXISTS;
}

std::optional<FairnessProof> MemoryStore::get_proof(const std::string& giveaway_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proofs_.find(giveaway_id);
    if (it == proofs_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::mark_winner(const std::string& giveaway_id,
                              const std::string& winner_entry_id,
                              const std::string& winner_user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    winners_[giveaway_id] = {winner_entry_id, winner_user_id};
    return true;
}

std::optional<std::pair<std::string, std::string>> MemoryStore::get_winner(const std::string& giveaway_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = winners_.find(giveaway_id);
    if (it == winners_.end()) return std::nullopt;
    return it->second;
}

}
