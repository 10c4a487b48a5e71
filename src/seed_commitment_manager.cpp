#include "seed_commitment_manager.hpp"

#include <algorithm>
#include <utility>

#include "crypto.hpp"
#include "fairness_error.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace fairdraw {

Timestamp system_now() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

SeedCommitmentManager::SeedCommitmentManager(FairnessStore& store, RandomSource& random, Clock clock)
    : store_(store), random_(random), clock_(std::move(clock)) {}

SeedCommitment SeedCommitmentManager::commit(const std::string& giveaway_id,
                                             Timestamp entries_close_at,
                                             const std::string& creator_id) {
    Timestamp now = clock_();
    if (now >= entries_close_at) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SEQUENCE_VIOLATION,
                            "internal", "Commit refused after entry close for giveaway " + giveaway_id);
        MetricsRegistry::instance().increment_counter("sequencing_errors_total");
        throw FairnessError(ErrorCode::ENTRIES_CLOSED, "entry window for " + giveaway_id + " already closed");
    }

    SeedCommitment record;
    record.giveaway_id = giveaway_id;
    record.creator_id = creator_id;
    record.seed = random_.generate(SEED_BYTES);
    if (record.seed.size() != SEED_BYTES) {
        throw FairnessError(ErrorCode::ENTROPY_FAILURE, "random source returned a short seed");
    }
    record.commitment = crypto::commitment_for(record.seed);
    record.committed_at = now;
    record.entries_close_at = entries_close_at;
    record.revealed = false;

    switch (store_.create_commitment(record)) {
        case WriteStatus::OK:
            break;
        case WriteStatus::EXISTS:
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SEQUENCE_VIOLATION,
                                "internal", "Duplicate commit for giveaway " + giveaway_id);
            MetricsRegistry::instance().increment_counter("sequencing_errors_total");
            throw FairnessError(ErrorCode::ALREADY_COMMITTED, giveaway_id);
        default:
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                                "internal", "Commitment write failed for giveaway " + giveaway_id);
            throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "commitment write failed for " + giveaway_id);
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SEED_COMMITTED,
                        "internal", "giveaway=" + giveaway_id + " commitment=" + record.commitment);
    MetricsRegistry::instance().increment_counter("commits_total");

    record.seed.clear();
    return record;
}

Bytes SeedCommitmentManager::reveal(const std::string& giveaway_id, Timestamp entries_close_at) {
    auto record = store_.get_commitment(giveaway_id);
    if (!record) {
        MetricsRegistry::instance().increment_counter("sequencing_errors_total");
        throw FairnessError(ErrorCode::NOT_COMMITTED, giveaway_id);
    }

    // The close time recorded at commit is a floor; a caller can only push it later.
    Timestamp effective_close = std::max(entries_close_at, record->entries_close_at);
    Timestamp now = clock_();
    if (now < effective_close) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SEQUENCE_VIOLATION,
                            "internal", "Premature reveal attempt for giveaway " + giveaway_id);
        MetricsRegistry::instance().increment_counter("sequencing_errors_total");
        throw FairnessError(ErrorCode::PREMATURE_REVEAL, "entries for " + giveaway_id + " are still open");
    }

    switch (store_.mark_revealed(giveaway_id, now)) {
        case WriteStatus::OK:
            break;
        case WriteStatus::EXISTS:
            MetricsRegistry::instance().increment_counter("sequencing_errors_total");
            throw FairnessError(ErrorCode::ALREADY_REVEALED, giveaway_id);
        case WriteStatus::MISSING:
            throw FairnessError(ErrorCode::NOT_COMMITTED, giveaway_id);
        default:
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                                "internal", "Reveal write failed for giveaway " + giveaway_id);
            throw FairnessError(ErrorCode::STORAGE_UNAVAILABLE, "reveal write failed for " + giveaway_id);
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SEED_REVEALED,
                        "internal", "giveaway=" + giveaway_id);
    MetricsRegistry::instance().increment_counter("reveals_total");
    return record->seed;
}

Bytes SeedCommitmentManager::revealed_seed(const std::string& giveaway_id) {
    auto record = store_.get_commitment(giveaway_id);
    if (!record) {
        throw FairnessError(ErrorCode::NOT_COMMITTED, giveaway_id);
    }
    if (!record->revealed) {
        throw FairnessError(ErrorCode::NOT_REVEALED, giveaway_id);
    }
    return record->seed;
}

std::optional<SeedCommitment> SeedCommitmentManager::public_commitment(const std::string& giveaway_id) {
    auto record = store_.get_commitment(giveaway_id);
    if (record && !record->revealed) {
        record->seed.clear();
    }
    return record;
}

}
