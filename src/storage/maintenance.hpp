#pragma once

#include "storage/record_repository.hpp"
#include "core/result.hpp"

#include <optional>

namespace tinsel::storage {

struct CleanupCounts {
    int jobs = 0;
    int pending = 0;

    bool operator==(const CleanupCounts&) const = default;
};

/**
 * The cleaned form of a record, or nullopt when the record kind is not
 * subject to cleanup.
 *
 * Jobs are re-normalized (strings trimmed, tier clamped) with materials
 * untouched; pending job.* payloads are re-prepared and sanitized.
 */
[[nodiscard]] std::optional<Record> cleaned_record(const Record& record);

/**
 * Rewrite every job and pending operation through cleaned_record().
 * Runs inside the caller's transaction.
 */
[[nodiscard]] Result<CleanupCounts, Error> cleanup_records(RecordRepository& records);

} // namespace tinsel::storage
