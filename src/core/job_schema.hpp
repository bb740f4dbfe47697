#pragma once

#include "core/job.hpp"
#include "core/result.hpp"
#include "core/sanitize.hpp"

#include <QVariant>
#include <QVariantMap>
#include <optional>
#include <string>
#include <vector>

namespace tinsel::schema {

// Valid house tiers; out-of-range values are clamped to the nearest bound.
inline constexpr int kHouseTierFloor = 1;
inline constexpr int kHouseTierCeiling = 5;
inline constexpr int kHouseTierDefault = 1;

/**
 * PreparedJob - a job normalized into its outbound document shape.
 *
 * `data` always carries the string fields notes/address/neighborhood/zip
 * (empty when absent), an integer houseTier within bounds, rehangPrice and
 * lifetimeSpend as a finite number or null, vip and bothCrews as booleans.
 */
struct PreparedJob {
    QVariantMap data;
    sanitize::Report report;
    std::vector<std::string> warnings;

    [[nodiscard]] int64_t id() const { return data.value(QStringLiteral("id")).toLongLong(); }
};

/**
 * Normalize a raw job value (map-shaped) for transmission to the remote store.
 * Fails with ValidationRejected when the id is not numeric or a required
 * field (date, crew, client, scope) is blank.
 */
[[nodiscard]] Result<PreparedJob, Error> prepare_job_for_remote(
    const QVariant& raw,
    const std::string& doc_path);

/**
 * Re-normalize a stored job: strings trimmed, tier clamped, non-finite
 * amounts cleared. Materials are carried over untouched.
 */
[[nodiscard]] Result<Job, Error> normalize_job(const Job& job);

/**
 * Trim every string field of a job, nothing else.
 */
[[nodiscard]] Job trim_job_strings(Job job);

/**
 * Normalize a materials value; anything that is not an object yields zeros.
 */
[[nodiscard]] Materials normalize_materials(const QVariant& value);

/**
 * Number from a number or numeric string (`$` and `,` ignored);
 * nullopt for blanks, non-finite values and everything else.
 */
[[nodiscard]] std::optional<double> to_number(const QVariant& value);

[[nodiscard]] bool to_boolean(const QVariant& value);

[[nodiscard]] QString to_trimmed_string(const QVariant& value);

} // namespace tinsel::schema
