#pragma once

#include "core/result.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <QVariantMap>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinsel {

inline constexpr std::string_view kBothCrews = "Both Crews";

// Largest integer a JSON number carries exactly; job ids beyond it are rejected.
inline constexpr double kMaxJobId = 9007199254740991.0;

[[nodiscard]] inline bool is_valid_job_id(double id) {
    return id >= -kMaxJobId && id <= kMaxJobId;
}

/**
 * Materials - consumables recorded against a job.
 */
struct Materials {
    double z_wire_ft = 0;
    int64_t male_plugs = 0;
    int64_t female_plugs = 0;
    int64_t timers = 0;

    bool operator==(const Materials&) const = default;
};

/**
 * Job - one scheduled installation visit.
 */
struct Job {
    int64_t id = 0;
    std::string date;  // ISO yyyy-mm-dd
    std::string crew;
    std::string client;
    std::string scope;
    std::optional<std::string> notes;
    std::optional<std::string> address;
    std::optional<std::string> neighborhood;
    std::optional<std::string> zip;
    std::optional<double> house_tier;
    std::optional<double> rehang_price;
    std::optional<double> lifetime_spend;
    bool vip = false;
    std::optional<Materials> materials;

    [[nodiscard]] bool both_crews() const { return crew == kBothCrews; }

    bool operator==(const Job&) const = default;
};

/**
 * Policy - organisation-wide scheduling rules.
 */
struct Policy {
    std::string cutoff_date_iso;
    std::vector<std::string> blocked_clients;
    int max_jobs_per_day = 2;
    std::optional<QJsonObject> season;
    std::optional<QJsonObject> leaderboard;
    std::optional<QJsonObject> awards;

    bool operator==(const Policy&) const = default;
};

struct User {
    std::string name;
    std::string role;  // admin, crew, dispatcher, support

    bool operator==(const User&) const = default;
};

/**
 * AppDataSnapshot - the in-memory view handed to the application at startup.
 */
struct AppDataSnapshot {
    std::vector<Job> jobs;
    Policy policy;
    std::string active_date;
    std::optional<User> user;

    bool operator==(const AppDataSnapshot&) const = default;
};

// JSON codecs. Decoders reject values without the required shape.

[[nodiscard]] QJsonObject materials_to_json(const Materials& materials);
[[nodiscard]] Materials materials_from_json(const QJsonObject& json);

[[nodiscard]] QJsonObject job_to_json(const Job& job);
[[nodiscard]] Result<Job, Error> job_from_json(const QJsonObject& json);

/**
 * Job as a raw value map, the shape accepted by job mutations.
 */
[[nodiscard]] QVariantMap job_to_variant(const Job& job);

[[nodiscard]] QJsonObject policy_to_json(const Policy& policy);
[[nodiscard]] Result<Policy, Error> policy_from_json(const QJsonValue& json);

[[nodiscard]] QJsonObject user_to_json(const User& user);
[[nodiscard]] Result<User, Error> user_from_json(const QJsonValue& json);

} // namespace tinsel
