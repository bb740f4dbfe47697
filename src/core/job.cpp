#include "core/job.hpp"

#include <QJsonArray>
#include <cmath>

namespace tinsel {

namespace {

std::optional<std::string> optional_string(const QJsonObject& json, const char* key) {
    const auto value = json.value(QLatin1String(key));
    if (value.isString()) return value.toString().toStdString();
    return std::nullopt;
}

std::optional<double> optional_number(const QJsonObject& json, const char* key) {
    const auto value = json.value(QLatin1String(key));
    if (value.isDouble()) return value.toDouble();
    return std::nullopt;
}

void put_optional(QJsonObject& json, const char* key, const std::optional<std::string>& value) {
    if (value) json.insert(QLatin1String(key), QString::fromStdString(*value));
}

void put_optional(QJsonObject& json, const char* key, const std::optional<double>& value) {
    if (value) json.insert(QLatin1String(key), *value);
}

std::optional<QJsonObject> optional_object(const QJsonObject& json, const char* key) {
    const auto value = json.value(QLatin1String(key));
    if (value.isObject()) return value.toObject();
    return std::nullopt;
}

} // namespace

QJsonObject materials_to_json(const Materials& materials) {
    return QJsonObject{
        {QStringLiteral("zWireFt"), materials.z_wire_ft},
        {QStringLiteral("malePlugs"), static_cast<qint64>(materials.male_plugs)},
        {QStringLiteral("femalePlugs"), static_cast<qint64>(materials.female_plugs)},
        {QStringLiteral("timers"), static_cast<qint64>(materials.timers)},
    };
}

Materials materials_from_json(const QJsonObject& json) {
    return Materials{
        .z_wire_ft = json.value(QStringLiteral("zWireFt")).toDouble(),
        .male_plugs = json.value(QStringLiteral("malePlugs")).toInteger(),
        .female_plugs = json.value(QStringLiteral("femalePlugs")).toInteger(),
        .timers = json.value(QStringLiteral("timers")).toInteger()
    };
}

QJsonObject job_to_json(const Job& job) {
    QJsonObject json{
        {QStringLiteral("id"), static_cast<qint64>(job.id)},
        {QStringLiteral("date"), QString::fromStdString(job.date)},
        {QStringLiteral("crew"), QString::fromStdString(job.crew)},
        {QStringLiteral("client"), QString::fromStdString(job.client)},
        {QStringLiteral("scope"), QString::fromStdString(job.scope)},
        {QStringLiteral("vip"), job.vip},
    };
    put_optional(json, "notes", job.notes);
    put_optional(json, "address", job.address);
    put_optional(json, "neighborhood", job.neighborhood);
    put_optional(json, "zip", job.zip);
    put_optional(json, "houseTier", job.house_tier);
    put_optional(json, "rehangPrice", job.rehang_price);
    put_optional(json, "lifetimeSpend", job.lifetime_spend);
    if (job.materials) {
        json.insert(QStringLiteral("materials"), materials_to_json(*job.materials));
    }
    return json;
}

Result<Job, Error> job_from_json(const QJsonObject& json) {
    const auto id = json.value(QStringLiteral("id"));
    if (!id.isDouble() || !std::isfinite(id.toDouble()) || !is_valid_job_id(id.toDouble())) {
        return Result<Job, Error>::err(Error{"Job id must be a finite number", ErrorKind::ValidationRejected});
    }

    Job job{
        .id = static_cast<int64_t>(std::llround(id.toDouble())),
        .date = json.value(QStringLiteral("date")).toString().toStdString(),
        .crew = json.value(QStringLiteral("crew")).toString().toStdString(),
        .client = json.value(QStringLiteral("client")).toString().toStdString(),
        .scope = json.value(QStringLiteral("scope")).toString().toStdString(),
        .notes = optional_string(json, "notes"),
        .address = optional_string(json, "address"),
        .neighborhood = optional_string(json, "neighborhood"),
        .zip = optional_string(json, "zip"),
        .house_tier = optional_number(json, "houseTier"),
        .rehang_price = optional_number(json, "rehangPrice"),
        .lifetime_spend = optional_number(json, "lifetimeSpend"),
        .vip = json.value(QStringLiteral("vip")).toBool(false),
        .materials = std::nullopt
    };
    if (auto materials = optional_object(json, "materials")) {
        job.materials = materials_from_json(*materials);
    }
    return Result<Job, Error>::ok(std::move(job));
}

QVariantMap job_to_variant(const Job& job) {
    return job_to_json(job).toVariantMap();
}

QJsonObject policy_to_json(const Policy& policy) {
    QJsonArray blocked;
    for (const auto& client : policy.blocked_clients) {
        blocked.append(QString::fromStdString(client));
    }
    QJsonObject json{
        {QStringLiteral("cutoffDateISO"), QString::fromStdString(policy.cutoff_date_iso)},
        {QStringLiteral("blockedClients"), blocked},
        {QStringLiteral("maxJobsPerDay"), policy.max_jobs_per_day},
    };
    if (policy.season) json.insert(QStringLiteral("season"), *policy.season);
    if (policy.leaderboard) json.insert(QStringLiteral("leaderboard"), *policy.leaderboard);
    if (policy.awards) json.insert(QStringLiteral("awards"), *policy.awards);
    return json;
}

Result<Policy, Error> policy_from_json(const QJsonValue& json) {
    if (!json.isObject()) {
        return Result<Policy, Error>::err(Error{"Policy must be an object", ErrorKind::ValidationRejected});
    }
    const auto obj = json.toObject();

    Policy policy;
    policy.cutoff_date_iso = obj.value(QStringLiteral("cutoffDateISO")).toString().toStdString();
    for (const auto& entry : obj.value(QStringLiteral("blockedClients")).toArray()) {
        if (entry.isString() && !entry.toString().isEmpty()) {
            policy.blocked_clients.push_back(entry.toString().toStdString());
        }
    }
    const auto max_jobs = obj.value(QStringLiteral("maxJobsPerDay"));
    if (max_jobs.isDouble() && max_jobs.toDouble() > 0) {
        policy.max_jobs_per_day = static_cast<int>(std::floor(max_jobs.toDouble()));
    }
    policy.season = optional_object(obj, "season");
    policy.leaderboard = optional_object(obj, "leaderboard");
    policy.awards = optional_object(obj, "awards");
    return Result<Policy, Error>::ok(std::move(policy));
}

QJsonObject user_to_json(const User& user) {
    return QJsonObject{
        {QStringLiteral("name"), QString::fromStdString(user.name)},
        {QStringLiteral("role"), QString::fromStdString(user.role)},
    };
}

Result<User, Error> user_from_json(const QJsonValue& json) {
    const auto obj = json.toObject();
    const auto name = obj.value(QStringLiteral("name"));
    if (!json.isObject() || !name.isString()) {
        return Result<User, Error>::err(Error{"User must be an object with a name", ErrorKind::ValidationRejected});
    }
    return Result<User, Error>::ok(User{
        .name = name.toString().toStdString(),
        .role = obj.value(QStringLiteral("role")).toString(QStringLiteral("crew")).toStdString()
    });
}

} // namespace tinsel
