#include "app/bootstrapper.hpp"

#include "core/logging.hpp"
#include "core/types.hpp"

#include <QJsonArray>

namespace tinsel::app {

using storage::AppStateRecord;
using storage::JobRecord;
using storage::PolicyRecord;
using storage::Record;
using storage::Table;

const char* source_name(BootstrapSource source) {
    switch (source) {
        case BootstrapSource::LocalStore: return "dexie";
        case BootstrapSource::LegacyFlatStorage: return "legacy-localStorage";
        case BootstrapSource::Fallback: return "fallback";
    }
    return "fallback";
}

namespace {

std::optional<QJsonValue> read_slot(const LegacySource& legacy, const std::string& key) {
    const auto raw = legacy.read(key);
    if (!raw || raw->isEmpty()) return std::nullopt;
    auto parsed = parse_json_text(*raw);
    if (!parsed) {
        qCWarning(tinselBootstrapLog) << "legacy slot" << QString::fromStdString(key)
                                      << "is not valid JSON; using fallback";
    }
    return parsed;
}

} // namespace

Bootstrapper::Bootstrapper(storage::LocalStore& store, const LegacySource& legacy, LegacyKeys keys)
    : store_(store), legacy_(legacy), keys_(std::move(keys)) {}

AppDataSnapshot Bootstrapper::read_legacy(const AppDataSnapshot& fallback) const {
    AppDataSnapshot snapshot = fallback;

    if (auto jobs = read_slot(legacy_, keys_.jobs); jobs && jobs->isArray()) {
        snapshot.jobs.clear();
        const auto entries = jobs->toArray();
        for (qsizetype i = 0; i < entries.size(); ++i) {
            auto job = job_from_json(entries.at(i).toObject());
            if (!entries.at(i).isObject() || job.is_err()) {
                qCWarning(tinselBootstrapLog) << "skipping legacy job at index" << i;
                continue;
            }
            snapshot.jobs.push_back(std::move(job).unwrap());
        }
    }

    if (auto policy = read_slot(legacy_, keys_.policy)) {
        auto parsed = policy_from_json(*policy);
        if (parsed.is_ok()) {
            snapshot.policy = std::move(parsed).unwrap();
        }
    }

    if (auto date = read_slot(legacy_, keys_.active_date); date && date->isString()) {
        const auto text = date->toString().toStdString();
        if (!text.empty()) snapshot.active_date = text;
    }

    if (auto user = read_slot(legacy_, keys_.user)) {
        if (user->isNull()) {
            snapshot.user = std::nullopt;
        } else if (auto parsed = user_from_json(*user); parsed.is_ok()) {
            snapshot.user = std::move(parsed).unwrap();
        }
    }

    return snapshot;
}

Result<void, Error> Bootstrapper::import_legacy(const AppDataSnapshot& snapshot) {
    const auto now = Timestamp::now();
    return store_.transaction([&]() -> Result<void, Error> {
        std::vector<Record> jobs;
        jobs.reserve(snapshot.jobs.size());
        for (const auto& job : snapshot.jobs) {
            jobs.emplace_back(storage::make_job_record(job, now));
        }
        if (!jobs.empty()) {
            auto written = store_.bulk_upsert(Table::Jobs, jobs);
            if (written.is_err()) return written;
        }

        auto policy = store_.put(PolicyRecord{
            .key = std::string(storage::kPolicyKey),
            .policy = snapshot.policy,
            .updated_at = now
        });
        if (policy.is_err()) return policy;

        auto date = store_.put(AppStateRecord{
            .key = std::string(storage::kActiveDateKey),
            .value = QString::fromStdString(snapshot.active_date),
            .updated_at = now
        });
        if (date.is_err()) return date;

        if (snapshot.user) {
            auto user = store_.put(AppStateRecord{
                .key = std::string(storage::kCurrentUserKey),
                .value = user_to_json(*snapshot.user),
                .updated_at = now
            });
            if (user.is_err()) return user;
        }
        return Result<void, Error>::ok();
    });
}

Result<AppDataSnapshot, Error> Bootstrapper::read_store(const AppDataSnapshot& fallback) {
    AppDataSnapshot snapshot = fallback;

    auto jobs = store_.scan_ordered(Table::Jobs, "date");
    if (jobs.is_err()) {
        return Result<AppDataSnapshot, Error>::err(jobs.unwrap_err());
    }
    snapshot.jobs.clear();
    for (const auto& record : jobs.unwrap()) {
        if (const auto* job = std::get_if<JobRecord>(&record)) {
            snapshot.jobs.push_back(job->job);
        }
    }

    auto policy = store_.get(Table::Policy, std::string(storage::kPolicyKey));
    if (policy.is_err()) {
        return Result<AppDataSnapshot, Error>::err(policy.unwrap_err());
    }
    if (policy.unwrap()) {
        if (const auto* record = std::get_if<PolicyRecord>(&*policy.unwrap())) {
            snapshot.policy = record->policy;
        }
    }

    auto date = store_.get(Table::State, std::string(storage::kActiveDateKey));
    if (date.is_err()) {
        return Result<AppDataSnapshot, Error>::err(date.unwrap_err());
    }
    if (date.unwrap()) {
        const auto* record = std::get_if<AppStateRecord>(&*date.unwrap());
        if (record && record->value.isString()) {
            snapshot.active_date = record->value.toString().toStdString();
        }
    }

    auto user = store_.get(Table::State, std::string(storage::kCurrentUserKey));
    if (user.is_err()) {
        return Result<AppDataSnapshot, Error>::err(user.unwrap_err());
    }
    if (user.unwrap()) {
        if (const auto* record = std::get_if<AppStateRecord>(&*user.unwrap())) {
            if (auto parsed = user_from_json(record->value); parsed.is_ok()) {
                snapshot.user = std::move(parsed).unwrap();
            }
        }
    }

    return Result<AppDataSnapshot, Error>::ok(std::move(snapshot));
}

BootstrapResult Bootstrapper::bootstrap(const AppDataSnapshot& fallback) {
    auto opened = store_.open();
    if (opened.is_err()) {
        const auto& error = opened.unwrap_err();
        if (error.kind == ErrorKind::MigrationFailed) {
            qCCritical(tinselBootstrapLog) << "store migration failed; running in memory:"
                                           << QString::fromStdString(error.message);
        } else {
            qCWarning(tinselBootstrapLog) << "store unavailable; running in memory:"
                                          << QString::fromStdString(error.message);
        }
        return BootstrapResult{
            .snapshot = fallback,
            .source = BootstrapSource::Fallback,
            .store_available = false
        };
    }

    auto degraded = [&fallback](const Error& error) {
        qCWarning(tinselBootstrapLog) << "bootstrap read failed; using fallback:"
                                      << QString::fromStdString(error.message);
        return BootstrapResult{
            .snapshot = fallback,
            .source = BootstrapSource::Fallback,
            .store_available = true
        };
    };

    auto count = store_.count(Table::Jobs);
    if (count.is_err()) {
        return degraded(count.unwrap_err());
    }

    if (count.unwrap() == 0) {
        auto snapshot = read_legacy(fallback);
        auto imported = import_legacy(snapshot);
        if (imported.is_err()) {
            return degraded(imported.unwrap_err());
        }
        qCInfo(tinselBootstrapLog) << "imported" << snapshot.jobs.size() << "jobs from legacy storage";
        return BootstrapResult{
            .snapshot = std::move(snapshot),
            .source = BootstrapSource::LegacyFlatStorage,
            .store_available = true
        };
    }

    auto snapshot = read_store(fallback);
    if (snapshot.is_err()) {
        return degraded(snapshot.unwrap_err());
    }
    return BootstrapResult{
        .snapshot = std::move(snapshot).unwrap(),
        .source = BootstrapSource::LocalStore,
        .store_available = true
    };
}

} // namespace tinsel::app
