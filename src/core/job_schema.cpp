#include "core/job_schema.hpp"

#include "core/logging.hpp"

#include <QJsonObject>
#include <QStringList>
#include <algorithm>
#include <cmath>

namespace tinsel::schema {

namespace {

bool is_numeric_type(const QVariant& value) {
    switch (value.metaType().id()) {
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::LongLong:
        case QMetaType::ULongLong:
        case QMetaType::Short:
        case QMetaType::UShort:
        case QMetaType::Long:
        case QMetaType::ULong:
        case QMetaType::Double:
        case QMetaType::Float:
            return true;
        default:
            return false;
    }
}

bool is_absent(const QVariant& value) {
    return !value.isValid() || value.metaType().id() == QMetaType::Nullptr;
}

QVariant null_value() {
    return QVariant::fromValue(nullptr);
}

std::optional<double> parse_number(QString text, bool strip_currency) {
    text = text.trimmed();
    if (strip_currency) {
        text.remove(QLatin1Char('$'));
        text.remove(QLatin1Char(','));
    }
    if (text.isEmpty()) return std::nullopt;
    bool ok = false;
    const double parsed = text.toDouble(&ok);
    if (!ok || !std::isfinite(parsed)) return std::nullopt;
    return parsed;
}

std::optional<QVariantMap> as_map(const QVariant& value) {
    switch (value.metaType().id()) {
        case QMetaType::QVariantMap:
        case QMetaType::QVariantHash:
            return value.toMap();
        case QMetaType::QJsonObject:
            return value.toJsonObject().toVariantMap();
        case QMetaType::QJsonValue: {
            const auto json = value.toJsonValue();
            if (json.isObject()) return json.toObject().toVariantMap();
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

double material_value(const QVariant& value, bool integer) {
    std::optional<double> numeric;
    if (is_numeric_type(value)) {
        const double d = value.toDouble();
        if (std::isfinite(d)) numeric = d;
    } else if (value.metaType().id() == QMetaType::QString) {
        numeric = parse_number(value.toString(), false);
    }
    if (!numeric) return 0;
    const double clamped = std::max(0.0, *numeric);
    return integer ? std::floor(clamped) : std::round(clamped * 100) / 100;
}

QVariant first_present(const QVariantMap& map, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const auto value = map.value(QLatin1String(key));
        if (!is_absent(value)) return value;
    }
    return {};
}

// Accumulates the normalized document for one job.
class JobNormalizer {
public:
    explicit JobNormalizer(const QVariantMap& raw) : raw_(raw) {}

    void trimmed_field(const char* key) {
        const auto previous = raw_.value(QLatin1String(key));
        const auto next = to_trimmed_string(previous);
        if (!is_absent(previous) && previous.toString() != next) {
            out_.report.record_change(key, previous, next, sanitize::ChangeReason::Trim);
        }
        out_.data.insert(QLatin1String(key), next);
    }

    void house_tier() {
        const auto previous = raw_.value(QStringLiteral("houseTier"));
        const auto number = to_number(previous);
        if (!number) {
            out_.warnings.emplace_back(is_absent(previous)
                ? "houseTier missing; defaulted to 1"
                : "houseTier invalid; defaulted to 1");
            if (!is_absent(previous)) {
                out_.report.record_change("houseTier", previous, kHouseTierDefault,
                                          sanitize::ChangeReason::Coerce);
            }
            out_.data.insert(QStringLiteral("houseTier"), kHouseTierDefault);
            return;
        }

        const auto rounded = static_cast<int64_t>(std::llround(std::clamp(*number, -kMaxJobId, kMaxJobId)));
        if (rounded < kHouseTierFloor || rounded > kHouseTierCeiling) {
            out_.warnings.push_back("houseTier " + std::to_string(rounded) +
                                    " outside 1-5; clamped to bounds");
        }
        const int tier = static_cast<int>(std::clamp<int64_t>(rounded, kHouseTierFloor, kHouseTierCeiling));
        if (static_cast<double>(tier) != *number || !is_numeric_type(previous)) {
            out_.report.record_change("houseTier", previous, tier, sanitize::ChangeReason::Coerce);
        }
        out_.data.insert(QStringLiteral("houseTier"), tier);
    }

    void money_field(const char* key) {
        const auto previous = raw_.value(QLatin1String(key));
        if (is_absent(previous)) {
            out_.data.insert(QLatin1String(key), null_value());
            return;
        }
        const auto number = to_number(previous);
        if (!number) {
            const bool infinite = is_numeric_type(previous) && std::isinf(previous.toDouble());
            out_.report.record_change(key, previous, null_value(),
                infinite ? sanitize::ChangeReason::Infinity : sanitize::ChangeReason::Nan);
            out_.data.insert(QLatin1String(key), null_value());
            return;
        }
        if (!is_numeric_type(previous)) {
            out_.report.record_change(key, previous, *number, sanitize::ChangeReason::Coerce);
        }
        out_.data.insert(QLatin1String(key), *number);
    }

    void flags(const QString& crew) {
        const auto raw_vip = raw_.value(QStringLiteral("vip"));
        const bool vip = to_boolean(raw_vip);
        if (!is_absent(raw_vip) && raw_vip.metaType().id() != QMetaType::Bool) {
            out_.report.record_change("vip", raw_vip, vip, sanitize::ChangeReason::Coerce);
        }
        out_.data.insert(QStringLiteral("vip"), vip);

        const auto raw_both = raw_.value(QStringLiteral("bothCrews"));
        const bool explicit_both = raw_both.metaType().id() == QMetaType::Bool && raw_both.toBool();
        const bool both = explicit_both || crew == QLatin1String(kBothCrews.data());
        if (!is_absent(raw_both) && (raw_both.metaType().id() != QMetaType::Bool || raw_both.toBool() != both)) {
            out_.report.record_change("bothCrews", raw_both, both, sanitize::ChangeReason::Coerce);
        }
        out_.data.insert(QStringLiteral("bothCrews"), both);
    }

    void materials() {
        const auto raw_materials = raw_.value(QStringLiteral("materials"));
        if (is_absent(raw_materials)) return;
        out_.data.insert(QStringLiteral("materials"),
                         materials_to_json(normalize_materials(raw_materials)).toVariantMap());
    }

    void updated_at() {
        if (raw_.contains(QStringLiteral("updatedAt"))) {
            out_.report.record_removed("updatedAt");
        }
    }

    PreparedJob& out() { return out_; }

private:
    const QVariantMap& raw_;
    PreparedJob out_;
};

Error rejection(const std::string& doc_path, std::vector<Issue> issues) {
    QStringList parts;
    for (const auto& issue : issues) {
        parts << QString::fromStdString(issue.path + ": " + issue.message);
    }
    Error error("Sync failed: invalid data in \"" + doc_path + "\" (" +
                    parts.join(QStringLiteral("; ")).toStdString() + ")",
                ErrorKind::ValidationRejected);
    error.issues = std::move(issues);
    return error;
}

} // namespace

std::optional<double> to_number(const QVariant& value) {
    if (is_numeric_type(value)) {
        const double d = value.toDouble();
        if (std::isfinite(d)) return d;
        return std::nullopt;
    }
    if (value.metaType().id() == QMetaType::QString) {
        return parse_number(value.toString(), true);
    }
    return std::nullopt;
}

bool to_boolean(const QVariant& value) {
    if (value.metaType().id() == QMetaType::Bool) return value.toBool();
    if (is_numeric_type(value)) return value.toDouble() != 0;
    if (value.metaType().id() == QMetaType::QString) {
        const auto text = value.toString().trimmed().toLower();
        return text == QLatin1String("true") || text == QLatin1String("1") ||
               text == QLatin1String("yes");
    }
    return false;
}

QString to_trimmed_string(const QVariant& value) {
    if (is_absent(value)) return {};
    return value.toString().trimmed();
}

Materials normalize_materials(const QVariant& value) {
    const auto map = as_map(value);
    if (!map) return Materials{};

    return Materials{
        .z_wire_ft = material_value(first_present(*map, {"zWireFt", "extCords", "extcords", "zwireFt"}), false),
        .male_plugs = static_cast<int64_t>(material_value(map->value(QStringLiteral("malePlugs")), true)),
        .female_plugs = static_cast<int64_t>(material_value(map->value(QStringLiteral("femalePlugs")), true)),
        .timers = static_cast<int64_t>(material_value(map->value(QStringLiteral("timers")), true))
    };
}

Result<Job, Error> normalize_job(const Job& job) {
    auto prepared = prepare_job_for_remote(job_to_variant(job), "store/jobs/" + std::to_string(job.id));
    if (prepared.is_err()) {
        return Result<Job, Error>::err(prepared.unwrap_err());
    }
    const auto& data = prepared.unwrap().data;

    auto text = [&data](const char* key) {
        return data.value(QLatin1String(key)).toString().toStdString();
    };
    auto optional_text = [&](const std::optional<std::string>& original, const char* key) {
        return original ? std::optional<std::string>(text(key)) : std::nullopt;
    };
    auto optional_number = [&data](const char* key) -> std::optional<double> {
        const auto value = data.value(QLatin1String(key));
        if (is_absent(value)) return std::nullopt;
        return value.toDouble();
    };

    return Result<Job, Error>::ok(Job{
        .id = data.value(QStringLiteral("id")).toLongLong(),
        .date = text("date"),
        .crew = text("crew"),
        .client = text("client"),
        .scope = text("scope"),
        .notes = optional_text(job.notes, "notes"),
        .address = optional_text(job.address, "address"),
        .neighborhood = optional_text(job.neighborhood, "neighborhood"),
        .zip = optional_text(job.zip, "zip"),
        .house_tier = optional_number("houseTier"),
        .rehang_price = optional_number("rehangPrice"),
        .lifetime_spend = optional_number("lifetimeSpend"),
        .vip = data.value(QStringLiteral("vip")).toBool(),
        .materials = job.materials
    });
}

Job trim_job_strings(Job job) {
    auto trim = [](std::string& text) {
        text = QString::fromStdString(text).trimmed().toStdString();
    };
    for (auto* field : {&job.date, &job.crew, &job.client, &job.scope}) {
        trim(*field);
    }
    for (auto* field : {&job.notes, &job.address, &job.neighborhood, &job.zip}) {
        if (*field) trim(**field);
    }
    return job;
}

Result<PreparedJob, Error> prepare_job_for_remote(const QVariant& raw, const std::string& doc_path) {
    const auto map = as_map(raw);
    if (!map) {
        return Result<PreparedJob, Error>::err(
            rejection(doc_path, {Issue{.path = "job", .message = "Job must be an object"}}));
    }

    std::vector<Issue> issues;
    const auto raw_id = map->value(QStringLiteral("id"));
    const auto id = to_number(raw_id);
    if (!id || !is_valid_job_id(*id)) {
        issues.push_back(Issue{.path = "id", .message = "Job id must be a finite number"});
    }

    static const char* const required[] = {"date", "crew", "client", "scope"};
    QVariantMap required_values;
    for (const char* key : required) {
        const auto value = to_trimmed_string(map->value(QLatin1String(key)));
        if (value.isEmpty()) {
            issues.push_back(Issue{.path = key, .message = std::string(key) + " is required"});
        }
        required_values.insert(QLatin1String(key), value);
    }
    if (!issues.empty()) {
        return Result<PreparedJob, Error>::err(rejection(doc_path, std::move(issues)));
    }

    JobNormalizer normalizer(*map);
    auto& out = normalizer.out();

    const auto job_id = static_cast<qint64>(std::llround(*id));
    if (static_cast<double>(job_id) != *id || !is_numeric_type(raw_id)) {
        out.report.record_change("id", raw_id, job_id, sanitize::ChangeReason::Coerce);
    }
    out.data.insert(QStringLiteral("id"), job_id);
    for (const char* key : required) {
        normalizer.trimmed_field(key);
    }
    for (const char* key : {"notes", "address", "neighborhood", "zip"}) {
        normalizer.trimmed_field(key);
    }
    normalizer.house_tier();
    normalizer.money_field("rehangPrice");
    normalizer.money_field("lifetimeSpend");
    normalizer.flags(required_values.value(QStringLiteral("crew")).toString());
    normalizer.materials();
    normalizer.updated_at();

    auto cleaned = sanitize::safe_serialize(out.data);
    out.data = cleaned.value.toMap();
    out.report.merge(cleaned.report);

    if (!out.report.removed.empty()) {
        qCDebug(tinselSanitizeLog) << "prepared" << QString::fromStdString(doc_path)
                                   << out.report.describe();
    }
    return Result<PreparedJob, Error>::ok(std::move(out));
}

} // namespace tinsel::schema
