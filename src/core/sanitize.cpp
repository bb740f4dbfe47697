#include "core/sanitize.hpp"

#include <QDate>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QStringList>
#include <QVariantHash>
#include <QVariantList>
#include <QVariantMap>
#include <cmath>

namespace tinsel::sanitize {

const char* reason_name(ChangeReason reason) {
    switch (reason) {
        case ChangeReason::Nan: return "nan";
        case ChangeReason::Infinity: return "infinity";
        case ChangeReason::InvalidDate: return "invalid-date";
        case ChangeReason::Trim: return "trim";
        case ChangeReason::Coerce: return "coerce";
    }
    return "unknown";
}

std::string child_path(const std::string& parent, const QString& key) {
    if (parent.empty()) return key.toStdString();
    return parent + "." + key.toStdString();
}

std::string index_path(const std::string& parent, qsizetype index) {
    return parent + "[" + std::to_string(index) + "]";
}

void Report::record_removed(const std::string& path) {
    removed.push_back(path);
}

void Report::record_change(const std::string& path, QVariant from, QVariant to, ChangeReason reason) {
    switch (reason) {
        case ChangeReason::Trim:
            trimmed.push_back(path);
            break;
        case ChangeReason::Nan:
        case ChangeReason::Infinity:
        case ChangeReason::InvalidDate:
            replaced.push_back(path);
            break;
        case ChangeReason::Coerce:
            coerced.push_back(path);
            break;
    }
    changes.push_back(Change{
        .path = path,
        .from = std::move(from),
        .to = std::move(to),
        .reason = reason
    });
}

void Report::merge(const Report& other, const std::string& prefix) {
    auto prefixed = [&prefix](const std::string& path) {
        if (prefix.empty()) return path;
        if (path.empty()) return prefix;
        if (path.front() == '[') return prefix + path;
        return prefix + "." + path;
    };
    for (const auto& p : other.removed) removed.push_back(prefixed(p));
    for (const auto& p : other.trimmed) trimmed.push_back(prefixed(p));
    for (const auto& p : other.replaced) replaced.push_back(prefixed(p));
    for (const auto& p : other.coerced) coerced.push_back(prefixed(p));
    for (const auto& c : other.changes) {
        changes.push_back(Change{
            .path = prefixed(c.path),
            .from = c.from,
            .to = c.to,
            .reason = c.reason
        });
    }
}

QString Report::describe() const {
    auto join = [](const std::vector<std::string>& paths) {
        QStringList parts;
        for (const auto& p : paths) {
            parts << (p.empty() ? QStringLiteral("(root)") : QString::fromStdString(p));
        }
        return parts.join(QLatin1Char(','));
    };
    return QStringLiteral("removed=[%1] trimmed=[%2] replaced=[%3] coerced=[%4]")
        .arg(join(removed), join(trimmed), join(replaced), join(coerced));
}

namespace {

QVariant null_value() {
    return QVariant::fromValue(nullptr);
}

class Pass {
public:
    Pass(const Options& options, Report& report) : options_(options), report_(report) {}

    // Returns an invalid QVariant when the value must be dropped.
    QVariant run(const QVariant& value, const std::string& path) {
        if (!value.isValid()) {
            report_.record_removed(path);
            return {};
        }

        switch (value.metaType().id()) {
            case QMetaType::Nullptr:
                return null_value();

            case QMetaType::QVariantList:
            case QMetaType::QStringList:
                return run_list(value.toList(), path);

            case QMetaType::QVariantMap:
                return run_map(value.toMap(), path);

            case QMetaType::QVariantHash: {
                const auto hash = value.toHash();
                QVariantMap map;
                for (auto it = hash.cbegin(); it != hash.cend(); ++it) {
                    map.insert(it.key(), it.value());
                }
                return run_map(map, path);
            }

            case QMetaType::QJsonValue:
            case QMetaType::QJsonObject:
            case QMetaType::QJsonArray:
                return run(QJsonValue::fromVariant(value).toVariant(), path);

            case QMetaType::QJsonDocument: {
                const auto doc = value.toJsonDocument();
                if (doc.isArray()) return run(doc.array().toVariantList(), path);
                if (doc.isObject()) return run(doc.object().toVariantMap(), path);
                return run(QVariant{}, path);
            }

            case QMetaType::QString:
                return run_string(value.toString(), path);

            case QMetaType::Double:
            case QMetaType::Float:
                return run_number(value, path);

            case QMetaType::Bool:
            case QMetaType::Int:
            case QMetaType::UInt:
            case QMetaType::LongLong:
            case QMetaType::ULongLong:
            case QMetaType::Short:
            case QMetaType::UShort:
            case QMetaType::Long:
            case QMetaType::ULong:
            case QMetaType::QByteArray:
                return value;

            case QMetaType::QDateTime:
                return run_date(value, value.toDateTime().isValid(), path);
            case QMetaType::QDate:
                return run_date(value, value.toDate().isValid(), path);

            default:
                break;
        }

        if (!options_.drop_unserializable) {
            return value;
        }
        report_.record_removed(path);
        return {};
    }

private:
    QVariant run_list(const QVariantList& list, const std::string& path) {
        QVariantList out;
        out.reserve(list.size());
        for (qsizetype i = 0; i < list.size(); ++i) {
            auto entry = run(list.at(i), index_path(path, i));
            if (entry.isValid()) {
                out.push_back(std::move(entry));
            }
        }
        return out;
    }

    QVariant run_map(const QVariantMap& map, const std::string& path) {
        QVariantMap out;
        for (auto it = map.cbegin(); it != map.cend(); ++it) {
            auto member = run(it.value(), child_path(path, it.key()));
            if (member.isValid()) {
                out.insert(it.key(), std::move(member));
            }
        }
        return out;
    }

    QVariant run_string(const QString& text, const std::string& path) {
        if (!options_.trim_strings) {
            return text;
        }
        auto trimmed = text.trimmed();
        if (trimmed != text) {
            report_.record_change(path, text, trimmed, ChangeReason::Trim);
        }
        if (options_.remove_empty_strings && trimmed.isEmpty()) {
            report_.record_removed(path);
            return {};
        }
        return trimmed;
    }

    QVariant run_number(const QVariant& value, const std::string& path) {
        const double number = value.toDouble();
        if (std::isfinite(number) || !options_.convert_special_numbers) {
            return value;
        }
        report_.record_change(path, value, null_value(),
                              std::isnan(number) ? ChangeReason::Nan : ChangeReason::Infinity);
        return null_value();
    }

    QVariant run_date(const QVariant& value, bool valid, const std::string& path) {
        if (valid || !options_.convert_special_numbers) {
            return value;
        }
        report_.record_change(path, value, null_value(), ChangeReason::InvalidDate);
        return null_value();
    }

    const Options& options_;
    Report& report_;
};

} // namespace

Sanitized safe_serialize(const QVariant& value, const Options& options) {
    Sanitized out;
    Pass pass(options, out.report);
    out.value = pass.run(value, {});
    return out;
}

Sanitized strip_undefined(const QVariant& value) {
    return safe_serialize(value, Options{
        .trim_strings = false,
        .convert_special_numbers = false,
        .remove_empty_strings = false,
        .drop_unserializable = false
    });
}

} // namespace tinsel::sanitize
