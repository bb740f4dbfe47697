#include "app/legacy_source.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>
#include <QStringList>
#include <memory>

namespace tinsel::app {

SettingsLegacySource::SettingsLegacySource(QString path) : path_(std::move(path)) {}

std::optional<QString> SettingsLegacySource::read(const std::string& key) const {
    auto settings = path_.isEmpty()
        ? std::make_unique<QSettings>()
        : std::make_unique<QSettings>(path_, QSettings::IniFormat);
    const auto value = settings->value(QString::fromStdString(key));
    if (!value.isValid()) return std::nullopt;

    // Unquoted INI values containing commas come back as a list.
    if (value.metaType().id() == QMetaType::QStringList) {
        return value.toStringList().join(QLatin1Char(','));
    }
    return value.toString();
}

std::optional<QJsonValue> parse_json_text(const QString& text) {
    QJsonParseError error{};
    const auto doc = QJsonDocument::fromJson(
        (QLatin1Char('[') + text + QLatin1Char(']')).toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray() || doc.array().size() != 1) {
        return std::nullopt;
    }
    return doc.array().at(0);
}

} // namespace tinsel::app
