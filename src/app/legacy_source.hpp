#pragma once

#include <QJsonValue>
#include <QString>
#include <optional>
#include <string>

namespace tinsel::app {

/**
 * LegacySource - read-only access to the old flat key/value storage.
 *
 * Each slot holds a JSON-encoded value; a missing slot is nullopt.
 */
class LegacySource {
public:
    virtual ~LegacySource() = default;

    [[nodiscard]] virtual std::optional<QString> read(const std::string& key) const = 0;
};

/**
 * LegacySource over a QSettings store (an INI file, or the application's
 * default settings when `path` is empty).
 */
class SettingsLegacySource final : public LegacySource {
public:
    explicit SettingsLegacySource(QString path = {});

    [[nodiscard]] std::optional<QString> read(const std::string& key) const override;

private:
    QString path_;
};

/**
 * Parse one JSON text of any kind, including bare scalars.
 */
[[nodiscard]] std::optional<QJsonValue> parse_json_text(const QString& text);

} // namespace tinsel::app
