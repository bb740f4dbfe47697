#pragma once

#include "sync/remote_backend.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <chrono>
#include <mutex>
#include <string>

namespace tinsel::sync {

struct FirestoreConfig {
    QString project_id;
    QString api_key;
    std::chrono::milliseconds timeout{15000};
    QString auth_endpoint = QStringLiteral("https://identitytoolkit.googleapis.com/v1");
    QString firestore_endpoint = QStringLiteral("https://firestore.googleapis.com/v1");
};

/**
 * FirestoreRestBackend - RemoteBackend over the Firestore REST API.
 *
 * Calls are synchronous: each request runs a local event loop bounded by
 * the configured timeout, and a timeout is reported as a failure. The
 * session is an anonymous Identity Toolkit account created on first use.
 */
class FirestoreRestBackend final : public RemoteBackend {
public:
    explicit FirestoreRestBackend(FirestoreConfig config);

    [[nodiscard]] Result<void, Error> ensure_session() override;

    [[nodiscard]] Result<void, Error> put(
        const std::string& collection,
        const std::string& doc_id,
        const QJsonObject& payload,
        bool merge) override;

    [[nodiscard]] Result<void, Error> remove(
        const std::string& collection,
        const std::string& doc_id) override;

    [[nodiscard]] QUrl document_url(const std::string& collection, const std::string& doc_id) const;

private:
    struct Reply {
        int status = 0;
        QByteArray body;
    };

    [[nodiscard]] Result<Reply, Error> send(const QByteArray& verb, const QUrl& url,
                                            const QByteArray& body, const QString& token);
    [[nodiscard]] QString token() const;

    FirestoreConfig config_;
    mutable std::mutex session_mutex_;
    QString id_token_;
};

// Firestore typed-value encoding.

[[nodiscard]] QJsonObject encode_firestore_value(const QJsonValue& value);

/**
 * A document body: {"fields": {name: typed value, ...}}.
 */
[[nodiscard]] QJsonObject encode_firestore_document(const QJsonObject& fields);

/**
 * updateMask field paths for a merge write; names that are not plain
 * identifiers are backquoted.
 */
[[nodiscard]] QStringList firestore_update_mask(const QJsonObject& fields);

} // namespace tinsel::sync
