#include "sync/firestore_backend.hpp"

#include "core/logging.hpp"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRegularExpression>
#include <QTimer>
#include <QUrlQuery>
#include <cmath>

namespace tinsel::sync {

namespace {

// Integral doubles up to 2^53 are sent as integerValue.
constexpr double kMaxExactInteger = 9007199254740992.0;

Error remote_error(std::string message, int status = 0) {
    return Error{std::move(message), ErrorKind::RemoteWriteFailed, status};
}

} // namespace

QJsonObject encode_firestore_value(const QJsonValue& value) {
    switch (value.type()) {
        case QJsonValue::Null:
        case QJsonValue::Undefined:
            return {{QStringLiteral("nullValue"), QJsonValue::Null}};
        case QJsonValue::Bool:
            return {{QStringLiteral("booleanValue"), value.toBool()}};
        case QJsonValue::Double: {
            const double number = value.toDouble();
            if (std::isfinite(number) && std::trunc(number) == number &&
                std::fabs(number) <= kMaxExactInteger) {
                return {{QStringLiteral("integerValue"),
                         QString::number(static_cast<qint64>(number))}};
            }
            return {{QStringLiteral("doubleValue"), number}};
        }
        case QJsonValue::String:
            return {{QStringLiteral("stringValue"), value.toString()}};
        case QJsonValue::Array: {
            QJsonArray values;
            for (const auto& entry : value.toArray()) {
                values.append(encode_firestore_value(entry));
            }
            return {{QStringLiteral("arrayValue"), QJsonObject{{QStringLiteral("values"), values}}}};
        }
        case QJsonValue::Object:
            return {{QStringLiteral("mapValue"), encode_firestore_document(value.toObject())}};
    }
    return {{QStringLiteral("nullValue"), QJsonValue::Null}};
}

QJsonObject encode_firestore_document(const QJsonObject& fields) {
    QJsonObject encoded;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        encoded.insert(it.key(), encode_firestore_value(it.value()));
    }
    return {{QStringLiteral("fields"), encoded}};
}

QStringList firestore_update_mask(const QJsonObject& fields) {
    static const QRegularExpression plain(QStringLiteral("^[A-Za-z_][A-Za-z0-9_]*$"));
    QStringList paths;
    for (const auto& key : fields.keys()) {
        if (plain.match(key).hasMatch()) {
            paths << key;
        } else {
            QString escaped = key;
            escaped.replace(QLatin1Char('\\'), QStringLiteral("\\\\"));
            escaped.replace(QLatin1Char('`'), QStringLiteral("\\`"));
            paths << QLatin1Char('`') + escaped + QLatin1Char('`');
        }
    }
    return paths;
}

FirestoreRestBackend::FirestoreRestBackend(FirestoreConfig config) : config_(std::move(config)) {}

QString FirestoreRestBackend::token() const {
    std::lock_guard lock(session_mutex_);
    return id_token_;
}

QUrl FirestoreRestBackend::document_url(const std::string& collection, const std::string& doc_id) const {
    return QUrl(config_.firestore_endpoint + QStringLiteral("/projects/") + config_.project_id +
                QStringLiteral("/databases/(default)/documents/") +
                QString::fromStdString(collection) + QLatin1Char('/') +
                QString::fromUtf8(QUrl::toPercentEncoding(QString::fromStdString(doc_id))));
}

Result<FirestoreRestBackend::Reply, Error> FirestoreRestBackend::send(
    const QByteArray& verb,
    const QUrl& url,
    const QByteArray& body,
    const QString& token
) {
    // One manager per call keeps the backend usable from any thread.
    QNetworkAccessManager network;
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!token.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + token.toUtf8());
    }

    QNetworkReply* reply = network.sendCustomRequest(request, verb, body);

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timeout.start(config_.timeout);
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        qCWarning(tinselRemoteLog) << verb << url.path() << "timed out";
        return Result<Reply, Error>::err(remote_error(
            "Request timed out after " + std::to_string(config_.timeout.count()) + " ms"));
    }

    Reply out{
        .status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt(),
        .body = reply->readAll()
    };
    if (reply->error() != QNetworkReply::NoError || out.status >= 300) {
        qCWarning(tinselRemoteLog) << verb << url.path() << "failed:" << out.status
                                   << reply->errorString();
        return Result<Reply, Error>::err(remote_error(
            verb.toStdString() + " " + url.path().toStdString() + " failed (" +
                std::to_string(out.status) + "): " + reply->errorString().toStdString(),
            out.status));
    }
    return Result<Reply, Error>::ok(std::move(out));
}

Result<void, Error> FirestoreRestBackend::ensure_session() {
    if (!token().isEmpty()) {
        return Result<void, Error>::ok();
    }
    if (config_.project_id.isEmpty() || config_.api_key.isEmpty()) {
        return Result<void, Error>::err(remote_error("Remote is not configured (project id and api key)"));
    }

    QUrl url(config_.auth_endpoint + QStringLiteral("/accounts:signUp"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("key"), config_.api_key);
    url.setQuery(query);

    const auto body = QJsonDocument(QJsonObject{{QStringLiteral("returnSecureToken"), true}})
                          .toJson(QJsonDocument::Compact);
    auto reply = send("POST", url, body, {});
    if (reply.is_err()) {
        return Result<void, Error>::err(reply.unwrap_err());
    }

    const auto id_token = QJsonDocument::fromJson(reply.unwrap().body).object()
                              .value(QStringLiteral("idToken")).toString();
    if (id_token.isEmpty()) {
        return Result<void, Error>::err(remote_error("Anonymous sign-in returned no token"));
    }

    std::lock_guard lock(session_mutex_);
    id_token_ = id_token;
    qCDebug(tinselRemoteLog) << "anonymous session acquired";
    return Result<void, Error>::ok();
}

Result<void, Error> FirestoreRestBackend::put(
    const std::string& collection,
    const std::string& doc_id,
    const QJsonObject& payload,
    bool merge
) {
    auto url = document_url(collection, doc_id);
    if (merge) {
        QUrlQuery query;
        for (const auto& path : firestore_update_mask(payload)) {
            query.addQueryItem(QStringLiteral("updateMask.fieldPaths"), path);
        }
        url.setQuery(query);
    }
    const auto body = QJsonDocument(encode_firestore_document(payload)).toJson(QJsonDocument::Compact);
    auto reply = send("PATCH", url, body, token());
    if (reply.is_err()) {
        return Result<void, Error>::err(reply.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> FirestoreRestBackend::remove(const std::string& collection, const std::string& doc_id) {
    auto reply = send("DELETE", document_url(collection, doc_id), {}, token());
    if (reply.is_err()) {
        return Result<void, Error>::err(reply.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace tinsel::sync
