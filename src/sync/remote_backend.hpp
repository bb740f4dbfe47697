#pragma once

#include "core/result.hpp"

#include <QJsonObject>
#include <string>

namespace tinsel::sync {

/**
 * RemoteBackend - the remote document store.
 *
 * Documents are addressed by collection and id. Failures are opaque to
 * the outbox: any error is retried with backoff.
 */
class RemoteBackend {
public:
    virtual ~RemoteBackend() = default;

    /**
     * Acquire a session (anonymous credential) if none is held yet.
     */
    [[nodiscard]] virtual Result<void, Error> ensure_session() = 0;

    /**
     * Write a document; with `merge` only the given fields are replaced.
     */
    [[nodiscard]] virtual Result<void, Error> put(
        const std::string& collection,
        const std::string& doc_id,
        const QJsonObject& payload,
        bool merge) = 0;

    [[nodiscard]] virtual Result<void, Error> remove(
        const std::string& collection,
        const std::string& doc_id) = 0;
};

} // namespace tinsel::sync
