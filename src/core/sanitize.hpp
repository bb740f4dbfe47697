#pragma once

#include <QString>
#include <QVariant>
#include <string>
#include <vector>

namespace tinsel::sanitize {

enum class ChangeReason {
    Nan,
    Infinity,
    InvalidDate,
    Trim,
    Coerce
};

[[nodiscard]] const char* reason_name(ChangeReason reason);

struct Change {
    std::string path;
    QVariant from;
    QVariant to;
    ChangeReason reason;
};

/**
 * Report - what a sanitization pass did, keyed by dotted/bracketed path
 * (`job.tags[2]`; the root value has the empty path).
 *
 * `removed` lists members that were dropped, `trimmed` strings whose
 * whitespace was stripped, `replaced` non-finite numbers and invalid dates
 * that became null, `coerced` values rewritten into their valid domain.
 */
struct Report {
    std::vector<std::string> removed;
    std::vector<std::string> trimmed;
    std::vector<std::string> replaced;
    std::vector<std::string> coerced;
    std::vector<Change> changes;

    [[nodiscard]] bool empty() const {
        return removed.empty() && trimmed.empty() && replaced.empty() && coerced.empty();
    }

    void record_removed(const std::string& path);
    void record_change(const std::string& path, QVariant from, QVariant to, ChangeReason reason);

    /**
     * Append another report, prefixing its paths with `prefix`.
     */
    void merge(const Report& other, const std::string& prefix = {});

    [[nodiscard]] QString describe() const;
};

struct Options {
    bool trim_strings = true;
    bool convert_special_numbers = true;
    bool remove_empty_strings = false;
    bool drop_unserializable = true;
};

/**
 * Sanitized - output value plus report. An invalid `value` means the root
 * itself was removed.
 */
struct Sanitized {
    QVariant value;
    Report report;
};

/**
 * Clean an arbitrary value graph for a document store: no undefined
 * members anywhere, non-finite numbers and invalid dates become null,
 * strings are trimmed (and dropped when blank if requested), arrays are
 * compacted, unserializable values are dropped.
 */
[[nodiscard]] Sanitized safe_serialize(const QVariant& value, const Options& options = {});

/**
 * Prune undefined members only; strings, numbers and dates are untouched.
 */
[[nodiscard]] Sanitized strip_undefined(const QVariant& value);

[[nodiscard]] std::string child_path(const std::string& parent, const QString& key);
[[nodiscard]] std::string index_path(const std::string& parent, qsizetype index);

} // namespace tinsel::sanitize
