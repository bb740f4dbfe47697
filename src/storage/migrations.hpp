#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <functional>
#include <string>
#include <vector>

namespace tinsel::storage {

/**
 * Migration - one schema version step.
 *
 * `up_sql` runs first, then `rewrite` (when set) transforms the rows
 * already on disk. Both run inside a single transaction per version.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::function<Result<void, Error>(Database&)> rewrite;
};

/**
 * All migrations in order.
 */
[[nodiscard]] const std::vector<Migration>& all_migrations();

/**
 * Rewrite legacy outbox rows (queue_id/kind/ts) into the current
 * pending-operation layout.
 */
[[nodiscard]] Result<void, Error> reshape_pending_ops(Database& db);

/**
 * Normalize the materials sub-object of jobs, state values and pending
 * job payloads.
 */
[[nodiscard]] Result<void, Error> normalize_stored_materials(Database& db);

/**
 * MigrationRunner - brings a database up to the latest schema version.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations. Failures carry ErrorKind::MigrationFailed.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return all_migrations().empty() ? 0 : all_migrations().back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

} // namespace tinsel::storage
