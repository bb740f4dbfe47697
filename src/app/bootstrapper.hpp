#pragma once

#include "app/legacy_source.hpp"
#include "storage/local_store.hpp"
#include "core/job.hpp"
#include "core/result.hpp"

#include <string>

namespace tinsel::app {

enum class BootstrapSource {
    LocalStore,
    LegacyFlatStorage,
    Fallback
};

[[nodiscard]] const char* source_name(BootstrapSource source);

struct BootstrapResult {
    AppDataSnapshot snapshot;
    BootstrapSource source = BootstrapSource::Fallback;
    bool store_available = false;
};

/**
 * Slot names in the legacy flat storage.
 */
struct LegacyKeys {
    std::string jobs = "sonl.jobs.v1";
    std::string policy = "sonl.policy.v1";
    std::string active_date = "sonl.activeDate.v1";
    std::string user = "sonl.user.v1";
};

/**
 * Bootstrapper - produces the startup snapshot.
 *
 * Store unavailable: the fallback, store_available = false.
 * Store open with no jobs: one-time import of the legacy slots.
 * Otherwise: the snapshot read back from the store.
 * Any failure after a successful open yields the fallback with
 * store_available = true.
 */
class Bootstrapper {
public:
    Bootstrapper(storage::LocalStore& store, const LegacySource& legacy, LegacyKeys keys = {});

    [[nodiscard]] BootstrapResult bootstrap(const AppDataSnapshot& fallback);

    /**
     * The legacy slots, each falling back to the matching fallback field.
     */
    [[nodiscard]] AppDataSnapshot read_legacy(const AppDataSnapshot& fallback) const;

private:
    [[nodiscard]] Result<void, Error> import_legacy(const AppDataSnapshot& snapshot);
    [[nodiscard]] Result<AppDataSnapshot, Error> read_store(const AppDataSnapshot& fallback);

    storage::LocalStore& store_;
    const LegacySource& legacy_;
    LegacyKeys keys_;
};

} // namespace tinsel::app
