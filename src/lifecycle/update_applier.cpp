#include "lifecycle/update_applier.hpp"
#include "core/crash_reporter.hpp"
#include "core/logger.hpp"

#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

static ApplyResult make_result(ApplyOutcome outcome, std::string message) {
    ApplyResult r;
    r.outcome = outcome;
    r.message = std::move(message);
    return r;
}

UpdateApplier::UpdateApplier() = default;

UpdateApplier::~UpdateApplier() = default;

std::string UpdateApplier::backup_path_for(const std::string& target) {
    return target + kBackupSuffix;
}

// ── Primitives ──────────────────────────────────────────────

std::error_code UpdateApplier::remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return ec;
}

std::error_code UpdateApplier::rename_file(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    return ec;
}

std::error_code UpdateApplier::copy_file(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) return ec;

    fs::permissions(to,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    return ec;
}

// ── Transaction ─────────────────────────────────────────────

void UpdateApplier::discard_artifact(const UpdateTransaction& tx) {
    if (auto ec = remove_file(tx.artifact)) {
        LOG_WARN("Could not remove staged artifact {}: {}", tx.artifact, ec.message());
    }
}

ApplyResult UpdateApplier::roll_back(const UpdateTransaction& tx, const std::string& reason) {
    // rename() replaces whatever partial file step 3 left at the target
    if (auto ec = rename_file(tx.backup, tx.target)) {
        CrashReporter::report("Update rollback",
                              "Could not restore " + tx.target + " from " + tx.backup + ": " +
                                  ec.message() + " (backup left in place)");
        return make_result(ApplyOutcome::RolledBack,
                           reason + "; restore failed, previous version kept at " + tx.backup);
    }
    LOG_WARN("Update rolled back, {} restored", tx.target);
    return make_result(ApplyOutcome::RolledBack, reason);
}

ApplyResult UpdateApplier::apply(const std::string& artifact, const std::string& target,
                                 const std::atomic<bool>* cancel) {
    UpdateTransaction tx{artifact, target, backup_path_for(target)};

    try {
        std::error_code ec;
        if (artifact.empty() || !fs::is_regular_file(artifact, ec)) {
            return make_result(ApplyOutcome::RolledBack, "Update artifact not found: " + artifact);
        }
        if (target.empty() || !fs::exists(target, ec)) {
            return make_result(ApplyOutcome::RolledBack, "Target executable not found: " + target);
        }
        if (fs::equivalent(artifact, target, ec)) {
            return make_result(ApplyOutcome::RolledBack, "Artifact and target are the same file");
        }

        if (cancel && cancel->load()) {
            discard_artifact(tx);
            return make_result(ApplyOutcome::Cancelled, "Update cancelled before install");
        }

        // Step 1: leftover backup from a previous cycle
        if (fs::exists(tx.backup, ec)) {
            if (auto rm = remove_file(tx.backup)) {
                return make_result(ApplyOutcome::RolledBack,
                                   "Cannot remove old backup " + tx.backup + ": " + rm.message());
            }
        }

        if (cancel && cancel->load()) {
            discard_artifact(tx);
            return make_result(ApplyOutcome::Cancelled, "Update cancelled before install");
        }

        // Step 2: move the current executable aside (same directory, atomic)
        if (auto mv = rename_file(tx.target, tx.backup)) {
            return make_result(ApplyOutcome::RolledBack,
                               "Cannot back up " + tx.target + ": " + mv.message());
        }

        // Step 3: install the new binary
        if (auto cp = copy_file(tx.artifact, tx.target)) {
            return roll_back(tx, "Cannot install update: " + cp.message());
        }

        // Step 5: cleanup, failures here do not undo the commit
        discard_artifact(tx);
        if (auto rm = remove_file(tx.backup)) {
            LOG_WARN("Could not remove backup {}: {}", tx.backup, rm.message());
        }

        LOG_INFO("Update installed at {}", tx.target);
        return make_result(ApplyOutcome::Committed, "Update installed");
    } catch (const std::exception& e) {
        CrashReporter::report("Applying update to " + target, e);
        std::error_code ec;
        if (!fs::exists(tx.target, ec) && fs::exists(tx.backup, ec)) {
            return roll_back(tx, std::string("Update failed: ") + e.what());
        }
        return make_result(ApplyOutcome::RolledBack, std::string("Update failed: ") + e.what());
    }
}
