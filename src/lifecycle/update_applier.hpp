#pragma once

#include <atomic>
#include <string>
#include <system_error>

/// One in-flight binary replacement.
struct UpdateTransaction {
    std::string artifact;  // staged download, deleted on commit
    std::string target;    // executable being replaced
    std::string backup;    // target + kBackupSuffix, same directory
};

enum class ApplyOutcome {
    Committed,
    RolledBack,
    Cancelled,  // cancel observed before the backup rename; nothing changed
};

struct ApplyResult {
    ApplyOutcome outcome = ApplyOutcome::RolledBack;
    std::string message;

    bool committed() const { return outcome == ApplyOutcome::Committed; }
};

/// Swaps a new executable in for an old one with a one-deep backup.
///
/// At every point either the target or its backup exists and is runnable.
/// The applier only touches the three paths of the transaction; it never
/// reads or writes the data directory, so user settings cannot be affected
/// by an update. Not safe to run concurrently against the same target.
class UpdateApplier {
public:
    static constexpr const char* kBackupSuffix = ".old";

    UpdateApplier();
    virtual ~UpdateApplier();

    /// Replace `target` with a copy of `artifact`.
    /// `cancel` is honoured only until the backup rename; after that the
    /// transaction runs to commit or rollback.
    ApplyResult apply(const std::string& artifact, const std::string& target,
                      const std::atomic<bool>* cancel = nullptr);

    static std::string backup_path_for(const std::string& target);

protected:
    // Filesystem primitives, overridable to inject failures
    virtual std::error_code remove_file(const std::string& path);
    virtual std::error_code rename_file(const std::string& from, const std::string& to);
    virtual std::error_code copy_file(const std::string& from, const std::string& to);

private:
    ApplyResult roll_back(const UpdateTransaction& tx, const std::string& reason);
    void discard_artifact(const UpdateTransaction& tx);
};
