#ifndef DUMPLOADER_PLANNER_HPP
#define DUMPLOADER_PLANNER_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <dumploader/export.hpp>
#include <dumploader/enums.hpp>
#include <dumploader/manifest.hpp>
#include <dumploader/state_store.hpp>

namespace dumploader
{
    namespace fs = std::filesystem;

    // One file to transfer.
    struct DUMPLOADER_API TransferTask
    {
        std::string path;
        // Location relative to a mirror root, used to rebuild the URL on another mirror.
        std::string location;
        std::string source_url;
        fs::path destination;
        std::uintmax_t resume_offset = 0;
        std::optional<std::uintmax_t> expected_size;
        std::optional<Checksum> expected_checksum;
        std::optional<file_time_point> last_modified;
    };

    struct PlannerOptions
    {
        std::string mirror_url;
        fs::path out_dir;
        // Empty means `StateStore::default_path(out_dir)`.
        fs::path state_path;
    };

    struct DUMPLOADER_API Plan
    {
        // Transfers, largest expected size first.
        std::vector<TransferTask> tasks;
        // Verified files whose remote checksum and size did not change.
        std::vector<std::string> up_to_date;
        // Verified files that changed remotely and must go back to Pending before transfer.
        std::vector<std::string> reset_to_pending;
        // Paths that cannot be placed under the output directory (or would overwrite the
        // downloader's own files), with the reason.
        std::vector<std::pair<std::string, std::string>> rejected;

        std::uintmax_t planned_bytes() const;
    };

    // True if the remote file differs from what was verified locally.
    DUMPLOADER_API bool remote_changed(const RemoteFile& remote, const LocalFileState& state);

    // Why `destination` (the resolved location of `path`) must not be written by a transfer:
    // partial files, the state directory, the state file and its temporary or quarantined
    // copies belong to the downloader. Nothing if the destination is free.
    DUMPLOADER_API std::optional<std::string> reserved_destination(const std::string& path,
                                                                   const fs::path& destination,
                                                                   const PlannerOptions& options);

    // Diffs `manifest` against `states`. Pure: no network or disk access, same inputs always
    // give the same plan.
    DUMPLOADER_API Plan plan(const Manifest& manifest,
                             const std::map<std::string, LocalFileState>& states,
                             const PlannerOptions& options);

    // Orders tasks by decreasing expected size, unknown sizes last, ties by path.
    DUMPLOADER_API void sort_tasks(std::vector<TransferTask>& tasks);
}

#endif
