#ifndef DUMPLOADER_RUN_SUMMARY_HPP
#define DUMPLOADER_RUN_SUMMARY_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <dumploader/export.hpp>
#include <dumploader/manifest.hpp>
#include <dumploader/transfer_engine.hpp>

namespace dumploader
{
    struct DUMPLOADER_API FailedFile
    {
        std::string path;
        std::string reason;
        // Listed in `RunConfig::allowed_failures`, does not fail the run.
        bool allowed = false;
    };

    // End of run report. Informational only, never persisted.
    struct DUMPLOADER_API RunSummary
    {
        DatasetId dataset;
        bool dry_run = false;
        bool interrupted = false;

        std::size_t manifest_files = 0;
        std::size_t planned = 0;
        std::size_t succeeded = 0;
        std::size_t failed = 0;
        std::size_t up_to_date = 0;
        // Up to date files found on disk without any recorded state.
        std::size_t adopted = 0;
        // Transfers not started or left InProgress because of an interruption.
        std::size_t incomplete = 0;
        std::uintmax_t bytes_transferred = 0;
        // Bytes the plan expected to transfer (known sizes only).
        std::uintmax_t planned_bytes = 0;

        std::vector<FailedFile> failures;
        std::vector<TransferOutcome> outcomes;
        std::chrono::milliseconds elapsed{ 0 };

        // True if every failure is an allowed one and the run was not interrupted.
        bool ok() const;

        // Process exit code: 0 ok, 1 failed transfers, 130 interrupted.
        int exit_code() const;

        // One `key=value` per line, failures as `failed_path=<path> reason=<reason>`.
        std::string to_text() const;
    };

    DUMPLOADER_API void to_json(nlohmann::json& j, const RunSummary& summary);
}

#endif
