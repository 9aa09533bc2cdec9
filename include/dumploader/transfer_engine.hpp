#ifndef DUMPLOADER_TRANSFER_ENGINE_HPP
#define DUMPLOADER_TRANSFER_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <dumploader/export.hpp>
#include <dumploader/enums.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/mirror.hpp>
#include <dumploader/planner.hpp>

extern "C"
{
#include <curl/curl.h>
}

namespace dumploader
{
    class Context;
    class StateStore;
    class Transfer;

    // Result of one TransferTask for a run.
    struct DUMPLOADER_API TransferOutcome
    {
        std::string path;
        TransferStatus status = TransferStatus::kNOT_STARTED;
        // Attempts made during this run (first try included).
        std::size_t attempts = 0;
        // Bytes received over the network and written to the partial file.
        std::uintmax_t bytes_transferred = 0;
        std::uintmax_t size = 0;
        std::optional<Error> error;
        // URL of the last attempt.
        std::string url;
    };

    // Runs TransferTasks with at most `Context::max_parallel_downloads` transfers at a time,
    // starting them in the given order. Per task failures are recorded in the StateStore and in
    // the outcomes, they never stop the other tasks.
    class DUMPLOADER_API TransferEngine
    {
    public:
        // With an empty `mirrors` list every attempt uses `TransferTask::source_url`, otherwise
        // each attempt picks a mirror and resolves `TransferTask::location` on it.
        TransferEngine(const Context& ctx, StateStore& store, mirror_list mirrors = {});
        ~TransferEngine();

        TransferEngine(const TransferEngine&) = delete;
        TransferEngine& operator=(const TransferEngine&) = delete;

        // Outcomes are returned in task order. Stops starting transfers as soon as an
        // interruption is requested; running ones keep their state InProgress.
        std::vector<TransferOutcome> run(const std::vector<TransferTask>& tasks);

        const mirror_list& mirrors() const
        {
            return m_mirrors;
        }

    private:
        bool prepare_next_transfers();
        void check_msgs();

        const Context& m_ctx;
        StateStore& m_store;
        mirror_list m_mirrors;

        CURLM* m_multi_handle = nullptr;
        std::vector<std::unique_ptr<Transfer>> m_transfers;
        std::vector<Transfer*> m_running_transfers;
    };
}

#endif
