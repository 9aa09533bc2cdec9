#include <algorithm>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

#include <dumploader/context.hpp>
#include <dumploader/state_store.hpp>
#include <dumploader/transfer_engine.hpp>
#include <dumploader/utils.hpp>

#include "transfer.hpp"

namespace dumploader
{
    TransferEngine::TransferEngine(const Context& ctx, StateStore& store, mirror_list mirrors)
        : m_ctx(ctx)
        , m_store(store)
        , m_mirrors(std::move(mirrors))
    {
        m_multi_handle = curl_multi_init();
        if (!m_multi_handle)
        {
            throw std::runtime_error("Could not initialize the CURL multi handle");
        }
        curl_multi_setopt(
            m_multi_handle, CURLMOPT_MAX_TOTAL_CONNECTIONS, m_ctx.max_parallel_downloads);
    }

    TransferEngine::~TransferEngine()
    {
        // Easy handles must leave the multi handle before it goes away.
        for (auto* transfer : m_running_transfers)
        {
            if (transfer->curl())
            {
                curl_multi_remove_handle(m_multi_handle, transfer->curl());
            }
        }
        m_running_transfers.clear();
        m_transfers.clear();
        curl_multi_cleanup(m_multi_handle);
    }

    bool TransferEngine::prepare_next_transfers()
    {
        if (is_sig_interrupted())
        {
            return false;
        }

        const auto now = std::chrono::steady_clock::now();
        const std::size_t max_running
            = static_cast<std::size_t>(std::max(1L, m_ctx.max_parallel_downloads));

        // Transfers are started in planner order.
        for (auto& transfer : m_transfers)
        {
            if (m_running_transfers.size() >= max_running)
            {
                break;
            }
            if (!transfer->ready_to_start(now))
            {
                continue;
            }
            if (transfer->start(m_multi_handle))
            {
                m_running_transfers.push_back(transfer.get());
            }
        }
        return true;
    }

    void TransferEngine::check_msgs()
    {
        int msgs_in_queue;
        while (CURLMsg* msg = curl_multi_info_read(m_multi_handle, &msgs_in_queue))
        {
            if (msg->msg != CURLMSG_DONE)
            {
                // We are only interested in messages about finished transfers
                continue;
            }

            auto it = std::find_if(m_running_transfers.begin(),
                                   m_running_transfers.end(),
                                   [&](Transfer* t) { return t->curl() == msg->easy_handle; });
            if (it == m_running_transfers.end())
            {
                spdlog::error("Finished handle does not belong to any running transfer");
                curl_multi_remove_handle(m_multi_handle, msg->easy_handle);
                continue;
            }

            Transfer* current = *it;
            // `msg` is invalidated once its handle is removed from the multi handle.
            const CURLcode result = msg->data.result;
            m_running_transfers.erase(it);

            spdlog::debug("Transfer finished {}", current->task().path);
            current->finish(m_multi_handle, result);
        }
    }

    std::vector<TransferOutcome> TransferEngine::run(const std::vector<TransferTask>& tasks)
    {
        m_transfers.clear();
        m_running_transfers.clear();
        m_transfers.reserve(tasks.size());
        for (const auto& task : tasks)
        {
            m_transfers.push_back(std::make_unique<Transfer>(m_ctx, m_store, task, m_mirrors));
        }

        const long max_wait_msecs = 1000;
        int still_running = 0;
        int repeats = 0;

        prepare_next_transfers();

        while (true)
        {
            CURLMcode code = curl_multi_perform(m_multi_handle, &still_running);
            if (code != CURLM_OK)
            {
                throw std::runtime_error(curl_multi_strerror(code));
            }

            check_msgs();
            // At this point, after handles of finished transfers were removed
            // from the multi handle, we can add new waiting transfers.
            const bool interrupted = !prepare_next_transfers();

            if (m_running_transfers.empty())
            {
                if (interrupted)
                {
                    break;
                }

                auto waiting = std::find_if(m_transfers.begin(),
                                            m_transfers.end(),
                                            [](const std::unique_ptr<Transfer>& t)
                                            { return t->state() == TransferState::kWAITING; });
                if (waiting == m_transfers.end())
                {
                    break;
                }

                // Only transfers waiting for their retry delay are left.
                auto next = std::chrono::steady_clock::time_point::max();
                for (const auto& transfer : m_transfers)
                {
                    if (transfer->state() == TransferState::kWAITING)
                    {
                        next = std::min(next, transfer->next_attempt());
                    }
                }
                const auto now = std::chrono::steady_clock::now();
                if (next > now)
                {
                    std::this_thread::sleep_for(
                        std::min<std::chrono::steady_clock::duration>(
                            next - now, std::chrono::milliseconds(max_wait_msecs)));
                }
                continue;
            }

            long curl_timeout = -1;
            code = curl_multi_timeout(m_multi_handle, &curl_timeout);
            if (code != CURLM_OK)
            {
                throw std::runtime_error(curl_multi_strerror(code));
            }

            // No wait
            if (curl_timeout == 0)
                continue;

            // Wait no more than 1s
            if (curl_timeout < 0 || curl_timeout > max_wait_msecs)
                curl_timeout = max_wait_msecs;

            int numfds;
            code = curl_multi_wait(m_multi_handle, nullptr, 0, static_cast<int>(curl_timeout), &numfds);
            if (code != CURLM_OK)
            {
                throw std::runtime_error(curl_multi_strerror(code));
            }

            if (!numfds)
            {
                // count number of repeated zero numfds
                repeats++;
                if (repeats > 1)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
            }
            else
            {
                repeats = 0;
            }
        }

        if (is_sig_interrupted())
        {
            for (auto& transfer : m_transfers)
            {
                if (transfer->state() == TransferState::kWAITING && transfer->outcome().attempts > 0)
                {
                    transfer->abandon(TransferStatus::kINTERRUPTED);
                }
            }
            spdlog::warn("Transfers interrupted");
        }
        else
        {
            spdlog::info("All transfers finished");
        }

        for (const auto& mirror : m_mirrors)
        {
            spdlog::info("Mirror {}: {} successful, {} failed transfers, {} received",
                         mirror->url(),
                         mirror->stats().succeeded,
                         mirror->stats().failed,
                         format_bytes(mirror->stats().bytes_received));
        }

        std::vector<TransferOutcome> outcomes;
        outcomes.reserve(m_transfers.size());
        for (const auto& transfer : m_transfers)
        {
            outcomes.push_back(transfer->outcome());
        }
        m_transfers.clear();
        return outcomes;
    }
}
