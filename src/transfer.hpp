#ifndef DUMPLOADER_SRC_TRANSFER_HPP
#define DUMPLOADER_SRC_TRANSFER_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <dumploader/context.hpp>
#include <dumploader/enums.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/fileio.hpp>
#include <dumploader/mirror.hpp>
#include <dumploader/planner.hpp>
#include <dumploader/state_store.hpp>
#include <dumploader/transfer_engine.hpp>

#include "curl_internal.hpp"

namespace dumploader
{
    namespace fs = std::filesystem;

    // One TransferTask moving through its attempts: WAITING -> RUNNING -> FINISHED / FAILED,
    // going back to WAITING when a failed attempt may be retried.
    class Transfer
    {
    public:
        static std::size_t header_callback(char* buffer,
                                           std::size_t size,
                                           std::size_t nitems,
                                           Transfer* self);
        static std::size_t write_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          Transfer* self);

        Transfer(const Context& ctx, StateStore& store, TransferTask task, mirror_list& mirrors);
        ~Transfer();

        Transfer(const Transfer&) = delete;
        Transfer& operator=(const Transfer&) = delete;

        // Opens the partial file and adds a configured easy handle to `multi_handle`.
        // On failure the transfer is already in its final (failed) state.
        bool start(CURLM* multi_handle);

        // Evaluates a finished attempt: verifies and finalizes the file, schedules a retry or
        // records the failure.
        void finish(CURLM* multi_handle, CURLcode result);

        // Leaves the transfer InProgress with its durable byte count recorded.
        void abandon(TransferStatus status);

        bool ready_to_start(std::chrono::steady_clock::time_point now) const
        {
            return m_state == TransferState::kWAITING && m_next_attempt <= now;
        }

        std::chrono::steady_clock::time_point next_attempt() const
        {
            return m_next_attempt;
        }

        TransferState state() const noexcept
        {
            return m_state;
        }

        CURL* curl() const noexcept
        {
            return m_curl_handle ? m_curl_handle->handle() : nullptr;
        }

        const TransferTask& task() const noexcept
        {
            return m_task;
        }

        const TransferOutcome& outcome() const noexcept
        {
            return m_outcome;
        }

        const fs::path& temp_file() const noexcept
        {
            return m_temp_file;
        }

    private:
        static int progress_callback(Transfer* self,
                                     curl_off_t total_to_download,
                                     curl_off_t now_downloaded,
                                     curl_off_t total_to_upload,
                                     curl_off_t now_uploaded);

        tl::expected<void, Error> open_target_file();
        void on_body_start();
        void maybe_persist_progress();
        void persist_progress();
        void close_target_file();

        tl::expected<void, Error> check_finished_transfer_status(CURLcode result);
        tl::expected<Checksum, Error> verify();
        tl::expected<void, Error> finalize(const Checksum& computed, std::uintmax_t size);

        void set_retrying(const Error& error);
        void set_failed(Error error);
        void set_finished();
        void complete_mirror_usage(bool success, bool serious);

        std::uintmax_t durable_size() const
        {
            return m_offset + m_received;
        }

        const Context& m_ctx;
        StateStore& m_store;
        TransferTask m_task;
        mirror_list& m_mirrors;

        fs::path m_temp_file;
        std::unique_ptr<FileIO> m_outfile;
        std::unique_ptr<CURLHandle> m_curl_handle;
        std::shared_ptr<Mirror> m_mirror;
        std::string m_url;

        TransferState m_state = TransferState::kWAITING;
        std::chrono::steady_clock::time_point m_next_attempt;
        TransferOutcome m_outcome;

        // Offset the current attempt started from and bytes written since.
        std::uintmax_t m_offset = 0;
        std::uintmax_t m_received = 0;
        std::uintmax_t m_persisted = 0;
        std::chrono::steady_clock::time_point m_last_persist;

        long m_http_status = 0;
        bool m_body_started = false;
        bool m_interrupted = false;
        int m_write_errno = 0;
        // The server refused the requested range, the next attempt starts from 0 and is not
        // counted against the retry limit.
        bool m_range_rejected = false;
        std::size_t m_range_restarts = 0;
        HeaderCbState m_headercb_state = HeaderCbState::kDEFAULT;
        std::string m_headercb_interrupt_reason;
        std::optional<std::uintmax_t> m_content_length;
    };

    // Delay before attempt `attempt + 1`: exponential with +/- 25% jitter, capped.
    std::chrono::steady_clock::duration retry_delay(const Context& ctx, std::size_t attempt);
}

#endif
