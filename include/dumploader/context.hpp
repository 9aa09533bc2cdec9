#ifndef DUMPLOADER_CONTEXT_HPP
#define DUMPLOADER_CONTEXT_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

#include <dumploader/export.hpp>

namespace dumploader
{
    // Transport settings shared by every request of a process. The live instance also owns the
    // libcurl global initialization, so there can only be one at any time.
    class DUMPLOADER_API Context
    {
    public:
        int verbosity = 0;

        // Skips peer and host verification for HTTPS mirrors.
        bool disable_ssl = false;
        // Compare completed files with the listed checksum (size is always checked).
        bool validate_checksum = true;

        long connect_timeout = 30L;
        // A transfer slower than `low_speed_limit` bytes/s for `low_speed_time` seconds is
        // aborted and retried.
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        long max_parallel_downloads = 3L;

        // Receive buffer of each easy handle, large values help on fast links.
        long transfer_buffersize = 100 * 1024;

        // Give downloaded files the modification time announced by the server or the listing.
        bool preserve_filetime = true;

        // Maximum number of attempts for one file during one run (first try included).
        std::size_t retry_limit = 3;
        std::size_t retry_backoff_factor = 2;
        std::chrono::steady_clock::duration retry_default_timeout = std::chrono::seconds(2);
        std::chrono::steady_clock::duration retry_max_timeout = std::chrono::seconds(120);

        // Progress of running transfers is persisted every `progress_persist_bytes` received or
        // every `progress_persist_interval`, whichever comes first.
        std::uintmax_t progress_persist_bytes = 8 * 1024 * 1024;
        std::chrono::steady_clock::duration progress_persist_interval = std::chrono::seconds(5);

        // Listing documents larger than this are refused.
        std::size_t max_listing_size = 64 * 1024 * 1024;

        std::string user_agent = "dumploader";

        // 0 = warn, 1 = info, 2 = debug, 3 and more = trace with libcurl verbose output.
        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum level);

        // Throws std::runtime_error if another instance is alive or libcurl cannot be set up.
        Context();
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;
    };
}

#endif
