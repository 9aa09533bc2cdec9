#include <atomic>
#include <stdexcept>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <dumploader/context.hpp>

namespace dumploader
{
    namespace
    {
        std::atomic<bool> context_alive{ false };
    }

    Context::Context()
    {
        bool expected = false;
        if (!context_alive.compare_exchange_strong(expected, true))
        {
            throw std::runtime_error("dumploader::Context created more than once");
        }

        const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK)
        {
            context_alive = false;
            throw std::runtime_error(std::string("Could not initialize libcurl: ")
                                     + curl_easy_strerror(rc));
        }

        spdlog::debug("Using {}", curl_version());
        set_verbosity(0);
    }

    Context::~Context()
    {
        curl_global_cleanup();
        context_alive = false;
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v > 2)
        {
            spdlog::set_level(spdlog::level::trace);
        }
        else if (v > 1)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else if (v > 0)
        {
            spdlog::set_level(spdlog::level::info);
        }
        else
        {
            spdlog::set_level(spdlog::level::warn);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum level)
    {
        spdlog::set_level(level);
        verbosity = level <= spdlog::level::trace ? 3 : level <= spdlog::level::debug ? 2 : 0;
    }
}
