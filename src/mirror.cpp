#include <algorithm>

#include <spdlog/spdlog.h>

#include <dumploader/mirror.hpp>
#include <dumploader/url.hpp>

namespace dumploader
{
    namespace
    {
        std::string without_trailing_slashes(std::string url)
        {
            while (url.size() > 1 && url.back() == '/' && url != "file://")
            {
                url.pop_back();
            }
            return url;
        }
    }

    double MirrorStats::success_rate() const
    {
        const int total = finished();
        if (total < 3)
        {
            return -1.0;
        }
        return static_cast<double>(succeeded) / total;
    }

    Mirror::Mirror(const Context& ctx, std::string base_url)
        : m_base_url(without_trailing_slashes(std::move(base_url)))
        , m_first_cooldown(ctx.retry_default_timeout)
        , m_max_cooldown(ctx.retry_max_timeout)
        , m_backoff_factor(std::max<std::size_t>(ctx.retry_backoff_factor, 1))
    {
    }

    bool Mirror::cooling_down(clock::time_point now) const
    {
        return m_consecutive_failures > 0 && now < m_cooldown_until;
    }

    void Mirror::begin_transfer()
    {
        ++m_stats.running;
    }

    void Mirror::end_transfer(bool success, std::uintmax_t bytes)
    {
        m_stats.running = std::max(m_stats.running - 1, 0);
        m_stats.bytes_received += bytes;

        if (success)
        {
            ++m_stats.succeeded;
            m_consecutive_failures = 0;
            return;
        }

        ++m_stats.failed;
        const auto now = clock::now();
        // Parallel transfers failing during the same cooldown count once.
        if (cooling_down(now))
        {
            return;
        }

        auto cooldown = m_first_cooldown;
        for (std::size_t i = 0; i < m_consecutive_failures && cooldown < m_max_cooldown; ++i)
        {
            cooldown *= m_backoff_factor;
        }
        ++m_consecutive_failures;
        m_cooldown_until = now + std::min(cooldown, m_max_cooldown);
        spdlog::debug("Mirror {} cooling down for {} ms",
                      m_base_url,
                      std::chrono::duration_cast<std::chrono::milliseconds>(
                          m_cooldown_until - now)
                          .count());
    }

    std::string Mirror::url_for(const std::string& path) const
    {
        return join_url(m_base_url, path);
    }

    void reorder_mirrors(mirror_list& mirrors,
                         const std::shared_ptr<Mirror>& mirror,
                         bool success,
                         bool serious)
    {
        const auto found = std::find(mirrors.begin(), mirrors.end(), mirror);
        if (!mirror || found == mirrors.end())
        {
            return;
        }
        const std::size_t pos = static_cast<std::size_t>(found - mirrors.begin());
        const std::size_t last = mirrors.size() - 1;

        if (!success && serious && mirror->stats().succeeded == 0)
        {
            if (pos != last)
            {
                std::rotate(found, found + 1, mirrors.end());
                spdlog::info("Mirror {} looks down, using it last", mirror->url());
            }
            return;
        }

        const double rate = mirror->stats().success_rate();
        if (rate < 0.0)
        {
            return;
        }

        if (success && pos > 0)
        {
            if (mirrors[pos - 1]->stats().success_rate() < rate)
            {
                std::swap(mirrors[pos - 1], mirrors[pos]);
                spdlog::debug("Mirror {} moved up", mirror->url());
            }
        }
        else if (!success && pos < last)
        {
            const double next_rate = mirrors[pos + 1]->stats().success_rate();
            if (next_rate < 0.0 || next_rate > rate)
            {
                std::swap(mirrors[pos], mirrors[pos + 1]);
                spdlog::debug("Mirror {} moved down", mirror->url());
            }
        }
    }

    std::shared_ptr<Mirror> pick_mirror(const mirror_list& mirrors,
                                        const std::shared_ptr<Mirror>& previous)
    {
        const auto now = Mirror::clock::now();
        const auto usable = std::find_if(mirrors.begin(),
                                         mirrors.end(),
                                         [&](const std::shared_ptr<Mirror>& m)
                                         { return m != previous && !m->cooling_down(now); });
        if (usable != mirrors.end())
        {
            return *usable;
        }
        if (previous)
        {
            return previous;
        }
        return mirrors.empty() ? nullptr : mirrors.front();
    }
}
