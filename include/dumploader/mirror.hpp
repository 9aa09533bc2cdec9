#ifndef DUMPLOADER_MIRROR_HPP
#define DUMPLOADER_MIRROR_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <dumploader/context.hpp>
#include <dumploader/export.hpp>

namespace dumploader
{
    struct MirrorStats
    {
        int running = 0;
        int succeeded = 0;
        int failed = 0;
        std::uintmax_t bytes_received = 0;

        int finished() const
        {
            return succeeded + failed;
        }

        // Fraction of finished transfers that succeeded, or a negative value while fewer than
        // three transfers have finished.
        double success_rate() const;
    };

    // One base URL serving the whole dataset tree. A mirror that fails is put on cooldown,
    // the cooldown grows with every consecutive failure and is cleared by the next success.
    class DUMPLOADER_API Mirror
    {
    public:
        using clock = std::chrono::steady_clock;

        Mirror(const Context& ctx, std::string base_url);

        Mirror(const Mirror&) = delete;
        Mirror& operator=(const Mirror&) = delete;

        const std::string& url() const
        {
            return m_base_url;
        }

        const MirrorStats& stats() const
        {
            return m_stats;
        }

        std::size_t consecutive_failures() const
        {
            return m_consecutive_failures;
        }

        bool cooling_down(clock::time_point now = clock::now()) const;
        clock::time_point cooldown_until() const
        {
            return m_cooldown_until;
        }

        void begin_transfer();
        void end_transfer(bool success, std::uintmax_t bytes = 0);

        // `path` is relative to the mirror root.
        std::string url_for(const std::string& path) const;

    private:
        std::string m_base_url;
        MirrorStats m_stats;

        clock::duration m_first_cooldown;
        clock::duration m_max_cooldown;
        std::size_t m_backoff_factor;

        std::size_t m_consecutive_failures = 0;
        clock::time_point m_cooldown_until;
    };

    using mirror_list = std::vector<std::shared_ptr<Mirror>>;

    // Moves `mirror` by at most one place after one of its transfers finished: forward on success
    // when it beats its predecessor, backward on failure when its successor does better. A mirror
    // that fails seriously before any success is sent to the back.
    DUMPLOADER_API void reorder_mirrors(mirror_list& mirrors,
                                        const std::shared_ptr<Mirror>& mirror,
                                        bool success,
                                        bool serious);

    // First mirror other than `previous` that is not cooling down. Falls back to `previous`,
    // then to the head of the list.
    DUMPLOADER_API std::shared_ptr<Mirror> pick_mirror(const mirror_list& mirrors,
                                                       const std::shared_ptr<Mirror>& previous);
}

#endif
