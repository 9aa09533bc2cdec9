#ifndef DUMPLOADER_ERRORS_HPP
#define DUMPLOADER_ERRORS_HPP

#include <string>

#include <spdlog/spdlog.h>
#include <dumploader/enums.hpp>

namespace dumploader
{
    // Returned through tl::expected by every fallible operation of the library.
    struct Error
    {
        ErrorLevel level = ErrorLevel::INFO;
        ErrorCode code = ErrorCode::DL_OK;
        std::string reason;

        // Serious errors penalize the mirror that produced them.
        bool is_serious() const noexcept
        {
            return level >= ErrorLevel::SERIOUS;
        }

        // The same request may succeed later (timeouts, 5xx, dropped connections).
        bool is_transient() const noexcept
        {
            return code == ErrorCode::DL_TRANSIENT_TRANSFER;
        }

        std::string to_string() const
        {
            return fmt::format("{}: {}", dumploader::to_string(code), reason);
        }

        spdlog::level::level_enum log_level() const noexcept
        {
            if (level == ErrorLevel::FATAL)
            {
                return spdlog::level::critical;
            }
            return is_serious() ? spdlog::level::err : spdlog::level::warn;
        }

        void log() const
        {
            spdlog::log(log_level(), reason);
        }
    };
}

#endif
