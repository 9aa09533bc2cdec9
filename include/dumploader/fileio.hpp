#ifndef DUMPLOADER_FILEIO_HPP
#define DUMPLOADER_FILEIO_HPP

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include <unistd.h>
#include <sys/types.h>

namespace dumploader
{
    namespace fs = std::filesystem;

    // Owning stdio handle for partial files and the state document.
    class FileIO
    {
    public:
        enum class Mode
        {
            // "wb+": created, or emptied if it exists.
            kCREATE,
            // "rb+": must exist, content kept.
            kUPDATE,
            // "ab+": created if missing, every write goes to the end.
            kAPPEND,
        };

        FileIO() = default;

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        FileIO(const fs::path& file_path, Mode mode, std::error_code& ec) noexcept
            : m_path(file_path)
        {
            ec.clear();
            m_fs = ::fopen(file_path.c_str(), mode_string(mode));
            if (!m_fs)
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }

        ~FileIO()
        {
            std::error_code ec;
            close(ec);
            if (ec)
            {
                spdlog::error("Could not close {}: {}", m_path.string(), ec.message());
            }
        }

        bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        const fs::path& path() const
        {
            return m_path;
        }

        int fd() const noexcept
        {
            return ::fileno(m_fs);
        }

        std::uintmax_t tell() const noexcept
        {
            const off_t pos = ::ftello(m_fs);
            return pos < 0 ? 0 : static_cast<std::uintmax_t>(pos);
        }

        // Returns the number of bytes written, short only on error.
        std::size_t write(const char* data, std::size_t size) const noexcept
        {
            return ::fwrite(data, 1, size, m_fs);
        }

        // Drops everything after `length` and moves the write position there.
        void reset_to(std::uintmax_t length, std::error_code& ec) const noexcept
        {
            ec.clear();
            if (::fflush(m_fs) != 0 || ::ftruncate(fd(), static_cast<off_t>(length)) != 0
                || ::fseeko(m_fs, static_cast<off_t>(length), SEEK_SET) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        // Flushes the stdio buffer and asks the kernel to write the data to stable storage.
        void sync(std::error_code& ec) const noexcept
        {
            ec.clear();
            if (::fflush(m_fs) != 0 || ::fsync(fd()) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        void close(std::error_code& ec) noexcept
        {
            ec.clear();
            if (!m_fs)
            {
                return;
            }
            if (::fclose(m_fs) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
            m_fs = nullptr;
        }

    private:
        static const char* mode_string(Mode mode) noexcept
        {
            switch (mode)
            {
                case Mode::kCREATE:
                    return "wb+";
                case Mode::kUPDATE:
                    return "rb+";
                case Mode::kAPPEND:
                    return "ab+";
            }
            return "rb+";
        }

        FILE* m_fs = nullptr;
        fs::path m_path;
    };
}

#endif
