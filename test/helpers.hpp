#ifndef DUMPLOADER_TEST_HELPERS_HPP
#define DUMPLOADER_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <dumploader/context.hpp>

namespace dumploader::testing
{
    namespace fs = std::filesystem;

    // Fresh directory under the system temp directory, removed with its content on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            static std::atomic<int> counter{ 0 };
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            m_path = fs::temp_directory_path()
                     / ("dumploader-test-" + std::to_string(stamp) + "-"
                        + std::to_string(counter++));
            fs::create_directories(m_path);
        }

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const
        {
            return m_path;
        }

    private:
        fs::path m_path;
    };

    inline std::string read_file(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    inline void write_file(const fs::path& path, const std::string& content)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    // Fast retries for tests.
    inline void set_test_timeouts(Context& ctx)
    {
        ctx.retry_default_timeout = std::chrono::milliseconds(10);
        ctx.retry_max_timeout = std::chrono::milliseconds(50);
        ctx.connect_timeout = 5L;
        ctx.preserve_filetime = true;
    }
}

#endif
