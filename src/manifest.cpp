#include <ctime>
#include <iomanip>
#include <sstream>

#include <fmt/core.h>

#include <dumploader/manifest.hpp>
#include <dumploader/utils.hpp>

namespace dumploader
{
    std::string RemoteFile::name() const
    {
        const auto pos = path.rfind('/');
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }

    std::string DatasetId::to_string() const
    {
        return fmt::format("dump={} version={} job={}", dump, version, job);
    }

    Manifest::Manifest(DatasetId dataset)
        : m_dataset(std::move(dataset))
    {
    }

    bool Manifest::add(RemoteFile file)
    {
        if (m_index.count(file.path))
        {
            return false;
        }
        m_index.emplace(file.path, m_files.size());
        m_files.push_back(std::move(file));
        return true;
    }

    const RemoteFile* Manifest::find(const std::string& path) const
    {
        auto it = m_index.find(path);
        if (it == m_index.end())
        {
            return nullptr;
        }
        return &m_files[it->second];
    }

    bool Manifest::contains(const std::string& path) const
    {
        return m_index.count(path) != 0;
    }

    std::uintmax_t Manifest::total_size() const
    {
        std::uintmax_t total = 0;
        for (const auto& f : m_files)
        {
            total += f.size.value_or(0);
        }
        return total;
    }

    std::optional<file_time_point> parse_utc_timestamp(const std::string& str)
    {
        std::string value(strip(str));
        if (ends_with(value, "Z"))
        {
            value.pop_back();
        }
        replace_all(value, "T", " ");

        std::tm tm = {};
        std::istringstream iss(value);
        iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (iss.fail())
        {
            return std::nullopt;
        }

#ifdef _WIN32
        const std::time_t t = _mkgmtime(&tm);
#else
        const std::time_t t = timegm(&tm);
#endif
        if (t == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t);
    }

    std::string format_utc_timestamp(file_time_point tp)
    {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm = {};
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }
}
