#ifndef DUMPLOADER_UTILS_HPP
#define DUMPLOADER_UTILS_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <dumploader/export.hpp>
#include <dumploader/enums.hpp>

namespace dumploader
{
    namespace fs = std::filesystem;

    // Interruption is process wide: it is raised from a signal handler and observed by every
    // running TransferEngine.
    DUMPLOADER_API bool is_sig_interrupted();
    DUMPLOADER_API void request_interrupt();
    DUMPLOADER_API void reset_interrupt();
    // Installs SIGINT / SIGTERM handlers that call `request_interrupt()`.
    DUMPLOADER_API void install_interrupt_handlers();

    DUMPLOADER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    DUMPLOADER_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    // Hex SHA-256 of an in-memory buffer.
    DUMPLOADER_API std::string sha256(const std::string& str);

    DUMPLOADER_API std::string to_lower(const std::string_view& input);
    DUMPLOADER_API bool contains(const std::string_view& str, const std::string_view& sub_str);
    DUMPLOADER_API std::string_view strip(std::string_view input);

    // Hex digest of `path` computed with the algorithm of `type`, empty if it cannot be read.
    DUMPLOADER_API std::string checksum_file(const fs::path& path, ChecksumType type);

    DUMPLOADER_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    DUMPLOADER_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    DUMPLOADER_API
    void replace_all(std::string& data, const std::string& search, const std::string& replace);

    // Human readable byte count with SI scales, e.g. "1.50 MB".
    DUMPLOADER_API std::string format_bytes(std::uintmax_t bytes);

    // True if `path` is relative, non empty and cannot escape its root once joined to it.
    DUMPLOADER_API bool is_safe_relative_path(const std::string_view& path);

    // Joins `relative` to `root`, returns nothing if the result would land outside of `root`.
    DUMPLOADER_API std::optional<fs::path> resolve_under(const fs::path& root,
                                                         const std::string_view& relative);
}

#endif
