#include <atomic>
#include <cctype>
#include <csignal>
#include <fstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>

#include <dumploader/utils.hpp>

namespace dumploader
{
    namespace
    {
        std::atomic<bool> sig_interrupted{ false };

        extern "C" void interrupt_signal_handler(int)
        {
            sig_interrupted = true;
        }

        const EVP_MD* evp_digest(ChecksumType type)
        {
            switch (type)
            {
                case ChecksumType::kSHA1:
                    return EVP_sha1();
                case ChecksumType::kMD5:
                    return EVP_md5();
                case ChecksumType::kSHA256:
                    break;
            }
            return EVP_sha256();
        }

        // Incremental hex digest over an OpenSSL EVP context.
        class Hasher
        {
        public:
            explicit Hasher(ChecksumType type)
                : m_ctx(EVP_MD_CTX_new())
            {
                if (m_ctx == nullptr || EVP_DigestInit_ex(m_ctx, evp_digest(type), nullptr) != 1)
                {
                    EVP_MD_CTX_free(m_ctx);
                    throw std::runtime_error("Could not initialize digest");
                }
            }

            ~Hasher()
            {
                EVP_MD_CTX_free(m_ctx);
            }

            Hasher(const Hasher&) = delete;
            Hasher& operator=(const Hasher&) = delete;

            void update(const char* data, std::size_t size)
            {
                EVP_DigestUpdate(m_ctx, data, size);
            }

            std::string hexdigest()
            {
                unsigned char md[EVP_MAX_MD_SIZE];
                unsigned int md_len = 0;
                EVP_DigestFinal_ex(m_ctx, md, &md_len);

                static constexpr char digits[] = "0123456789abcdef";
                std::string out;
                out.reserve(md_len * 2);
                for (unsigned int i = 0; i < md_len; ++i)
                {
                    out.push_back(digits[md[i] >> 4]);
                    out.push_back(digits[md[i] & 0x0f]);
                }
                return out;
            }

        private:
            EVP_MD_CTX* m_ctx;
        };
    }

    bool is_sig_interrupted()
    {
        return sig_interrupted;
    }

    void request_interrupt()
    {
        sig_interrupted = true;
    }

    void reset_interrupt()
    {
        sig_interrupted = false;
    }

    void install_interrupt_handlers()
    {
        std::signal(SIGINT, interrupt_signal_handler);
        std::signal(SIGTERM, interrupt_signal_handler);
    }

    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    std::string sha256(const std::string& str)
    {
        Hasher hasher(ChecksumType::kSHA256);
        hasher.update(str.data(), str.size());
        return hasher.hexdigest();
    }

    std::string to_lower(const std::string_view& input)
    {
        std::string res(input);
        for (char& c : res)
        {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return res;
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::string_view strip(std::string_view input)
    {
        while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front())))
            input.remove_prefix(1);
        while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back())))
            input.remove_suffix(1);
        return input;
    }

    std::string checksum_file(const fs::path& path, ChecksumType type)
    {
        std::ifstream infile(path, std::ios::binary);
        if (!infile)
        {
            return {};
        }

        Hasher hasher(type);
        std::vector<char> buffer(64 * 1024);
        while (infile.read(buffer.data(), buffer.size()) || infile.gcount() > 0)
        {
            hasher.update(buffer.data(), static_cast<std::size_t>(infile.gcount()));
        }
        return hasher.hexdigest();
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key, value;
            key = header.substr(0, colon_idx);
            value = strip(header.substr(colon_idx + 1));
            // http headers are case insensitive!
            std::string lkey = to_lower(key);

            return std::make_pair(lkey, std::string(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    void replace_all(std::string& data, const std::string& search, const std::string& replace)
    {
        std::size_t pos = data.find(search);
        while (pos != std::string::npos)
        {
            data.replace(pos, search.size(), replace);
            pos = data.find(search, pos + replace.size());
        }
    }

    std::string format_bytes(std::uintmax_t bytes)
    {
        static constexpr std::array<const char*, 7> scales = { "", "k", "M", "G", "T", "P", "E" };
        double value = static_cast<double>(bytes);
        std::size_t scale = 0;
        while (value >= 1000.0 && scale + 1 < scales.size())
        {
            value /= 1000.0;
            ++scale;
        }
        return fmt::format("{:.2f} {}B", value, scales[scale]);
    }

    bool is_safe_relative_path(const std::string_view& path)
    {
        if (path.empty() || path.front() == '/' || path.front() == '\\')
            return false;
        if (contains(path, "\\") || contains(path, std::string_view("\0", 1)))
            return false;
        // Windows drive letters, "C:foo"
        if (path.size() > 1 && path[1] == ':')
            return false;

        bool has_name = false;
        for (const auto& part : split(path, "/"))
        {
            if (part == "..")
                return false;
            if (!part.empty() && part != ".")
                has_name = true;
        }
        return has_name;
    }

    std::optional<fs::path> resolve_under(const fs::path& root, const std::string_view& relative)
    {
        if (!is_safe_relative_path(relative))
            return std::nullopt;

        const fs::path base = root.lexically_normal();
        const fs::path full = (base / fs::path(std::string(relative))).lexically_normal();
        const fs::path rel = full.lexically_relative(base);
        if (rel.empty() || rel == "." || *rel.begin() == "..")
            return std::nullopt;
        return full;
    }
}
