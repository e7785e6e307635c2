#include <cstdlib>
#include <ctime>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>

#include <vmxfer/errors.hpp>
#include <vmxfer/utils.hpp>

namespace vmxfer
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_upper(const std::string_view& input)
    {
        return string_transform(input, std::toupper);
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    bool contains_ignore_case(const std::string_view& str, const std::string_view& sub_str)
    {
        return contains(to_lower(str), to_lower(sub_str));
    }

    std::string sha256sum(const fs::path& path)
    {
        std::ifstream infile(path, std::ios::binary);
        if (!infile)
        {
            return {};
        }

        unsigned char hash[32];
        EVP_MD_CTX* mdctx;
        mdctx = EVP_MD_CTX_create();
        EVP_DigestInit_ex(mdctx, EVP_sha256(), NULL);

        constexpr std::size_t BUFSIZE = 32768;
        std::vector<char> buffer(BUFSIZE);

        while (infile)
        {
            infile.read(buffer.data(), BUFSIZE);
            size_t count = infile.gcount();
            if (!count)
                break;
            EVP_DigestUpdate(mdctx, buffer.data(), count);
        }

        EVP_DigestFinal_ex(mdctx, hash, nullptr);
        EVP_MD_CTX_destroy(mdctx);

        return hex_string(hash, 32);
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
                if (max_split == 0)
                    break;
                --max_split;
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

    std::string format_bytes(std::uintmax_t bytes)
    {
        constexpr const char* units[] = { "B", "KiB", "MiB", "GiB", "TiB", "PiB" };
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit < 5)
        {
            value /= 1024.0;
            ++unit;
        }
        if (unit == 0)
        {
            return fmt::format("{} B", bytes);
        }
        return fmt::format("{:.2f} {}", value, units[unit]);
    }

    std::uintmax_t parse_byte_size(const std::string_view& input)
    {
        std::string s = to_upper(input);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            s.pop_back();
        if (ends_with(s, "IB"))
            s.resize(s.size() - 2);
        else if (ends_with(s, "B") && s.size() > 1
                 && !std::isdigit(static_cast<unsigned char>(s[s.size() - 2])))
            s.resize(s.size() - 1);

        std::uintmax_t multiplier = 1;
        if (!s.empty())
        {
            switch (s.back())
            {
                case 'K':
                    multiplier = 1024ULL;
                    break;
                case 'M':
                    multiplier = 1024ULL * 1024;
                    break;
                case 'G':
                    multiplier = 1024ULL * 1024 * 1024;
                    break;
                case 'T':
                    multiplier = 1024ULL * 1024 * 1024 * 1024;
                    break;
                default:
                    break;
            }
            if (multiplier != 1)
                s.pop_back();
        }

        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
        {
            throw std::invalid_argument(fmt::format("Invalid byte size: '{}'", input));
        }
        std::uintmax_t value = 0;
        try
        {
            value = std::stoull(s);
        }
        catch (const std::out_of_range&)
        {
            throw std::out_of_range(fmt::format("Byte size out of range: '{}'", input));
        }
        if (value > std::numeric_limits<std::uintmax_t>::max() / multiplier)
            throw std::out_of_range(fmt::format("Byte size out of range: '{}'", input));
        return value * multiplier;
    }

    std::string format_timestamp(std::chrono::system_clock::time_point tp)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

    std::chrono::system_clock::time_point parse_timestamp(const std::string& input)
    {
        std::tm tm{};
        std::istringstream iss(input);
        iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (iss.fail())
        {
            return {};
        }

        std::time_t t = timegm(&tm);

        // skip fractional seconds, then apply a "+hh:mm" / "-hh:mm" offset if any
        std::string rest;
        std::getline(iss, rest);
        std::size_t pos = 0;
        if (pos < rest.size() && rest[pos] == '.')
        {
            ++pos;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])))
                ++pos;
        }
        if (rest.size() >= pos + 6 && (rest[pos] == '+' || rest[pos] == '-'))
        {
            int hours = std::atoi(rest.substr(pos + 1, 2).c_str());
            int minutes = std::atoi(rest.substr(pos + 4, 2).c_str());
            int offset = (hours * 3600 + minutes * 60) * (rest[pos] == '+' ? 1 : -1);
            t -= offset;
        }
        return std::chrono::system_clock::from_time_t(t);
    }

    const char* to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::XF_OK:
                return "ok";
            case ErrorCode::XF_BADARG:
                return "bad argument";
            case ErrorCode::XF_POOL_SHUTTING_DOWN:
                return "pool is shutting down";
            case ErrorCode::XF_QUEUE_FULL:
                return "task queue is full";
            case ErrorCode::XF_POOL_CLOSED:
                return "pool already closed";
            case ErrorCode::XF_POOL_STARTED:
                return "pool already started";
            case ErrorCode::XF_NOT_FOUND:
                return "not found";
            case ErrorCode::XF_CORRUPT:
                return "corrupt";
            case ErrorCode::XF_CANNOTCREATEDIR:
                return "cannot create directory";
            case ErrorCode::XF_FILE:
                return "file error";
            case ErrorCode::XF_IO:
                return "i/o error";
            case ErrorCode::XF_CURL:
                return "curl error";
            case ErrorCode::XF_BADSTATUS:
                return "bad status";
            case ErrorCode::XF_RANGE_NOT_SATISFIABLE:
                return "range not satisfiable";
            case ErrorCode::XF_CANCELLED:
                return "cancelled";
            case ErrorCode::XF_SHORT_WRITE:
                return "short write";
            case ErrorCode::XF_SIZE_MISMATCH:
                return "size mismatch";
            case ErrorCode::XF_BADCHECKSUM:
                return "bad checksum";
            case ErrorCode::XF_RETRIES_EXHAUSTED:
                return "retries exhausted";
            case ErrorCode::XF_UNKNOWNERROR:
                return "unknown error";
        }
        return "unknown error";
    }
}
