#ifndef VMXFER_UTILS_HPP
#define VMXFER_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <vmxfer/export.hpp>

namespace vmxfer
{
    namespace fs = std::filesystem;

    VMXFER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    VMXFER_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    template <class B>
    inline std::string hex_string(const B& buffer, std::size_t size)
    {
        std::ostringstream oss;
        oss << std::hex;
        for (std::size_t i = 0; i < size; ++i)
        {
            oss << std::setw(2) << std::setfill('0') << static_cast<int>(buffer[i]);
        }
        return oss.str();
    }

    template <class B>
    inline std::string hex_string(const B& buffer)
    {
        return hex_string(buffer, buffer.size());
    }

    VMXFER_API std::string string_transform(const std::string_view& input, int (*functor)(int));
    VMXFER_API std::string to_upper(const std::string_view& input);
    VMXFER_API std::string to_lower(const std::string_view& input);
    VMXFER_API bool contains(const std::string_view& str, const std::string_view& sub_str);
    VMXFER_API bool contains_ignore_case(const std::string_view& str,
                                         const std::string_view& sub_str);

    // SHA-256 of the file content as a lowercase hex string, empty if unreadable.
    VMXFER_API std::string sha256sum(const fs::path& path);

    VMXFER_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    // Human readable byte count, e.g. "1.50 MiB".
    VMXFER_API std::string format_bytes(std::uintmax_t bytes);

    // Parses "4096", "64K", "10M", "2G" (binary multiples). Throws std::invalid_argument.
    VMXFER_API std::uintmax_t parse_byte_size(const std::string_view& input);

    // RFC 3339 timestamps as used in checkpoint files.
    VMXFER_API std::string format_timestamp(std::chrono::system_clock::time_point tp);
    VMXFER_API std::chrono::system_clock::time_point parse_timestamp(const std::string& input);
}

#endif
