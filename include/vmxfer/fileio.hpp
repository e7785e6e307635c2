#ifndef VMXFER_FILEIO_HPP
#define VMXFER_FILEIO_HPP

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#else
#include <io.h>
#include <windows.h>
#endif


namespace vmxfer
{
    namespace fs = std::filesystem;

    // Thin RAII wrapper around a C FILE* with 64 bit offsets.
    // Errors are reported through std::error_code, never by throwing.
    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;

    public:
#ifdef _WIN32
        constexpr static wchar_t read_update_binary[] = L"rb+";
        constexpr static wchar_t write_update_binary[] = L"wb+";
        constexpr static wchar_t write_binary[] = L"wb";
        constexpr static wchar_t read_binary[] = L"rb";
        using mode_type = const wchar_t*;
#else
        constexpr static char read_update_binary[] = "rb+";
        constexpr static char write_update_binary[] = "wb+";
        constexpr static char write_binary[] = "wb";
        constexpr static char read_binary[] = "rb";
        using mode_type = const char*;
#endif

        FileIO() = default;

        inline explicit FileIO(const fs::path& file_path, mode_type mode, std::error_code& ec) noexcept
            : m_path(file_path)
        {
#ifdef _WIN32
            m_fs = ::_wfsopen(file_path.wstring().c_str(), mode, _SH_DENYNO);
#else
            m_fs = ::fopen(file_path.c_str(), mode);
#endif
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error closing {}: {}", m_path.string(), ec.message());
                }
            }
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline int fd() const noexcept
        {
#ifndef _WIN32
            return ::fileno(m_fs);
#else
            return ::_fileno(m_fs);
#endif
        }

        inline int seek(std::uintmax_t offset, int origin) const noexcept
        {
#ifdef _WIN32
            return ::_fseeki64(m_fs, static_cast<long long>(offset), origin);
#else
            return ::fseeko(m_fs, static_cast<off_t>(offset), origin);
#endif
        }

        inline std::intmax_t tell() const noexcept
        {
#ifdef _WIN32
            return ::_ftelli64(m_fs);
#else
            return ::ftello(m_fs);
#endif
        }

        inline std::size_t write(const void* buffer, std::size_t size) const noexcept
        {
            return ::fwrite(buffer, 1, size, m_fs);
        }

        inline std::size_t read(void* buffer, std::size_t size) const noexcept
        {
            return ::fread(buffer, 1, size, m_fs);
        }

        void truncate(std::uintmax_t length, std::error_code& ec) const noexcept
        {
            ec.clear();
            ::fflush(m_fs);
#ifdef _WIN32
            if (::_chsize_s(fd(), static_cast<long long>(length)) != 0)
#else
            if (::ftruncate(fd(), static_cast<off_t>(length)) != 0)
#endif
            {
                ec.assign(errno, std::generic_category());
            }
        }

        void flush(std::error_code& ec) const noexcept
        {
            ec.clear();
            if (::fflush(m_fs) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        // Flushes user space buffers and asks the OS to persist the file content.
        void sync(std::error_code& ec) const noexcept
        {
            flush(ec);
            if (ec)
                return;
#ifdef _WIN32
            if (::_commit(fd()) != 0)
#else
            if (::fsync(fd()) != 0)
#endif
            {
                ec.assign(errno, std::generic_category());
            }
        }

        inline const fs::path& path() const noexcept
        {
            return m_path;
        }

        void close(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec.clear();
                return;
            }
            if (::fclose(m_fs) == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
            m_fs = nullptr;
        }

        inline int error() const noexcept
        {
            return ::ferror(m_fs);
        }
    };
}

#endif
