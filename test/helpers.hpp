#ifndef VMXFER_TEST_HELPERS_HPP
#define VMXFER_TEST_HELPERS_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <vmxfer/fetcher.hpp>

namespace vmxfer::test
{
    namespace fs = std::filesystem;

    // Fresh directory under the system temp dir, removed with its content on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            std::mt19937_64 gen(rd());
            m_path = fs::temp_directory_path() / ("vmxfer-test-" + std::to_string(gen()));
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

        fs::path operator/(const std::string& name) const
        {
            return m_path / name;
        }

    private:
        fs::path m_path;
    };

    inline std::string make_body(std::size_t size, unsigned seed = 1)
    {
        std::string body(size, '\0');
        std::mt19937 gen(seed);
        for (auto& c : body)
            c = static_cast<char>('a' + gen() % 26);
        return body;
    }

    inline std::string read_file(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    inline void write_file(const fs::path& path, const std::string& content)
    {
        if (path.has_parent_path())
            fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    // In-memory Fetcher with scripted failures.
    class MockFetcher : public Fetcher
    {
    public:
        struct Resource
        {
            std::string body;
            bool honor_range = true;
            // stop the body after this many bytes and report success
            std::size_t truncate_at = std::string::npos;
            // the first `fail_times` fetches break after `fail_after` bytes
            std::size_t fail_times = 0;
            std::size_t fail_after = 0;
            std::string failure = "connection reset by peer";
            // answered instead of a body when not 2xx
            long status = 200;
            std::chrono::milliseconds chunk_delay{ 0 };
        };

        static constexpr std::size_t chunk = 32 * 1024;

        void add(const std::string& url, Resource resource)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_resources[url] = std::move(resource);
        }

        tl::expected<void, TransferError> fetch(const FetchRequest& request,
                                                FetchSink& sink) override
        {
            Resource resource;
            bool fail = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_requests;
                m_offsets[request.url].push_back(request.offset);
                auto it = m_resources.find(request.url);
                if (it == m_resources.end())
                    return tl::make_unexpected(http_status_error(404, request.url));
                if (it->second.fail_times > 0)
                {
                    --it->second.fail_times;
                    fail = true;
                }
                resource = it->second;
            }

            if (request.token.cancelled())
                return tl::make_unexpected(cancelled_error(request.url));
            if (resource.status / 100 != 2)
                return tl::make_unexpected(http_status_error(resource.status, request.url));
            if (request.offset > 0 && resource.honor_range && request.offset >= resource.body.size())
                return tl::make_unexpected(http_status_error(416, request.url));

            ResponseInfo info;
            std::size_t start = 0;
            if (request.offset > 0 && resource.honor_range)
            {
                info.status = 206;
                start = request.offset;
            }
            else
            {
                info.status = 200;
                info.range_honored = (request.offset == 0);
            }
            info.content_length = resource.body.size() - start;
            if (!sink.on_response(info))
                return tl::make_unexpected(sink_aborted_error(request.url));

            const std::size_t end = std::min(resource.body.size(), resource.truncate_at);
            std::size_t delivered = 0;
            for (std::size_t pos = start; pos < end;)
            {
                if (request.token.cancelled())
                    return tl::make_unexpected(cancelled_error(request.url));
                if (fail && delivered >= resource.fail_after)
                {
                    return tl::make_unexpected(TransferError{
                        ErrorLevel::INFO, ErrorCode::XF_CURL, resource.failure });
                }

                std::size_t n = std::min(chunk, end - pos);
                if (fail)
                    n = std::min(n, resource.fail_after - delivered);
                if (!sink.on_data(resource.body.data() + pos, n))
                    return tl::make_unexpected(sink_aborted_error(request.url));
                pos += n;
                delivered += n;
                if (resource.chunk_delay.count() > 0)
                    std::this_thread::sleep_for(resource.chunk_delay);
            }
            if (fail)
            {
                return tl::make_unexpected(
                    TransferError{ ErrorLevel::INFO, ErrorCode::XF_CURL, resource.failure });
            }
            return {};
        }

        std::size_t requests() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_requests;
        }

        std::vector<std::size_t> offsets(const std::string& url) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_offsets.find(url);
            return it == m_offsets.end() ? std::vector<std::size_t>{} : it->second;
        }

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, Resource> m_resources;
        std::map<std::string, std::vector<std::size_t>> m_offsets;
        std::size_t m_requests = 0;
    };
}

#endif
