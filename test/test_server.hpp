#ifndef DUMPLOADER_TEST_SERVER_HPP
#define DUMPLOADER_TEST_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dumploader::testing
{
    // What the server answers for one path.
    struct Resource
    {
        std::string body;
        // Answer `Range: bytes=N-` requests with 206 (or 416 past the end), otherwise 200.
        bool honour_ranges = true;
        // Without Content-Length the end of the body is marked by closing the connection.
        bool send_content_length = true;
        // Status codes for the next requests, consumed one per request. A non 2xx status is
        // sent with a short error body.
        std::deque<int> scripted_statuses;
        // The body is sent in chunks of `chunk_size` bytes, waiting `chunk_delay` between them.
        std::size_t chunk_size = 64 * 1024;
        std::chrono::milliseconds chunk_delay{ 0 };
        // Called after every chunk with the number of body bytes sent so far.
        std::function<void(std::size_t)> on_sent;
    };

    struct RequestRecord
    {
        std::string path;
        // Value of the Range header, empty if none.
        std::string range;
        int status = 0;
    };

    // HTTP/1.1 server on 127.0.0.1 (random port), one connection per request, one thread per
    // connection. Only GET is supported.
    class TestServer
    {
    public:
        TestServer();
        ~TestServer();

        TestServer(const TestServer&) = delete;
        TestServer& operator=(const TestServer&) = delete;

        // http://127.0.0.1:<port>
        std::string url() const;

        void set(const std::string& path, Resource resource);
        void set(const std::string& path, const std::string& body);
        void remove(const std::string& path);

        std::vector<RequestRecord> requests() const;
        std::vector<RequestRecord> requests(const std::string& path) const;

    private:
        void accept_loop();
        void handle(int client);

        int m_listen_fd = -1;
        int m_port = 0;
        std::atomic<bool> m_stop{ false };
        std::thread m_accept_thread;

        mutable std::mutex m_mutex;
        std::map<std::string, Resource> m_resources;
        std::vector<RequestRecord> m_requests;
        std::vector<std::thread> m_connections;
    };
}

#endif
