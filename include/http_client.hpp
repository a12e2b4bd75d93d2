#pragma once

#include <string>
#include <memory>
#include <vector>
#include <mutex>
#include <cstdint>
#include <curl/curl.h>

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HTTPClient {
public:
    HTTPClient();
    ~HTTPClient();

    HTTPClient(const HTTPClient&) = delete;
    HTTPClient& operator=(const HTTPClient&) = delete;

    // Timeouts are retried with exponential backoff; every other transport
    // failure, and exhausted retries, throw PriceConnectionError
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers,
                      uint32_t timeout_ms = 30000,
                      int max_retries = 3);

private:
    CURL* curl_;
    std::string response_buffer_;

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
};

class HTTPClientPool {
public:
    static HTTPClientPool& instance();
    std::unique_ptr<HTTPClient> acquire();
    void release(std::unique_ptr<HTTPClient> client);

    [[nodiscard]] size_t idleCount() const;

private:
    HTTPClientPool() = default;
    std::vector<std::unique_ptr<HTTPClient>> pool_;
    mutable std::mutex mutex_;
};
