#include "http_client.hpp"
#include "debug_log.hpp"
#include "errors.hpp"
#include <thread>
#include <chrono>

namespace {

constexpr size_t MAX_POOL_SIZE = 4;

// Owns the header list for the duration of one request
struct HeaderList {
    curl_slist* list = nullptr;

    explicit HeaderList(const std::vector<std::string>& headers) {
        for (const auto& header : headers) {
            curl_slist* next = curl_slist_append(list, header.c_str());
            if (!next) {
                curl_slist_free_all(list);
                throw PriceConnectionError("Failed to build request headers");
            }
            list = next;
        }
    }

    ~HeaderList() {
        curl_slist_free_all(list);
    }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
};

}  // namespace

size_t HTTPClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

HTTPClient::HTTPClient() : curl_(curl_easy_init()) {
    if (!curl_) {
        throw PriceConnectionError("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_buffer_);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT,
                     "Mozilla/5.0 (X11; Linux x86_64) gridprice/1.0");
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);     // Thread-safe
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
}

HTTPClient::~HTTPClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

HttpResponse HTTPClient::post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers,
                              uint32_t timeout_ms,
                              int max_retries) {
    HeaderList header_list(headers);

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list.list);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));

    const int attempts = max_retries < 1 ? 1 : max_retries;
    int retry_count = 0;

    while (true) {
        response_buffer_.clear();
        CURLcode res = curl_easy_perform(curl_);

        if (res == CURLE_OK) {
            HttpResponse response;
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
            response.body = response_buffer_;
            // The header list dies with this call
            curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
            return response;
        }

        if (res != CURLE_OPERATION_TIMEDOUT) {
            curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
            throw PriceConnectionError(std::string("Error communicating with API: ") +
                                       curl_easy_strerror(res));
        }

        retry_count++;
        if (retry_count >= attempts) {
            break;
        }

        int backoff_ms = 1000 * (1 << (retry_count - 1));  // 1s, 2s, 4s
        WARN_LOG("Retry " << retry_count << "/" << attempts
                 << ": waiting " << backoff_ms << "ms");
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
    }

    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    throw PriceConnectionError("Timeout while communicating with API");
}


HTTPClientPool& HTTPClientPool::instance() {
    static HTTPClientPool pool;
    return pool;
}

std::unique_ptr<HTTPClient> HTTPClientPool::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_.empty()) {
        auto client = std::move(pool_.back());
        pool_.pop_back();
        return client;
    }
    return std::make_unique<HTTPClient>();
}

void HTTPClientPool::release(std::unique_ptr<HTTPClient> client) {
    if (!client) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_.size() < MAX_POOL_SIZE) {
        pool_.push_back(std::move(client));
    }
}

size_t HTTPClientPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.size();
}
