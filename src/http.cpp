// Transport for non-Linux builds on top of libcurl. CMakeLists.txt compiles
// either this file or http_socket.cpp, never both.
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace callgate {

namespace {

constexpr size_t kMaxBodyBytes = 16 * 1024 * 1024;
constexpr long kMaxRedirects = 3;

struct BodySink {
    std::string data;
    bool overflow = false;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<BodySink*>(userdata);
    size_t n = size * nmemb;
    if (sink->data.size() + n > kMaxBodyBytes) {
        sink->overflow = true;
        return 0; // makes curl fail with CURLE_WRITE_ERROR
    }
    sink->data.append(ptr, n);
    return n;
}

// Polled by curl about once per second; non-zero aborts the transfer.
int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    return flag->load(std::memory_order_relaxed) ? 1 : 0;
}

HttpFailure failure_for(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return HttpFailure::Timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return HttpFailure::Aborted;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_LOGIN_DENIED:
            return HttpFailure::InvalidUrl;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return HttpFailure::Connect;
        default:
            return HttpFailure::Io;
    }
}

// One easy handle per transfer; handles are cheap next to a TLS handshake.
class CurlTransfer {
public:
    CurlTransfer() : curl_(curl_easy_init()) {}
    ~CurlTransfer() {
        curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    HttpResponse run(const std::string& url, const std::string* body,
                     const std::vector<Header>& headers, long timeout_seconds,
                     const std::atomic<bool>* abort_flag) {
        if (!curl_) return HttpResponse::failed(HttpFailure::Io, "curl_easy_init failed");

        for (const auto& h : headers)
            headers_ = curl_slist_append(headers_, (h.first + ": " + h.second).c_str());
        // curl adds "Expect: 100-continue" to larger POSTs; APIs rarely want it.
        if (body) headers_ = curl_slist_append(headers_, "Expect:");

        error_[0] = '\0';
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_);
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, kMaxRedirects);
        curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &sink_);

        if (abort_flag) {
            curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, on_progress);
            curl_easy_setopt(curl_, CURLOPT_XFERINFODATA,
                             const_cast<std::atomic<bool>*>(abort_flag));
        }

        if (body) {
            curl_easy_setopt(curl_, CURLOPT_POST, 1L);
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body->data());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body->size()));
        } else {
            curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        }

        CURLcode code = curl_easy_perform(curl_);
        if (sink_.overflow)
            return HttpResponse::failed(HttpFailure::Io, "response body too large");
        if (code != CURLE_OK) {
            std::string message = error_[0] ? error_ : curl_easy_strerror(code);
            return HttpResponse::failed(failure_for(code), message);
        }

        HttpResponse resp;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status_code);
        resp.body = std::move(sink_.data);
        return resp;
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
    BodySink sink_;
    char error_[CURL_ERROR_SIZE];
};

} // anonymous namespace

void http_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void http_cleanup() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    CurlTransfer transfer;
    return transfer.run(url, nullptr, headers, timeout_seconds, abort_flag_);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    CurlTransfer transfer;
    return transfer.run(url, &body, headers, timeout_seconds, abort_flag_);
}

} // namespace callgate

#endif // !__linux__
