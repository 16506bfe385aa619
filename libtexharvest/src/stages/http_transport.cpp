#include "../../include/http_transport.hpp"
#include "../../include/logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace texharvest {

namespace {

constexpr const char* kTag = "CurlTransport";

struct CurlEasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;

struct TransferState {
    Bytes* body;
    size_t limit;
    bool too_large = false;
    std::stop_token st;
};

size_t write_cb(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    const size_t n = size * nmemb;
    if (state->body->size() + n > state->limit) {
        state->too_large = true;
        return 0; // makes curl fail with CURLE_WRITE_ERROR
    }
    state->body->insert(state->body->end(),
                        reinterpret_cast<unsigned char*>(ptr),
                        reinterpret_cast<unsigned char*>(ptr) + n);
    return n;
}

int progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* state = static_cast<TransferState*>(userdata);
    return state->st.stop_requested() ? 1 : 0;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            Logger::log(LogLevel::Error, "curl_global_init failed", kTag);
        }
    });
}

} // namespace

CurlTransport::CurlTransport(std::string user_agent, const size_t max_body_bytes)
    : user_agent_(std::move(user_agent)), max_body_bytes_(max_body_bytes) {
    ensure_curl_global_init();
}

Outcome<HttpResponse> CurlTransport::get(const std::string& url,
                                         const std::chrono::milliseconds timeout,
                                         std::stop_token st) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return PipelineError::download("curl_easy_init failed");
    }

    HttpResponse response;
    TransferState state{&response.body, max_body_bytes_, false, std::move(st)};
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        if (state.too_large) {
            return PipelineError::download("response body exceeds " + std::to_string(max_body_bytes_) + " bytes");
        }
        if (res == CURLE_ABORTED_BY_CALLBACK) {
            return PipelineError::cancelled("download cancelled");
        }
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return PipelineError::download("timed out after " + std::to_string(timeout.count()) + "ms");
        }
        const std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return PipelineError::download(detail);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    Logger::log(LogLevel::Debug,
                "GET " + url + " -> " + std::to_string(response.status) +
                " (" + std::to_string(response.body.size()) + " bytes)", kTag);
    return response;
}

} // namespace texharvest
