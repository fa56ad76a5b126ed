#include <pyres/http.hpp>
#include <pyres/cancel.hpp>
#include <pyres/log.hpp>

#include <algorithm>
#include <mutex>
#include <thread>

#include <curl/curl.h>

namespace pyres {

// ---------------------------------------------------------------------------
// CurlTransport
// ---------------------------------------------------------------------------

namespace {

std::once_flag g_curl_init;

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

int check_cancel(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const CancelToken*>(userdata);
    return cancel && cancel->is_cancelled() ? 1 : 0;
}

struct EasyHandle {
    CURL* curl = curl_easy_init();
    curl_slist* headers = nullptr;
    ~EasyHandle() {
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
};

} // anonymous namespace

CurlTransport::CurlTransport(Credentials creds, std::string user_agent)
    : creds_(std::move(creds)), user_agent_(std::move(user_agent)) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> CurlTransport::get(const HttpRequest& request) {
    EasyHandle h;
    if (!h.curl) {
        return PyresError{PyresError::Network, "curl_easy_init failed"};
    }

    HttpResponse resp;
    char error_buffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(h.curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h.curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h.curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(h.curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    curl_easy_setopt(h.curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(h.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h.curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(h.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h.curl, CURLOPT_XFERINFOFUNCTION, &check_cancel);
    curl_easy_setopt(h.curl, CURLOPT_XFERINFODATA, request.cancel);

    if (!creds_.netrc_file.empty()) {
        curl_easy_setopt(h.curl, CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        curl_easy_setopt(h.curl, CURLOPT_NETRC_FILE, creds_.netrc_file.c_str());
    }
    if (!creds_.username.empty()) {
        curl_easy_setopt(h.curl, CURLOPT_USERNAME, creds_.username.c_str());
        curl_easy_setopt(h.curl, CURLOPT_PASSWORD, creds_.password.c_str());
    }

    for (const auto& header : request.headers) {
        h.headers = curl_slist_append(h.headers, header.c_str());
    }
    if (!creds_.token.empty()) {
        std::string auth = "Authorization: Bearer " + creds_.token;
        h.headers = curl_slist_append(h.headers, auth.c_str());
    }
    if (h.headers) curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);

    CURLcode rc = curl_easy_perform(h.curl);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return PyresError{PyresError::Cancelled, "request cancelled: " + request.url};
    }
    // Local file indexes: a missing file reads as not found
    if (rc == CURLE_FILE_COULDNT_READ_FILE) {
        resp.status = 404;
        resp.effective_url = request.url;
        return Result<HttpResponse>::ok(std::move(resp));
    }
    if (rc != CURLE_OK) {
        std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(rc);
        return PyresError{PyresError::Network,
            "GET " + request.url + " failed: " + detail};
    }

    curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &resp.status);
    // file:// transfers report no status code
    if (resp.status == 0) resp.status = 200;

    char* content_type = nullptr;
    curl_easy_getinfo(h.curl, CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) resp.content_type = content_type;
    char* effective = nullptr;
    curl_easy_getinfo(h.curl, CURLINFO_EFFECTIVE_URL, &effective);
    resp.effective_url = effective ? effective : request.url;

    log::trace("GET %s -> %ld (%zu bytes)", request.url.c_str(), resp.status,
               resp.body.size());
    return Result<HttpResponse>::ok(std::move(resp));
}

// ---------------------------------------------------------------------------
// RetryPolicy
// ---------------------------------------------------------------------------

bool RetryPolicy::is_transient(const Result<HttpResponse>& outcome) {
    if (outcome.is_err()) return outcome.error().code == PyresError::Network;
    long status = outcome.value().status;
    return status >= 500 || status == 429;
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    auto delay = backoff;
    for (int i = 1; i < attempt && delay < max_backoff; ++i) delay *= 2;
    return std::min(delay, max_backoff);
}

Result<HttpResponse> RetryPolicy::run(const std::function<Result<HttpResponse>()>& call,
                                      const std::string& what,
                                      const CancelToken* cancel) const {
    int attempts = std::max(1, max_attempts);
    for (int attempt = 1;; ++attempt) {
        if (cancel && cancel->is_cancelled()) {
            return PyresError{PyresError::Cancelled, what + " cancelled"};
        }
        auto outcome = call();
        if (attempt >= attempts || !retryable || !retryable(outcome)) {
            return outcome;
        }

        auto delay = delay_for(attempt);
        log::warn("%s failed (%s), retrying in %lldms [%d/%d]", what.c_str(),
                  outcome.is_err() ? outcome.error().message.c_str()
                                   : ("HTTP " + std::to_string(outcome.value().status)).c_str(),
                  static_cast<long long>(delay.count()), attempt, attempts);
        if (sleep) {
            sleep(delay);
        } else {
            // Sleep in slices so a cancel is noticed promptly
            auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until) {
                if (cancel && cancel->is_cancelled()) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
    }
}

} // namespace pyres
