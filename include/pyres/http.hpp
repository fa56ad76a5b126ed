#pragma once

#include <pyres/result.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace pyres {

class CancelToken;

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_type;
    std::string effective_url;   // after redirects

    bool ok() const { return status >= 200 && status < 300; }
};

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;    // "Name: value"
    int timeout_seconds = 30;
    const CancelToken* cancel = nullptr;
};

// Transport seam: the index client and downloads only see this interface.
// A returned error means no HTTP response at all (Network or Cancelled);
// HTTP error statuses come back as responses.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> get(const HttpRequest& request) = 0;
};

struct Credentials {
    std::string netrc_file;     // empty disables netrc lookup
    std::string username;
    std::string password;
    std::string token;          // bearer token, wins over basic auth
};

// libcurl-backed transport. One easy handle per request, so concurrent
// calls from prefetch workers are safe.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(Credentials creds = {},
                           std::string user_agent = "pyres/0.1");

    Result<HttpResponse> get(const HttpRequest& request) override;

private:
    Credentials creds_;
    std::string user_agent_;
};

// Retry with exponential backoff: delay = backoff * 2^(attempt-1), capped.
struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds backoff{500};
    std::chrono::milliseconds max_backoff{8000};

    // Which outcomes are worth another attempt
    std::function<bool(const Result<HttpResponse>&)> retryable = is_transient;
    // Replaced by tests to avoid real sleeping
    std::function<void(std::chrono::milliseconds)> sleep;

    // Network errors, 5xx and 429
    static bool is_transient(const Result<HttpResponse>& outcome);

    std::chrono::milliseconds delay_for(int attempt) const;

    // Runs the call until it succeeds, is not retryable or attempts run out;
    // returns the last outcome. Stops early with Cancelled when the token fires.
    Result<HttpResponse> run(const std::function<Result<HttpResponse>()>& call,
                             const std::string& what,
                             const CancelToken* cancel = nullptr) const;
};

} // namespace pyres
