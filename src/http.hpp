#pragma once
#include <atomic>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

// Process-wide libcurl setup; call once from main before any thread starts.
void http_init();
void http_cleanup();

// Set by the SIGINT/SIGTERM handler. Transfers in flight poll it about once
// a second and give up when it turns true.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// status_code 0: no HTTP exchange happened (DNS, connect, timeout, abort).
// Callers treat that the same as a malformed reply.
struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// The only transport the reasoning and embedding clients see. Tests swap in
// a scripted implementation.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 60) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent = "vigil/0.1")
        : user_agent_(std::move(user_agent)) {}

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 60) override;

private:
    std::string user_agent_;
};

} // namespace vigil
