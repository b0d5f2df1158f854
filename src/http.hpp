#pragma once
#include <string>
#include <vector>
#include <utility>

namespace purgecord {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure (no response received)
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    virtual HttpResponse patch(const std::string& url,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_seconds = 10) = 0;

    virtual HttpResponse del(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 10) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
    HttpResponse patch(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 10) override;
    HttpResponse del(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 10) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
    HttpResponse patch(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 10) override;
    HttpResponse del(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 10) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// HTTP GET
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);

// HTTP PATCH with JSON body
HttpResponse http_patch(const std::string& url,
                        const std::string& body,
                        const std::vector<Header>& headers,
                        long timeout_seconds = 10);

// HTTP DELETE
HttpResponse http_delete(const std::string& url,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 10);

} // namespace purgecord
