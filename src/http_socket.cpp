// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Same public API as http.cpp (libcurl). http_init/cleanup are no-ops since
// OpenSSL 1.1+ initialises itself. One connection per request
// ("Connection: close"); a request is never interrupted once started, it
// completes or hits the socket timeout.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>

namespace purgecord {

void http_init() {}
void http_cleanup() {}

namespace {

// ── URL parsing ────────────────────────────────────────────────

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // path + query, always starts with '/'
};

bool parse_endpoint(const std::string& url, Endpoint& out) {
    size_t sep = url.find("://");
    if (sep == std::string::npos) return false;

    std::string scheme = url.substr(0, sep);
    if (scheme == "https") out.tls = true;
    else if (scheme != "http") return false;

    size_t authority_start = sep + 3;
    size_t slash = url.find('/', authority_start);
    std::string authority = url.substr(authority_start,
        slash == std::string::npos ? std::string::npos : slash - authority_start);
    out.target = slash == std::string::npos ? "/" : url.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = out.tls ? "443" : "80";
    }
    return !out.host.empty();
}

// ── Socket + optional TLS session ──────────────────────────────

class Socket {
public:
    Socket() = default;
    ~Socket() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    bool open(const Endpoint& ep, long timeout_secs) {
        if (!open_tcp(ep, timeout_secs)) return false;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        return !ep.tls || start_tls(ep.host);
    }

    // >0 bytes read, 0 on EOF, -1 on error or timeout
    ssize_t recv_some(char* buf, size_t len) {
        for (;;) {
            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n >= 0) return n;
                int err = SSL_get_error(ssl_, n);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) return -1;
            } else {
                ssize_t n = ::recv(fd_, buf, len, 0);
                if (n >= 0) return n;
                if (errno != EINTR) return -1;
            }
        }
    }

    bool send_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, p, static_cast<int>(left));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                    return false;
                }
            } else {
                n = ::send(fd_, p, left, 0);
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN) continue;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    // Non-blocking connect bounded by the timeout, then back to blocking
    bool open_tcp(const Endpoint& ep, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res) != 0) return false;

        for (auto* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            bool ok = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
            if (!ok && errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                if (select(fd + 1, nullptr, &wset, nullptr, &tv) > 0) {
                    int so_error = 0;
                    socklen_t len = sizeof(so_error);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                    ok = so_error == 0;
                }
            }

            if (ok) {
                fcntl(fd, F_SETFL, flags);
                fd_ = fd;
            } else {
                ::close(fd);
            }
        }
        freeaddrinfo(res);
        return fd_ >= 0;
    }

    bool start_tls(const std::string& host) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, host.c_str()); // SNI
        return SSL_connect(ssl_) == 1;
    }

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

// ── Response reading ───────────────────────────────────────────

// Buffered reader over a Socket for the status line, headers and body
class ResponseReader {
public:
    explicit ResponseReader(Socket& sock) : sock_(sock) {}

    // Status code, or 0 if no parseable status line arrived
    long read_head() {
        std::string status_line;
        if (!line(status_line) || status_line.compare(0, 5, "HTTP/") != 0) return 0;

        size_t sp = status_line.find(' ');
        if (sp == std::string::npos || sp + 4 > status_line.size()) return 0;
        long status = std::strtol(status_line.substr(sp + 1, 3).c_str(), nullptr, 10);
        if (status < 100) return 0;

        std::string header;
        while (line(header) && !header.empty()) {
            size_t colon = header.find(':');
            if (colon == std::string::npos) continue;
            std::string name = lower(header.substr(0, colon));
            std::string value = lower(header.substr(colon + 1));
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding") {
                chunked_ = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                content_length_ = std::strtoul(value.c_str(), nullptr, 10);
                has_length_ = true;
            }
        }
        return status;
    }

    // False if the connection ended before the framed body was complete
    bool read_body(long status, std::string& body) {
        if (status == 204 || status == 304) return true;

        if (chunked_) {
            std::string size_line;
            while (line(size_line)) {
                if (size_line.empty()) continue;
                // hex size, optional ";ext"
                size_t size = std::strtoul(size_line.c_str(), nullptr, 16);
                if (size == 0) return true;
                std::string crlf;
                if (!take(size, body) || !take(2, crlf)) return false;
            }
            return false;
        }
        if (has_length_) return take(content_length_, body);

        body.swap(buffer_);
        char chunk[4096];
        ssize_t n;
        while ((n = sock_.recv_some(chunk, sizeof(chunk))) > 0)
            body.append(chunk, static_cast<size_t>(n));
        return n == 0;
    }

private:
    bool fill() {
        char chunk[4096];
        ssize_t n = sock_.recv_some(chunk, sizeof(chunk));
        if (n <= 0) return false;
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }

    // One CRLF-terminated line without the terminator
    bool line(std::string& out) {
        size_t nl;
        while ((nl = buffer_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        out.assign(buffer_, 0, nl);
        buffer_.erase(0, nl + 1);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return true;
    }

    // Append exactly n bytes to out
    bool take(size_t n, std::string& out) {
        while (buffer_.size() < n) {
            if (!fill()) {
                out += buffer_;
                buffer_.clear();
                return false;
            }
        }
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
        return true;
    }

    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    Socket& sock_;
    std::string buffer_;
    bool chunked_ = false;
    bool has_length_ = false;
    size_t content_length_ = 0;
};

// ── Request ────────────────────────────────────────────────────

std::string format_request(const std::string& method, const Endpoint& ep,
                           const std::string& body, const std::vector<Header>& headers) {
    std::string req = method + " " + ep.target + " HTTP/1.1\r\n";
    req += "Host: " + ep.host + "\r\n";
    for (const auto& h : headers) req += h.first + ": " + h.second + "\r\n";
    // DELETE and PATCH always state a length so proxies do not wait for a body
    if (method != "GET") req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

HttpResponse perform(const std::string& method, const std::string& url,
                     const std::string& body, const std::vector<Header>& headers,
                     long timeout_secs) {
    HttpResponse resp; // status 0 until a response head is parsed

    Endpoint ep;
    if (!parse_endpoint(url, ep)) return resp;

    Socket sock;
    if (!sock.open(ep, timeout_secs)) return resp;
    if (!sock.send_all(format_request(method, ep, body, headers))) return resp;

    ResponseReader reader(sock);
    long status = reader.read_head();
    if (status == 0) return resp;

    std::string resp_body;
    if (!reader.read_body(status, resp_body)) return resp; // truncated: transport failure

    resp.status_code = status;
    resp.body = std::move(resp_body);
    return resp;
}

} // namespace

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::patch(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_patch(url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::del(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_delete(url, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return perform("GET", url, "", headers, timeout_seconds);
}

HttpResponse http_patch(const std::string& url,
                        const std::string& body,
                        const std::vector<Header>& headers,
                        long timeout_seconds) {
    return perform("PATCH", url, body, headers, timeout_seconds);
}

HttpResponse http_delete(const std::string& url,
                         const std::vector<Header>& headers,
                         long timeout_seconds) {
    return perform("DELETE", url, "", headers, timeout_seconds);
}

} // namespace purgecord

#endif // __linux__
