// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour (OpenSSL 1.1+ auto-inits, so http_init only has to
// ignore SIGPIPE). Every request runs against one deadline covering name
// resolution, connect, TLS handshake, send and the full response read.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/select.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <memory>
#include <mutex>
#include <string>
#include <stdexcept>
#include <thread>

namespace dgadmin {

void http_init() { std::signal(SIGPIPE, SIG_IGN); }
void http_cleanup() {}

using Clock = std::chrono::steady_clock;

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.rfind(':');
    size_t bracket = host_port.rfind(']');
    if (bracket != std::string::npos && (colon == std::string::npos || colon < bracket))
        colon = std::string::npos; // IPv6 literal without port
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.size() > 2 && result.host.front() == '[' && result.host.back() == ']')
        result.host = result.host.substr(1, result.host.size() - 2);
    if (result.host.empty())
        throw std::runtime_error("invalid URL (no host): " + url);
    return result;
}

static std::string host_header(const ParsedUrl& url) {
    std::string host = url.host.find(':') != std::string::npos
        ? "[" + url.host + "]" : url.host;
    bool default_port = (url.tls && url.port == "443") ||
                        (!url.tls && url.port == "80");
    return default_port ? host : host + ":" + url.port;
}

static std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

// ── Name resolution under the deadline ────────────────────────

struct Resolution {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    int status = 0;
    struct addrinfo* result = nullptr;

    ~Resolution() { if (result) freeaddrinfo(result); }
};

// getaddrinfo has no timeout of its own, so it runs on a detached thread and
// the caller stops waiting at the deadline. Returns nullptr on timeout; the
// thread finishes later and releases the shared state.
static std::shared_ptr<Resolution> resolve_host(const ParsedUrl& url,
                                                Clock::time_point deadline) {
    auto state = std::make_shared<Resolution>();
    std::thread([state, host = url.host, port = url.port]() {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int status = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);

        std::lock_guard<std::mutex> lock(state->mutex);
        state->status = status;
        state->result = res;
        state->done = true;
        state->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->cv.wait_until(lock, deadline, [&state] { return state->done; }))
        return nullptr;
    return state;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    Clock::time_point deadline;
    long        timeout_secs = 0;
    std::string error; // set on the first unrecoverable failure

    explicit Connection(long timeout)
        : deadline(Clock::now() + std::chrono::seconds(timeout))
        , timeout_secs(timeout) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool expired() const { return Clock::now() >= deadline; }

    bool fail_timeout() {
        error = "request timed out after " + std::to_string(timeout_secs) + " seconds";
        return false;
    }

    bool connect(const ParsedUrl& url) {
        auto resolved = resolve_host(url, deadline);
        if (!resolved) return fail_timeout();
        if (resolved->status != 0) {
            error = "could not resolve host " + url.host + ": " + gai_strerror(resolved->status);
            return false;
        }
        struct addrinfo* res = resolved->result;

        bool connected = false;
        int last_errno = 0;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            if (expired()) { last_errno = ETIMEDOUT; break; }
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so the deadline is honoured.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv = remaining();
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_errno = err;
                    }
                } else {
                    last_errno = (rc == 0) ? ETIMEDOUT : errno;
                }
            } else {
                last_errno = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        if (!connected) {
            if (last_errno == ETIMEDOUT) return fail_timeout();
            error = "failed to connect to " + url.host + ":" + url.port + ": " +
                    std::strerror(last_errno);
            return false;
        }

        // Use the remaining budget for the TLS handshake, then switch to
        // 1-second slices so the deadline is re-checked while reading.
        if (url.tls) {
            set_socket_timeout(remaining());

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS setup failed: " + ssl_error_string(); return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS setup failed: " + ssl_error_string(); return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI
            SSL_set1_host(ssl, url.host.c_str());

            if (SSL_connect(ssl) != 1) {
                if (expired()) return fail_timeout();
                error = "TLS handshake with " + url.host + " failed: " + ssl_error_string();
                return false;
            }
        }

        struct timeval slice{1, 0};
        set_socket_timeout(slice);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on unrecoverable error
    // (error is set). EAGAIN (1-second slice expiry) loops until the deadline.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (expired()) { fail_timeout(); return -1; }

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0; // peer closed
                error = "TLS read failed: " + ssl_error_string();
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                error = std::string("read failed: ") + std::strerror(errno);
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (expired()) return fail_timeout();
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    error = "TLS write failed: " + ssl_error_string();
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    error = std::string("write failed: ") + std::strerror(errno);
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    struct timeval remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::microseconds>(
            deadline - Clock::now()).count();
        if (left < 0) left = 0;
        struct timeval tv{};
        tv.tv_sec  = static_cast<time_t>(left / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(left % 1000000);
        return tv;
    }

    void set_socket_timeout(struct timeval tv) {
        if (tv.tv_sec == 0 && tv.tv_usec == 0) tv.tv_usec = 1000;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + host_header(url) + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (method == "POST" && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false if the connection ended before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

// Parse status line + headers; populates is_chunked / content_length.
// Returns 0 when no valid status line could be read.
static long parse_response_headers(Connection& conn, std::string& leftover,
                                    bool& is_chunked, long& content_length) {
    is_chunked     = false;
    content_length = -1;

    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return 0;

    // "HTTP/1.1 200 OK": extract the three-digit code
    if (status_line.rfind("HTTP/", 0) != 0) return 0;
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return 0;
    long status = 0;
    try { status = std::stol(status_line.substr(sp1 + 1, 3)); }
    catch (const std::exception&) { return 0; }
    if (status < 100 || status > 999) return 0;

    while (true) {
        std::string line;
        if (!read_line(conn, leftover, line)) return 0;
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding")
            is_chunked = (value.find("chunked") != std::string::npos);
        else if (name == "content-length")
            try { content_length = std::stol(value); } catch (const std::exception&) {}
    }
    return status;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

static bool read_until_eof(Connection& conn, std::string& leftover,
                            std::string& out) {
    out += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        out.append(buf, static_cast<size_t>(n));
    }
}

// Chunk size line: hex digits, optional whitespace, optional ";ext".
static bool parse_chunk_size(const std::string& line, size_t& size) {
    size_t i = 0;
    size = 0;
    for (; i < line.size() && std::isxdigit(static_cast<unsigned char>(line[i])); i++) {
        if (i >= 15) return false; // would overflow size_t on 64-bit
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(line[i])));
        size = size * 16 + static_cast<size_t>(c <= '9' ? c - '0' : c - 'a' + 10);
    }
    if (i == 0) return false;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) i++;
    return i == line.size() || line[i] == ';';
}

// Accumulate full body (handles chunked + content-length + read-to-close).
static bool read_body(Connection& conn, std::string& leftover,
                       bool is_chunked, long content_length, std::string& body) {
    if (is_chunked) {
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line)) return false;
            size_t chunk_size = 0;
            if (!parse_chunk_size(size_line, chunk_size)) {
                conn.error = "malformed chunk size in HTTP response: '" + size_line + "'";
                return false;
            }
            if (chunk_size == 0) return true;
            if (!read_exactly(conn, leftover, chunk_size, body)) return false;
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return false;
            if (crlf != "\r\n") {
                conn.error = "malformed chunk terminator in HTTP response";
                return false;
            }
        }
    }
    if (content_length >= 0)
        return read_exactly(conn, leftover, static_cast<size_t>(content_length), body);
    return read_until_eof(conn, leftover, body);
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse fail(std::string error) {
    HttpResponse resp;
    resp.error = std::move(error);
    return resp;
}

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                long timeout_secs) {
    ParsedUrl url;
    try { url = parse_url(url_str); }
    catch (const std::exception& e) { return fail(e.what()); }

    Connection conn(timeout_secs);
    if (!conn.connect(url)) return fail(conn.error);

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return fail(conn.error);

    std::string leftover;
    bool is_chunked     = false;
    long content_length = -1;
    long status = parse_response_headers(conn, leftover, is_chunked, content_length);
    if (status == 0) {
        if (!conn.error.empty()) return fail(conn.error);
        return fail("malformed or empty HTTP response from " + host_header(url));
    }

    HttpResponse resp;
    resp.status_code = status;
    if (!read_body(conn, leftover, is_chunked, content_length, resp.body)) {
        if (!conn.error.empty()) return fail(conn.error);
        return fail("connection closed before the full response body was received");
    }
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

} // namespace dgadmin

#endif // __linux__
