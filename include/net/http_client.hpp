#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <stdexcept>
#include <string>
#include <vector>

// Raised when a request could not complete (connect failure, timeout, ...).
// A response with a non-2xx status is not an error at this level.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what) : std::runtime_error(what) {}
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Owns curl_global_init/cleanup. Create one before any worker thread issues requests.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Blocking single-shot requests, one easy handle per call. Safe to use from many threads.
class HttpClient {
public:
    static HttpResponse post(const std::string& url,
                             const std::string& body,
                             const std::string& contentType,
                             long timeoutMs,
                             const std::vector<std::string>& extraHeaders = {});

    static HttpResponse get(const std::string& url, long timeoutMs);
};

#endif
