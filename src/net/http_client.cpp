#include "net/http_client.hpp"

#include <curl/curl.h>

static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Constructor
CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

// Destructor
CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

static HttpResponse perform(CURL* curl, const std::string& url, long timeoutMs, curl_slist* headers) {
    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw HttpError(url + ": " + curl_easy_strerror(res));
    }
    return response;
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::string& contentType,
                              long timeoutMs,
                              const std::vector<std::string>& extraHeaders) {
    CURL* curl = curl_easy_init();
    if (!curl) throw HttpError("curl_easy_init failed");

    curl_slist* headers = nullptr;
    const std::string ct = "Content-Type: " + contentType;
    headers = curl_slist_append(headers, ct.c_str());
    // Suppress the "Expect: 100-continue" round trip.
    headers = curl_slist_append(headers, "Expect:");
    for (const auto& h : extraHeaders) headers = curl_slist_append(headers, h.c_str());

    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());

    return perform(curl, url, timeoutMs, headers);
}

HttpResponse HttpClient::get(const std::string& url, long timeoutMs) {
    CURL* curl = curl_easy_init();
    if (!curl) throw HttpError("curl_easy_init failed");

    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    return perform(curl, url, timeoutMs, nullptr);
}
