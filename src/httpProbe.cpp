#include "../inc/httpProbe.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

namespace {
struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct CurlUrlDeleter {
    void operator()(CURLU* url) const { curl_url_cleanup(url); }
};
struct CurlStringDeleter {
    void operator()(char* str) const { curl_free(str); }
};

ProbeResult other_error(const std::string& detail) {
    ProbeResult result;
    result.outcome = Outcome::OtherError;
    result.detail = detail;
    return result;
}
}  // namespace

bool CurlProbe::has_http_scheme(const std::string& url, std::string& reason) {
    std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
    if (!handle) {
        reason = "curl url init failed";
        return false;
    }
    // no CURLU_GUESS_SCHEME: "example.com" or "" must not turn into http://...
    CURLUcode uc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (uc != CURLUE_OK) {
        reason = "invalid url (CURLUcode " + std::to_string(static_cast<int>(uc)) + ")";
        return false;
    }
    char* raw_scheme = nullptr;
    uc = curl_url_get(handle.get(), CURLUPART_SCHEME, &raw_scheme, 0);
    std::unique_ptr<char, CurlStringDeleter> scheme(raw_scheme);
    if (uc != CURLUE_OK || !scheme) {
        reason = "invalid url: no scheme";
        return false;
    }
    std::string scheme_str(scheme.get());
    if (scheme_str != "http" && scheme_str != "https") {
        reason = "unsupported scheme: " + scheme_str;
        return false;
    }
    return true;
}

ProbeResult CurlProbe::probe(const std::string& url) {
    std::string reason;
    if (!has_http_scheme(url, reason)) {
        return other_error(reason);
    }

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return other_error("curl init failed");
    }
    std::size_t received{0};
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, max_redirects);
    // 5s to connect and 5s without any byte, a slow but steady body is still a success
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, timeout_ms / 1000);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "sitestatus/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &received);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return other_error(error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(res));
    }

    ProbeResult result;
    if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status_code) != CURLE_OK) {
        return other_error("no response code");
    }
    result.outcome = classify_status(result.status_code);
    if (result.outcome == Outcome::HttpError) {
        result.detail = "HTTP " + std::to_string(result.status_code);
    } else {
        result.detail = "HTTP " + std::to_string(result.status_code) + ", " + std::to_string(received) + " bytes";
    }
    return result;
}

Outcome CurlProbe::classify_status(long status_code) {
    if (status_code >= 400 && status_code < 600) {
        return Outcome::HttpError;
    }
    return Outcome::Success;
}

size_t CurlProbe::curlWriteCallback(void* contents, size_t size, size_t nmemb, std::size_t* received) {
    (void)contents;
    *received += size * nmemb;
    return size * nmemb;
}
