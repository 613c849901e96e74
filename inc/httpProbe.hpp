#pragma once

#include <cstddef>
#include <string>

#include "dataStructs.hpp"

// performs one http GET and classifies it
class Probe {
   public:
    virtual ~Probe() = default;
    virtual ProbeResult probe(const std::string& url) = 0;
};

// libcurl backed probe, curl_global_init() must have been called before use.
// Every probe() uses its own easy handle, so one instance serves all workers.
class CurlProbe : public Probe {
   public:
    static constexpr long timeout_ms = 5000;
    static constexpr long max_redirects = 30;

    CurlProbe() = default;
    ProbeResult probe(const std::string& url) override;
    // 400-599 are http errors, any other status a received response counts as success
    static Outcome classify_status(long status_code);

   private:
    // rejects urls that name no scheme or a scheme other than http(s)
    static bool has_http_scheme(const std::string& url, std::string& reason);
    static size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, std::size_t* received);
};
