#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace kw::util {

void ensureCurlGlobalInit();

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    bool reached() const { return curl == CURLE_OK; }
};

template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();
    CurlEasy h;                    // RAII handle
    std::string bodyBuf;

    curl_easy_setopt(static_cast<CURL*>(h), CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) {
        auto* buf = static_cast<std::string*>(ud);
        buf->append(p, s * n);
        return s * n;
    });
    curl_easy_setopt(static_cast<CURL*>(h), CURLOPT_WRITEDATA, &bodyBuf);

    setup(static_cast<CURL*>(h));  // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    if (r.curl == CURLE_OK) curl_easy_getinfo(static_cast<CURL*>(h), CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    return r;
}

}
