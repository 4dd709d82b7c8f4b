#include "net/CurlHttpClient.hpp"

#include <curl/curl.h>

#include "monitor/Logger.hpp"

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

static curl_slist* buildHeaders(const HttpHeaders& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.first + ": " + h.second;
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Setup chung + perform; caller giữ ownership của headers/mime
static HttpResponse perform(CURL* curl, const std::string& url, curl_slist* headers,
                            long timeoutMs) {
    HttpResponse out;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        out.error = curl_easy_strerror(res);
        return out;
    }

    out.transportOk = true;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    if (!out.ok()) {
        out.error = "HTTP " + std::to_string(out.status);
    }
    return out;
}

CurlHttpClient::CurlHttpClient(long timeoutMs) : timeoutMs_(timeoutMs) {}

void CurlHttpClient::globalInit() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void CurlHttpClient::globalCleanup() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        HttpResponse r;
        r.error = "curl_easy_init failed";
        return r;
    }

    curl_slist* list = buildHeaders(headers);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    HttpResponse r = perform(curl, url, list, timeoutMs_);

    curl_slist_free_all(list);
    curl_easy_cleanup(curl);
    return r;
}

HttpResponse CurlHttpClient::post(const std::string& url, const HttpHeaders& headers,
                                  const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        HttpResponse r;
        r.error = "curl_easy_init failed";
        return r;
    }

    curl_slist* list = buildHeaders(headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());

    HttpResponse r = perform(curl, url, list, timeoutMs_);

    curl_slist_free_all(list);
    curl_easy_cleanup(curl);
    return r;
}

HttpResponse CurlHttpClient::postMultipart(const std::string& url, const HttpHeaders& headers,
                                           const std::vector<FormPart>& parts) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        HttpResponse r;
        r.error = "curl_easy_init failed";
        return r;
    }

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& p : parts) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, p.name.c_str());
        curl_mime_data(part, p.value.data(), p.value.size());
        if (!p.filename.empty()) curl_mime_filename(part, p.filename.c_str());
        if (!p.contentType.empty()) curl_mime_type(part, p.contentType.c_str());
    }

    curl_slist* list = buildHeaders(headers);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    HttpResponse r = perform(curl, url, list, timeoutMs_);
    if (!r.transportOk) {
        LOGD("HTTP", "multipart POST failed: " << r.error);
    }

    curl_slist_free_all(list);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);
    return r;
}
