#pragma once
#include "net/HttpClient.hpp"

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeoutMs);

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;

    HttpResponse post(const std::string& url, const HttpHeaders& headers,
                      const std::string& body) override;

    HttpResponse postMultipart(const std::string& url, const HttpHeaders& headers,
                               const std::vector<FormPart>& parts) override;

    long timeoutMs() const { return timeoutMs_; }

    // Gọi 1 lần lúc khởi động, trước khi có thread nào
    static void globalInit();
    static void globalCleanup();

private:
    long timeoutMs_;
};
