#pragma once
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    bool transportOk = false;   // false = lỗi kết nối / timeout, status không có nghĩa
    long status = 0;
    std::string body;
    std::string error;

    bool ok() const { return transportOk && status >= 200 && status < 300; }
};

// 1 part của multipart/form-data; filename rỗng = field text
struct FormPart {
    std::string name;
    std::string value;
    std::string filename;
    std::string contentType;
};

// Implementation phải an toàn khi gọi đồng thời từ nhiều thread
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;

    virtual HttpResponse post(const std::string& url, const HttpHeaders& headers,
                              const std::string& body) = 0;

    virtual HttpResponse postMultipart(const std::string& url, const HttpHeaders& headers,
                                       const std::vector<FormPart>& parts) = 0;
};
