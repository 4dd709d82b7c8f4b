#include "image/ImageInfo.hpp"

#include <climits>
#include <vector>

#include <openssl/evp.h>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

#include "monitor/Logger.hpp"

std::optional<ImageSize> readImageSize(const std::string& bytes) {
    if (bytes.empty() || bytes.size() > static_cast<std::size_t>(INT_MAX)) return std::nullopt;

    int w = 0, h = 0, comp = 0;
    int ok = stbi_info_from_memory(reinterpret_cast<const stbi_uc*>(bytes.data()),
                                   static_cast<int>(bytes.size()), &w, &h, &comp);
    if (!ok || w <= 0 || h <= 0) {
        LOGD("IMAGE", "stbi_info failed: " << stbi_failure_reason());
        return std::nullopt;
    }
    return ImageSize{w, h};
}

bool validateImageSize(const std::string& bytes, int maxSizeMb) {
    double sizeMb = static_cast<double>(bytes.size()) / (1024.0 * 1024.0);
    if (sizeMb > maxSizeMb) {
        LOGW("IMAGE", "Image size " << sizeMb << "MB exceeds limit " << maxSizeMb << "MB");
        return false;
    }
    return true;
}

std::string base64Encode(const std::string& bytes) {
    if (bytes.empty()) return "";

    // EVP_EncodeBlock: 4 byte output cho mỗi 3 byte input, + NUL
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}
