#pragma once
#include <cstddef>
#include <optional>
#include <string>

struct ImageSize {
    int width;
    int height;
};

// Chỉ đọc header ảnh (jpeg/png/gif/bmp/webp...), không decode pixel
std::optional<ImageSize> readImageSize(const std::string& bytes);

bool validateImageSize(const std::string& bytes, int maxSizeMb);

std::string base64Encode(const std::string& bytes);
