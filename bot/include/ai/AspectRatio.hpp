#pragma once
#include <array>
#include <string>

struct SupportedRatio {
    const char* label;
    int width;
    int height;
};

class AspectRatioClassifier {
public:
    static constexpr const char* DEFAULT_LABEL = "1:1";

    // Thứ tự bảng quyết định tie-break: entry xuất hiện trước thắng
    static const std::array<SupportedRatio, 11>& table();

    static int gcd(int a, int b);

    // Nhãn tỉ lệ gần nhất cho width x height
    static std::string classify(int width, int height);

    // Đọc kích thước ảnh rồi classify; ảnh không đọc được -> fallback
    static std::string classifyImage(const std::string& imageBytes,
                                     const std::string& fallback = DEFAULT_LABEL);

    static bool isSupported(const std::string& label);
};
