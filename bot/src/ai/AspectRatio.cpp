#include "ai/AspectRatio.hpp"

#include <cmath>
#include <limits>

#include "image/ImageInfo.hpp"
#include "monitor/Logger.hpp"

static const std::array<SupportedRatio, 11> SUPPORTED_RATIOS = {{
    {"1:1", 1, 1},   {"4:3", 4, 3},   {"3:4", 3, 4},
    {"16:9", 16, 9}, {"9:16", 9, 16}, {"21:9", 21, 9},
    {"9:21", 9, 21}, {"3:2", 3, 2},   {"2:3", 2, 3},
    {"7:3", 7, 3},   {"3:7", 3, 7},
}};

const std::array<SupportedRatio, 11>& AspectRatioClassifier::table() {
    return SUPPORTED_RATIOS;
}

int AspectRatioClassifier::gcd(int a, int b) {
    while (b != 0) {
        int t = a % b;
        a = b;
        b = t;
    }
    return a;
}

std::string AspectRatioClassifier::classify(int width, int height) {
    int g = gcd(width, height);
    if (g <= 0 || height <= 0) return DEFAULT_LABEL;

    int rw = width / g;
    int rh = height / g;
    double current = static_cast<double>(rw) / rh;

    std::string closest = DEFAULT_LABEL;
    double minDiff = std::numeric_limits<double>::infinity();

    for (const auto& r : SUPPORTED_RATIOS) {
        double target = static_cast<double>(r.width) / r.height;
        double diff = std::fabs(current - target);
        if (diff < minDiff) {
            minDiff = diff;
            closest = r.label;
        }
    }

    LOGD("RATIO", width << "x" << height << " -> " << rw << ":" << rh << " -> " << closest);
    return closest;
}

std::string AspectRatioClassifier::classifyImage(const std::string& imageBytes,
                                                 const std::string& fallback) {
    auto size = readImageSize(imageBytes);
    if (!size) {
        LOGE("RATIO", "Error calculating aspect ratio: cannot read image dimensions"
                          << " (" << imageBytes.size() << " bytes), using " << fallback);
        return fallback;
    }

    std::string label = classify(size->width, size->height);
    LOGX("RATIO", "Image processed: " << size->width << "x" << size->height << " -> " << label);
    return label;
}

bool AspectRatioClassifier::isSupported(const std::string& label) {
    for (const auto& r : SUPPORTED_RATIOS) {
        if (label == r.label) return true;
    }
    return false;
}
