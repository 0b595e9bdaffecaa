#include "region_cropper.hpp"
#include "errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace blossom {

namespace {

// Tolerance for regions computed as 1 - x in floating point.
constexpr double kEdgeEpsilon = 1e-9;

bool in_unit_interval(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

std::string describe(const CropRegion& r) {
    std::ostringstream out;
    out << "{x:" << r.x << ", y:" << r.y << ", width:" << r.width << ", height:" << r.height << "}";
    return out.str();
}

} // namespace

void CropRegion::validate() const {
    if (!in_unit_interval(x) || !in_unit_interval(y) ||
        !in_unit_interval(width) || !in_unit_interval(height)) {
        throw std::invalid_argument("Crop region values must lie in [0, 1]: " + describe(*this));
    }
    if (width <= 0.0 || height <= 0.0) {
        throw std::invalid_argument("Crop region must have positive width and height: " + describe(*this));
    }
    if (x + width > 1.0 + kEdgeEpsilon || y + height > 1.0 + kEdgeEpsilon) {
        throw std::invalid_argument("Crop region extends past the image: " + describe(*this));
    }
}

cv::Rect CropRegion::to_pixels(const cv::Size& image_size) const {
    validate();

    int left = static_cast<int>(std::lround(x * image_size.width));
    int top = static_cast<int>(std::lround(y * image_size.height));
    int w = static_cast<int>(std::lround(width * image_size.width));
    int h = static_cast<int>(std::lround(height * image_size.height));

    // Rounding may push the far edge one pixel past the image.
    cv::Rect rect = cv::Rect(left, top, w, h) & cv::Rect(0, 0, image_size.width, image_size.height);
    if (rect.width <= 0 || rect.height <= 0) {
        throw std::invalid_argument("Crop region " + describe(*this) + " is empty on a " +
                                    std::to_string(image_size.width) + "x" +
                                    std::to_string(image_size.height) + " image");
    }
    return rect;
}

ImageBuffer RegionCropper::crop(const ImageBuffer& buffer, const CropRegion& region) const {
    region.validate();

    cv::Mat raw(1, static_cast<int>(buffer.size()), CV_8UC1, const_cast<unsigned char*>(buffer.data()));
    cv::Mat image = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw CompressionError("Cannot decode image for cropping (" + std::to_string(buffer.size()) + " bytes)");
    }

    const cv::Rect rect = region.to_pixels(image.size());
    const cv::Mat cropped = image(rect);

    MediaType input_type;
    if (!detect_media_type(buffer, input_type)) {
        input_type = MediaType::Png;
    }

    ImageBuffer out;
    bool ok = false;
    if (input_type == MediaType::Jpeg) {
        ok = cv::imencode(".jpg", cropped, out, {cv::IMWRITE_JPEG_QUALITY, 95});
    } else {
        ok = cv::imencode(".png", cropped, out);
    }

    if (!ok || out.empty()) {
        throw CompressionError("Failed to encode cropped image");
    }
    return out;
}

} // namespace blossom
