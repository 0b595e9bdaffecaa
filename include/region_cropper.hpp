#pragma once

#include "media_types.hpp"

#include <opencv2/opencv.hpp>

namespace blossom {

// Sub-rectangle in image-relative coordinates, each value in [0, 1].
struct CropRegion {
    double x = 0.0;
    double y = 0.0;
    double width = 1.0;
    double height = 1.0;

    // Throws std::invalid_argument unless every value lies in [0, 1], the
    // width and height are positive and the region ends inside the image.
    void validate() const;

    // Absolute pixel rectangle for an image of the given size. Rounding never
    // moves an edge past the image. Throws std::invalid_argument when it rounds to zero area.
    cv::Rect to_pixels(const cv::Size& image_size) const;
};

class RegionCropper {
public:
    // Crops against the buffer's own measured dimensions and re-encodes in
    // the input's format (JPEG stays JPEG, everything else becomes PNG).
    ImageBuffer crop(const ImageBuffer& buffer, const CropRegion& region) const;
};

} // namespace blossom
