#ifndef KRIDGE_IMAGE_H
#define KRIDGE_IMAGE_H

#include <Eigen/Dense>

namespace kridge {

using namespace Eigen;

// Layout of one image stored as a dataset row: channel planar, each plane row-major.
struct ImageShape {
    int height;
    int width;
    int channels;

    ImageShape(int h = 32, int w = 32, int c = 3) : height(h), width(w), channels(c) {}

    Index size() const { return static_cast<Index>(height) * width * channels; }
    Index offset(int c, int r, int col) const {
        return (static_cast<Index>(c) * height + r) * width + col;
    }
};

// throws std::invalid_argument for non-positive dimensions,
// ShapeMismatchError when x does not hold images of this shape
void check_image_rows(const ImageShape& shape, const MatrixXd& x);

}

#endif
