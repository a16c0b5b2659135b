#include "../include/kridge_bits/image.hpp"
#include "../include/kridge_bits/errors.hpp"

#include <stdexcept>
#include <string>

namespace kridge {

void check_image_rows(const ImageShape& shape, const MatrixXd& x) {
    if (shape.height <= 0 || shape.width <= 0 || shape.channels <= 0) {
        throw std::invalid_argument("image dimensions must be positive");
    }
    if (x.cols() != shape.size()) {
        throw ShapeMismatchError("rows hold " + std::to_string(x.cols()) + " values, image shape "
                                 + std::to_string(shape.height) + "x" + std::to_string(shape.width) + "x"
                                 + std::to_string(shape.channels) + " needs " + std::to_string(shape.size()));
    }
}

}
