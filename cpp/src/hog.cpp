#include "../include/kridge_bits/hog.hpp"
#include "../include/kridge_bits/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace kridge {

namespace {

const double kPi = 3.14159265358979323846;
const double kEps = 1e-5;
const double kClip = 0.2;

void l2_hys(VectorXd& v) {
    v /= std::sqrt(v.squaredNorm() + kEps * kEps);
    v = v.cwiseMin(kClip);
    v /= std::sqrt(v.squaredNorm() + kEps * kEps);
}

}

HogExtractor::HogExtractor(const ImageShape& shape, int cell_size, int n_bins, int block_size)
    : _shape(shape), _cell_size(cell_size), _n_bins(n_bins), _block_size(block_size) {
    if (shape.height <= 0 || shape.width <= 0 || shape.channels <= 0) {
        throw std::invalid_argument("image dimensions must be positive");
    }
    if (cell_size < 1 || n_bins < 1 || block_size < 1) {
        throw std::invalid_argument("hog cell_size, n_bins and block_size must be >= 1");
    }
    _cells_y = shape.height / cell_size;
    _cells_x = shape.width / cell_size;
    if (_cells_y < block_size || _cells_x < block_size) {
        throw std::invalid_argument("image of " + std::to_string(shape.height) + "x" + std::to_string(shape.width)
                                    + " is too small for " + std::to_string(block_size) + "x"
                                    + std::to_string(block_size) + " blocks of "
                                    + std::to_string(cell_size) + " pixel cells");
    }
}

Index HogExtractor::n_features() const {
    const Index blocks = static_cast<Index>(_cells_y - _block_size + 1) * (_cells_x - _block_size + 1);
    return blocks * _block_size * _block_size * _n_bins;
}

MatrixXd HogExtractor::_cell_histograms(const VectorXd& image) const {
    const int h = _shape.height;
    const int w = _shape.width;
    const double bin_width = 180.0 / _n_bins;
    MatrixXd hist = MatrixXd::Zero(static_cast<Index>(_cells_y) * _cells_x, _n_bins);

    for (int r = 0; r < _cells_y * _cell_size; r++) {
        const int up = r > 0 ? r - 1 : r;
        const int down = r < h - 1 ? r + 1 : r;
        for (int col = 0; col < _cells_x * _cell_size; col++) {
            const int left = col > 0 ? col - 1 : col;
            const int right = col < w - 1 ? col + 1 : col;

            // strongest channel wins
            double gx = 0.0, gy = 0.0, mag2 = -1.0;
            for (int c = 0; c < _shape.channels; c++) {
                const double dx = image(_shape.offset(c, r, right)) - image(_shape.offset(c, r, left));
                const double dy = image(_shape.offset(c, down, col)) - image(_shape.offset(c, up, col));
                if (dx * dx + dy * dy > mag2) {
                    gx = dx;
                    gy = dy;
                    mag2 = dx * dx + dy * dy;
                }
            }
            const double mag = std::sqrt(mag2);
            if (mag == 0.0) {
                continue;
            }
            double angle = std::atan2(gy, gx) * 180.0 / kPi;
            if (angle < 0.0) angle += 180.0;
            if (angle >= 180.0) angle -= 180.0;

            const double pos = angle / bin_width - 0.5;
            int b0 = static_cast<int>(std::floor(pos));
            const double frac = pos - b0;
            int b1 = b0 + 1;
            if (b0 < 0) b0 += _n_bins;
            if (b1 >= _n_bins) b1 -= _n_bins;

            const Index cell = static_cast<Index>(r / _cell_size) * _cells_x + col / _cell_size;
            hist(cell, b0) += mag * (1.0 - frac);
            hist(cell, b1) += mag * frac;
        }
    }
    return hist;
}

VectorXd HogExtractor::transform_one(const VectorXd& image) const {
    if (image.size() != _shape.size()) {
        throw ShapeMismatchError("image has " + std::to_string(image.size()) + " values, expected "
                                 + std::to_string(_shape.size()));
    }
    const MatrixXd hist = _cell_histograms(image);
    const Index block_len = static_cast<Index>(_block_size) * _block_size * _n_bins;

    VectorXd features(n_features());
    Index pos = 0;
    for (int by = 0; by + _block_size <= _cells_y; by++) {
        for (int bx = 0; bx + _block_size <= _cells_x; bx++) {
            VectorXd block(block_len);
            Index k = 0;
            for (int cy = by; cy < by + _block_size; cy++) {
                for (int cx = bx; cx < bx + _block_size; cx++) {
                    block.segment(k, _n_bins) = hist.row(static_cast<Index>(cy) * _cells_x + cx).transpose();
                    k += _n_bins;
                }
            }
            l2_hys(block);
            features.segment(pos, block_len) = block;
            pos += block_len;
        }
    }
    return features;
}

MatrixXd HogExtractor::transform(const MatrixXd& x) const {
    check_image_rows(_shape, x);
    MatrixXd features(x.rows(), n_features());
    for (Index i = 0; i < x.rows(); i++) {
        features.row(i) = transform_one(x.row(i).transpose()).transpose();
    }
    return features;
}

}
