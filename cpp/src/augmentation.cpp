#include "../include/kridge_bits/augmentation.hpp"
#include "../include/kridge_bits/errors.hpp"
#include "../include/kridge_bits/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace kridge {

namespace {

const double kPi = 3.14159265358979323846;

// k distinct indices out of [0, n)
std::vector<Index> pick(Index n, Index k, std::mt19937& rng) {
    std::vector<Index> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::shuffle(idx.begin(), idx.end(), rng);
    idx.resize(k);
    return idx;
}

Index count_for(double ratio, Index n) {
    return std::min<Index>(n, static_cast<Index>(std::lround(ratio * n)));
}

double clamped(const ImageShape& shape, const VectorXd& image, int c, int r, int col) {
    r = std::max(0, std::min(shape.height - 1, r));
    col = std::max(0, std::min(shape.width - 1, col));
    return image(shape.offset(c, r, col));
}

}

void AugmentationParams::validate() const {
    if (flip_ratio < 0.0 || flip_ratio > 1.0) {
        throw std::invalid_argument("flip_ratio must be in [0, 1]");
    }
    if (rot_ratio < 0.0 || rot_ratio > 1.0) {
        throw std::invalid_argument("rot_ratio must be in [0, 1]");
    }
    if (rot_replicas < 0) {
        throw std::invalid_argument("rot_replicas must be >= 0");
    }
    if (rot_angle < 0.0) {
        throw std::invalid_argument("rot_angle must be >= 0");
    }
}

VectorXd flip_horizontal(const ImageShape& shape, const VectorXd& image) {
    VectorXd res(image.size());
    for (int c = 0; c < shape.channels; c++) {
        for (int r = 0; r < shape.height; r++) {
            for (int col = 0; col < shape.width; col++) {
                res(shape.offset(c, r, col)) = image(shape.offset(c, r, shape.width - 1 - col));
            }
        }
    }
    return res;
}

VectorXd rotate(const ImageShape& shape, const VectorXd& image, double angle_deg) {
    const double theta = angle_deg * kPi / 180.0;
    const double cos_t = std::cos(theta);
    const double sin_t = std::sin(theta);
    const double cy = (shape.height - 1) / 2.0;
    const double cx = (shape.width - 1) / 2.0;

    VectorXd res(image.size());
    for (int r = 0; r < shape.height; r++) {
        for (int col = 0; col < shape.width; col++) {
            // inverse map the destination pixel into the source image
            const double dy = r - cy;
            const double dx = col - cx;
            const double sx = cos_t * dx + sin_t * dy + cx;
            const double sy = -sin_t * dx + cos_t * dy + cy;
            const int x0 = static_cast<int>(std::floor(sx));
            const int y0 = static_cast<int>(std::floor(sy));
            const double fx = sx - x0;
            const double fy = sy - y0;
            for (int c = 0; c < shape.channels; c++) {
                const double top = (1.0 - fx) * clamped(shape, image, c, y0, x0) + fx * clamped(shape, image, c, y0, x0 + 1);
                const double bottom = (1.0 - fx) * clamped(shape, image, c, y0 + 1, x0)
                                      + fx * clamped(shape, image, c, y0 + 1, x0 + 1);
                res(shape.offset(c, r, col)) = (1.0 - fy) * top + fy * bottom;
            }
        }
    }
    return res;
}

void augment_dataset(const MatrixXd& x, const VectorXi& y, const ImageShape& shape, const AugmentationParams& params,
                     std::mt19937& rng, MatrixXd& x_out, VectorXi& y_out) {
    params.validate();
    check_image_rows(shape, x);
    if (x.rows() != y.size()) {
        throw ShapeMismatchError("X has " + std::to_string(x.rows()) + " rows but y has " + std::to_string(y.size()));
    }
    const Index n = x.rows();
    const Index n_flip = count_for(params.flip_ratio, n);
    const Index n_rot = count_for(params.rot_ratio, n);
    const Index total = n + n_flip + n_rot * params.rot_replicas;

    x_out.resize(total, x.cols());
    y_out.resize(total);
    x_out.topRows(n) = x;
    y_out.head(n) = y;

    Index pos = n;
    for (Index i : pick(n, n_flip, rng)) {
        x_out.row(pos) = flip_horizontal(shape, x.row(i).transpose()).transpose();
        y_out(pos) = y(i);
        pos++;
    }

    std::uniform_real_distribution<double> angle(-params.rot_angle, params.rot_angle);
    for (int rep = 0; rep < params.rot_replicas; rep++) {
        for (Index i : pick(n, n_rot, rng)) {
            x_out.row(pos) = rotate(shape, x.row(i).transpose(), angle(rng)).transpose();
            y_out(pos) = y(i);
            pos++;
        }
    }
    KRIDGE_LOG_INFO("Augmented " << n << " samples to " << total << " (" << n_flip << " flipped, "
                                  << n_rot * params.rot_replicas << " rotated)");
}

}
