#ifndef KRIDGE_HOG_H
#define KRIDGE_HOG_H

#include <Eigen/Dense>

#include "image.hpp"

namespace kridge {

using namespace Eigen;

// Histogram of oriented gradients over images stored as dataset rows.
// Unsigned orientations, linear vote interpolation between neighbouring bins,
// overlapping blocks (stride one cell) normalized with L2-Hys.
class HogExtractor {
public:
    explicit HogExtractor(const ImageShape& shape = ImageShape(), int cell_size = 8, int n_bins = 9,
                          int block_size = 2);

    // one feature row per image row, same order
    MatrixXd transform(const MatrixXd& x) const;
    VectorXd transform_one(const VectorXd& image) const;

    Index n_features() const;
    const ImageShape& shape() const { return _shape; }
    int cell_size() const { return _cell_size; }
    int n_bins() const { return _n_bins; }
    int block_size() const { return _block_size; }

private:
    ImageShape _shape;
    int _cell_size;
    int _n_bins;
    int _block_size;
    int _cells_y;
    int _cells_x;

    // cells_y * cells_x rows of n_bins
    MatrixXd _cell_histograms(const VectorXd& image) const;
};

}

#endif
