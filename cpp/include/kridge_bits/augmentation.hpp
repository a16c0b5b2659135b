#ifndef KRIDGE_AUGMENTATION_H
#define KRIDGE_AUGMENTATION_H

#include <Eigen/Dense>
#include <random>

#include "image.hpp"

namespace kridge {

using namespace Eigen;

struct AugmentationParams {
    double flip_ratio;
    int rot_replicas;
    double rot_ratio;
    double rot_angle;  // degrees, angles drawn from [-rot_angle, rot_angle]

    AugmentationParams(double flip_ratio = 0.2, int rot_replicas = 1, double rot_ratio = 0.2, double rot_angle = 20)
        : flip_ratio(flip_ratio), rot_replicas(rot_replicas), rot_ratio(rot_ratio), rot_angle(rot_angle) {}

    // throws std::invalid_argument
    void validate() const;
};

// mirror left/right
VectorXd flip_horizontal(const ImageShape& shape, const VectorXd& image);
// rotation about the image centre, bilinear sampling, edges clamped
VectorXd rotate(const ImageShape& shape, const VectorXd& image, double angle_deg);

// Returns the original samples followed by round(flip_ratio*N) flipped copies and,
// per replica, round(rot_ratio*N) rotated copies. Sources are drawn without
// replacement within each pass; every copy keeps the label of its source.
void augment_dataset(const MatrixXd& x, const VectorXi& y, const ImageShape& shape, const AugmentationParams& params,
                     std::mt19937& rng, MatrixXd& x_out, VectorXi& y_out);

}

#endif
