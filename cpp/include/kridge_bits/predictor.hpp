#ifndef KRIDGE_PREDICTOR_H
#define KRIDGE_PREDICTOR_H

#include <Eigen/Dense>

#include "kernel.hpp"

namespace kridge {

using namespace Eigen;

// f(x) = sum(alpha_i * K(x, x_i)), one output per row of x
VectorXd predict_values(const Kernel& kernel, const VectorXd& alpha, const MatrixXd& x);

// alpha is num_classes x N; result is rows(x) x num_classes
MatrixXd decision_scores(const Kernel& kernel, const MatrixXd& alpha, const MatrixXd& x);

// column of the row maximum; ties go to the lowest column
VectorXi argmax_rows(const MatrixXd& scores);

}

#endif
