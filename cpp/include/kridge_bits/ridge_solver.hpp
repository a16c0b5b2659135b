#ifndef KRIDGE_RIDGE_SOLVER_H
#define KRIDGE_RIDGE_SOLVER_H

#include <Eigen/Dense>

namespace kridge {

using namespace Eigen;

// K + C * N * I
MatrixXd regularize(const MatrixXd& K, double c);

// Solves a * x = b assuming a is symmetric positive definite (Cholesky).
// Throws SingularSystemError when the factorization breaks down.
VectorXd solve_positive_definite(const MatrixXd& a, const VectorXd& b);

// Closed form ridge solve (K + C*N*I) alpha = y.
// The regularized system is factorized once and reused for every target.
class RidgeSolver {
public:
    RidgeSolver(const MatrixXd& K, double c);

    // one target -> one coefficient vector of length N
    VectorXd solve(const VectorXd& y) const;
    // Y is N x num_targets (one column per class); result is num_targets x N
    MatrixXd solve_all(const MatrixXd& Y) const;

    Index size() const { return _n; }
    double c() const { return _c; }

private:
    Index _n;
    double _c;
    LLT<MatrixXd> _llt;
};

}

#endif
