#include "../include/kridge_bits/ridge_solver.hpp"
#include "../include/kridge_bits/errors.hpp"
#include "../include/kridge_bits/logging.hpp"

#include <stdexcept>
#include <string>

namespace kridge {

namespace {

void check_square(const MatrixXd& K) {
    if (K.rows() != K.cols()) {
        throw ShapeMismatchError("kernel matrix must be square, got " + std::to_string(K.rows()) + "x"
                                 + std::to_string(K.cols()));
    }
}

void check_finite(const MatrixXd& alpha) {
    if (!alpha.allFinite()) {
        throw SingularSystemError("ridge solve produced non-finite coefficients, system is ill-conditioned");
    }
}

}

MatrixXd regularize(const MatrixXd& K, double c) {
    check_square(K);
    if (!(c > 0.0)) {
        throw std::invalid_argument("regularization constant C must be > 0");
    }
    MatrixXd res = K;
    res.diagonal().array() += c * static_cast<double>(K.rows());
    return res;
}

VectorXd solve_positive_definite(const MatrixXd& a, const VectorXd& b) {
    check_square(a);
    if (b.size() != a.rows()) {
        throw ShapeMismatchError("right hand side has " + std::to_string(b.size()) + " rows, system has "
                                 + std::to_string(a.rows()));
    }
    LLT<MatrixXd> llt(a);
    if (llt.info() != Success) {
        throw SingularSystemError("system matrix is not positive definite");
    }
    VectorXd x = llt.solve(b);
    check_finite(x);
    return x;
}

RidgeSolver::RidgeSolver(const MatrixXd& K, double c) : _n(K.rows()), _c(c) {
    if (_n == 0) {
        throw ShapeMismatchError("cannot solve over an empty kernel matrix");
    }
    _llt.compute(regularize(K, c));
    if (_llt.info() != Success) {
        throw SingularSystemError("K + C*N*I is not positive definite (N=" + std::to_string(_n)
                                  + ", C=" + std::to_string(c) + "), check the kernel or increase C");
    }
    KRIDGE_LOG_DEBUG("Factorized regularized system of size " << _n << " with C=" << c);
}

VectorXd RidgeSolver::solve(const VectorXd& y) const {
    if (y.size() != _n) {
        throw ShapeMismatchError("target has " + std::to_string(y.size()) + " rows, kernel matrix has "
                                 + std::to_string(_n));
    }
    VectorXd alpha = _llt.solve(y);
    check_finite(alpha);
    return alpha;
}

MatrixXd RidgeSolver::solve_all(const MatrixXd& Y) const {
    if (Y.rows() != _n) {
        throw ShapeMismatchError("targets have " + std::to_string(Y.rows()) + " rows, kernel matrix has "
                                 + std::to_string(_n));
    }
    MatrixXd alpha(Y.cols(), _n);
    for (Index k = 0; k < Y.cols(); k++) {
        const VectorXd a = _llt.solve(Y.col(k));
        alpha.row(k) = a.transpose();
        KRIDGE_LOG_TRACE("Solved one-vs-all target " << k + 1 << "/" << Y.cols());
    }
    check_finite(alpha);
    return alpha;
}

}
