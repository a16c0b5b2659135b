#include "../include/kridge_bits/kernel.hpp"
#include "../include/kridge_bits/errors.hpp"
#include "../include/kridge_bits/logging.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace kridge {

Kernel::Kernel(const MatrixXd& train_x) : _train_x(train_x), _computed(false) {
}

const MatrixXd& Kernel::similarity_matrix() {
    if (_computed) {
        return _kernel_val;
    }
    const Index n = n_samples();
    KRIDGE_LOG_INFO("Start computing " << name() << " kernel similarity matrix over " << n << " samples...");
    const auto start = std::chrono::steady_clock::now();

    // rows copied out once, val() only sees plain vectors
    std::vector<VectorXd> rows(n);
    for (Index i = 0; i < n; i++) {
        rows[i] = _train_x.row(i).transpose();
    }
    _kernel_val = MatrixXd(n, n);
    for (Index i = 0; i < n; i++) {
        for (Index j = i; j < n; j++) {
            _kernel_val(i, j) = val(rows[i], rows[j]);
            _kernel_val(j, i) = _kernel_val(i, j);
        }
    }
    _computed = true;

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    KRIDGE_LOG_INFO("Kernel similarity matrix computed in " << elapsed.count() << " seconds");
    return _kernel_val;
}

VectorXd Kernel::similarity(const VectorXd& x) const {
    if (x.size() != n_features()) {
        throw ShapeMismatchError("sample has " + std::to_string(x.size()) + " features, kernel was built on "
                                 + std::to_string(n_features()));
    }
    const Index n = n_samples();
    VectorXd res(n);
    for (Index i = 0; i < n; i++) {
        res(i) = val(x, _train_x.row(i).transpose());
    }
    return res;
}

PolyKernel::PolyKernel(const MatrixXd& train_x, int deg, double c) : Kernel(train_x), _deg(deg), _c(c) {
    if (deg < 1) {
        throw std::invalid_argument("polynomial kernel degree must be >= 1, got " + std::to_string(deg));
    }
}

double PolyKernel::val(const VectorXd& x, const VectorXd& y) const {
    return std::pow(x.dot(y) + _c, _deg);
}

GaussianKernel::GaussianKernel(const MatrixXd& train_x, double gamma) : Kernel(train_x), _gamma(gamma) {
    if (!(gamma > 0.0)) {
        throw std::invalid_argument("rbf kernel gamma must be > 0");
    }
}

double GaussianKernel::val(const VectorXd& x, const VectorXd& y) const {
    return std::exp(-_gamma * (x - y).squaredNorm());
}

LaplacianKernel::LaplacianKernel(const MatrixXd& train_x, double gamma) : Kernel(train_x), _gamma(gamma) {
    if (!(gamma > 0.0)) {
        throw std::invalid_argument("laplacian kernel gamma must be > 0");
    }
}

double LaplacianKernel::val(const VectorXd& x, const VectorXd& y) const {
    return std::exp(-_gamma * (x - y).lpNorm<1>());
}

}
