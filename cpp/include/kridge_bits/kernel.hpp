#ifndef KRIDGE_KERNEL_H
#define KRIDGE_KERNEL_H

#include <Eigen/Dense>
#include <cmath>
#include <string>

namespace kridge {

using namespace Eigen;

// A similarity function bound to a training set.
// similarity_matrix() is the N x N Gram matrix over the stored samples,
// similarity(x) is the length N vector K(x, x_i).
class Kernel {
public:
    explicit Kernel(const MatrixXd& train_x);
    virtual ~Kernel() = default;

    virtual double val(const VectorXd& x, const VectorXd& y) const = 0;
    virtual std::string name() const = 0;

    // computed on first call, then served from cache
    const MatrixXd& similarity_matrix();
    VectorXd similarity(const VectorXd& x) const;

    const MatrixXd& train_x() const { return _train_x; }
    Index n_samples() const { return _train_x.rows(); }
    Index n_features() const { return _train_x.cols(); }
    bool has_similarity_matrix() const { return _computed; }

private:
    MatrixXd _train_x;
    MatrixXd _kernel_val;
    bool _computed;
};

class LinearKernel : public Kernel {
public:
    explicit LinearKernel(const MatrixXd& train_x) : Kernel(train_x) {}
    double val(const VectorXd& x, const VectorXd& y) const override {
        return x.dot(y);
    }
    std::string name() const override { return "linear"; }
};

// (x.y + c)^deg
class PolyKernel : public Kernel {
public:
    PolyKernel(const MatrixXd& train_x, int deg, double c = 1.0);
    double val(const VectorXd& x, const VectorXd& y) const override;
    std::string name() const override { return "poly"; }

    int degree() const { return _deg; }

private:
    int _deg;
    double _c;
};

// exp(-gamma * ||x - y||^2)
class GaussianKernel : public Kernel {
public:
    GaussianKernel(const MatrixXd& train_x, double gamma);
    double val(const VectorXd& x, const VectorXd& y) const override;
    std::string name() const override { return "rbf"; }

    double gamma() const { return _gamma; }

private:
    double _gamma;
};

// exp(-gamma * ||x - y||_1)
class LaplacianKernel : public Kernel {
public:
    LaplacianKernel(const MatrixXd& train_x, double gamma);
    double val(const VectorXd& x, const VectorXd& y) const override;
    std::string name() const override { return "laplacian"; }

    double gamma() const { return _gamma; }

private:
    double _gamma;
};

}

#endif
