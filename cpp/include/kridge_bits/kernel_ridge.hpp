#ifndef KRIDGE_KERNEL_RIDGE_H
#define KRIDGE_KERNEL_RIDGE_H

#include <Eigen/Dense>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "ConfusionMatrix.hpp"
#include "augmentation.hpp"
#include "hog.hpp"
#include "kernel.hpp"
#include "kernel_registry.hpp"
#include "label_binarizer.hpp"

namespace kridge {

using namespace Eigen;

// f(x) = sum(alpha_i * K(x, x_i)) with (K + C*N*I) alpha = y
class KernelRidgeRegressor {
public:
    KernelRidgeRegressor(double c = 1.0, const std::string& kernel_name = "rbf", double gamma = 10,
                         const KernelRegistry& registry = KernelRegistry::defaults());

    KernelRidgeRegressor& fit(const MatrixXd& x, const VectorXd& y);
    VectorXd predict(const MatrixXd& x) const;
    // mean squared error
    double score(const MatrixXd& x, const VectorXd& y) const;

    double c() const { return _c; }
    const std::string& kernel_name() const { return _kernel_name; }
    double gamma() const { return _gamma; }

    bool fitted() const { return _kernel != nullptr; }
    const VectorXd& alpha() const;
    const Kernel& kernel() const;

private:
    double _c;
    std::string _kernel_name;
    double _gamma;
    KernelRegistry _registry;

    std::unique_ptr<Kernel> _kernel;
    VectorXd _alpha;
};

// One-vs-all: one ridge solve per class against {+1, -1} targets, prediction is
// the class with the largest score (lowest class on ties).
class KernelRidgeClassifier {
public:
    KernelRidgeClassifier(double c = 1.0, const std::string& kernel_name = "rbf", double gamma = 10,
                          const KernelRegistry& registry = KernelRegistry::defaults());
    virtual ~KernelRidgeClassifier() = default;

    KernelRidgeClassifier& fit(const MatrixXd& x, const VectorXi& y);
    VectorXi predict(const MatrixXd& x) const;
    // rows(x) x num_classes, column k belongs to classes()[k]
    MatrixXd decision_function(const MatrixXd& x) const;
    // error rate
    double score(const MatrixXd& x, const VectorXi& y) const;
    double evaluate(const MatrixXd& x, const VectorXi& y, ConfusionMatrix& matrix) const;

    double c() const { return _c; }
    const std::string& kernel_name() const { return _kernel_name; }
    double gamma() const { return _gamma; }

    bool fitted() const { return _kernel != nullptr; }
    const std::vector<int>& classes() const;
    // num_classes x N
    const MatrixXd& alpha() const;
    const Kernel& kernel() const;

protected:
    // training only; sees the raw training set, produces the one the kernel is built on
    virtual void _prepare_fit(const MatrixXd& x, const VectorXi& y, MatrixXd& x_out, VectorXi& y_out);
    // applied to every input of predict/decision_function
    virtual MatrixXd _prepare_predict(const MatrixXd& x) const;

    virtual std::string _name() const { return "KernelRidgeClassifier"; }

private:
    double _c;
    std::string _kernel_name;
    double _gamma;
    KernelRegistry _registry;

    std::unique_ptr<Kernel> _kernel;
    LabelBinarizer _binarizer;
    MatrixXd _alpha;

    void _check_fitted() const;
};

// Augments the training images (flips, rotations), then trains on their HOG
// features. Prediction extracts HOG features only.
class AugmentedHogKernelRidgeClassifier : public KernelRidgeClassifier {
public:
    AugmentedHogKernelRidgeClassifier(const ImageShape& shape = ImageShape(), double c = 1.0,
                                      const std::string& kernel_name = "rbf", double gamma = 10,
                                      double flip_ratio = 0.2, int rot_replicas = 1, double rot_ratio = 0.2,
                                      double rot_angle = 20, unsigned int seed = 0, int cell_size = 8,
                                      int n_bins = 9, const KernelRegistry& registry = KernelRegistry::defaults());

    AugmentedHogKernelRidgeClassifier& fit(const MatrixXd& x, const VectorXi& y);

    const AugmentationParams& augmentation() const { return _augmentation; }
    const HogExtractor& hog_extractor() const { return _hog_extractor; }
    unsigned int seed() const { return _seed; }

protected:
    void _prepare_fit(const MatrixXd& x, const VectorXi& y, MatrixXd& x_out, VectorXi& y_out) override;
    MatrixXd _prepare_predict(const MatrixXd& x) const override;

    std::string _name() const override { return "AugmentedHogKernelRidgeClassifier"; }

private:
    AugmentationParams _augmentation;
    HogExtractor _hog_extractor;
    unsigned int _seed;
};

}

#endif
