#include "../include/kridge_bits/kernel_ridge.hpp"
#include "../include/kridge_bits/errors.hpp"
#include "../include/kridge_bits/logging.hpp"
#include "../include/kridge_bits/predictor.hpp"
#include "../include/kridge_bits/ridge_solver.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace kridge {

namespace {

void check_hyperparameters(double c, double gamma, const std::string& kernel_name, const KernelRegistry& registry) {
    registry.check(kernel_name, gamma);
    if (!(c > 0.0)) {
        throw std::invalid_argument("regularization constant C must be > 0");
    }
}

void check_rows(Index x_rows, Index y_rows) {
    if (x_rows != y_rows) {
        throw ShapeMismatchError("X has " + std::to_string(x_rows) + " rows but y has " + std::to_string(y_rows));
    }
    if (x_rows == 0) {
        throw ShapeMismatchError("cannot fit on an empty training set");
    }
}

void check_width(const Kernel& kernel, const MatrixXd& x) {
    if (x.cols() != kernel.n_features()) {
        throw ShapeMismatchError("X has " + std::to_string(x.cols()) + " features, model was fitted on "
                                 + std::to_string(kernel.n_features()));
    }
}

}

// KernelRidgeRegressor

KernelRidgeRegressor::KernelRidgeRegressor(double c, const std::string& kernel_name, double gamma,
                                           const KernelRegistry& registry)
    : _c(c), _kernel_name(kernel_name), _gamma(gamma), _registry(registry) {
    check_hyperparameters(c, gamma, kernel_name, _registry);
}

KernelRidgeRegressor& KernelRidgeRegressor::fit(const MatrixXd& x, const VectorXd& y) {
    check_rows(x.rows(), y.size());
    KRIDGE_LOG_INFO("Fitting kernel ridge regressor on " << x.rows() << " samples of " << x.cols()
                                                         << " features (kernel=" << _kernel_name << ", gamma=" << _gamma
                                                         << ", C=" << _c << ")");
    std::unique_ptr<Kernel> kernel = _registry.make(_kernel_name, x, _gamma);
    RidgeSolver solver(kernel->similarity_matrix(), _c);
    VectorXd alpha = solver.solve(y);

    _kernel = std::move(kernel);
    _alpha = std::move(alpha);
    return *this;
}

VectorXd KernelRidgeRegressor::predict(const MatrixXd& x) const {
    if (!fitted()) {
        throw NotFittedError("KernelRidgeRegressor");
    }
    check_width(*_kernel, x);
    return predict_values(*_kernel, _alpha, x);
}

double KernelRidgeRegressor::score(const MatrixXd& x, const VectorXd& y) const {
    VectorXd y_preds = predict(x);
    if (y_preds.size() != y.size()) {
        throw ShapeMismatchError("X has " + std::to_string(x.rows()) + " rows but y has " + std::to_string(y.size()));
    }
    if (y.size() == 0) {
        return 0.0;
    }
    return (y_preds - y).squaredNorm() / y.size();
}

const VectorXd& KernelRidgeRegressor::alpha() const {
    if (!fitted()) {
        throw NotFittedError("KernelRidgeRegressor");
    }
    return _alpha;
}

const Kernel& KernelRidgeRegressor::kernel() const {
    if (!fitted()) {
        throw NotFittedError("KernelRidgeRegressor");
    }
    return *_kernel;
}

// KernelRidgeClassifier

KernelRidgeClassifier::KernelRidgeClassifier(double c, const std::string& kernel_name, double gamma,
                                             const KernelRegistry& registry)
    : _c(c), _kernel_name(kernel_name), _gamma(gamma), _registry(registry) {
    check_hyperparameters(c, gamma, kernel_name, _registry);
}

void KernelRidgeClassifier::_prepare_fit(const MatrixXd& x, const VectorXi& y, MatrixXd& x_out, VectorXi& y_out) {
    x_out = x;
    y_out = y;
}

MatrixXd KernelRidgeClassifier::_prepare_predict(const MatrixXd& x) const {
    return x;
}

void KernelRidgeClassifier::_check_fitted() const {
    if (!fitted()) {
        throw NotFittedError(_name());
    }
}

KernelRidgeClassifier& KernelRidgeClassifier::fit(const MatrixXd& x, const VectorXi& y) {
    check_rows(x.rows(), y.size());

    MatrixXd train_x;
    VectorXi train_y;
    _prepare_fit(x, y, train_x, train_y);
    check_rows(train_x.rows(), train_y.size());

    // map labels in {-1, 1}, one column per sorted class
    LabelBinarizer binarizer(1.0, -1.0);
    const MatrixXd Y = binarizer.fit_transform(train_y);
    KRIDGE_LOG_INFO("Fitting " << _name() << " on " << train_x.rows() << " samples of " << train_x.cols()
                               << " features, " << binarizer.n_classes() << " classes (kernel=" << _kernel_name
                               << ", gamma=" << _gamma << ", C=" << _c << ")");

    std::unique_ptr<Kernel> kernel = _registry.make(_kernel_name, train_x, _gamma);
    RidgeSolver solver(kernel->similarity_matrix(), _c);
    MatrixXd alpha = solver.solve_all(Y);
    KRIDGE_LOG_INFO("Solved " << alpha.rows() << " one-vs-all systems");

    _kernel = std::move(kernel);
    _binarizer = binarizer;
    _alpha = std::move(alpha);
    return *this;
}

MatrixXd KernelRidgeClassifier::decision_function(const MatrixXd& x) const {
    _check_fitted();
    const MatrixXd features = _prepare_predict(x);
    check_width(*_kernel, features);
    return decision_scores(*_kernel, _alpha, features);
}

VectorXi KernelRidgeClassifier::predict(const MatrixXd& x) const {
    return _binarizer.inverse_transform(argmax_rows(decision_function(x)));
}

double KernelRidgeClassifier::score(const MatrixXd& x, const VectorXi& y) const {
    VectorXi y_preds = predict(x);
    if (y_preds.size() != y.size()) {
        throw ShapeMismatchError("X has " + std::to_string(x.rows()) + " rows but y has " + std::to_string(y.size()));
    }
    if (y.size() == 0) {
        return 0.0;
    }
    return double((y_preds.array() != y.array()).count()) / y.size();
}

double KernelRidgeClassifier::evaluate(const MatrixXd& x, const VectorXi& y, ConfusionMatrix& matrix) const {
    VectorXi y_preds = predict(x);
    if (y_preds.size() != y.size()) {
        throw ShapeMismatchError("X has " + std::to_string(x.rows()) + " rows but y has " + std::to_string(y.size()));
    }
    Index errors = 0;
    for (Index i = 0; i < y.size(); i++) {
        matrix.AddPrediction(y(i), y_preds(i));
        if (y(i) != y_preds(i)) {
            errors++;
        }
    }
    return y.size() == 0 ? 0.0 : double(errors) / y.size();
}

const std::vector<int>& KernelRidgeClassifier::classes() const {
    _check_fitted();
    return _binarizer.classes();
}

const MatrixXd& KernelRidgeClassifier::alpha() const {
    _check_fitted();
    return _alpha;
}

const Kernel& KernelRidgeClassifier::kernel() const {
    _check_fitted();
    return *_kernel;
}

// AugmentedHogKernelRidgeClassifier

AugmentedHogKernelRidgeClassifier::AugmentedHogKernelRidgeClassifier(
    const ImageShape& shape, double c, const std::string& kernel_name, double gamma, double flip_ratio,
    int rot_replicas, double rot_ratio, double rot_angle, unsigned int seed, int cell_size, int n_bins,
    const KernelRegistry& registry)
    : KernelRidgeClassifier(c, kernel_name, gamma, registry),
      _augmentation(flip_ratio, rot_replicas, rot_ratio, rot_angle),
      _hog_extractor(shape, cell_size, n_bins),
      _seed(seed) {
    _augmentation.validate();
}

AugmentedHogKernelRidgeClassifier& AugmentedHogKernelRidgeClassifier::fit(const MatrixXd& x, const VectorXi& y) {
    KernelRidgeClassifier::fit(x, y);
    return *this;
}

void AugmentedHogKernelRidgeClassifier::_prepare_fit(const MatrixXd& x, const VectorXi& y, MatrixXd& x_out,
                                                     VectorXi& y_out) {
    // fresh generator per fit, refitting on the same data gives the same model
    std::mt19937 rng(_seed);
    MatrixXd augmented;
    augment_dataset(x, y, _hog_extractor.shape(), _augmentation, rng, augmented, y_out);
    x_out = _hog_extractor.transform(augmented);
    KRIDGE_LOG_DEBUG("Extracted " << x_out.cols() << " HOG features per image");
}

MatrixXd AugmentedHogKernelRidgeClassifier::_prepare_predict(const MatrixXd& x) const {
    return _hog_extractor.transform(x);
}

}
