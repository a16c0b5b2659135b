#include "../include/kridge_bits/label_binarizer.hpp"
#include "../include/kridge_bits/errors.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>

namespace kridge {

LabelBinarizer::LabelBinarizer(double pos_label, double neg_label) : _pos_label(pos_label), _neg_label(neg_label) {
    if (!(neg_label < pos_label)) {
        throw std::invalid_argument("neg_label must be strictly less than pos_label");
    }
}

LabelBinarizer& LabelBinarizer::fit(const VectorXi& y) {
    if (y.size() == 0) {
        throw ShapeMismatchError("cannot fit label binarizer on an empty label vector");
    }
    std::set<int> unique(y.data(), y.data() + y.size());
    _classes.assign(unique.begin(), unique.end());
    return *this;
}

Index LabelBinarizer::index_of(int label) const {
    auto it = std::lower_bound(_classes.begin(), _classes.end(), label);
    if (it == _classes.end() || *it != label) {
        throw std::invalid_argument("label " + std::to_string(label) + " was not seen during fit");
    }
    return static_cast<Index>(it - _classes.begin());
}

MatrixXd LabelBinarizer::transform(const VectorXi& y) const {
    if (!fitted()) {
        throw NotFittedError("LabelBinarizer");
    }
    MatrixXd Y = MatrixXd::Constant(y.size(), n_classes(), _neg_label);
    for (Index i = 0; i < y.size(); i++) {
        Y(i, index_of(y(i))) = _pos_label;
    }
    return Y;
}

MatrixXd LabelBinarizer::fit_transform(const VectorXi& y) {
    return fit(y).transform(y);
}

VectorXi LabelBinarizer::inverse_transform(const VectorXi& indices) const {
    if (!fitted()) {
        throw NotFittedError("LabelBinarizer");
    }
    VectorXi labels(indices.size());
    for (Index i = 0; i < indices.size(); i++) {
        if (indices(i) < 0 || indices(i) >= n_classes()) {
            throw std::invalid_argument("class index " + std::to_string(indices(i)) + " out of range");
        }
        labels(i) = _classes[indices(i)];
    }
    return labels;
}

}
