#include "../include/kridge_bits/ConfusionMatrix.hpp"

#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace kridge {

ConfusionMatrix::ConfusionMatrix(const std::vector<int>& classes) : _classes(classes) {
    std::sort(_classes.begin(), _classes.end());
    _classes.erase(std::unique(_classes.begin(), _classes.end()), _classes.end());
    if (_classes.empty()) {
        throw std::invalid_argument("confusion matrix needs at least one class");
    }
    const Index k = static_cast<Index>(_classes.size());
    _counts = MatrixXi::Zero(k, k);
}

Index ConfusionMatrix::_index(int label) const {
    auto it = std::lower_bound(_classes.begin(), _classes.end(), label);
    if (it == _classes.end() || *it != label) {
        throw std::invalid_argument("label " + std::to_string(label) + " is not a class of this confusion matrix");
    }
    return static_cast<Index>(it - _classes.begin());
}

void ConfusionMatrix::AddPrediction(int true_label, int predicted_label) {
    _counts(_index(true_label), _index(predicted_label))++;
}

int ConfusionMatrix::GetCount(int true_label, int predicted_label) const {
    return _counts(_index(true_label), _index(predicted_label));
}

int ConfusionMatrix::GetTotal() const {
    return _counts.sum();
}

double ConfusionMatrix::error_rate() const {
    const int total = GetTotal();
    if (total == 0) {
        return 0.0;
    }
    return double(total - _counts.trace()) / double(total);
}

double ConfusionMatrix::precision(int label) const {
    // TP/(TP+FP)
    const Index k = _index(label);
    const int predicted = _counts.col(k).sum();
    return predicted == 0 ? 0.0 : double(_counts(k, k)) / double(predicted);
}

double ConfusionMatrix::detection_rate(int label) const {
    // TP/(TP+FN)
    const Index k = _index(label);
    const int actual = _counts.row(k).sum();
    return actual == 0 ? 0.0 : double(_counts(k, k)) / double(actual);
}

double ConfusionMatrix::f_score(int label) const {
    const double p = precision(label);
    const double r = detection_rate(label);
    return p + r == 0.0 ? 0.0 : 2 * p * r / (p + r);
}

void ConfusionMatrix::PrintEvaluation(std::ostream& out) const {
    out << "\t\tPredicted\n\t";
    for (int label : _classes) {
        out << "\t" << label;
    }
    out << "\n";
    for (Index i = 0; i < _counts.rows(); i++) {
        out << (i == 0 ? "Actual" : "") << "\t" << _classes[i];
        for (Index j = 0; j < _counts.cols(); j++) {
            out << "\t" << _counts(i, j);
        }
        out << "\n";
    }
    out << "\nError rate\t" << error_rate() << "\n";
    out << "Class\tPrecision\tDetection rate\tF-score\n";
    for (int label : _classes) {
        out << label << "\t" << std::setprecision(4) << precision(label) << "\t\t" << detection_rate(label) << "\t\t"
            << f_score(label) << "\n";
    }
}

}
