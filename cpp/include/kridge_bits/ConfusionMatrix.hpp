#ifndef KRIDGE_CONFUSION_MATRIX_H
#define KRIDGE_CONFUSION_MATRIX_H

#include <Eigen/Dense>
#include <iostream>
#include <vector>

namespace kridge {

using namespace Eigen;

// rows: actual class, cols: predicted class, both by sorted label rank
class ConfusionMatrix {
public:
    explicit ConfusionMatrix(const std::vector<int>& classes);
    ~ConfusionMatrix() = default;

    void AddPrediction(int true_label, int predicted_label);
    void PrintEvaluation(std::ostream& out = std::cout) const;

    int GetCount(int true_label, int predicted_label) const;
    int GetTotal() const;
    const std::vector<int>& classes() const { return _classes; }
    const MatrixXi& counts() const { return _counts; }

    double error_rate() const;
    // per class, one-vs-rest; 0 when the denominator is empty
    double precision(int label) const;
    double detection_rate(int label) const;
    double f_score(int label) const;

private:
    std::vector<int> _classes;
    MatrixXi _counts;

    Index _index(int label) const;
};

}

#endif
