#ifndef KRIDGE_LABEL_BINARIZER_H
#define KRIDGE_LABEL_BINARIZER_H

#include <Eigen/Dense>
#include <vector>

namespace kridge {

using namespace Eigen;

// One-vs-all encoding of integer labels.
// Column k of the encoded matrix belongs to the k-th smallest label and holds
// pos_label where the sample has that label, neg_label elsewhere. Two classes
// still give two columns.
class LabelBinarizer {
public:
    explicit LabelBinarizer(double pos_label = 1.0, double neg_label = -1.0);

    LabelBinarizer& fit(const VectorXi& y);
    MatrixXd transform(const VectorXi& y) const;
    MatrixXd fit_transform(const VectorXi& y);

    // class rank -> label
    VectorXi inverse_transform(const VectorXi& indices) const;
    // label -> class rank, throws std::invalid_argument for unseen labels
    Index index_of(int label) const;

    const std::vector<int>& classes() const { return _classes; }
    Index n_classes() const { return static_cast<Index>(_classes.size()); }
    bool fitted() const { return !_classes.empty(); }

private:
    double _pos_label;
    double _neg_label;
    std::vector<int> _classes;
};

}

#endif
