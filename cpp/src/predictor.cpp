#include "../include/kridge_bits/predictor.hpp"
#include "../include/kridge_bits/errors.hpp"
#include "../include/kridge_bits/logging.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace kridge {

namespace {

void check_alpha(const Kernel& kernel, Index alpha_len) {
    if (alpha_len != kernel.n_samples()) {
        throw ShapeMismatchError("coefficient length " + std::to_string(alpha_len)
                                 + " does not match the number of training samples "
                                 + std::to_string(kernel.n_samples()));
    }
}

// logs at debug level every 10% of the samples
class Progress {
public:
    explicit Progress(Index total) : _total(total), _step(std::max<Index>(1, total / 10)),
                                     _start(std::chrono::steady_clock::now()) {
        KRIDGE_LOG_INFO("Predicting " << total << " samples...");
    }

    void tick(Index done) const {
        if (done % _step == 0 && done != _total) {
            KRIDGE_LOG_DEBUG("Predicted " << done << "/" << _total);
        }
    }

    void finish() const {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - _start;
        KRIDGE_LOG_INFO("Predicted " << _total << " samples in " << elapsed.count() << " seconds");
    }

private:
    Index _total;
    Index _step;
    std::chrono::steady_clock::time_point _start;
};

}

VectorXd predict_values(const Kernel& kernel, const VectorXd& alpha, const MatrixXd& x) {
    check_alpha(kernel, alpha.size());
    const Index m = x.rows();
    VectorXd y_preds(m);
    Progress progress(m);
    for (Index i = 0; i < m; i++) {
        y_preds(i) = alpha.dot(kernel.similarity(x.row(i).transpose()));
        progress.tick(i + 1);
    }
    progress.finish();
    return y_preds;
}

MatrixXd decision_scores(const Kernel& kernel, const MatrixXd& alpha, const MatrixXd& x) {
    check_alpha(kernel, alpha.cols());
    const Index m = x.rows();
    MatrixXd scores(m, alpha.rows());
    Progress progress(m);
    for (Index i = 0; i < m; i++) {
        scores.row(i) = (alpha * kernel.similarity(x.row(i).transpose())).transpose();
        progress.tick(i + 1);
    }
    progress.finish();
    return scores;
}

VectorXi argmax_rows(const MatrixXd& scores) {
    if (scores.rows() > 0 && scores.cols() == 0) {
        throw ShapeMismatchError("argmax over an empty score row");
    }
    VectorXi idx(scores.rows());
    for (Index i = 0; i < scores.rows(); i++) {
        Index best = 0;
        for (Index k = 1; k < scores.cols(); k++) {
            // strict comparison keeps the first maximum
            if (scores(i, k) > scores(i, best)) {
                best = k;
            }
        }
        idx(i) = static_cast<int>(best);
    }
    return idx;
}

}
