#ifndef KRIDGE_CSV_IO_H
#define KRIDGE_CSV_IO_H

#include <Eigen/Dense>
#include <string>

namespace kridge {

using namespace Eigen;

// Comma separated numeric rows, all of the same width. Throws std::runtime_error.
MatrixXd load_matrix(const std::string& path, bool has_header = false);

// One label per line, or "Id,Prediction" pairs (the last column is the label).
VectorXi load_labels(const std::string& path, bool has_header = false);

// "Id,Prediction" header, ids start at 1
void save_predictions(const std::string& path, const VectorXi& labels);
void save_predictions(const std::string& path, const VectorXd& values);

}

#endif
