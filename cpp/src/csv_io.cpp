#include "../include/kridge_bits/csv_io.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace kridge {

namespace {

std::vector<std::vector<double>> read_rows(const std::string& path, bool has_header) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::vector<std::vector<double>> rows;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if ((has_header && line_no == 1) || line.empty()) {
            continue;
        }
        std::vector<double> row;
        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            size_t used = 0;
            double value = 0.0;
            try {
                value = std::stod(cell, &used);
            } catch (const std::logic_error&) {
                used = 0;
            }
            if (used == 0 || cell.find_first_not_of(" \t", used) != std::string::npos) {
                throw std::runtime_error(path + ":" + std::to_string(line_no) + ": not a number: '" + cell + "'");
            }
            row.push_back(value);
        }
        if (!rows.empty() && row.size() != rows.front().size()) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected "
                                     + std::to_string(rows.front().size()) + " columns, got "
                                     + std::to_string(row.size()));
        }
        rows.push_back(row);
    }
    if (in.bad()) {
        throw std::runtime_error("error while reading " + path);
    }
    return rows;
}

std::ofstream open_for_write(const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot write " + path);
    }
    out << "Id,Prediction\n";
    return out;
}

}

MatrixXd load_matrix(const std::string& path, bool has_header) {
    const auto rows = read_rows(path, has_header);
    const Index n = static_cast<Index>(rows.size());
    const Index d = rows.empty() ? 0 : static_cast<Index>(rows.front().size());
    MatrixXd x(n, d);
    for (Index i = 0; i < n; i++) {
        for (Index j = 0; j < d; j++) {
            x(i, j) = rows[i][j];
        }
    }
    return x;
}

VectorXi load_labels(const std::string& path, bool has_header) {
    const auto rows = read_rows(path, has_header);
    VectorXi y(static_cast<Index>(rows.size()));
    for (size_t i = 0; i < rows.size(); i++) {
        if (rows[i].empty() || rows[i].size() > 2) {
            throw std::runtime_error(path + ": label rows must have one or two columns");
        }
        const double v = rows[i].back();
        if (v != std::floor(v) || std::fabs(v) > std::numeric_limits<int>::max()) {
            throw std::runtime_error(path + ": label " + std::to_string(v) + " is not an integer");
        }
        y(i) = static_cast<int>(v);
    }
    return y;
}

void save_predictions(const std::string& path, const VectorXi& labels) {
    std::ofstream out = open_for_write(path);
    for (Index i = 0; i < labels.size(); i++) {
        out << i + 1 << "," << labels(i) << "\n";
    }
    if (!out) {
        throw std::runtime_error("error while writing " + path);
    }
}

void save_predictions(const std::string& path, const VectorXd& values) {
    std::ofstream out = open_for_write(path);
    out.precision(17);
    for (Index i = 0; i < values.size(); i++) {
        out << i + 1 << "," << values(i) << "\n";
    }
    if (!out) {
        throw std::runtime_error("error while writing " + path);
    }
}

}
