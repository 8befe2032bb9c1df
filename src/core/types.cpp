#include "core/types.h"
#include "core/errors.h"
#include <string>

namespace syncfield {

Matrix Matrix::from_rows(const std::vector<std::vector<double>>& rows) {
    Matrix m(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != rows.size()) {
            throw TopologyMismatchError(
                "adjacency row " + std::to_string(i) + " has " +
                std::to_string(rows[i].size()) + " entries, expected " +
                std::to_string(rows.size()));
        }
        for (size_t j = 0; j < rows.size(); ++j) {
            m.at(i, j) = rows[i][j];
        }
    }
    return m;
}

size_t Matrix::count_nonzero() const {
    size_t n = 0;
    for (size_t i = 0; i < n_; ++i) {
        for (size_t j = 0; j < n_; ++j) {
            if (i != j && at(i, j) != 0.0) n++;
        }
    }
    return n;
}

bool Matrix::is_symmetric() const {
    for (size_t i = 0; i < n_; ++i) {
        for (size_t j = i + 1; j < n_; ++j) {
            if (at(i, j) != at(j, i)) return false;
        }
    }
    return true;
}

std::vector<std::vector<double>> Matrix::to_rows() const {
    std::vector<std::vector<double>> rows(n_);
    for (size_t i = 0; i < n_; ++i) {
        rows[i].assign(row(i), row(i) + n_);
    }
    return rows;
}

} // namespace syncfield
