/// @file src/linalg/matrix_inverse.cpp
/// @brief Gauss-Jordan and LLT inversion.

#include "qsae/linalg.hpp"

#include <Eigen/Cholesky>
#include <algorithm>
#include <cmath>
#include <utility>

namespace qsae::linalg {

std::optional<Matrix> gauss_jordan_inverse(const Matrix& a, double pivot_epsilon) {
    if (a.rows() != a.cols()) return std::nullopt;

    const Eigen::Index n = a.rows();

    // Augmented [A | I], reduced in place to [I | A⁻¹].
    Matrix aug(n, 2 * n);
    aug.leftCols(n)  = a;
    aug.rightCols(n) = Matrix::Identity(n, n);

    for (Eigen::Index col = 0; col < n; ++col) {
        Eigen::Index pivot_row = col;
        aug.col(col).segment(col, n - col).cwiseAbs().maxCoeff(&pivot_row);
        pivot_row += col;

        const double pivot = aug(pivot_row, col);
        if (!std::isfinite(pivot) || std::abs(pivot) < pivot_epsilon) {
            return std::nullopt;
        }
        if (pivot_row != col) aug.row(col).swap(aug.row(pivot_row));

        aug.row(col) /= pivot;
        for (Eigen::Index r = 0; r < n; ++r) {
            if (r == col) continue;
            const double factor = aug(r, col);
            if (factor != 0.0) aug.row(r) -= factor * aug.row(col);
        }
    }
    return Matrix(aug.rightCols(n));
}

std::optional<Matrix> cholesky_inverse(const Matrix& a) {
    if (a.rows() != a.cols()) return std::nullopt;
    if (a.rows() == 0) return Matrix(0, 0);

    Eigen::LLT<Matrix> llt(a);
    if (llt.info() != Eigen::Success) return std::nullopt;

    Matrix inv = llt.solve(Matrix::Identity(a.rows(), a.cols()));
    if (!inv.allFinite()) return std::nullopt;
    return inv;
}

std::optional<Matrix> invert(const Matrix& a, InversionMethod method) {
    switch (method) {
        case InversionMethod::Cholesky:    return cholesky_inverse(a);
        case InversionMethod::GaussJordan: break;
    }
    return gauss_jordan_inverse(a);
}

Inversion invert_or_identity(const Matrix& a, InversionMethod method) {
    if (auto inv = invert(a, method)) {
        return Inversion{std::move(*inv), false};
    }
    const Eigen::Index n = std::max(a.rows(), a.cols());
    return Inversion{Matrix::Identity(n, n), true};
}

}  // namespace qsae::linalg
