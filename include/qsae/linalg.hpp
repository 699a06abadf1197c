#pragma once

/// @file include/qsae/linalg.hpp
/// @brief Dense matrix inversion for the portfolio optimizer.
///
/// Covariance matrices in the optimizer are small (tens of symbols), so a
/// straightforward O(n³) Gauss-Jordan elimination is the default.  An Eigen
/// LLT (Cholesky) path is offered behind the same contract for symmetric
/// positive-definite input.
///
/// ## Singularity Contract
/// A matrix is treated as singular when Gauss-Jordan meets a pivot with
/// |pivot| < SINGULAR_PIVOT_EPSILON after partial pivoting, or when the LLT
/// factorisation fails.  `invert_or_identity` then substitutes the identity
/// and reports the fallback; nothing here ever throws.

#include "qsae/constants.hpp"
#include "qsae/types.hpp"

#include <optional>

namespace qsae::linalg {

/// Algorithm used by `invert` / `invert_or_identity`.
enum class InversionMethod {
    GaussJordan,  ///< Partial pivoting, works for any non-singular matrix
    Cholesky,     ///< Eigen::LLT, symmetric positive-definite input only
};

/// Result of an inversion that never fails.
struct Inversion {
    Matrix inverse;
    bool   singular = false;  ///< True when `inverse` is the identity fallback
};

/// Gauss-Jordan elimination with partial (row) pivoting.
///
/// # Returns
/// `nullopt` for a non-square matrix or when a pivot magnitude falls below
/// `pivot_epsilon`.
[[nodiscard]] std::optional<Matrix>
gauss_jordan_inverse(const Matrix& a,
                     double pivot_epsilon = constants::SINGULAR_PIVOT_EPSILON);

/// Inverse through Eigen's LLT factorisation.
///
/// # Returns
/// `nullopt` for a non-square matrix or if `a` is not positive definite.
[[nodiscard]] std::optional<Matrix> cholesky_inverse(const Matrix& a);

/// Dispatch on `method`.
[[nodiscard]] std::optional<Matrix>
invert(const Matrix& a, InversionMethod method = InversionMethod::GaussJordan);

/// Invert `a`, substituting the identity when it is singular.
[[nodiscard]] Inversion
invert_or_identity(const Matrix& a,
                   InversionMethod method = InversionMethod::GaussJordan);

}  // namespace qsae::linalg
