#pragma once

//
// ... Standard header files
//
#include <span>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/permutation.hpp>
#include <sparsolve/data/sparse_lu.hpp>
#include <sparsolve/data/status.hpp>
#include <sparsolve/data/triangular_solve.hpp>

namespace sparsolve::data::detail {

  // Solve A*x = b with existing LU factors (P*A = L*U):
  //   b'[k] = b[perm[k]],  L*z = b',  U*x = z
  //
  // Status::dimension_mismatch when b does not match the factors;
  // Status::singular_matrix when U has a zero or missing diagonal.

  template <typename T>
  Result<std::vector<T>>
  lu_solve(Lu_factors<T> const& factors, std::span<T const> b) {
    if (b.size() != factors.perm.size()) { return Status::dimension_mismatch; }

    auto b_perm = permute<T>(factors.perm, b);

    auto z = lower_solve(factors.L, std::span<T const>{b_perm});
    if (!z) { return z.status(); }

    return upper_solve(factors.U, std::span<T const>{z.value()});
  }

  // Solve A*x = b by LU factorization of A.
  //
  // options are passed straight to sparse_lu, so the default is partial
  // pivoting. Any failure status is returned unchanged; there is no
  // retry with different options.

  template <typename T>
  Result<std::vector<T>>
  solve(Compressed_column_matrix<T> const& A,
        std::span<T const> b,
        Lu_options const& options = {}) {
    if (!A.shape().is_square()
        || static_cast<config::size_type>(b.size()) != A.shape().row()) {
      return Status::dimension_mismatch;
    }

    auto factors = sparse_lu(A, options);
    if (!factors) { return factors.status(); }

    return lu_solve(factors.value(), b);
  }

  // Solve A*x = b given the Cholesky factor L of A = L*L^T:
  //   L*z = b,  L^T*x = z

  template <typename T>
  Result<std::vector<T>>
  cholesky_solve(Compressed_column_matrix<T> const& L, std::span<T const> b) {
    auto z = lower_solve(L, b);
    if (!z) { return z.status(); }

    return lower_transpose_solve(L, std::span<T const>{z.value()});
  }

} // end of namespace sparsolve::data::detail
