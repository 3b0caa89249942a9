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
#include <sparsolve/data/status.hpp>

namespace sparsolve::data::detail {

  // Forward substitution: solve L*x = b where L is lower triangular CSC
  // with its diagonal stored first in each column.
  //
  // Column-by-column, left to right (cf. CSparse cs_lsolve):
  //   x = copy of b
  //   for j = 0 to n-1:
  //     x[j] /= L(j,j)
  //     for i in L.col(j) where i > j:
  //       x[i] -= L(i,j) * x[j]
  //
  // Status::singular_matrix if a column is empty, does not start with its
  // diagonal, or the diagonal is zero.

  template <typename T>
  Result<std::vector<T>>
  lower_solve(Compressed_column_matrix<T> const& L, std::span<T const> b) {
    auto n = L.shape().column();

    if (!L.shape().is_square() || static_cast<config::size_type>(b.size()) != n) {
      return Status::dimension_mismatch;
    }

    auto cp = L.col_ptr();
    auto ri = L.row_ind();
    auto vals = L.values();

    std::vector<T> x(b.begin(), b.end());

    for (config::size_type j = 0; j < n; ++j) {
      auto p1 = cp[j];
      auto p2 = cp[j + 1];
      if (p1 == p2 || ri[p1] != j || vals[p1] == T{0}) {
        return Status::singular_matrix;
      }

      auto uj = static_cast<std::size_t>(j);
      if (x[uj] == T{0}) { continue; }

      x[uj] /= vals[p1];
      for (auto p = p1 + 1; p < p2; ++p) {
        x[static_cast<std::size_t>(ri[p])] -= vals[p] * x[uj];
      }
    }

    return x;
  }

  // Backward substitution: solve U*x = b where U is upper triangular CSC.
  //
  // Row order inside a column is not assumed, so the diagonal is located
  // by scanning each column from its end:
  //   x = copy of b
  //   for j = n-1 downto 0:
  //     x[j] /= U(j,j)
  //     for i in U.col(j) where i != j:
  //       x[i] -= U(i,j) * x[j]
  //
  // Status::singular_matrix for a missing or zero diagonal.

  template <typename T>
  Result<std::vector<T>>
  upper_solve(Compressed_column_matrix<T> const& U, std::span<T const> b) {
    auto n = U.shape().column();

    if (!U.shape().is_square() || static_cast<config::size_type>(b.size()) != n) {
      return Status::dimension_mismatch;
    }

    auto cp = U.col_ptr();
    auto ri = U.row_ind();
    auto vals = U.values();

    std::vector<T> x(b.begin(), b.end());

    for (auto jj = n; jj > 0; --jj) {
      auto j = jj - 1;
      auto p1 = cp[j];
      auto p2 = cp[j + 1];

      auto diag_pos = p2 - 1;
      while (diag_pos >= p1 && ri[diag_pos] != j) { --diag_pos; }
      if (diag_pos < p1 || vals[diag_pos] == T{0}) {
        return Status::singular_matrix;
      }

      auto uj = static_cast<std::size_t>(j);
      x[uj] /= vals[diag_pos];
      for (auto p = p1; p < p2; ++p) {
        if (p == diag_pos) { continue; }
        x[static_cast<std::size_t>(ri[p])] -= vals[p] * x[uj];
      }
    }

    return x;
  }

  // Solve L^T*x = b using L (lower triangular CSC, diagonal first) without
  // forming L^T.
  //
  // Column j of L is row j of L^T, so each unknown is a dot product
  // (cf. CSparse cs_ltsolve):
  //   x = copy of b
  //   for j = n-1 downto 0:
  //     for i in L.col(j) where i > j:
  //       x[j] -= L(i,j) * x[i]
  //     x[j] /= L(j,j)

  template <typename T>
  Result<std::vector<T>>
  lower_transpose_solve(Compressed_column_matrix<T> const& L,
                        std::span<T const> b) {
    auto n = L.shape().column();

    if (!L.shape().is_square() || static_cast<config::size_type>(b.size()) != n) {
      return Status::dimension_mismatch;
    }

    auto cp = L.col_ptr();
    auto ri = L.row_ind();
    auto vals = L.values();

    std::vector<T> x(b.begin(), b.end());

    for (auto jj = n; jj > 0; --jj) {
      auto j = jj - 1;
      auto p1 = cp[j];
      auto p2 = cp[j + 1];
      if (p1 == p2 || ri[p1] != j || vals[p1] == T{0}) {
        return Status::singular_matrix;
      }

      auto uj = static_cast<std::size_t>(j);
      for (auto p = p1 + 1; p < p2; ++p) {
        x[uj] -= vals[p] * x[static_cast<std::size_t>(ri[p])];
      }
      x[uj] /= vals[p1];
    }

    return x;
  }

} // end of namespace sparsolve::data::detail
