#pragma once

//
// ... Standard header files
//
#include <cmath>
#include <utility>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/status.hpp>

namespace sparsolve::data::detail {

  // Magnitude below which an entry of R is dropped when R is compressed.
  inline constexpr double qr_drop_tolerance = 1e-14;

  // Householder QR on a dense copy of A: A = Q*R, R only.
  //
  // A (m x n, m >= n) is scattered into a row-major dense array and
  // reduced column by column. For column k:
  //   alpha = -sign(a_kk) * ||A(k:m-1,k)||
  //   v     = A(k:m-1,k) - alpha * e_k
  //   A(k:m-1,j) -= (2 / v^T v) * v * (v^T A(k:m-1,j))   for j > k
  //   R(k,k) = alpha
  // A column with zero norm below the diagonal is left as is.
  //
  // R is n x n upper triangular with entries of magnitude above
  // qr_drop_tolerance, rows ascending within each column. Q is not kept,
  // so the result serves rank and conditioning checks or R^T*R normal
  // equations, not Q^T*b.
  //
  // Status::dimension_mismatch when A has fewer rows than columns.

  template <typename T>
  Result<Compressed_column_matrix<T>>
  dense_qr(Compressed_column_matrix<T> const& A) {
    using size_type = config::size_type;

    auto m = A.shape().row();
    auto n = A.shape().column();
    if (m < n) { return Status::dimension_mismatch; }

    auto cp = A.col_ptr();
    auto ri = A.row_ind();
    auto vals = A.values();

    auto un = static_cast<std::size_t>(n);
    std::vector<T> dense(static_cast<std::size_t>(m) * un, T{0});
    auto at = [&](size_type i, size_type j) -> T& {
      return dense[static_cast<std::size_t>(i) * un + static_cast<std::size_t>(j)];
    };

    for (size_type j = 0; j < n; ++j) {
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        at(ri[p], j) += vals[p];
      }
    }

    for (size_type k = 0; k < n; ++k) {
      T normx{0};
      for (auto i = k; i < m; ++i) {
        normx += at(i, k) * at(i, k);
      }
      normx = std::sqrt(normx);
      if (normx == T{0}) { continue; }

      auto alpha = at(k, k) >= T{0} ? -normx : normx;
      auto v0 = at(k, k) - alpha;

      T vtv = v0 * v0;
      for (auto i = k + 1; i < m; ++i) {
        vtv += at(i, k) * at(i, k);
      }
      if (vtv == T{0}) { continue; }
      auto beta = T{2} / vtv;

      for (auto j = k + 1; j < n; ++j) {
        T dot = v0 * at(k, j);
        for (auto i = k + 1; i < m; ++i) {
          dot += at(i, k) * at(i, j);
        }
        dot *= beta;

        at(k, j) -= dot * v0;
        for (auto i = k + 1; i < m; ++i) {
          at(i, j) -= dot * at(i, k);
        }
      }

      at(k, k) = alpha;
      for (auto i = k + 1; i < m; ++i) {
        at(i, k) = T{0};
      }
    }

    std::vector<size_type> r_ptr(un + 1, 0);
    std::vector<size_type> r_ind;
    std::vector<T> r_val;

    for (size_type j = 0; j < n; ++j) {
      r_ptr[static_cast<std::size_t>(j)] = static_cast<size_type>(r_ind.size());
      for (size_type i = 0; i <= j; ++i) {
        auto value = at(i, j);
        if (std::abs(value) > static_cast<T>(qr_drop_tolerance)) {
          r_ind.push_back(i);
          r_val.push_back(value);
        }
      }
    }
    r_ptr[un] = static_cast<size_type>(r_ind.size());

    return Compressed_column_matrix<T>{
      Shape{n, n}, std::move(r_ptr), std::move(r_ind), std::move(r_val)};
  }

} // end of namespace sparsolve::data::detail
