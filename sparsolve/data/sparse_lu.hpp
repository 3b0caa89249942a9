#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/permutation.hpp>
#include <sparsolve/data/status.hpp>

namespace sparsolve::data::detail {

  // Configuration for sparse_lu.
  //
  // pivot_tolerance in [0, 1]: 1 disables pivoting; below 1 the diagonal
  // candidate is kept only while |x_kk| >= (1 - pivot_tolerance) * max|x_ik|,
  // so 0 is plain partial pivoting.
  //
  // capacity bounds the entries of each factor; 0 selects
  // 10 * nnz(A) + n. A NaN tolerance or a negative capacity throws.

  struct Lu_options {
    config::value_type pivot_tolerance{0};
    config::size_type capacity{0};
  };

  // LU factors: P*A = L*U.
  //
  // L: unit lower triangular, diagonal stored first in each column.
  // U: upper triangular, rows ascending, diagonal last in each column.
  // perm[k] = original row of A at position k; pinv is its inverse.

  template <typename T>
  struct Lu_factors {
    Compressed_column_matrix<T> L;
    Compressed_column_matrix<T> U;
    std::vector<config::size_type> perm;
    std::vector<config::size_type> pinv;
  };

  // Default step observer for sparse_lu: ignores every step.

  struct Lu_no_observer {
    void
    operator()(config::size_type,
               std::span<config::size_type const>,
               std::span<config::size_type const>) const {}
  };

  // Left-looking sparse LU with optional partial pivoting.
  //
  // Column k of A is scattered (through pinv) into a dense workspace and
  // solved against the finished columns of L. A pivot row is chosen among
  // positions >= k; swapping it into position k updates perm, pinv, the
  // workspace and every row reference already stored in L. Ties go to the
  // first row of maximal magnitude, so repeated runs are bit-identical.
  //
  // Each column costs O(n) for the dense workspace on top of the
  // O(nnz(L) + nnz(U)) factor work.
  //
  // Status::singular_matrix on an exactly zero pivot;
  // Status::capacity_exceeded when a factor outgrows options.capacity;
  // Status::dimension_mismatch for non-square A.
  // Throws std::invalid_argument for a pivot tolerance outside [0, 1] or
  // a negative capacity.
  //
  // observe(k, perm, pinv) runs once the pivot of column k is in place.

  template <typename T, typename Observer = Lu_no_observer>
  Result<Lu_factors<T>>
  sparse_lu(Compressed_column_matrix<T> const& A,
            Lu_options const& options = {},
            Observer observe = {}) {
    using size_type = config::size_type;

    if (!(options.pivot_tolerance >= 0 && options.pivot_tolerance <= 1)) {
      throw std::invalid_argument("sparse_lu: pivot tolerance outside [0, 1]");
    }
    if (options.capacity < 0) {
      throw std::invalid_argument("sparse_lu: negative capacity");
    }
    if (!A.shape().is_square()) { return Status::dimension_mismatch; }

    auto n = A.shape().column();
    auto un = static_cast<std::size_t>(n);
    auto ap = A.col_ptr();
    auto ai = A.row_ind();
    auto ax = A.values();

    auto capacity = static_cast<std::int64_t>(options.capacity);
    if (capacity == 0) {
      capacity = std::int64_t{10} * A.size() + n;
    }

    std::vector<size_type> l_ptr(un + 1, 0);
    std::vector<size_type> u_ptr(un + 1, 0);
    std::vector<size_type> l_ind;
    std::vector<size_type> u_ind;
    std::vector<T> l_val;
    std::vector<T> u_val;
    l_ind.reserve(static_cast<std::size_t>(std::min<std::int64_t>(capacity, n * std::int64_t{n})));
    l_val.reserve(l_ind.capacity());
    u_ind.reserve(l_ind.capacity());
    u_val.reserve(l_ind.capacity());

    auto perm = identity_permutation(n);
    auto pinv = identity_permutation(n);

    auto pivoting = options.pivot_tolerance < 1;
    auto threshold = T{1} - static_cast<T>(options.pivot_tolerance);

    std::vector<T> x(un);

    for (size_type k = 0; k < n; ++k) {
      auto uk = static_cast<std::size_t>(k);
      l_ptr[uk] = static_cast<size_type>(l_ind.size());
      u_ptr[uk] = static_cast<size_type>(u_ind.size());

      // 1. Scatter the permuted column: x = P * A(:,k)
      std::fill(x.begin(), x.end(), T{0});
      for (auto p = ap[k]; p < ap[k + 1]; ++p) {
        x[static_cast<std::size_t>(pinv[static_cast<std::size_t>(ai[p])])] = ax[p];
      }

      // 2. Solve L(:,0:k-1) against x in place (unit diagonal)
      for (size_type j = 0; j < k; ++j) {
        auto xj = x[static_cast<std::size_t>(j)];
        if (xj == T{0}) { continue; }
        auto uj = static_cast<std::size_t>(j);
        for (auto p = l_ptr[uj] + 1; p < l_ptr[uj + 1]; ++p) {
          x[static_cast<std::size_t>(l_ind[static_cast<std::size_t>(p)])] -=
            l_val[static_cast<std::size_t>(p)] * xj;
        }
      }

      // 3. Choose the pivot row
      auto pivot_row = k;
      if (pivoting) {
        auto max_row = k;
        auto max_abs = std::abs(x[uk]);
        for (auto i = k + 1; i < n; ++i) {
          auto xi = std::abs(x[static_cast<std::size_t>(i)]);
          if (xi > max_abs) {
            max_abs = xi;
            max_row = i;
          }
        }
        auto diag_abs = std::abs(x[uk]);
        if (!(diag_abs > T{0} && diag_abs >= threshold * max_abs)) {
          pivot_row = max_row;
        }
      }

      // 4. Move the pivot row into position k
      if (pivot_row != k) {
        swap_positions(perm, pinv, k, pivot_row);
        std::swap(x[uk], x[static_cast<std::size_t>(pivot_row)]);
        for (auto& row : l_ind) {
          if (row == k) {
            row = pivot_row;
          } else if (row == pivot_row) {
            row = k;
          }
        }
      }

      observe(k,
              std::span<size_type const>{perm},
              std::span<size_type const>{pinv});

      auto ukk = x[uk];
      if (ukk == T{0}) { return Status::singular_matrix; }

      // 5. U(0:k,k) = x(0:k)
      auto u_count = std::count_if(
        x.begin(), x.begin() + k + 1, [](T v) { return v != T{0}; });
      if (static_cast<std::int64_t>(u_ind.size()) + u_count > capacity) {
        return Status::capacity_exceeded;
      }
      for (size_type i = 0; i <= k; ++i) {
        auto xi = x[static_cast<std::size_t>(i)];
        if (xi != T{0}) {
          u_ind.push_back(i);
          u_val.push_back(xi);
        }
      }

      // 6. L(k:n-1,k) = [1, x(k+1:n-1) / x(k)]
      auto l_count = 1 + std::count_if(
        x.begin() + k + 1, x.end(), [](T v) { return v != T{0}; });
      if (static_cast<std::int64_t>(l_ind.size()) + l_count > capacity) {
        return Status::capacity_exceeded;
      }
      l_ind.push_back(k);
      l_val.push_back(T{1});
      for (auto i = k + 1; i < n; ++i) {
        auto xi = x[static_cast<std::size_t>(i)];
        if (xi != T{0}) {
          l_ind.push_back(i);
          l_val.push_back(xi / ukk);
        }
      }
    }

    l_ptr[un] = static_cast<size_type>(l_ind.size());
    u_ptr[un] = static_cast<size_type>(u_ind.size());

    Shape shape{n, n};
    return Lu_factors<T>{
      Compressed_column_matrix<T>{
        shape, std::move(l_ptr), std::move(l_ind), std::move(l_val)},
      Compressed_column_matrix<T>{
        shape, std::move(u_ptr), std::move(u_ind), std::move(u_val)},
      std::move(perm),
      std::move(pinv)};
  }

} // end of namespace sparsolve::data::detail
