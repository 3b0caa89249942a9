#pragma once

//
// ... Standard header files
//
#include <iterator>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>

namespace sparsolve::data::detail {

  // -- Permutation utilities (implemented in permutation.cpp) --
  //
  // A row permutation is kept as the pair (perm, pinv): perm[k] is the
  // original row now at position k and pinv[perm[k]] == k.

  bool
  is_valid_permutation(std::span<config::size_type const> perm);

  std::vector<config::size_type>
  inverse_permutation(std::span<config::size_type const> perm);

  std::vector<config::size_type>
  identity_permutation(config::size_type n);

  // Exchange positions a and b in perm and repair pinv for both moved
  // rows, so pinv[perm[i]] == i keeps holding.
  void
  swap_positions(std::span<config::size_type> perm,
                 std::span<config::size_type> pinv,
                 config::size_type a,
                 config::size_type b);

  // -- Vector and matrix permutations (template, header-only) --

  // y[k] = b[perm[k]]
  template <typename T>
  std::vector<T>
  permute(std::span<config::size_type const> perm, std::span<T const> b) {
    std::vector<T> y(perm.size());
    for (std::size_t k = 0; k < perm.size(); ++k) {
      y[k] = b[static_cast<std::size_t>(perm[k])];
    }
    return y;
  }

  // C = P*A*Q: column k of C is column q[k] of A, and row i of A becomes
  // row pinv[i] of C. An empty pinv or q leaves that side unpermuted.
  // Row order inside each column is preserved.
  template <typename T>
  Compressed_column_matrix<T>
  permute_matrix(Compressed_column_matrix<T> const& A,
                 std::span<config::size_type const> pinv,
                 std::span<config::size_type const> q) {
    auto shape = A.shape();
    if (!pinv.empty() && (std::ssize(pinv) != shape.row() || !is_valid_permutation(pinv))) {
      throw std::invalid_argument("permute_matrix: invalid row permutation");
    }
    if (!q.empty() && (std::ssize(q) != shape.column() || !is_valid_permutation(q))) {
      throw std::invalid_argument("permute_matrix: invalid column permutation");
    }

    auto cp = A.col_ptr();
    auto ri = A.row_ind();
    auto vals = A.values();

    std::vector<config::size_type> col_ptr(cp.size(), 0);
    std::vector<config::size_type> row_ind;
    std::vector<T> values;
    row_ind.reserve(ri.size());
    values.reserve(vals.size());

    for (config::size_type k = 0; k < shape.column(); ++k) {
      auto j = q.empty() ? k : q[static_cast<std::size_t>(k)];
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        auto row = ri[p];
        row_ind.push_back(pinv.empty() ? row : pinv[static_cast<std::size_t>(row)]);
        values.push_back(vals[p]);
      }
      col_ptr[static_cast<std::size_t>(k) + 1] =
        static_cast<config::size_type>(row_ind.size());
    }

    return Compressed_column_matrix<T>{
      shape, std::move(col_ptr), std::move(row_ind), std::move(values)};
  }

  // Row permutation P*A: row perm[k] of A becomes row k. Row order inside
  // each column is preserved.
  template <typename T>
  Compressed_column_matrix<T>
  rperm(Compressed_column_matrix<T> const& A,
        std::span<config::size_type const> perm) {
    auto pinv = inverse_permutation(perm);
    return permute_matrix(A, std::span<config::size_type const>{pinv}, {});
  }

} // end of namespace sparsolve::data::detail
