#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <cmath>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/status.hpp>
#include <sparsolve/data/symbolic_cholesky.hpp>

namespace sparsolve::data::detail {

  // Numeric Cholesky factorization A = L*L^T with storage sized by a
  // prior symbolic analysis.
  //
  // Left-looking, column by column. For column k, A(k:n-1,k) is scattered
  // into a dense workspace x; every finished column j with L(k,j) != 0
  // contributes x -= L(k:n-1,j) * L(k,j) and d -= L(k,j)^2. The columns
  // to apply are found through per-row linked lists: column j waits in
  // the list of the next row it has an entry in.
  //
  // Only the lower triangle of A is referenced. Columns of L are stored
  // diagonal first with ascending row indices.
  //
  // Status::not_positive_definite when a diagonal accumulator is <= 0;
  // Status::capacity_exceeded when the fill outgrows symbolic.nnz();
  // Status::dimension_mismatch for non-square A or a symbolic analysis of
  // a different size. Nothing is returned on failure; the caller decides
  // whether to regularize and refactor.

  template <typename T>
  Result<Compressed_column_matrix<T>>
  numeric_cholesky(Compressed_column_matrix<T> const& A,
                   Symbolic_cholesky const& symbolic) {
    using size_type = config::size_type;

    auto n = A.shape().column();
    if (!A.shape().is_square() || symbolic.size() != n) {
      return Status::dimension_mismatch;
    }

    auto ap = A.col_ptr();
    auto ai = A.row_ind();
    auto ax = A.values();

    auto un = static_cast<std::size_t>(n);
    auto capacity = symbolic.nnz();

    std::vector<size_type> l_ptr(un + 1, 0);
    std::vector<size_type> l_ind(static_cast<std::size_t>(capacity));
    std::vector<T> l_val(static_cast<std::size_t>(capacity));
    size_type lnz = 0;

    std::vector<T> x(un, T{0});
    std::vector<size_type> marker(un, -1);
    std::vector<size_type> pattern;
    pattern.reserve(un);

    // head[r]: first column waiting to update row r; next links the rest.
    // cursor[j]: position in L(:,j) of the entry in the row j waits on.
    std::vector<size_type> head(un, -1);
    std::vector<size_type> next(un, -1);
    std::vector<size_type> cursor(un, 0);

    auto link = [&](size_type j) {
      auto uj = static_cast<std::size_t>(j);
      if (cursor[uj] < l_ptr[uj + 1]) {
        auto r = static_cast<std::size_t>(l_ind[static_cast<std::size_t>(cursor[uj])]);
        next[uj] = head[r];
        head[r] = j;
      }
    };

    for (size_type k = 0; k < n; ++k) {
      auto uk = static_cast<std::size_t>(k);
      pattern.clear();
      marker[uk] = k;

      for (auto p = ap[k]; p < ap[k + 1]; ++p) {
        auto i = ai[p];
        if (i < k) { continue; }
        auto ui = static_cast<std::size_t>(i);
        x[ui] = ax[p];
        if (marker[ui] != k) {
          marker[ui] = k;
          pattern.push_back(i);
        }
      }

      T d = x[uk];
      x[uk] = T{0};

      for (auto j = head[uk]; j != -1;) {
        auto uj = static_cast<std::size_t>(j);
        auto j_next = next[uj];

        auto pos = cursor[uj];
        auto lkj = l_val[static_cast<std::size_t>(pos)];
        d -= lkj * lkj;

        for (auto q = pos + 1; q < l_ptr[uj + 1]; ++q) {
          auto i = l_ind[static_cast<std::size_t>(q)];
          auto ui = static_cast<std::size_t>(i);
          if (marker[ui] != k) {
            marker[ui] = k;
            pattern.push_back(i);
          }
          x[ui] -= l_val[static_cast<std::size_t>(q)] * lkj;
        }

        // Column j now waits on its next row, which is below k.
        ++cursor[uj];
        link(j);
        j = j_next;
      }
      head[uk] = -1;

      if (!(d > T{0})) { return Status::not_positive_definite; }

      auto column_size = static_cast<size_type>(pattern.size()) + 1;
      if (lnz + column_size > capacity) { return Status::capacity_exceeded; }

      std::sort(pattern.begin(), pattern.end());

      auto lkk = std::sqrt(d);
      l_ptr[uk] = lnz;
      l_ind[static_cast<std::size_t>(lnz)] = k;
      l_val[static_cast<std::size_t>(lnz)] = lkk;
      ++lnz;

      for (auto i : pattern) {
        auto ui = static_cast<std::size_t>(i);
        l_ind[static_cast<std::size_t>(lnz)] = i;
        l_val[static_cast<std::size_t>(lnz)] = x[ui] / lkk;
        x[ui] = T{0};
        ++lnz;
      }
      l_ptr[uk + 1] = lnz;

      cursor[uk] = l_ptr[uk] + 1;
      link(k);
    }

    l_ind.resize(static_cast<std::size_t>(lnz));
    l_val.resize(static_cast<std::size_t>(lnz));

    return Compressed_column_matrix<T>{
      Shape{n, n}, std::move(l_ptr), std::move(l_ind), std::move(l_val)};
  }

  // Convenience: combined symbolic + numeric Cholesky.
  template <typename T>
  Result<Compressed_column_matrix<T>>
  cholesky(Compressed_column_matrix<T> const& A) {
    auto symbolic = symbolic_cholesky(A.sparsity());
    if (!symbolic) { return symbolic.status(); }
    return numeric_cholesky(A, symbolic.value());
  }

} // end of namespace sparsolve::data::detail
