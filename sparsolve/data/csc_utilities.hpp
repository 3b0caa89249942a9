#pragma once

//
// ... Standard header files
//
#include <span>
#include <stdexcept>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/status.hpp>

namespace sparsolve::data::detail {

  // -- Visited markers --
  //
  // flip(i) = -(i+2) maps every index i >= 0 to a negative value and is
  // its own inverse, so an index array doubles as a visited set without
  // losing the stored index.

  inline config::size_type
  flip(config::size_type i) {
    return -(i + 2);
  }

  inline config::size_type
  unflip(config::size_type i) {
    return i < 0 ? flip(i) : i;
  }

  inline bool
  marked(std::span<config::size_type const> w, config::size_type j) {
    return w[static_cast<std::size_t>(j)] < 0;
  }

  inline void
  mark(std::span<config::size_type> w, config::size_type j) {
    w[static_cast<std::size_t>(j)] = flip(w[static_cast<std::size_t>(j)]);
  }

  // Exclusive prefix sum: out[0..n] with out[n] the total, where
  // n = counts.size(). counts[i] is overwritten with out[i], so the
  // counts become a fresh insertion cursor per column. Returns the total.
  config::size_type
  cumulative_sum(std::span<config::size_type> out,
                 std::span<config::size_type> counts);

  // Pattern of the transpose (rows become columns). Row indices of the
  // result are sorted within each column.
  Compressed_column_sparsity
  transpose_pattern(Compressed_column_sparsity const& sp);

  // Iterative depth-first search in the graph of G starting at node j.
  //
  // marks holds a copy of G's column pointers (length n+1); a node is
  // visited once its entry has been flipped. Finished nodes are pushed
  // onto xi[--top], so on return xi[top..] holds them in topological
  // order. xi[0..] doubles as the node stack and pstack[0..] holds the
  // resume position of each stacked node. When pinv is non-empty, node j
  // is expanded through column pinv[j]; a negative pinv[j] has no
  // outgoing edges. Returns the new top.
  config::size_type
  depth_first_search(config::size_type j,
                     Compressed_column_sparsity const& G,
                     std::span<config::size_type> marks,
                     config::size_type top,
                     std::span<config::size_type> xi,
                     std::span<config::size_type> pstack,
                     std::span<config::size_type const> pinv = {});

  // Nonzero pattern of x = G \ B(:,k), in topological order.
  std::vector<config::size_type>
  reach(Compressed_column_sparsity const& G,
        Compressed_column_sparsity const& B,
        config::size_type k,
        std::span<config::size_type const> pinv = {});

  // Result of a sparse right-hand-side triangular solve: the pattern of
  // x in topological order, and x itself (dense, zero off the pattern).
  template <typename T>
  struct Sparse_solution {
    std::vector<config::size_type> pattern;
    std::vector<T> x;
  };

  // Solve G*x = B(:,k) touching only the entries that can become nonzero.
  //
  // G is square and triangular; the diagonal of the column that node j
  // maps to is the entry whose row is j, wherever it sits in the column.
  // A missing or zero diagonal gives singular_matrix.
  template <typename T>
  Result<Sparse_solution<T>>
  sparse_triangular_solve(Compressed_column_matrix<T> const& G,
                          Compressed_column_matrix<T> const& B,
                          config::size_type k,
                          bool lower,
                          std::span<config::size_type const> pinv = {}) {
    auto n = G.shape().column();
    if (!G.shape().is_square() || B.shape().row() != n) {
      throw std::invalid_argument(
          "sparse_triangular_solve: dimensions do not match");
    }

    auto gp = G.col_ptr();
    auto gi = G.row_ind();
    auto gx = G.values();
    auto bp = B.col_ptr();
    auto bi = B.row_ind();
    auto bx = B.values();

    Sparse_solution<T> result{reach(G.sparsity(), B.sparsity(), k, pinv),
                              std::vector<T>(static_cast<std::size_t>(n), T{0})};
    auto& x = result.x;

    for (auto p = bp[k]; p < bp[k + 1]; ++p) {
      x[static_cast<std::size_t>(bi[p])] = bx[p];
    }

    for (auto j : result.pattern) {
      auto J = pinv.empty() ? j : pinv[static_cast<std::size_t>(j)];
      if (J < 0) { continue; }

      auto p1 = gp[J];
      auto p2 = gp[J + 1];

      // Lower factors keep the diagonal near the front, upper near the back.
      auto diag_pos = lower ? p1 : p2 - 1;
      if (lower) {
        while (diag_pos < p2 && gi[diag_pos] != j) { ++diag_pos; }
      } else {
        while (diag_pos >= p1 && gi[diag_pos] != j) { --diag_pos; }
      }
      if (diag_pos < p1 || diag_pos >= p2 || gx[diag_pos] == T{0}) {
        return Status::singular_matrix;
      }

      auto uj = static_cast<std::size_t>(j);
      x[uj] /= gx[diag_pos];
      for (auto p = p1; p < p2; ++p) {
        if (p == diag_pos) { continue; }
        x[static_cast<std::size_t>(gi[p])] -= gx[p] * x[uj];
      }
    }

    return result;
  }

} // end of namespace sparsolve::data::detail
