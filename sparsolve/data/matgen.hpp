#pragma once

//
// ... Standard header files
//
#include <cmath>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/Entry.hpp>

namespace sparsolve::data::detail {

  // Build a CSC matrix from a list of (index, value) entries. The first
  // entry wins when an index repeats.
  template <typename T = config::value_type>
  Compressed_column_matrix<T>
  make_matrix(Shape shape, std::vector<Entry<T>> const& entries) {
    return Compressed_column_matrix<T>{shape, entries};
  }

  // Build an n x n diagonal matrix from a vector of diagonal values.
  template <typename T = config::value_type>
  Compressed_column_matrix<T>
  diagonal_matrix(std::vector<T> const& diag) {
    auto n = static_cast<config::size_type>(diag.size());

    std::vector<Entry<T>> entries;
    entries.reserve(diag.size());
    for (config::size_type i = 0; i < n; ++i) {
      entries.push_back(
        Entry<T>{Index{i, i}, diag[static_cast<std::size_t>(i)]});
    }

    return make_matrix(Shape{n, n}, entries);
  }

  // Build an n x n tridiagonal matrix with given sub-diagonal,
  // diagonal, and super-diagonal values.
  template <typename T = config::value_type>
  Compressed_column_matrix<T>
  tridiagonal_matrix(config::size_type n, T sub, T diag, T super) {
    std::vector<Entry<T>> entries;

    for (config::size_type i = 0; i < n; ++i) {
      if (i > 0) { entries.push_back(Entry<T>{Index{i, i - 1}, sub}); }
      entries.push_back(Entry<T>{Index{i, i}, diag});
      if (i + 1 < n) { entries.push_back(Entry<T>{Index{i, i + 1}, super}); }
    }

    return make_matrix(Shape{n, n}, entries);
  }

  // Build an n x n arrow matrix: dense first row/column plus diagonal.
  //
  // Eliminating column 0 first fills the whole trailing block, which makes
  // it the classic worst case for fill-in.
  template <typename T = config::value_type>
  Compressed_column_matrix<T>
  arrow_matrix(config::size_type n, T diag, T arrow) {
    std::vector<Entry<T>> entries;

    entries.push_back(Entry<T>{Index{0, 0}, diag});
    for (config::size_type j = 1; j < n; ++j) {
      entries.push_back(Entry<T>{Index{0, j}, arrow});
      entries.push_back(Entry<T>{Index{j, 0}, arrow});
      entries.push_back(Entry<T>{Index{j, j}, diag});
    }

    return make_matrix(Shape{n, n}, entries);
  }

  // 5-point finite-difference Laplacian on an nx x ny grid with
  // Dirichlet boundary: 4 on the diagonal, -1 between grid neighbors.
  // The result is SPD.
  template <typename T = config::value_type>
  Compressed_column_matrix<T>
  poisson_2d(config::size_type nx, config::size_type ny) {
    auto const n = nx * ny;

    std::vector<Entry<T>> entries;
    entries.reserve(static_cast<std::size_t>(5 * n));

    for (config::size_type r = 0; r < ny; ++r) {
      for (config::size_type c = 0; c < nx; ++c) {
        auto node = r * nx + c;
        if (r > 0) { entries.push_back(Entry<T>{Index{node, node - nx}, T{-1}}); }
        if (c > 0) { entries.push_back(Entry<T>{Index{node, node - 1}, T{-1}}); }
        entries.push_back(Entry<T>{Index{node, node}, T{4}});
        if (c + 1 < nx) { entries.push_back(Entry<T>{Index{node, node + 1}, T{-1}}); }
        if (r + 1 < ny) { entries.push_back(Entry<T>{Index{node, node + nx}, T{-1}}); }
      }
    }

    return make_matrix(Shape{n, n}, entries);
  }

  // Random symmetric positive definite n x n matrix.
  //
  // Each strictly-lower position is kept with probability density and
  // given a value in [-1, 1], mirrored above the diagonal. The diagonal is
  // 1 + the absolute row sum, so the matrix is strictly diagonally
  // dominant with a positive diagonal. The same seed gives the same
  // matrix.
  template <typename T = config::value_type>
  Compressed_column_matrix<T>
  random_spd_matrix(config::size_type n, double density, std::uint32_t seed) {
    std::mt19937 engine{seed};
    std::uniform_real_distribution<double> coin{0.0, 1.0};
    std::uniform_real_distribution<double> value{-1.0, 1.0};

    std::vector<Entry<T>> entries;
    std::vector<T> row_sum(static_cast<std::size_t>(n), T{0});

    for (config::size_type j = 0; j < n; ++j) {
      for (auto i = j + 1; i < n; ++i) {
        if (coin(engine) >= density) { continue; }
        auto v = static_cast<T>(value(engine));
        entries.push_back(Entry<T>{Index{i, j}, v});
        entries.push_back(Entry<T>{Index{j, i}, v});
        row_sum[static_cast<std::size_t>(i)] += std::abs(v);
        row_sum[static_cast<std::size_t>(j)] += std::abs(v);
      }
    }

    for (config::size_type i = 0; i < n; ++i) {
      entries.push_back(
        Entry<T>{Index{i, i}, T{1} + row_sum[static_cast<std::size_t>(i)]});
    }

    return make_matrix(Shape{n, n}, entries);
  }

  // Random nonsymmetric n x n matrix. The diagonal lies in [0.1, 0.2]
  // while off-diagonals lie in [-1, 1], so partial pivoting has to swap
  // rows. The same seed gives the same matrix.
  template <typename T = config::value_type>
  Compressed_column_matrix<T>
  random_sparse_matrix(config::size_type n, double density, std::uint32_t seed) {
    std::mt19937 engine{seed};
    std::uniform_real_distribution<double> coin{0.0, 1.0};
    std::uniform_real_distribution<double> value{-1.0, 1.0};

    std::vector<Entry<T>> entries;
    for (config::size_type j = 0; j < n; ++j) {
      for (config::size_type i = 0; i < n; ++i) {
        if (i == j) {
          entries.push_back(Entry<T>{Index{i, j}, static_cast<T>(0.1 + 0.1 * coin(engine))});
        } else if (coin(engine) < density) {
          entries.push_back(Entry<T>{Index{i, j}, static_cast<T>(value(engine))});
        }
      }
    }

    return make_matrix(Shape{n, n}, entries);
  }

  // Entries of A on or below the diagonal.
  template <typename T>
  Compressed_column_matrix<T>
  lower_triangle(Compressed_column_matrix<T> const& A) {
    auto cols = A.shape().column();
    auto cp = A.col_ptr();
    auto ri = A.row_ind();
    auto vals = A.values();

    std::vector<config::size_type> col_ptr{0};
    std::vector<config::size_type> row_ind;
    std::vector<T> values;

    for (config::size_type j = 0; j < cols; ++j) {
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        if (ri[p] >= j) {
          row_ind.push_back(ri[p]);
          values.push_back(vals[p]);
        }
      }
      col_ptr.push_back(static_cast<config::size_type>(row_ind.size()));
    }

    return Compressed_column_matrix<T>{
      A.shape(), std::move(col_ptr), std::move(row_ind), std::move(values)};
  }

} // end of namespace sparsolve::data::detail
