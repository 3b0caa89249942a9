#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <span>
#include <utility>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>

namespace sparsolve::data::detail {

  // y = A*x, column by column; columns with x[j] == 0 are skipped.
  template<typename T>
  std::vector<T>
  multiply(Compressed_column_matrix<T> const& A, std::span<T const> x)
  {
    auto rows = A.shape().row();
    auto cols = A.shape().column();
    auto cp = A.col_ptr();
    auto ri = A.row_ind();
    auto vals = A.values();

    std::vector<T> y(static_cast<std::size_t>(rows), T{0});
    for (config::size_type j = 0; j < cols; ++j) {
      auto xj = x[static_cast<std::size_t>(j)];
      if (xj == T{0}) { continue; }
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        y[static_cast<std::size_t>(ri[p])] += vals[p] * xj;
      }
    }
    return y;
  }

  // y = A^T*x
  template<typename T>
  std::vector<T>
  multiply_transpose(Compressed_column_matrix<T> const& A, std::span<T const> x)
  {
    auto cols = A.shape().column();
    auto cp = A.col_ptr();
    auto ri = A.row_ind();
    auto vals = A.values();

    std::vector<T> y(static_cast<std::size_t>(cols), T{0});
    for (config::size_type j = 0; j < cols; ++j) {
      T sum{0};
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        sum += vals[p] * x[static_cast<std::size_t>(ri[p])];
      }
      y[static_cast<std::size_t>(j)] = sum;
    }
    return y;
  }

  // Counting-sort transpose. Rows of the result come out ascending within
  // each column whatever the row order of A.
  template<typename T>
  Compressed_column_matrix<T>
  transpose(Compressed_column_matrix<T> const& A)
  {
    using size_type = config::size_type;
    auto rows = A.shape().row();
    auto cols = A.shape().column();
    auto cp = A.col_ptr();
    auto ri = A.row_ind();
    auto vals = A.values();
    auto um = static_cast<std::size_t>(rows);

    std::vector<size_type> count(um + 1, 0);
    for (auto row : ri) {
      ++count[static_cast<std::size_t>(row) + 1];
    }
    for (std::size_t i = 0; i < um; ++i) {
      count[i + 1] += count[i];
    }

    std::vector<size_type> t_ptr(count);
    std::vector<size_type> t_ind(static_cast<std::size_t>(A.size()));
    std::vector<T> t_val(static_cast<std::size_t>(A.size()));

    for (size_type j = 0; j < cols; ++j) {
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        auto q = static_cast<std::size_t>(count[static_cast<std::size_t>(ri[p])]++);
        t_ind[q] = j;
        t_val[q] = vals[p];
      }
    }

    return Compressed_column_matrix<T>{
      Shape{cols, rows}, std::move(t_ptr), std::move(t_ind), std::move(t_val)};
  }

  // C = A*B, one column of C at a time (Gustavson): column j of C is the
  // combination of the columns of A selected by column j of B.
  template<typename T>
  Compressed_column_matrix<T>
  multiply(
    Compressed_column_matrix<T> const& A,
    Compressed_column_matrix<T> const& B)
  {
    using size_type = config::size_type;
    if (A.shape().column() != B.shape().row()) {
      throw invalid_argument("multiply: inner dimensions do not match");
    }

    auto a_rows = A.shape().row();
    auto b_cols = B.shape().column();
    auto a_cp = A.col_ptr();
    auto a_ri = A.row_ind();
    auto a_vals = A.values();
    auto b_cp = B.col_ptr();
    auto b_ri = B.row_ind();
    auto b_vals = B.values();

    auto m = static_cast<std::size_t>(a_rows);
    std::vector<T> w(m, T{0});
    std::vector<bool> occupied(m, false);

    std::vector<size_type> c_ptr(static_cast<std::size_t>(b_cols) + 1, 0);
    std::vector<size_type> c_ind;
    std::vector<T> c_val;
    std::vector<size_type> row_list;

    for (size_type j = 0; j < b_cols; ++j) {
      row_list.clear();

      for (auto pb = b_cp[j]; pb < b_cp[j + 1]; ++pb) {
        auto k = b_ri[pb];
        auto b_kj = b_vals[pb];
        for (auto pa = a_cp[k]; pa < a_cp[k + 1]; ++pa) {
          auto row = static_cast<std::size_t>(a_ri[pa]);
          if (!occupied[row]) {
            occupied[row] = true;
            row_list.push_back(a_ri[pa]);
          }
          w[row] += a_vals[pa] * b_kj;
        }
      }

      std::sort(row_list.begin(), row_list.end());

      for (auto row : row_list) {
        auto ur = static_cast<std::size_t>(row);
        c_ind.push_back(row);
        c_val.push_back(w[ur]);
        w[ur] = T{0};
        occupied[ur] = false;
      }
      c_ptr[static_cast<std::size_t>(j) + 1] = static_cast<size_type>(c_ind.size());
    }

    return Compressed_column_matrix<T>{
      Shape{a_rows, b_cols}, std::move(c_ptr), std::move(c_ind), std::move(c_val)};
  }

  // Row-major dense copy of A; duplicate entries are summed.
  template<typename T>
  std::vector<T>
  to_dense(Compressed_column_matrix<T> const& A)
  {
    auto rows = A.shape().row();
    auto cols = A.shape().column();
    auto cp = A.col_ptr();
    auto ri = A.row_ind();
    auto vals = A.values();
    auto uc = static_cast<std::size_t>(cols);

    std::vector<T> dense(static_cast<std::size_t>(rows) * uc, T{0});
    for (config::size_type j = 0; j < cols; ++j) {
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        dense[static_cast<std::size_t>(ri[p]) * uc + static_cast<std::size_t>(j)] += vals[p];
      }
    }
    return dense;
  }

} // end of namespace sparsolve::data::detail
