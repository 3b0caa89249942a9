#pragma once

//
// ... Standard header files
//
#include <algorithm>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/Compressed_column_sparsity.hpp>
#include <sparsolve/data/Entry.hpp>

namespace sparsolve::data::detail {

  template<typename T = config::value_type>
  class Compressed_column_matrix final
  {
  public:
    using size_type = config::size_type;
    using value_type = T;

    Compressed_column_matrix(
      Compressed_column_sparsity sparsity,
      std::vector<T> values)
      : sparsity_(std::move(sparsity))
      , values_(std::move(values))
    {
      check_values();
    }

    Compressed_column_matrix(
      Compressed_column_sparsity sparsity,
      std::initializer_list<T> const& values)
      : sparsity_(std::move(sparsity))
      , values_(values)
    {
      check_values();
    }

    // The CSC triple as produced by an external assembler. Row indices
    // within a column are kept in the given order.
    Compressed_column_matrix(
      Shape shape,
      std::vector<size_type> col_ptr,
      std::vector<size_type> row_ind,
      std::vector<T> values)
      : sparsity_(shape, std::move(col_ptr), std::move(row_ind))
      , values_(std::move(values))
    {
      check_values();
    }

    template<typename F>
    Compressed_column_matrix(Compressed_column_sparsity sparsity, F f)
      : sparsity_(std::move(sparsity))
    {
      auto cp = sparsity_.col_ptr();
      auto ri = sparsity_.row_ind();
      values_.resize(static_cast<std::size_t>(sparsity_.size()));

      for (size_type col = 0; col < sparsity_.shape().column(); ++col) {
        for (auto j = cp[col]; j < cp[col + 1]; ++j) {
          values_[static_cast<std::size_t>(j)] = f(ri[j], col);
        }
      }
    }

    Compressed_column_matrix(
      Shape shape,
      std::initializer_list<Entry<T>> const& input)
      : Compressed_column_matrix(from_entries(shape, input.begin(), input.end()))
    {}

    Compressed_column_matrix(
      Shape shape,
      std::vector<Entry<T>> const& input)
      : Compressed_column_matrix(from_entries(shape, input.begin(), input.end()))
    {}

    size_type
    size() const
    {
      return sparsity_.size();
    }

    Shape
    shape() const
    {
      return sparsity_.shape();
    }

    std::span<size_type const>
    col_ptr() const
    {
      return sparsity_.col_ptr();
    }

    std::span<size_type const>
    row_ind() const
    {
      return sparsity_.row_ind();
    }

    std::span<T const>
    values() const
    {
      return {values_.data(), values_.size()};
    }

    // Rows may be unsorted within a column, so the column is scanned.
    T
    operator()(size_type row, size_type col) const
    {
      auto cp = sparsity_.col_ptr();
      auto ri = sparsity_.row_ind();
      for (auto p = cp[col]; p < cp[col + 1]; ++p) {
        if (ri[p] == row) { return values_[static_cast<std::size_t>(p)]; }
      }
      return T{0};
    }

    Compressed_column_sparsity const&
    sparsity() const
    {
      return sparsity_;
    }

  private:

    void
    check_values() const
    {
      if (static_cast<size_type>(values_.size()) != sparsity_.size()) {
        throw invalid_argument(
          "value array length does not match the sparsity pattern");
      }
    }

    template<typename Iter>
    static
    Compressed_column_matrix
    from_entries(Shape shape, Iter first, Iter last)
    {
      std::vector<Entry<T>> sorted(first, last);

      std::stable_sort(
        sorted.begin(), sorted.end(),
        [](Entry<T> const& a, Entry<T> const& b) {
          return column_major_less(a, b);
        });

      auto same_index = [](auto const& a, auto const& b) {
        return a.index == b.index;
      };
      sorted.erase(
        std::unique(sorted.begin(), sorted.end(), same_index),
        sorted.end());

      std::vector<Index> indices;
      std::vector<T> values;
      indices.reserve(sorted.size());
      values.reserve(sorted.size());

      for (auto const& entry : sorted) {
        indices.push_back(entry.index);
        values.push_back(entry.value);
      }

      return Compressed_column_matrix{
        Compressed_column_sparsity{shape, indices.begin(), indices.end()},
        std::move(values)};
    }

    Compressed_column_sparsity sparsity_;
    std::vector<T> values_;

  }; // end of class Compressed_column_matrix

} // end of namespace sparsolve::data::detail
