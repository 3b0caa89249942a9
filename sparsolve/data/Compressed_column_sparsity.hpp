#pragma once

//
// ... Standard header files
//
#include <initializer_list>
#include <span>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/Index.hpp>
#include <sparsolve/data/Shape.hpp>

namespace sparsolve::data::detail {

  /**
   * @brief Immutable compressed sparse column pattern.
   *
   * Column @c c owns @c row_ind()[col_ptr()[c] .. col_ptr()[c+1]), and a
   * row appears at most once per column. A pattern assembled from indices
   * has its rows ascending within each column. A pattern adopted from raw
   * arrays keeps the caller's row order, so kernels that read a pattern
   * must not assume sorted columns.
   */
  class Compressed_column_sparsity final {
  public:
    using size_type = config::size_type;

    /**
     * @brief Assemble from nonzero positions; repeated positions collapse.
     *
     * @throws std::invalid_argument if a position lies outside @p shape.
     */
    Compressed_column_sparsity(Shape shape, std::initializer_list<Index> input);

    template <typename Iter>
    Compressed_column_sparsity(Shape shape, Iter first, Iter last)
        : Compressed_column_sparsity(shape, std::vector<Index>(first, last)) {}

    /**
     * @brief Adopt a CSC pair produced by an external assembler.
     *
     * @throws std::invalid_argument unless @p col_ptr has
     *         shape.column()+1 entries, starts at zero, never decreases
     *         and ends at row_ind.size(), every row lies in
     *         [0, shape.row()), and no row repeats within a column.
     */
    Compressed_column_sparsity(Shape shape,
                               std::vector<size_type> col_ptr,
                               std::vector<size_type> row_ind);

    size_type
    size() const {
      return static_cast<size_type>(row_ind_.size());
    }

    Shape
    shape() const {
      return shape_;
    }

    std::span<size_type const>
    col_ptr() const {
      return col_ptr_;
    }

    std::span<size_type const>
    row_ind() const {
      return row_ind_;
    }

  private:
    Compressed_column_sparsity(Shape shape, std::vector<Index> indices);

    void
    check_arrays() const;

    Shape shape_;
    std::vector<size_type> col_ptr_;
    std::vector<size_type> row_ind_;

  }; // end of class Compressed_column_sparsity

} // end of namespace sparsolve::data::detail
