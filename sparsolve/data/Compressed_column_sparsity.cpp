#include <sparsolve/data/Compressed_column_sparsity.hpp>

//
// ... Standard header files
//
#include <algorithm>
#include <string>
#include <utility>

//
// ... sparsolve header files
//
#include <sparsolve/data/csc_utilities.hpp>

namespace sparsolve::data::detail {

  Compressed_column_sparsity::Compressed_column_sparsity(
      Shape shape, std::initializer_list<Index> input)
      : Compressed_column_sparsity(shape, std::vector<Index>(input)) {}

  Compressed_column_sparsity::Compressed_column_sparsity(
      Shape shape, std::vector<Index> indices)
      : shape_(shape),
        col_ptr_(static_cast<std::size_t>(shape.column()) + 1, 0) {
    std::sort(indices.begin(), indices.end(),
              [](Index const& a, Index const& b) {
                return column_major_less(a, b);
              });
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    std::vector<size_type> counts(static_cast<std::size_t>(shape.column()), 0);
    row_ind_.reserve(indices.size());
    for (auto const& index : indices) {
      if (index.row() >= shape.row() || index.column() >= shape.column()) {
        throw invalid_argument("index (" + std::to_string(index.row()) + ", " +
                               std::to_string(index.column()) +
                               ") outside of the matrix shape");
      }
      row_ind_.push_back(index.row());
      ++counts[static_cast<std::size_t>(index.column())];
    }

    cumulative_sum(col_ptr_, counts);
  }

  Compressed_column_sparsity::Compressed_column_sparsity(
      Shape shape,
      std::vector<size_type> col_ptr,
      std::vector<size_type> row_ind)
      : shape_(shape), col_ptr_(std::move(col_ptr)),
        row_ind_(std::move(row_ind)) {
    check_arrays();
  }

  void
  Compressed_column_sparsity::check_arrays() const {
    auto ncol = shape_.column();

    if (col_ptr_.size() != static_cast<std::size_t>(ncol) + 1) {
      throw invalid_argument("column pointer array must have columns+1 entries");
    }
    if (col_ptr_.front() != 0) {
      throw invalid_argument("column pointer array must start at zero");
    }
    if (!std::is_sorted(col_ptr_.begin(), col_ptr_.end())) {
      throw invalid_argument("column pointer array must be non-decreasing");
    }
    if (static_cast<std::size_t>(col_ptr_.back()) != row_ind_.size()) {
      throw invalid_argument(
          "row index array length does not match the column pointers");
    }

    // last_seen[i] is the latest column holding row i.
    std::vector<size_type> last_seen(static_cast<std::size_t>(shape_.row()), -1);
    for (size_type c = 0; c < ncol; ++c) {
      auto p1 = col_ptr_[static_cast<std::size_t>(c)];
      auto p2 = col_ptr_[static_cast<std::size_t>(c) + 1];
      for (auto p = p1; p < p2; ++p) {
        auto row = row_ind_[static_cast<std::size_t>(p)];
        if (row < 0 || row >= shape_.row()) {
          throw invalid_argument("row index outside of the matrix shape");
        }
        auto& seen = last_seen[static_cast<std::size_t>(row)];
        if (seen == c) {
          throw invalid_argument("row " + std::to_string(row) +
                                 " repeated in column " + std::to_string(c));
        }
        seen = c;
      }
    }
  }

} // end of namespace sparsolve::data::detail
