#pragma once

//
// ... Standard header files
//
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_sparsity.hpp>
#include <sparsolve/data/status.hpp>

namespace sparsolve::data::detail {

  // Structure of the Cholesky factor, computed before any numeric work.
  //
  // col_ptr is the exclusive prefix sum of column_counts, i.e. the column
  // pointers L will have; col_ptr.back() is the exact nnz(L).

  struct Symbolic_cholesky {
    std::vector<config::size_type> parent;
    std::vector<config::size_type> postorder;
    std::vector<config::size_type> column_counts;
    std::vector<config::size_type> col_ptr;

    config::size_type
    size() const {
      return static_cast<config::size_type>(parent.size());
    }

    config::size_type
    nnz() const {
      return col_ptr.empty() ? 0 : col_ptr.back();
    }
  };

  // Analyze the lower triangle of a symmetric pattern. Non-square input
  // yields Status::dimension_mismatch.
  Result<Symbolic_cholesky>
  symbolic_cholesky(Compressed_column_sparsity const& lower);

} // end of namespace sparsolve::data::detail
