//
// ... Standard header files
//
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/csc_utilities.hpp>
#include <sparsolve/data/elimination_tree.hpp>
#include <sparsolve/data/symbolic_cholesky.hpp>

namespace sparsolve::data::detail {

  using size_type = config::size_type;

  Result<Symbolic_cholesky>
  symbolic_cholesky(Compressed_column_sparsity const& lower) {
    if (!lower.shape().is_square()) { return Status::dimension_mismatch; }

    auto n = lower.shape().column();

    // The elimination tree walks the entries above the diagonal, which
    // for a lower-triangle input are found in its transpose.
    Symbolic_cholesky result;
    result.parent = elimination_tree(transpose_pattern(lower));
    result.postorder = tree_postorder(result.parent);
    result.column_counts =
      cholesky_column_counts(lower, result.parent, result.postorder);

    auto counts = result.column_counts;
    result.col_ptr.assign(static_cast<std::size_t>(n + 1), 0);
    cumulative_sum(result.col_ptr, counts);

    return result;
  }

} // end of namespace sparsolve::data::detail
