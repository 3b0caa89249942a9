#pragma once

//
// ... Standard header files
//
#include <span>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_sparsity.hpp>

namespace sparsolve::data::detail {

  // Elimination tree of a square pattern. Only entries above the
  // diagonal (row i < column k) are referenced; parent[j] == -1 marks a
  // root.
  std::vector<config::size_type>
  elimination_tree(Compressed_column_sparsity const& sp);

  // Postorder of a forest given by its parent array. Children are
  // visited in ascending order; no recursion.
  std::vector<config::size_type>
  tree_postorder(std::span<config::size_type const> parent);

  // Exact nonzero count of every column of the Cholesky factor L
  // (diagonal included). lower is the lower triangle of the symmetric
  // matrix; entries on or above the diagonal are ignored.
  std::vector<config::size_type>
  cholesky_column_counts(Compressed_column_sparsity const& lower,
                         std::span<config::size_type const> parent,
                         std::span<config::size_type const> post);

} // end of namespace sparsolve::data::detail
