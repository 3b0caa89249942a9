#pragma once

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/Compressed_column_sparsity.hpp>
#include <sparsolve/data/Entry.hpp>
#include <sparsolve/data/Shape.hpp>
#include <sparsolve/data/dense_qr.hpp>
#include <sparsolve/data/numeric_cholesky.hpp>
#include <sparsolve/data/sparse_lu.hpp>
#include <sparsolve/data/sparse_solve.hpp>
#include <sparsolve/data/status.hpp>
#include <sparsolve/data/symbolic_cholesky.hpp>
#include <sparsolve/data/triangular_solve.hpp>

namespace sparsolve::data {
  using ::sparsolve::data::detail::Compressed_column_matrix;
  using ::sparsolve::data::detail::Compressed_column_sparsity;
  using ::sparsolve::data::detail::Entry;
  using ::sparsolve::data::detail::Index;
  using ::sparsolve::data::detail::Shape;

  using ::sparsolve::data::detail::Lu_factors;
  using ::sparsolve::data::detail::Lu_options;
  using ::sparsolve::data::detail::Result;
  using ::sparsolve::data::detail::Status;
  using ::sparsolve::data::detail::Symbolic_cholesky;

  using ::sparsolve::data::detail::cholesky;
  using ::sparsolve::data::detail::cholesky_solve;
  using ::sparsolve::data::detail::dense_qr;
  using ::sparsolve::data::detail::lower_solve;
  using ::sparsolve::data::detail::lower_transpose_solve;
  using ::sparsolve::data::detail::lu_solve;
  using ::sparsolve::data::detail::numeric_cholesky;
  using ::sparsolve::data::detail::solve;
  using ::sparsolve::data::detail::sparse_lu;
  using ::sparsolve::data::detail::symbolic_cholesky;
  using ::sparsolve::data::detail::upper_solve;

} // end of namespace sparsolve::data
