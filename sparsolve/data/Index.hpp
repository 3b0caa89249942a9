#pragma once

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/import.hpp>

namespace sparsolve::data::detail {

  // Position of a stored entry. Negative coordinates throw logic_error.
  class Index final {
  public:
    using size_type = config::size_type;

    Index(size_type row, size_type column);

    size_type
    row() const {
      return row_;
    }

    size_type
    column() const {
      return column_;
    }

    friend bool
    operator==(Index const&, Index const&) = default;

  private:
    size_type row_;
    size_type column_;

  }; // end of class Index

  // Order of storage in a CSC pattern: by column, then by row.
  bool
  column_major_less(Index const& a, Index const& b);

} // namespace sparsolve::data::detail
