#pragma once

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/Index.hpp>

namespace sparsolve::data::detail {

  // One (row, column, value) triplet of an assembly list. When a list
  // names the same Index twice, the first occurrence is kept.
  template <typename T = config::value_type>
  struct Entry {
    Index index;
    T value;
  };

  template <typename T>
  bool
  column_major_less(Entry<T> const& a, Entry<T> const& b) {
    return column_major_less(a.index, b.index);
  }

} // end of namespace sparsolve::data::detail
