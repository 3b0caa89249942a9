#include <sparsolve/data/Index.hpp>

//
// ... Standard header files
//
#include <string>

namespace sparsolve::data::detail {

  Index::Index(size_type row, size_type column) : row_(row), column_(column) {
    if (row < 0 || column < 0) {
      throw logic_error("negative matrix index (" + std::to_string(row) + ", " +
                        std::to_string(column) + ")");
    }
  }

  bool
  column_major_less(Index const& a, Index const& b) {
    if (a.column() != b.column()) { return a.column() < b.column(); }
    return a.row() < b.row();
  }

} // end of namespace sparsolve::data::detail
