#include <sparsolve/data/Shape.hpp>

//
// ... Standard header files
//
#include <string>

namespace sparsolve::data::detail {

  Shape::Shape(size_type rows, size_type columns)
      : rows_(rows), columns_(columns) {
    if (rows < 0 || columns < 0) {
      throw logic_error("negative matrix shape " + std::to_string(rows) + "x" +
                        std::to_string(columns));
    }
  }

  void
  to_json(json& j, Shape const& shape) {
    j = json::array({shape.row(), shape.column()});
  }

  void
  from_json(json const& j, Shape& shape) {
    if (!j.is_array() || j.size() != 2) {
      throw invalid_argument("shape must be a [rows, columns] array");
    }
    shape = Shape{j[0].get<size_type>(), j[1].get<size_type>()};
  }

} // end of namespace sparsolve::data::detail
