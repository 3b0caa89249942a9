#pragma once

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/import.hpp>

namespace sparsolve::data::detail {

  // Matrix dimensions. Zero rows or columns are allowed, so 0x0 and 1x1
  // systems are ordinary inputs; negative dimensions throw logic_error.
  // JSON form is [rows, columns].
  class Shape final {
  public:
    using size_type = config::size_type;

    Shape() = default;
    Shape(size_type rows, size_type columns);

    size_type
    row() const {
      return rows_;
    }

    size_type
    column() const {
      return columns_;
    }

    bool
    is_square() const {
      return rows_ == columns_;
    }

    friend bool
    operator==(Shape const&, Shape const&) = default;

  private:
    size_type rows_{0};
    size_type columns_{0};

  }; // end of class Shape

  void
  to_json(json& j, Shape const& shape);

  void
  from_json(json const& j, Shape& shape);

} // namespace sparsolve::data::detail
