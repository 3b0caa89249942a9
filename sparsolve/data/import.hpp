#pragma once

//
// ... Standard header files
//
#include <stdexcept>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>

namespace sparsolve::data::detail {

  using size_type = config::size_type;

  using nlohmann::json;

  using std::vector;

  using std::invalid_argument;
  using std::logic_error;

} // end of namespace sparsolve::data::detail
