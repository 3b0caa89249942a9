#include <sparsolve/data/status.hpp>

namespace sparsolve::data::detail {

  std::string
  to_string(Status status)
  {
    switch (status) {
    case Status::success:
      return "success";
    case Status::singular_matrix:
      return "singular matrix";
    case Status::not_positive_definite:
      return "matrix is not positive definite";
    case Status::dimension_mismatch:
      return "dimension mismatch";
    case Status::capacity_exceeded:
      return "factor storage capacity exceeded";
    }
    return "unknown status";
  }

} // end of namespace sparsolve::data::detail
