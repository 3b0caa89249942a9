#pragma once

//
// ... Standard header files
//
#include <optional>
#include <string>
#include <utility>

//
// ... sparsolve header files
//
#include <sparsolve/data/import.hpp>

namespace sparsolve::data::detail {

  // Outcome of a factorization or solve.
  //
  // Numeric failures are reported through these values rather than
  // exceptions; none of them is retried internally. Recovering from
  // singular_matrix or not_positive_definite (regularization, a different
  // pivot tolerance) is up to the caller, who must re-run the
  // factorization from scratch.

  enum class Status {
    success,
    singular_matrix,
    not_positive_definite,
    dimension_mismatch,
    capacity_exceeded
  };

  std::string
  to_string(Status status);

  NLOHMANN_JSON_SERIALIZE_ENUM(
    Status,
    {{Status::success, "success"},
     {Status::singular_matrix, "singular_matrix"},
     {Status::not_positive_definite, "not_positive_definite"},
     {Status::dimension_mismatch, "dimension_mismatch"},
     {Status::capacity_exceeded, "capacity_exceeded"}})

  // Either a value or the Status explaining why there is none.

  template <typename V>
  class Result final {
  public:
    using value_type = V;

    Result(V value)
        : status_(Status::success), value_(std::move(value)) {}

    Result(Status status) : status_(status) {
      if (status == Status::success) {
        throw logic_error("a successful result requires a value");
      }
    }

    bool
    ok() const {
      return status_ == Status::success;
    }

    explicit
    operator bool() const {
      return ok();
    }

    Status
    status() const {
      return status_;
    }

    V const&
    value() const& {
      check();
      return *value_;
    }

    V&
    value() & {
      check();
      return *value_;
    }

    V&&
    value() && {
      check();
      return std::move(*value_);
    }

  private:
    void
    check() const {
      if (!value_) {
        throw logic_error("no value in failed result: " + to_string(status_));
      }
    }

    Status status_;
    std::optional<V> value_;

  }; // end of class Result

} // end of namespace sparsolve::data::detail
