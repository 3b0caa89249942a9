#pragma once

//
// ... Standard header files
//
#include <utility>
#include <vector>

//
// ... External header files
//
#include <nlohmann/json.hpp>

//
// ... sparsolve header files
//
#include <sparsolve/config.hpp>
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/Compressed_column_sparsity.hpp>
#include <sparsolve/data/Entry.hpp>
#include <sparsolve/data/sparse_lu.hpp>
#include <sparsolve/data/status.hpp>

// adl_serializer specializations for non-default-constructible types.
// Index has no default constructor, so get<Index>() and
// get<std::vector<Index>>() require this specialization.

namespace nlohmann {

  template <>
  struct adl_serializer<sparsolve::data::detail::Index> {
    static sparsolve::data::detail::Index
    from_json(json const& j) {
      return sparsolve::data::detail::Index{
          j.at(0).get<sparsolve::config::size_type>(),
          j.at(1).get<sparsolve::config::size_type>()};
    }

    static void
    to_json(json& j, sparsolve::data::detail::Index const& idx) {
      j = {idx.row(), idx.column()};
    }
  };

  template <typename T>
  struct adl_serializer<sparsolve::data::detail::Entry<T>> {
    static sparsolve::data::detail::Entry<T>
    from_json(json const& j) {
      return sparsolve::data::detail::Entry<T>{
          j.at("index").get<sparsolve::data::detail::Index>(),
          j.at("value").get<T>()};
    }

    static void
    to_json(json& j, sparsolve::data::detail::Entry<T> const& e) {
      j = {{"index", e.index}, {"value", e.value}};
    }
  };

} // end of namespace nlohmann

namespace sparsolve::data::detail {

  // -- Compressed_column_sparsity --
  //
  // {"shape": [m, n], "col_ptr": [...], "row_ind": [...]}
  // Arrays are read back as-is, so a malformed pattern is rejected by the
  // sparsity constructor with std::invalid_argument.

  inline nlohmann::json
  compressed_column_sparsity_to_json(Compressed_column_sparsity const& sp) {
    nlohmann::json j;
    j["shape"] = sp.shape();

    auto cp = sp.col_ptr();
    j["col_ptr"] = std::vector<config::size_type>(cp.begin(), cp.end());

    auto ri = sp.row_ind();
    j["row_ind"] = std::vector<config::size_type>(ri.begin(), ri.end());

    return j;
  }

  inline Compressed_column_sparsity
  compressed_column_sparsity_from_json(nlohmann::json const& j) {
    return Compressed_column_sparsity{
        j.at("shape").get<Shape>(),
        j.at("col_ptr").get<std::vector<config::size_type>>(),
        j.at("row_ind").get<std::vector<config::size_type>>()};
  }

  // -- Compressed_column_matrix<T> --
  //
  // The sparsity fields plus "values".

  template <typename T>
  nlohmann::json
  compressed_column_matrix_to_json(Compressed_column_matrix<T> const& A) {
    auto j = compressed_column_sparsity_to_json(A.sparsity());
    auto vals = A.values();
    j["values"] = std::vector<T>(vals.begin(), vals.end());
    return j;
  }

  template <typename T>
  Compressed_column_matrix<T>
  compressed_column_matrix_from_json(nlohmann::json const& j) {
    return Compressed_column_matrix<T>{
        compressed_column_sparsity_from_json(j),
        j.at("values").get<std::vector<T>>()};
  }

  // -- Lu_factors<T> --

  template <typename T>
  nlohmann::json
  lu_factors_to_json(Lu_factors<T> const& factors) {
    nlohmann::json j;
    j["L"] = compressed_column_matrix_to_json(factors.L);
    j["U"] = compressed_column_matrix_to_json(factors.U);
    j["perm"] = factors.perm;
    j["pinv"] = factors.pinv;
    return j;
  }

  // pinv is recomputed from perm; a perm that is not a permutation of
  // 0..n-1 throws std::invalid_argument.
  template <typename T>
  Lu_factors<T>
  lu_factors_from_json(nlohmann::json const& j) {
    auto perm = j.at("perm").get<std::vector<config::size_type>>();
    if (!is_valid_permutation(perm)) {
      throw invalid_argument("lu_factors_from_json: invalid permutation");
    }
    auto pinv = inverse_permutation(perm);
    return Lu_factors<T>{
        compressed_column_matrix_from_json<T>(j.at("L")),
        compressed_column_matrix_from_json<T>(j.at("U")),
        std::move(perm),
        std::move(pinv)};
  }

} // end of namespace sparsolve::data::detail
