//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

//
// ... Standard header files
//
#include <span>
#include <stdexcept>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/matgen.hpp>
#include <sparsolve/data/permutation.hpp>

namespace sparsolve::testing {

  using sparsolve::data::detail::Compressed_column_matrix;
  using sparsolve::data::detail::Entry;
  using sparsolve::data::detail::Index;
  using sparsolve::data::detail::Shape;
  using sparsolve::data::detail::identity_permutation;
  using sparsolve::data::detail::inverse_permutation;
  using sparsolve::data::detail::is_valid_permutation;
  using sparsolve::data::detail::make_matrix;
  using sparsolve::data::detail::permute;
  using sparsolve::data::detail::permute_matrix;
  using sparsolve::data::detail::rperm;
  using sparsolve::data::detail::swap_positions;

  using size_type = sparsolve::config::size_type;
  using V = std::vector<size_type>;

  // ================================================================
  // is_valid_permutation
  // ================================================================

  TEST_CASE("permutation - is_valid_permutation valid", "[permutation]")
  {
    V p{2, 0, 1};
    CHECK(is_valid_permutation(p));
  }

  TEST_CASE("permutation - is_valid_permutation empty", "[permutation]")
  {
    V p{};
    CHECK(is_valid_permutation(p));
  }

  TEST_CASE("permutation - is_valid_permutation duplicate", "[permutation]")
  {
    V p{0, 0, 1};
    CHECK_FALSE(is_valid_permutation(p));
  }

  TEST_CASE("permutation - is_valid_permutation out of range", "[permutation]")
  {
    CHECK_FALSE(is_valid_permutation(V{0, 3, 1}));
    CHECK_FALSE(is_valid_permutation(V{0, -1, 1}));
  }

  // ================================================================
  // inverse / identity / swap
  // ================================================================

  TEST_CASE("permutation - inverse_permutation", "[permutation]")
  {
    V p{2, 0, 1};
    auto inv = inverse_permutation(p);
    CHECK(inv == V{1, 2, 0});
  }

  TEST_CASE("permutation - identity_permutation", "[permutation]")
  {
    CHECK(identity_permutation(4) == V{0, 1, 2, 3});
    CHECK(identity_permutation(0).empty());
  }

  TEST_CASE("permutation - swap_positions keeps the pair consistent", "[permutation]")
  {
    auto perm = identity_permutation(5);
    auto pinv = identity_permutation(5);

    swap_positions(perm, pinv, 0, 3);
    swap_positions(perm, pinv, 3, 4);
    swap_positions(perm, pinv, 1, 1);

    CHECK(perm == V{3, 1, 2, 4, 0});
    for (std::size_t i = 0; i < perm.size(); ++i) {
      CHECK(pinv[static_cast<std::size_t>(perm[i])] == static_cast<size_type>(i));
    }
    CHECK(pinv == inverse_permutation(perm));
  }

  // ================================================================
  // permute / rperm
  // ================================================================

  TEST_CASE("permutation - permute a vector", "[permutation]")
  {
    V p{2, 0, 1};
    std::vector<double> b{10.0, 20.0, 30.0};

    auto y = permute<double>(p, b);

    CHECK(y == std::vector<double>{30.0, 10.0, 20.0});
  }

  TEST_CASE("permutation - rperm moves rows", "[permutation]")
  {
    // [1 . 2]
    // [. 3 .]
    // [4 . 5]
    auto A = make_matrix<double>(
      Shape{3, 3},
      {Entry<double>{Index{0, 0}, 1.0},
       Entry<double>{Index{2, 0}, 4.0},
       Entry<double>{Index{1, 1}, 3.0},
       Entry<double>{Index{0, 2}, 2.0},
       Entry<double>{Index{2, 2}, 5.0}});

    V p{2, 0, 1};
    auto B = rperm(A, p);

    // Row k of B is row p[k] of A.
    for (size_type k = 0; k < 3; ++k) {
      for (size_type j = 0; j < 3; ++j) {
        CHECK(B(k, j) == A(p[static_cast<std::size_t>(k)], j));
      }
    }
    CHECK(B.size() == A.size());
  }

  TEST_CASE("permutation - permute_matrix moves rows and columns", "[permutation]")
  {
    auto A = make_matrix<double>(
      Shape{3, 3},
      {Entry<double>{Index{0, 0}, 1.0},
       Entry<double>{Index{2, 0}, 4.0},
       Entry<double>{Index{1, 1}, 3.0},
       Entry<double>{Index{0, 2}, 2.0},
       Entry<double>{Index{2, 2}, 5.0}});

    V pinv{1, 2, 0};
    V q{2, 0, 1};
    auto C = permute_matrix(A, pinv, q);

    // Row i of A lands in row pinv[i]; column k of C is column q[k] of A.
    for (size_type i = 0; i < 3; ++i) {
      for (size_type k = 0; k < 3; ++k) {
        CHECK(C(pinv[static_cast<std::size_t>(i)], k) ==
              A(i, q[static_cast<std::size_t>(k)]));
      }
    }
    CHECK(C.size() == A.size());

    auto columns_only = permute_matrix(A, {}, q);
    CHECK(columns_only(2, 1) == 4.0);
    CHECK(columns_only(0, 0) == 2.0);
  }

  TEST_CASE("permutation - permute_matrix rejects bad permutations", "[permutation]")
  {
    auto A = make_matrix<double>(Shape{2, 2}, {Entry<double>{Index{0, 0}, 1.0}});
    CHECK_THROWS_AS(permute_matrix(A, V{0, 0}, {}), std::invalid_argument);
    CHECK_THROWS_AS(permute_matrix(A, {}, V{0, 1, 2}), std::invalid_argument);
  }

} // end of namespace sparsolve::testing
