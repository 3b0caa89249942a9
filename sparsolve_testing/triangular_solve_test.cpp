//
// ... Test header files
//
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <span>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/Compressed_column_matrix.hpp>
#include <sparsolve/data/matgen.hpp>
#include <sparsolve/data/numeric_cholesky.hpp>
#include <sparsolve/data/sparse_blas.hpp>
#include <sparsolve/data/triangular_solve.hpp>

namespace sparsolve::testing {

  using sparsolve::data::detail::Compressed_column_matrix;
  using sparsolve::data::detail::Entry;
  using sparsolve::data::detail::Index;
  using sparsolve::data::detail::Shape;
  using sparsolve::data::detail::Status;

  using sparsolve::data::detail::cholesky;
  using sparsolve::data::detail::lower_solve;
  using sparsolve::data::detail::lower_transpose_solve;
  using sparsolve::data::detail::lower_triangle;
  using sparsolve::data::detail::make_matrix;
  using sparsolve::data::detail::multiply;
  using sparsolve::data::detail::multiply_transpose;
  using sparsolve::data::detail::poisson_2d;
  using sparsolve::data::detail::upper_solve;

  using size_type = sparsolve::config::size_type;

  // [2 . .]
  // [1 3 .]
  // [. 4 5]
  static Compressed_column_matrix<double>
  small_lower() {
    return make_matrix<double>(
      Shape{3, 3},
      {Entry<double>{Index{0, 0}, 2.0},
       Entry<double>{Index{1, 0}, 1.0},
       Entry<double>{Index{1, 1}, 3.0},
       Entry<double>{Index{2, 1}, 4.0},
       Entry<double>{Index{2, 2}, 5.0}});
  }

  // ================================================================
  // lower_solve
  // ================================================================

  TEST_CASE("triangular_solve - lower_solve", "[triangular_solve]")
  {
    auto L = small_lower();
    std::vector<double> b{2.0, 4.0, 9.0};

    auto x = lower_solve(L, std::span<double const>{b});

    REQUIRE(x.ok());
    CHECK(x.value()[0] == Catch::Approx(1.0));
    CHECK(x.value()[1] == Catch::Approx(1.0));
    CHECK(x.value()[2] == Catch::Approx(1.0));
  }

  TEST_CASE("triangular_solve - lower_solve zero right-hand side entries", "[triangular_solve]")
  {
    auto L = small_lower();
    std::vector<double> b{0.0, 3.0, 4.0};

    auto x = lower_solve(L, std::span<double const>{b});

    REQUIRE(x.ok());
    CHECK(x.value()[0] == 0.0);
    CHECK(x.value()[1] == Catch::Approx(1.0));
    CHECK(x.value()[2] == Catch::Approx(0.0).margin(1e-15));
  }

  TEST_CASE("triangular_solve - lower_solve missing diagonal", "[triangular_solve]")
  {
    auto L = make_matrix<double>(
      Shape{2, 2},
      {Entry<double>{Index{0, 0}, 1.0}, Entry<double>{Index{1, 0}, 1.0}});
    std::vector<double> b{1.0, 1.0};

    CHECK(lower_solve(L, std::span<double const>{b}).status() ==
          Status::singular_matrix);
  }

  TEST_CASE("triangular_solve - lower_solve zero diagonal", "[triangular_solve]")
  {
    auto L = make_matrix<double>(
      Shape{2, 2},
      {Entry<double>{Index{0, 0}, 1.0}, Entry<double>{Index{1, 1}, 0.0}});
    std::vector<double> b{1.0, 0.0};

    CHECK(lower_solve(L, std::span<double const>{b}).status() ==
          Status::singular_matrix);
  }

  TEST_CASE("triangular_solve - wrong right-hand side length", "[triangular_solve]")
  {
    auto L = small_lower();
    std::vector<double> b{1.0, 2.0};
    std::span<double const> sb{b};

    CHECK(lower_solve(L, sb).status() == Status::dimension_mismatch);
    CHECK(upper_solve(L, sb).status() == Status::dimension_mismatch);
    CHECK(lower_transpose_solve(L, sb).status() == Status::dimension_mismatch);
  }

  // ================================================================
  // upper_solve
  // ================================================================

  TEST_CASE("triangular_solve - upper_solve", "[triangular_solve]")
  {
    // [2 1 .]
    // [. 3 4]
    // [. . 5]
    auto U = make_matrix<double>(
      Shape{3, 3},
      {Entry<double>{Index{0, 0}, 2.0},
       Entry<double>{Index{0, 1}, 1.0},
       Entry<double>{Index{1, 1}, 3.0},
       Entry<double>{Index{1, 2}, 4.0},
       Entry<double>{Index{2, 2}, 5.0}});
    std::vector<double> b{3.0, 7.0, 5.0};

    auto x = upper_solve(U, std::span<double const>{b});

    REQUIRE(x.ok());
    CHECK(x.value()[0] == Catch::Approx(1.0));
    CHECK(x.value()[1] == Catch::Approx(1.0));
    CHECK(x.value()[2] == Catch::Approx(1.0));
  }

  TEST_CASE("triangular_solve - upper_solve with unsorted rows", "[triangular_solve]")
  {
    // Same U as above, column 1 stored diagonal first.
    Compressed_column_matrix<double> U{
      Shape{3, 3},
      std::vector<size_type>{0, 1, 3, 5},
      std::vector<size_type>{0, 1, 0, 2, 1},
      std::vector<double>{2.0, 3.0, 1.0, 5.0, 4.0}};
    std::vector<double> b{3.0, 7.0, 5.0};

    auto x = upper_solve(U, std::span<double const>{b});

    REQUIRE(x.ok());
    CHECK(x.value()[0] == Catch::Approx(1.0));
    CHECK(x.value()[1] == Catch::Approx(1.0));
    CHECK(x.value()[2] == Catch::Approx(1.0));
  }

  TEST_CASE("triangular_solve - upper_solve missing diagonal", "[triangular_solve]")
  {
    auto U = make_matrix<double>(
      Shape{2, 2},
      {Entry<double>{Index{0, 0}, 1.0}, Entry<double>{Index{0, 1}, 1.0}});
    std::vector<double> b{1.0, 1.0};

    CHECK(upper_solve(U, std::span<double const>{b}).status() ==
          Status::singular_matrix);
  }

  // ================================================================
  // lower_transpose_solve
  // ================================================================

  TEST_CASE("triangular_solve - lower_transpose_solve", "[triangular_solve]")
  {
    auto L = small_lower();
    std::vector<double> x_true{1.0, -2.0, 0.5};
    auto b = multiply_transpose(L, std::span<double const>{x_true});

    auto x = lower_transpose_solve(L, std::span<double const>{b});

    REQUIRE(x.ok());
    for (std::size_t i = 0; i < 3; ++i) {
      CHECK(x.value()[i] == Catch::Approx(x_true[i]));
    }
  }

  TEST_CASE("triangular_solve - solves with a Cholesky factor", "[triangular_solve]")
  {
    auto A = poisson_2d<double>(5, 5);
    auto L = cholesky(lower_triangle(A));
    REQUIRE(L.ok());

    std::vector<double> x_true(25);
    for (std::size_t i = 0; i < 25; ++i) {
      x_true[i] = 1.0 + static_cast<double>(i % 4);
    }
    auto b = multiply(A, std::span<double const>{x_true});

    auto z = lower_solve(L.value(), std::span<double const>{b});
    REQUIRE(z.ok());
    auto x = lower_transpose_solve(L.value(), std::span<double const>{z.value()});
    REQUIRE(x.ok());

    for (std::size_t i = 0; i < 25; ++i) {
      CHECK(x.value()[i] == Catch::Approx(x_true[i]).epsilon(1e-12));
    }
  }

} // end of namespace sparsolve::testing
