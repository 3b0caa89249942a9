//
// ... Test header files
//
#include <catch2/catch_test_macros.hpp>

//
// ... Standard header files
//
#include <cmath>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/matgen.hpp>
#include <sparsolve/data/sparse_blas.hpp>

namespace sparsolve::testing {

  using sparsolve::data::detail::Shape;

  using sparsolve::data::detail::arrow_matrix;
  using sparsolve::data::detail::diagonal_matrix;
  using sparsolve::data::detail::lower_triangle;
  using sparsolve::data::detail::poisson_2d;
  using sparsolve::data::detail::random_sparse_matrix;
  using sparsolve::data::detail::random_spd_matrix;
  using sparsolve::data::detail::to_dense;
  using sparsolve::data::detail::transpose;
  using sparsolve::data::detail::tridiagonal_matrix;

  using size_type = sparsolve::config::size_type;

  TEST_CASE("matgen - diagonal", "[matgen]")
  {
    auto A = diagonal_matrix<double>({1.0, 2.0, 3.0});
    CHECK(A.shape() == Shape(3, 3));
    CHECK(A.size() == 3);
    CHECK(A(2, 2) == 3.0);
  }

  TEST_CASE("matgen - tridiagonal", "[matgen]")
  {
    auto A = tridiagonal_matrix<double>(4, -1.0, 2.0, -3.0);
    CHECK(A.size() == 10);
    CHECK(A(1, 0) == -1.0);
    CHECK(A(1, 1) == 2.0);
    CHECK(A(0, 1) == -3.0);
    CHECK(A(3, 0) == 0.0);
  }

  TEST_CASE("matgen - arrow", "[matgen]")
  {
    auto A = arrow_matrix<double>(5, 4.0, 1.0);
    CHECK(A.size() == 13);
    CHECK(A(0, 4) == 1.0);
    CHECK(A(4, 0) == 1.0);
    CHECK(A(3, 3) == 4.0);
    CHECK(A(3, 4) == 0.0);
  }

  TEST_CASE("matgen - poisson_2d", "[matgen]")
  {
    auto A = poisson_2d<double>(3, 2);
    CHECK(A.shape() == Shape(6, 6));
    // 6 diagonal + 2 * (4 horizontal + 3 vertical) neighbours
    CHECK(A.size() == 20);
    CHECK(to_dense(A) == to_dense(transpose(A)));
  }

  TEST_CASE("matgen - random_spd_matrix is symmetric and dominant", "[matgen]")
  {
    auto A = random_spd_matrix<double>(30, 0.2, 4);
    auto dense = to_dense(A);
    CHECK(dense == to_dense(transpose(A)));

    for (std::size_t i = 0; i < 30; ++i) {
      double off = 0.0;
      for (std::size_t j = 0; j < 30; ++j) {
        if (i != j) { off += std::abs(dense[i * 30 + j]); }
      }
      CHECK(dense[i * 30 + i] > off);
    }
  }

  TEST_CASE("matgen - same seed, same matrix", "[matgen]")
  {
    CHECK(to_dense(random_spd_matrix<double>(15, 0.3, 9)) ==
          to_dense(random_spd_matrix<double>(15, 0.3, 9)));
    CHECK(to_dense(random_sparse_matrix<double>(15, 0.3, 9)) ==
          to_dense(random_sparse_matrix<double>(15, 0.3, 9)));
  }

  TEST_CASE("matgen - lower_triangle", "[matgen]")
  {
    auto L = lower_triangle(tridiagonal_matrix<double>(4, -1.0, 2.0, -1.0));
    CHECK(L.size() == 7);
    CHECK(L(0, 1) == 0.0);
    CHECK(L(1, 0) == -1.0);
    CHECK(L(3, 3) == 2.0);
  }

} // end of namespace sparsolve::testing
