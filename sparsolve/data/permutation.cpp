//
// ... Standard header files
//
#include <numeric>
#include <span>
#include <utility>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/permutation.hpp>

namespace sparsolve::data::detail {

  bool
  is_valid_permutation(std::span<config::size_type const> perm)
  {
    auto n = static_cast<config::size_type>(perm.size());
    std::vector<bool> seen(static_cast<std::size_t>(n), false);
    for (auto val : perm) {
      if (val < 0 || val >= n) {
        return false;
      }
      if (seen[static_cast<std::size_t>(val)]) {
        return false;
      }
      seen[static_cast<std::size_t>(val)] = true;
    }
    return true;
  }

  std::vector<config::size_type>
  inverse_permutation(std::span<config::size_type const> perm)
  {
    auto n = perm.size();
    std::vector<config::size_type> inv(n);
    for (std::size_t old_idx = 0; old_idx < n; ++old_idx) {
      inv[static_cast<std::size_t>(perm[old_idx])] =
        static_cast<config::size_type>(old_idx);
    }
    return inv;
  }

  std::vector<config::size_type>
  identity_permutation(config::size_type n)
  {
    std::vector<config::size_type> perm(static_cast<std::size_t>(n));
    std::iota(perm.begin(), perm.end(), config::size_type{0});
    return perm;
  }

  void
  swap_positions(std::span<config::size_type> perm,
                 std::span<config::size_type> pinv,
                 config::size_type a,
                 config::size_type b)
  {
    auto ua = static_cast<std::size_t>(a);
    auto ub = static_cast<std::size_t>(b);
    std::swap(perm[ua], perm[ub]);
    pinv[static_cast<std::size_t>(perm[ua])] = a;
    pinv[static_cast<std::size_t>(perm[ub])] = b;
  }

} // end of namespace sparsolve::data::detail
