//
// ... Standard header files
//
#include <stdexcept>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/csc_utilities.hpp>

namespace sparsolve::data::detail {

  size_type
  cumulative_sum(std::span<size_type> out, std::span<size_type> counts) {
    size_type nz = 0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
      out[i] = nz;
      nz += counts[i];
      counts[i] = out[i];
    }
    out[counts.size()] = nz;
    return nz;
  }

  Compressed_column_sparsity
  transpose_pattern(Compressed_column_sparsity const& sp) {
    auto nrow = sp.shape().row();
    auto ncol = sp.shape().column();
    auto cp = sp.col_ptr();
    auto ri = sp.row_ind();

    std::vector<size_type> count(static_cast<std::size_t>(nrow), 0);
    for (auto p = 0; p < sp.size(); ++p) {
      ++count[static_cast<std::size_t>(ri[p])];
    }

    std::vector<size_type> col_ptr(static_cast<std::size_t>(nrow + 1), 0);
    auto nnz = cumulative_sum(col_ptr, count);

    // Scanning columns in order leaves each output column sorted.
    std::vector<size_type> row_ind(static_cast<std::size_t>(nnz));
    for (size_type j = 0; j < ncol; ++j) {
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        auto pos = count[static_cast<std::size_t>(ri[p])]++;
        row_ind[static_cast<std::size_t>(pos)] = j;
      }
    }

    return Compressed_column_sparsity{
      Shape{ncol, nrow}, std::move(col_ptr), std::move(row_ind)};
  }

  size_type
  depth_first_search(size_type j,
                     Compressed_column_sparsity const& G,
                     std::span<size_type> marks,
                     size_type top,
                     std::span<size_type> xi,
                     std::span<size_type> pstack,
                     std::span<size_type const> pinv) {
    auto gi = G.row_ind();
    size_type head = 0;

    xi[0] = j;
    while (head >= 0) {
      auto uh = static_cast<std::size_t>(head);
      j = xi[uh];
      auto jnew = pinv.empty() ? j : pinv[static_cast<std::size_t>(j)];

      if (!marked(marks, j)) {
        mark(marks, j);
        pstack[uh] =
          jnew < 0 ? 0 : unflip(marks[static_cast<std::size_t>(jnew)]);
      }

      auto done = true;
      auto p2 =
        jnew < 0 ? 0 : unflip(marks[static_cast<std::size_t>(jnew + 1)]);

      for (auto p = pstack[uh]; p < p2; ++p) {
        auto i = gi[p];
        if (marked(marks, i)) { continue; }

        // Remember where to resume this node, then descend into i.
        pstack[uh] = p;
        xi[static_cast<std::size_t>(++head)] = i;
        done = false;
        break;
      }

      if (done) {
        --head;
        xi[static_cast<std::size_t>(--top)] = j;
      }
    }

    return top;
  }

  std::vector<size_type>
  reach(Compressed_column_sparsity const& G,
        Compressed_column_sparsity const& B,
        size_type k,
        std::span<size_type const> pinv) {
    auto n = G.shape().column();
    if (!G.shape().is_square() || B.shape().row() != n) {
      throw std::invalid_argument("reach: dimensions do not match");
    }

    auto gp = G.col_ptr();
    auto bp = B.col_ptr();
    auto bi = B.row_ind();

    auto un = static_cast<std::size_t>(n);
    std::vector<size_type> marks(gp.begin(), gp.end());
    std::vector<size_type> xi(un);
    std::vector<size_type> pstack(un);

    auto top = n;
    for (auto p = bp[k]; p < bp[k + 1]; ++p) {
      if (!marked(marks, bi[p])) {
        top = depth_first_search(bi[p], G, marks, top, xi, pstack, pinv);
      }
    }

    return std::vector<size_type>(xi.begin() + top, xi.end());
  }

} // end of namespace sparsolve::data::detail
