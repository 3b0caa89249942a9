//
// ... Standard header files
//
#include <stdexcept>
#include <vector>

//
// ... sparsolve header files
//
#include <sparsolve/data/elimination_tree.hpp>

namespace sparsolve::data::detail {

  using size_type = config::size_type;

  namespace {

    enum class Leaf { none, first, subsequent };

    // Decide whether column j is a leaf of the row subtree of i.
    //
    // first[j] is the postorder index of j's first descendant, maxfirst[i]
    // the largest first[] seen for row i, prevleaf[i] the previous leaf of
    // row i's subtree. ancestor is a path-compressed union-find over the
    // already-processed part of the tree. For a subsequent leaf the return
    // value is the least common ancestor of j and the previous leaf; for
    // the first leaf it is i.
    size_type
    classify_leaf(size_type i, size_type j,
                  std::span<size_type const> first,
                  std::vector<size_type>& maxfirst,
                  std::vector<size_type>& prevleaf,
                  std::vector<size_type>& ancestor,
                  Leaf& jleaf) {
      auto ui = static_cast<std::size_t>(i);
      auto uj = static_cast<std::size_t>(j);

      jleaf = Leaf::none;
      if (i <= j || first[uj] <= maxfirst[ui]) { return -1; }

      maxfirst[ui] = first[uj];
      auto jprev = prevleaf[ui];
      prevleaf[ui] = j;

      if (jprev == -1) {
        jleaf = Leaf::first;
        return i;
      }
      jleaf = Leaf::subsequent;

      auto q = jprev;
      while (q != ancestor[static_cast<std::size_t>(q)]) {
        q = ancestor[static_cast<std::size_t>(q)];
      }

      // Path compression
      for (auto s = jprev; s != q;) {
        auto sparent = ancestor[static_cast<std::size_t>(s)];
        ancestor[static_cast<std::size_t>(s)] = q;
        s = sparent;
      }

      return q;
    }

  } // end of anonymous namespace

  std::vector<size_type>
  elimination_tree(Compressed_column_sparsity const& sp) {
    if (!sp.shape().is_square()) {
      throw std::invalid_argument("elimination_tree requires a square matrix");
    }

    auto n = sp.shape().column();
    auto cp = sp.col_ptr();
    auto ri = sp.row_ind();

    std::vector<size_type> parent(static_cast<std::size_t>(n), -1);
    std::vector<size_type> ancestor(static_cast<std::size_t>(n), -1);

    for (size_type k = 0; k < n; ++k) {
      for (auto p = cp[k]; p < cp[k + 1]; ++p) {
        // Walk from i up to the root of its current subtree, pointing
        // every visited node at k on the way.
        for (auto i = ri[p]; i != -1 && i < k;) {
          auto inext = ancestor[static_cast<std::size_t>(i)];
          ancestor[static_cast<std::size_t>(i)] = k;
          if (inext == -1) { parent[static_cast<std::size_t>(i)] = k; }
          i = inext;
        }
      }
    }

    return parent;
  }

  std::vector<size_type>
  tree_postorder(std::span<size_type const> parent) {
    auto n = static_cast<size_type>(parent.size());
    auto un = static_cast<std::size_t>(n);

    // First-child / next-sibling lists. Scanning from the last node makes
    // each child list ascending.
    std::vector<size_type> head(un, -1);
    std::vector<size_type> next(un, -1);

    for (auto j = n - 1; j >= 0; --j) {
      auto p = parent[static_cast<std::size_t>(j)];
      if (p == -1) { continue; }
      next[static_cast<std::size_t>(j)] = head[static_cast<std::size_t>(p)];
      head[static_cast<std::size_t>(p)] = j;
    }

    std::vector<size_type> post;
    post.reserve(un);
    std::vector<size_type> stack;

    for (size_type root = 0; root < n; ++root) {
      if (parent[static_cast<std::size_t>(root)] != -1) { continue; }

      stack.push_back(root);
      while (!stack.empty()) {
        auto node = stack.back();
        auto child = head[static_cast<std::size_t>(node)];

        if (child == -1) {
          stack.pop_back();
          post.push_back(node);
        } else {
          head[static_cast<std::size_t>(node)] =
            next[static_cast<std::size_t>(child)];
          stack.push_back(child);
        }
      }
    }

    return post;
  }

  std::vector<size_type>
  cholesky_column_counts(Compressed_column_sparsity const& lower,
                         std::span<size_type const> parent,
                         std::span<size_type const> post) {
    auto n = lower.shape().column();
    auto un = static_cast<std::size_t>(n);
    auto cp = lower.col_ptr();
    auto ri = lower.row_ind();

    std::vector<size_type> ancestor(un);
    std::vector<size_type> maxfirst(un, -1);
    std::vector<size_type> prevleaf(un, -1);
    std::vector<size_type> first(un, -1);

    // delta[j] becomes colcount[j] once accumulated up the tree.
    std::vector<size_type> delta(un, 0);

    // first[j] = postorder index of the first descendant of j;
    // leaves start with delta = 1.
    for (size_type k = 0; k < n; ++k) {
      auto j = post[static_cast<std::size_t>(k)];
      delta[static_cast<std::size_t>(j)] =
        first[static_cast<std::size_t>(j)] == -1 ? 1 : 0;
      for (; j != -1 && first[static_cast<std::size_t>(j)] == -1;
           j = parent[static_cast<std::size_t>(j)]) {
        first[static_cast<std::size_t>(j)] = k;
      }
    }

    for (size_type i = 0; i < n; ++i) {
      ancestor[static_cast<std::size_t>(i)] = i;
    }

    for (size_type k = 0; k < n; ++k) {
      auto j = post[static_cast<std::size_t>(k)];
      auto uj = static_cast<std::size_t>(j);
      if (parent[uj] != -1) { --delta[static_cast<std::size_t>(parent[uj])]; }

      // Column j of the lower triangle lists the rows i > j with
      // A(i,j) != 0, i.e. the row subtrees j may be a leaf of.
      for (auto p = cp[j]; p < cp[j + 1]; ++p) {
        auto i = ri[p];
        Leaf jleaf;
        auto q =
          classify_leaf(i, j, first, maxfirst, prevleaf, ancestor, jleaf);
        if (jleaf != Leaf::none) { ++delta[uj]; }
        if (jleaf == Leaf::subsequent) {
          --delta[static_cast<std::size_t>(q)];
        }
      }

      if (parent[uj] != -1) { ancestor[uj] = parent[uj]; }
    }

    // Sum each child's delta into its parent. Children have smaller
    // indices than their parents, so one ascending sweep suffices.
    for (size_type j = 0; j < n; ++j) {
      auto p = parent[static_cast<std::size_t>(j)];
      if (p != -1) {
        delta[static_cast<std::size_t>(p)] += delta[static_cast<std::size_t>(j)];
      }
    }

    return delta;
  }

} // end of namespace sparsolve::data::detail
