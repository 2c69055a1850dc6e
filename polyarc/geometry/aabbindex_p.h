// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_GEOMETRY_AABBINDEX_P_H_INCLUDED
#define POLYARC_GEOMETRY_AABBINDEX_P_H_INCLUDED

#include <polyarc/geometry/commons_p.h>

#include <vector>

//! \cond INTERNAL
//! \addtogroup polyarc_geometry
//! \{

namespace pa::Geometry {

//! Static packed Hilbert R-tree of axis aligned boxes.
//!
//! Boxes are added by `add()` in item order, then `finish()` sorts them along a Hilbert curve and builds the tree
//! bottom-up. The index is immutable once finished. Member functions that allocate throw `std::bad_alloc`.
class AABBIndex {
public:
  PA_NONCOPYABLE(AABBIndex)

  enum : size_t {
    //! Number of children of each tree node.
    kNodeSize = 16
  };

  //! \name Members
  //! \{

  //! Leaf boxes (sorted) followed by node boxes of each level, the root is the last box.
  std::vector<PABox> _boxes;
  //! Item index of each leaf box, position of the first child of each node box.
  std::vector<size_t> _indices;
  //! End position (in `_boxes`) of each level, starting at leaves.
  std::vector<size_t> _level_bounds;
  //! Number of items added.
  size_t _item_count = 0;
  //! Bounds of all items.
  PABox _bounds = empty_box();
  //! Whether `finish()` has been called.
  bool _finished = false;

  //! \}

  PA_INLINE_NODEBUG AABBIndex() noexcept = default;

  //! \name Accessors
  //! \{

  [[nodiscard]]
  PA_INLINE_NODEBUG size_t item_count() const noexcept { return _item_count; }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool empty() const noexcept { return _item_count == 0; }

  [[nodiscard]]
  PA_INLINE_NODEBUG const PABox& bounds() const noexcept { return _bounds; }

  [[nodiscard]]
  PA_INLINE_NODEBUG bool is_finished() const noexcept { return _finished; }

  //! \}

  //! \name Construction
  //! \{

  PA_INLINE void reserve(size_t n) {
    _boxes.reserve(n + n / (kNodeSize - 1u) + 1u);
    _indices.reserve(n + n / (kNodeSize - 1u) + 1u);
  }

  //! Adds a box of the next item (items are numbered in the order they were added).
  PA_INLINE void add(const PABox& box) {
    PA_ASSERT(!_finished);
    _indices.push_back(_item_count++);
    _boxes.push_back(box);
    bound(_bounds, box);
  }

  //! Sorts the items and builds all tree levels.
  PA_HIDDEN void finish();

  //! \}

  //! \name Queries
  //! \{

  //! Calls `visitor(item_index)` for every item whose box overlaps `query`.
  //!
  //! The visitor returns `true` to continue and `false` to stop the query early.
  template<typename Visitor>
  PA_INLINE void visit(const PABox& query, Visitor&& visitor) const {
    PA_ASSERT(_finished);
    if (_item_count == 0)
      return;

    std::vector<size_t> stack;
    size_t node_pos = _boxes.size() - 1u;

    for (;;) {
      size_t end = pa_min(node_pos + size_t(kNodeSize), level_end(node_pos));
      bool is_leaf_level = node_pos < _item_count;

      for (size_t pos = node_pos; pos < end; pos++) {
        if (!overlaps(query, _boxes[pos]))
          continue;

        if (is_leaf_level) {
          if (!visitor(_indices[pos]))
            return;
        }
        else {
          stack.push_back(_indices[pos]);
        }
      }

      if (stack.empty())
        break;

      node_pos = stack.back();
      stack.pop_back();
    }
  }

  //! Appends indexes of all items whose box overlaps `query` to `out`.
  PA_INLINE void query(const PABox& query, std::vector<size_t>& out) const {
    visit(query, [&](size_t index) {
      out.push_back(index);
      return true;
    });
  }

  //! \}

private:
  //! Returns the end position of the level that contains `pos`.
  PA_INLINE size_t level_end(size_t pos) const noexcept {
    for (size_t bound : _level_bounds)
      if (pos < bound)
        return bound;
    return _boxes.size();
  }
};

} // {pa::Geometry}

//! \}
//! \endcond

#endif // POLYARC_GEOMETRY_AABBINDEX_P_H_INCLUDED
