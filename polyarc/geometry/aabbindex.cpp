// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_p.h>
#include <polyarc/geometry/aabbindex_p.h>
#include <polyarc/support/algorithm_p.h>

namespace pa::Geometry {

// pa::Geometry - AABBIndex - Hilbert Curve
// ========================================

//! Maps a 16-bit grid position to its distance along the Hilbert curve.
static uint32_t hilbert_xy_to_index(uint32_t x, uint32_t y) noexcept {
  uint32_t a = x ^ y;
  uint32_t b = 0xFFFFu ^ a;
  uint32_t c = 0xFFFFu ^ (x | y);
  uint32_t d = x & (y ^ 0xFFFFu);

  uint32_t A = a | (b >> 1);
  uint32_t B = (a >> 1) ^ a;
  uint32_t C = ((c >> 1) ^ (b & (d >> 1))) ^ c;
  uint32_t D = ((a & (c >> 1)) ^ (d >> 1)) ^ d;

  a = A; b = B; c = C; d = D;
  A = ((a & (a >> 2)) ^ (b & (b >> 2)));
  B = ((a & (b >> 2)) ^ (b & ((a ^ b) >> 2)));
  C ^= ((a & (c >> 2)) ^ (b & (d >> 2)));
  D ^= ((b & (c >> 2)) ^ ((a ^ b) & (d >> 2)));

  a = A; b = B; c = C; d = D;
  A = ((a & (a >> 4)) ^ (b & (b >> 4)));
  B = ((a & (b >> 4)) ^ (b & ((a ^ b) >> 4)));
  C ^= ((a & (c >> 4)) ^ (b & (d >> 4)));
  D ^= ((b & (c >> 4)) ^ ((a ^ b) & (d >> 4)));

  a = A; b = B; c = C; d = D;
  C ^= ((a & (c >> 8)) ^ (b & (d >> 8)));
  D ^= ((b & (c >> 8)) ^ ((a ^ b) & (d >> 8)));

  a = C ^ (C >> 1);
  b = D ^ (D >> 1);

  uint32_t i0 = x ^ y;
  uint32_t i1 = b | (0xFFFFu ^ (i0 | a));

  i0 = (i0 | (i0 << 8)) & 0x00FF00FFu;
  i0 = (i0 | (i0 << 4)) & 0x0F0F0F0Fu;
  i0 = (i0 | (i0 << 2)) & 0x33333333u;
  i0 = (i0 | (i0 << 1)) & 0x55555555u;

  i1 = (i1 | (i1 << 8)) & 0x00FF00FFu;
  i1 = (i1 | (i1 << 4)) & 0x0F0F0F0Fu;
  i1 = (i1 | (i1 << 2)) & 0x33333333u;
  i1 = (i1 | (i1 << 1)) & 0x55555555u;

  return (i1 << 1) | i0;
}

// pa::Geometry - AABBIndex - Finish
// =================================

namespace {

struct HilbertItem {
  uint32_t value;
  size_t index;
  PABox box;
};

} // {anonymous}

void AABBIndex::finish() {
  PA_ASSERT(!_finished);
  _finished = true;

  size_t n = _item_count;
  if (n == 0)
    return;

  // Level bounds, leaves first, always at least one node above the leaves.
  size_t count = n;
  size_t total = n;
  _level_bounds.push_back(total);
  do {
    count = (count + kNodeSize - 1u) / kNodeSize;
    total += count;
    _level_bounds.push_back(total);
  } while (count != 1u);

  // Sort leaves along the Hilbert curve, ties keep item order.
  {
    constexpr double kHilbertMax = double(0xFFFFu);

    double w = _bounds.width();
    double h = _bounds.height();
    double sx = w > 0.0 ? kHilbertMax / w : 0.0;
    double sy = h > 0.0 ? kHilbertMax / h : 0.0;

    std::vector<HilbertItem> items;
    items.reserve(n);

    for (size_t i = 0; i < n; i++) {
      const PABox& box = _boxes[i];
      uint32_t hx = uint32_t(Math::floor(((box.x0 + box.x1) * 0.5 - _bounds.x0) * sx));
      uint32_t hy = uint32_t(Math::floor(((box.y0 + box.y1) * 0.5 - _bounds.y0) * sy));
      items.push_back(HilbertItem{hilbert_xy_to_index(hx, hy), _indices[i], box});
    }

    quick_sort(items.data(), items.size(), [](const HilbertItem& a, const HilbertItem& b) noexcept -> int {
      if (a.value != b.value)
        return a.value < b.value ? -1 : 1;
      return a.index < b.index ? -1 : a.index > b.index ? 1 : 0;
    });

    for (size_t i = 0; i < n; i++) {
      _boxes[i] = items[i].box;
      _indices[i] = items[i].index;
    }
  }

  // Build parent nodes level by level.
  size_t pos = 0;
  for (size_t level = 0; level + 1u < _level_bounds.size(); level++) {
    size_t end = _level_bounds[level];

    while (pos < end) {
      size_t node_index = pos;
      PABox node_box = _boxes[pos];

      size_t group_end = pa_min(pos + size_t(kNodeSize), end);
      for (pos++; pos < group_end; pos++)
        bound(node_box, _boxes[pos]);

      _indices.push_back(node_index);
      _boxes.push_back(node_box);
    }
  }
}

} // {pa::Geometry}
