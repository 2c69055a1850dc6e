// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef POLYARC_SUPPORT_ALGORITHM_P_H_INCLUDED
#define POLYARC_SUPPORT_ALGORITHM_P_H_INCLUDED

#include <polyarc/core/api-internal_p.h>

#include <utility>

//! \cond INTERNAL
//! \addtogroup polyarc_support
//! \{

namespace pa {

//! \name Sorting
//! \{

//! Compares any type that implements `<` and `>` operators and returns -1, 0, or 1.
struct CompareOp {
  template<typename A, typename B>
  PA_INLINE int operator()(const A& a, const B& b) const noexcept {
    return a < b ? -1 : a > b ? 1 : 0;
  }
};

//! Insertion sort.
template<typename T, typename Compare = CompareOp>
static PA_INLINE void insertion_sort(T* base, size_t size, const Compare& cmp = Compare()) noexcept {
  for (T* pm = base + 1; pm < base + size; pm++)
    for (T* pl = pm; pl > base && cmp(pl[-1], pl[0]) > 0; pl--)
      std::swap(pl[-1], pl[0]);
}

namespace Internal {

//! Quick-sort implementation.
//!
//! Not stable, `Compare` must order all items totally where a deterministic result is required.
template<typename T, class Compare>
struct QuickSortImpl {
  enum : size_t {
    kStackSize = 64 * 2,
    kISortThreshold = 7
  };

  static void sort(T* base, size_t size, const Compare& cmp) noexcept {
    T* end = base + size;
    T* stack[kStackSize];
    T** stackptr = stack;

    for (;;) {
      if (size_t(end - base) > kISortThreshold) {
        // Median of three, the first item becomes the pivot.
        T* pi = base + 1;
        T* pj = end - 1;
        std::swap(base[size_t(end - base) / 2], base[0]);

        if (cmp(*pi  , *pj  ) > 0) std::swap(*pi  , *pj  );
        if (cmp(*base, *pj  ) > 0) std::swap(*base, *pj  );
        if (cmp(*pi  , *base) > 0) std::swap(*pi  , *base);

        for (;;) {
          while (pi < pj   && cmp(*++pi, *base) < 0) continue;
          while (pj > base && cmp(*--pj, *base) > 0) continue;

          if (pi > pj)
            break;
          std::swap(*pi, *pj);
        }

        std::swap(*base, *pj);

        // Push the larger partition, continue with the smaller one.
        if (pj - base > end - pi) {
          *stackptr++ = base;
          *stackptr++ = pj;
          base = pi;
        }
        else {
          *stackptr++ = pi;
          *stackptr++ = end;
          end = pj;
        }
        PA_ASSERT(stackptr <= stack + kStackSize);
      }
      else {
        insertion_sort(base, size_t(end - base), cmp);
        if (stackptr == stack)
          break;
        end = *--stackptr;
        base = *--stackptr;
      }
    }
  }
};

} // {Internal}

//! Quick sort.
template<typename T, class Compare = CompareOp>
static PA_INLINE void quick_sort(T* base, size_t size, const Compare& cmp = Compare()) noexcept {
  Internal::QuickSortImpl<T, Compare>::sort(base, size, cmp);
}

//! \}

} // {pa}

//! \}
//! \endcond

#endif // POLYARC_SUPPORT_ALGORITHM_P_H_INCLUDED
