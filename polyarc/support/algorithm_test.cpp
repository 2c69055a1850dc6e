// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_test_p.h>
#if defined(PA_TEST)

#include <polyarc/support/algorithm_p.h>
#include <polyarc/support/math_p.h>

namespace pa {
namespace Tests {

template<typename T>
static void check_arrays(const T* a, const T* b, size_t size) noexcept {
  for (size_t i = 0; i < size; i++) {
    EXPECT_EQ(a[i], b[i]) << "Mismatch at " << i;
  }
}

struct KeyedItem {
  double key;
  uint32_t index;
};

UNIT(support_algorithm, PA_TEST_GROUP_SUPPORT_UTILITIES) {
  INFO("pa::quick_sort() - Testing quick_sort and insertion_sort of predefined arrays");
  {
    constexpr size_t kArraySize = 11;

    int ref_[kArraySize] = { -4, -2, -1, 0, 1, 9, 12, 13, 14, 19, 22 };
    int arr1[kArraySize] = { 0, 1, -1, 19, 22, 14, -4, 9, 12, 13, -2 };
    int arr2[kArraySize];

    memcpy(arr2, arr1, kArraySize * sizeof(int));

    insertion_sort(arr1, kArraySize);
    quick_sort(arr2, kArraySize);
    check_arrays(arr1, ref_, kArraySize);
    check_arrays(arr2, ref_, kArraySize);
  }

  INFO("pa::quick_sort() - Testing quick_sort of reversed arrays of all sizes");
  {
    constexpr size_t kArraySize = 200;

    int arr[kArraySize];
    int ref_[kArraySize];

    for (size_t size = 2; size < kArraySize; size++) {
      for (size_t i = 0; i < size; i++) {
        arr[i] = int(size - 1 - i);
        ref_[i] = int(i);
      }

      quick_sort(arr, size);
      check_arrays(arr, ref_, size);
    }
  }

  INFO("pa::quick_sort() - Testing quick_sort with a key and index tie-break");
  {
    KeyedItem items[] = {
      { 2.0, 0 }, { 1.0, 1 }, { 2.0, 2 }, { 0.5, 3 }, { 1.0, 4 },
      { 2.0, 5 }, { 0.5, 6 }, { 3.0, 7 }, { 1.0, 8 }, { 0.5, 9 }
    };

    quick_sort(items, PA_ARRAY_SIZE(items), [](const KeyedItem& a, const KeyedItem& b) noexcept -> int {
      if (a.key != b.key)
        return a.key < b.key ? -1 : 1;
      return a.index < b.index ? -1 : a.index > b.index ? 1 : 0;
    });

    static const uint32_t expected[] = { 3, 6, 9, 1, 4, 8, 0, 2, 5, 7 };
    for (size_t i = 0; i < PA_ARRAY_SIZE(items); i++)
      EXPECT_EQ(items[i].index, expected[i]);
  }
}

} // {Tests}
} // {pa}

#endif // PA_TEST
