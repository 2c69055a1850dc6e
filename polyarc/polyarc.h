// This file is part of polyarc project
//
// SPDX-License-Identifier: Zlib
//
// Copyright (c) 2024 The polyarc Authors
//
// This software is provided 'as-is', without any express or implied
// warranty. In no event will the authors be held liable for any damages
// arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose,
// including commercial applications, and to alter it and redistribute it
// freely, subject to the following restrictions:
//
// 1. The origin of this software must not be misrepresented; you must not
//    claim that you wrote the original software. If you use this software
//    in a product, an acknowledgment in the product documentation would be
//    appreciated but is not required.
// 2. Altered source versions must be plainly marked as such, and must not be
//    misrepresented as being the original software.
// 3. This notice may not be removed or altered from any source distribution.

// ----------------------------------------------------------------------------
// This is a public header file designed to be used by polyarc users. It
// includes all the necessary files required to use polyarc library and it's
// the only header that is guaranteed to always be provided.
//
// Headers that end with "_p" suffix are private and should never be included,
// they are not part of the public API.
// ----------------------------------------------------------------------------

#ifndef POLYARC_H_INCLUDED
#define POLYARC_H_INCLUDED

#include <polyarc/core/api.h>
#include <polyarc/core/geometry.h>
#include <polyarc/core/polyline.h>
#include <polyarc/core/runtime.h>

#endif // POLYARC_H_INCLUDED
