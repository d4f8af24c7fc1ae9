// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation.
// The MA_NO_* feature switches are set for the whole voxsrt_core target in
// CMakeLists.txt, so this file and AudioProbe see the same configuration.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
