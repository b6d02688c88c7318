// chainrule expression graph library.
// Copyright (c) 2024 Gareth Cross
// For license information refer to accompanying LICENSE file.
#pragma once

// Wrap fmt and absl includes so their warnings do not leak into our builds.
#ifdef _MSC_VER  //  MSVC

#define CR_BEGIN_THIRD_PARTY_INCLUDES                                \
  __pragma(warning(push))               /* push */                   \
      __pragma(warning(disable : 4100)) /* unreferenced parameter */ \
      __pragma(warning(disable : 4127)) /* constant if-statement */  \
      __pragma(warning(disable : 4324)) /* padded for alignment */
#define CR_END_THIRD_PARTY_INCLUDES __pragma(warning(pop))

#elif defined(__GNUC__)  // gcc (and clang, which defines __GNUC__)

#define CR_BEGIN_THIRD_PARTY_INCLUDES \
  _Pragma("GCC diagnostic push") _Pragma("GCC diagnostic ignored \"-Wpedantic\"")
#define CR_END_THIRD_PARTY_INCLUDES _Pragma("GCC diagnostic pop")

#else
#define CR_BEGIN_THIRD_PARTY_INCLUDES
#define CR_END_THIRD_PARTY_INCLUDES
#endif
