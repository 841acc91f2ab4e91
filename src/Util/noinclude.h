// Copyright (c) 2025, WH, All rights reserved.
// miscellaneous utilities/macros which don't require transitive includes
#pragma once

// not copy or move constructable/assignable
// purely for clarifying intent
#define NOCOPY_NOMOVE(classname__)                        \
   private:                                               \
    classname__(const classname__ &) = delete;            \
    classname__ &operator=(const classname__ &) = delete; \
    classname__(classname__ &&) = delete;                 \
    classname__ &operator=(classname__ &&) = delete;

// move-only types (owning handles)
#define NOCOPY(classname__)                    \
   public:                                     \
    classname__(const classname__ &) = delete; \
    classname__ &operator=(const classname__ &) = delete;

#if defined(__GNUC__) || defined(__clang__)
#define likely(x) __builtin_expect(bool(x), 1)
#define unlikely(x) __builtin_expect(bool(x), 0)
#define forceinline __attribute__((always_inline)) inline

// force all functions in the function body to be inlined into it
// different from "forceinline", because the function itself won't necessarily be inlined at all call sites
#define INLINE_BODY __attribute__((flatten))

#else
#define likely(x) (x)
#define unlikely(x) (x)
#ifdef _MSC_VER
#define forceinline __forceinline
#else
#define forceinline inline
#endif
#define INLINE_BODY
#endif
