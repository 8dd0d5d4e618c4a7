#pragma once

#ifndef __has_attribute
# define __has_attribute(x) 0  // Compatibility with non-clang compilers
#endif

#if __has_attribute(always_inline) || defined(__GNUC__)
# define KPMDOS_ALWAYS_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER) || defined(__INTEL_COMPILER)
# define KPMDOS_ALWAYS_INLINE __forceinline
#else
# define KPMDOS_ALWAYS_INLINE inline
#endif
