#pragma once

// VT_RUNTIME_DEBUG is defined by CMake. Default it OFF if someone includes this directly.
#ifndef VT_RUNTIME_DEBUG
  #define VT_RUNTIME_DEBUG 0
#endif

#if VT_RUNTIME_DEBUG
  #include <cassert>
  #define VT_ASSERT(expr) assert(expr)
#else
  #define VT_ASSERT(expr) ((void)0)
#endif
