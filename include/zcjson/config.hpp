#pragma once

// Compile-time configuration. Define any of these before including zcjson.

// SSE2 fast paths for whitespace and string scanning.
#ifndef ZCJSON_ENABLE_SSE2
  #if defined(_M_X64) || defined(__SSE2__)
    #define ZCJSON_ENABLE_SSE2 1
  #else
    #define ZCJSON_ENABLE_SSE2 0
  #endif
#endif

// Default for parse_options::max_depth.
#ifndef ZCJSON_DEFAULT_MAX_DEPTH
  #define ZCJSON_DEFAULT_MAX_DEPTH 256
#endif
