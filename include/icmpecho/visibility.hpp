#pragma once

/**
 * Export macro for the icmpecho shared library.
 *
 * The shared build compiles with hidden visibility by default, so only
 * declarations marked ICMPECHO_API leave the library. Static builds and
 * consumers see an empty macro.
 */
#if defined(ICMPECHO_BUILDING_DLL)
  #if defined(_WIN32) || defined(__CYGWIN__)
    #define ICMPECHO_API __declspec(dllexport)
  #elif defined(__GNUC__)
    #define ICMPECHO_API __attribute__((visibility("default")))
  #else
    #define ICMPECHO_API
  #endif
#else
  #define ICMPECHO_API
#endif
