#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_ABIDUMP_STATIC)
    #define NGIN_ABIDUMP_API
  #else
    #if defined(NGIN_ABIDUMP_EXPORTS)
      #define NGIN_ABIDUMP_API __declspec(dllexport)
    #else
      #define NGIN_ABIDUMP_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_ABIDUMP_API
#endif
