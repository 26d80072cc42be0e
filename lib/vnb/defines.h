#pragma once

#if defined(_WIN32)
  #if defined(VNB_SHARED)
    #if defined(VNB_EXPORTS)
      #define VNB_API __declspec(dllexport)
    #else
      #define VNB_API __declspec(dllimport)
    #endif
  #else
    #define VNB_API
  #endif
#else
  #if defined(VNB_SHARED)
    #define VNB_API __attribute__((visibility("default")))
  #else
    #define VNB_API
  #endif
#endif
