#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NEHA_CATCHERS_STATIC)
    #define NEHA_CATCHERS_API
  #else
    #if defined(NEHA_CATCHERS_EXPORTS)
      #define NEHA_CATCHERS_API __declspec(dllexport)
    #else
      #define NEHA_CATCHERS_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NEHA_CATCHERS_API
#endif
