#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(TESSERA_CATALOG_STATIC)
    #define TESSERA_CATALOG_API
  #else
    #if defined(TESSERA_CATALOG_EXPORTS)
      #define TESSERA_CATALOG_API __declspec(dllexport)
    #else
      #define TESSERA_CATALOG_API __declspec(dllimport)
    #endif
  #endif
#else
  #define TESSERA_CATALOG_API
#endif
