#pragma once

#if defined(_WIN32)
    #if defined(BLISS_EXPORT)
        #define BLISS_API __declspec(dllexport)
    #else
        #define BLISS_API __declspec(dllimport)
    #endif
#else
    #define BLISS_API __attribute__((visibility("default")))
#endif
