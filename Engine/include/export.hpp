#pragma once

#if defined(_WIN32)
    #if defined(SYNOD_EXPORT)
        #define SYNOD_API __declspec(dllexport)
    #else
        #define SYNOD_API __declspec(dllimport)
    #endif
#else
    #define SYNOD_API __attribute__((visibility("default")))
#endif
