#pragma once

// STANCHION_STATIC: consumers link the static engine library, nothing to import
#if defined(STANCHION_STATIC)
    #define STANCHION_API
#elif defined(_WIN32)
    #if defined(STANCHION_EXPORT)
        #define STANCHION_API __declspec(dllexport)
    #else
        #define STANCHION_API __declspec(dllimport)
    #endif
#else
    #define STANCHION_API __attribute__((visibility("default")))
#endif
