#pragma once

#ifdef _WIN32
// Suppress C4251 warnings for STL containers in exported classes
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

#ifdef CHATRAW_SERVER_STATIC
    // Static library linking, no import/export needed
    #define CHATRAW_SERVER_API
#elif defined(_WIN32)
    #ifdef CHATRAW_SERVER_BUILD
        #define CHATRAW_SERVER_API __declspec(dllexport)
    #else
        #define CHATRAW_SERVER_API __declspec(dllimport)
    #endif
#else
    #ifdef CHATRAW_SERVER_BUILD
        #define CHATRAW_SERVER_API __attribute__((visibility("default")))
    #else
        #define CHATRAW_SERVER_API
    #endif
#endif

#ifdef _WIN32
#pragma warning(pop)
#endif
