#pragma once

#define Z_CAREFUL_PRAGMA(PRAGMA) _Pragma(#PRAGMA)

#if defined(__clang__)
// check clang first because it may define _MSC_VER
#define CAREFUL_MSVC_WARNING(...)
#define CAREFUL_GCC_DIAGNOSTIC(...)
#define CAREFUL_CLANG_DIAGNOSTIC(DIAGNOSTIC) Z_CAREFUL_PRAGMA(clang diagnostic DIAGNOSTIC)
#elif defined(_MSC_VER)
#define CAREFUL_MSVC_WARNING(...) Z_CAREFUL_PRAGMA(warning(__VA_ARGS__))
#define CAREFUL_GCC_DIAGNOSTIC(...)
#define CAREFUL_CLANG_DIAGNOSTIC(...)
#else
// gcc
#define CAREFUL_MSVC_WARNING(...)
#define CAREFUL_GCC_DIAGNOSTIC(DIAGNOSTIC) Z_CAREFUL_PRAGMA(GCC diagnostic DIAGNOSTIC)
#define CAREFUL_CLANG_DIAGNOSTIC(DIAGNOSTIC)
#endif
