#ifndef DUMPLOADER_API_HPP
#define DUMPLOADER_API_HPP


#ifdef DUMPLOADER_STATIC
// As a static library: no symbol import/export.
#  define DUMPLOADER_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef DUMPLOADER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define DUMPLOADER_API __declspec(dllexport)
#    else
#         define DUMPLOADER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define DUMPLOADER_API __declspec(dllimport)
#    else
#         define DUMPLOADER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
