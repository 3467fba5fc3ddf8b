#ifndef CLOUDGET_EXPORT_HPP
#define CLOUDGET_EXPORT_HPP

// clang-format off
#ifdef CLOUDGET_STATIC
// As a static library: no symbol import/export.
#  define CLOUDGET_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef CLOUDGET_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define CLOUDGET_API __declspec(dllexport)
#    else
#         define CLOUDGET_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define CLOUDGET_API __declspec(dllimport)
#    else
#         define CLOUDGET_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif
// clang-format on

#endif
