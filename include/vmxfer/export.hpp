#ifndef VMXFER_API_HPP
#define VMXFER_API_HPP


#ifdef VMXFER_STATIC
// As a static library: no symbol import/export.
#  define VMXFER_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef VMXFER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define VMXFER_API __declspec(dllexport)
#    else
#         define VMXFER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define VMXFER_API __declspec(dllimport)
#    else
#         define VMXFER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
