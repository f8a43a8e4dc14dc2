#pragma once

#if defined(MIMETREE_STATIC_DEFINE)
#  ifndef MIMETREE_EXPORT
#    define MIMETREE_EXPORT
#  endif
#  ifndef MIMETREE_NO_EXPORT
#    define MIMETREE_NO_EXPORT
#  endif
#else
#  ifndef MIMETREE_EXPORT
#    if defined(_WIN32) || defined(__CYGWIN__)
#      ifdef MIMETREE_EXPORTS
#        define MIMETREE_EXPORT __declspec(dllexport)
#      else
#        define MIMETREE_EXPORT __declspec(dllimport)
#      endif
#      define MIMETREE_NO_EXPORT
#    else
#      if defined(__GNUC__) && __GNUC__ >= 4
#        define MIMETREE_EXPORT __attribute__((visibility("default")))
#        define MIMETREE_NO_EXPORT __attribute__((visibility("hidden")))
#      else
#        define MIMETREE_EXPORT
#        define MIMETREE_NO_EXPORT
#      endif
#    endif
#  endif
#endif
