/*

config.hpp
----------

Global build configuration for mimetree.

Define MIMETREE_NO_EXCEPTIONS to disable exception-based wrappers.
Define MIMETREE_DEFAULT_MAX_DEPTH to change the default multipart nesting limit.

*/

#pragma once

#if defined(MIMETREE_NO_EXCEPTIONS)
#define MIMETREE_THROWING_ENABLED 0
#else
#define MIMETREE_THROWING_ENABLED 1
#endif

#if !defined(MIMETREE_DEFAULT_MAX_DEPTH)
#define MIMETREE_DEFAULT_MAX_DEPTH 32
#endif
