#pragma once

#if defined(_WIN32)
#  if defined(MESHCACHE_BUILD_SHARED)
#    if defined(meshcache_core_EXPORTS)
#      define MESHCACHE_API __declspec(dllexport)
#    else
#      define MESHCACHE_API __declspec(dllimport)
#    endif
#  else
#    define MESHCACHE_API
#  endif
#else
#  if defined(MESHCACHE_BUILD_SHARED)
#    define MESHCACHE_API __attribute__((visibility("default")))
#  else
#    define MESHCACHE_API
#  endif
#endif
