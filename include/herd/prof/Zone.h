#pragma once
// Tracy zones for the navigation build and queries. Compiled out unless the
// build defines TRACY_ENABLE (CMake option HERD_ENABLE_TRACY).

#ifdef TRACY_ENABLE
  #include <tracy/Tracy.hpp>
  #define HERD_TRACY_ZONE(name_literal) ZoneScopedN(name_literal)
#else
  #define HERD_TRACY_ZONE(name_literal)
#endif
