#pragma once

// Chroma Profiler Abstraction
// When CHROMA_PROFILING_ENABLED is defined, these map to Tracy.
// Otherwise, they compile to nothing.

#ifdef CHROMA_PROFILING_ENABLED
#include <tracy/Tracy.hpp>

#define CHROMA_ZONE_SCOPED ZoneScoped
#define CHROMA_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define CHROMA_ZONE_VALUE(val) ZoneValue(val)
#define CHROMA_PLOT(name, val) TracyPlot(name, val)

#else
#define CHROMA_ZONE_SCOPED
#define CHROMA_ZONE_SCOPED_N(name)
#define CHROMA_ZONE_VALUE(val)
#define CHROMA_PLOT(name, val)
#endif
