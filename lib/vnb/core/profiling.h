#pragma once

#if defined(VNB_PROFILING)
#include <cstring>
#include "tracy/Tracy.hpp"
// zone colors for codec stages
#define VNB_PROFILER_COLOR_ENCODE 0x0000ff
#define VNB_PROFILER_COLOR_DECODE 0x00ff00
#define VNB_PROFILER_COLOR_LEGACY 0xff6600
#define VNB_PROFILER_COLOR_RESOLVE 0x8b0a50
#define VNB_PROFILER_COLOR_IO 0xffffff
//
#define VNB_PROFILER_FUNCTION() ZoneScoped
#define VNB_PROFILER_FUNCTION_COLOR(color) ZoneScopedC(color)
#define VNB_PROFILER_ZONE(name, color)                                         \
  {                                                                            \
    ZoneScopedC(color);                                                        \
    ZoneName(name, strlen(name))
#define VNB_PROFILER_ZONE_END() }
#define VNB_PROFILER_THREAD(name) tracy::SetThreadName(name)
#else
#define VNB_PROFILER_FUNCTION()
#define VNB_PROFILER_FUNCTION_COLOR(color)
#define VNB_PROFILER_ZONE(name, color) {
#define VNB_PROFILER_ZONE_END() }
#define VNB_PROFILER_THREAD(name)
#endif // VNB_PROFILING
