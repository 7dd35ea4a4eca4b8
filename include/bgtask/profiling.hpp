#pragma once

#include <cstdint>

// User can specify a "profiling include" to specify how profiling needs to be done
#ifdef BGTASK_PROFILING_INCLUDE
#include BGTASK_PROFILING_INCLUDE
#endif

#if TRACY_ENABLE

#include "Tracy.hpp"

#define BGTASK_ENABLE_PROFILING 1

#define BGTASK_PROFILING_INIT() static_cast<void>(tracy::GetProfiler())
#define BGTASK_PROFILING_FUNCTION() ZoneScopedN(__FUNCTION__)
#define BGTASK_PROFILING_SCOPE_N(staticName) ZoneScopedN(staticName)
#define BGTASK_PROFILING_PLOT(staticName, val) TracyPlot(staticName, val)

#define BGTASK_PROFILING_SETTHREADNAME(name) tracy::SetThreadName(name)

#endif

#if !BGTASK_ENABLE_PROFILING

#define BGTASK_PROFILING_INIT()                 /*nothing*/
#define BGTASK_PROFILING_FUNCTION()             /*nothing*/
#define BGTASK_PROFILING_SCOPE_N(staticName)    /*nothing*/
#define BGTASK_PROFILING_PLOT(staticName, val)  /*nothing*/

#define BGTASK_PROFILING_SETTHREADNAME(name) /*nothing*/

#endif
