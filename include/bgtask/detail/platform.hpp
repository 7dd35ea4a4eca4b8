#pragma once

// User can specify a "platform include" that can override everything that's in here
#ifdef BGTASK_PLATFORM_INCLUDE
#include BGTASK_PLATFORM_INCLUDE
#endif

// Detect the platform (if we were not given one)
#ifndef BGTASK_PLATFORM

#if __APPLE__
#define BGTASK_PLATFORM_APPLE 1
#elif __linux__ || __FreeBSD__ || __NetBSD__ || __OpenBSD__
#define BGTASK_PLATFORM_LINUX 1
#elif _MSC_VER && __MINGW64__ || __MINGW32__
#define BGTASK_PLATFORM_WINDOWS 1
#else
#define BGTASK_PLATFORM_UNKNOWN 1
#endif

#define BGTASK_PLATFORM(X) (BGTASK_PLATFORM_##X)
#endif

// Detect use of pthreads; use it on Linux and Apple
#if !defined(BGTASK_USE_PTHREADS) && (BGTASK_PLATFORM_LINUX || BGTASK_PLATFORM_APPLE)
#define BGTASK_USE_PTHREADS 1
#endif
