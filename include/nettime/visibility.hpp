#pragma once

// Symbol visibility for the shared library build:
//
// NETTIME_API - exported symbol
// NETTIME_LOCAL - symbol hidden even when its enclosing class is exported
//
// The library is compiled with `-fvisibility=hidden`, so everything
// not marked with `NETTIME_API` stays internal to it.

#ifndef _WIN32
	#define NETTIME_API __attribute__((visibility("default")))
	#define NETTIME_LOCAL __attribute__((visibility("hidden")))
#else
	#ifdef NETTIME_EXPORTS
		#define NETTIME_API __declspec(dllexport)
	#else
		#define NETTIME_API __declspec(dllimport)
	#endif
	#define NETTIME_LOCAL
#endif
