// stdafx.h : include file for standard system include files,
// or project specific include files that are used frequently, but
// are changed infrequently
//

#pragma once

// All files within the library are compiled with the BABELBRIDGE_EXPORTS symbol defined
// by the build. Projects using the library see BABELBRIDGE_API functions as imported.
#if defined(_WIN32)
	#ifdef BABELBRIDGE_EXPORTS
		#define BABELBRIDGE_API __declspec(dllexport)
	#else
		#define BABELBRIDGE_API __declspec(dllimport)
	#endif
#else
	#define BABELBRIDGE_API __attribute__((visibility("default")))
#endif

#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <algorithm>
#include <functional>
#include <memory>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <thread>
#include <mutex>
#include <atomic>
