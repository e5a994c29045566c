#pragma once

#include <cstdio>
#include <string>
#include <filesystem>
#include <source_location>
#include <stdexcept>

/* [LEVEL build-time file:line 'function'] message, always to stderr */
#define CHARTGEOM_LOG(LEVEL, str, ...) do{ \
		auto location = std::source_location::current(); \
		fprintf(stderr, (std::string{"[%s %s %s:%d '%s'] "} + str + std::string{"\n"}).c_str(), \
			#LEVEL, __TIME__, std::filesystem::path(location.file_name()).filename().c_str(), \
			location.line(), location.function_name(), ##__VA_ARGS__); \
	}while(0)
#define LOG_INFO(str, ...) CHARTGEOM_LOG(INFO, str, ##__VA_ARGS__)
#define LOG_WARNING(str, ...) CHARTGEOM_LOG(WARNING, str, ##__VA_ARGS__)
#define LOG_ERROR(str, ...) CHARTGEOM_LOG(ERROR, str, ##__VA_ARGS__)
#define LOG_ASSERT(str, ...) CHARTGEOM_LOG(ASSERT, str, ##__VA_ARGS__)

/* internal invariant, never data dependent */
#define ASSERT_ON_MSG(cond, msg) do{ \
		if(cond) [[unlikely]]{ \
			LOG_ASSERT(std::string{"Assert "} + std::string{msg} + std::string{" "} + std::string{#cond}); \
			throw std::logic_error("Assert " #cond); \
		} \
	}while(0)
#define ASSERT_ON(cond) ASSERT_ON_MSG(cond, "")

#ifndef CHARTGEOM_DEBUG
#define CHARTGEOM_DEBUG 0
#endif

#if CHARTGEOM_DEBUG == 0
#define LOG_DEBUG(str, ...)
#else
#define LOG_DEBUG(str, ...) CHARTGEOM_LOG(DEBUG, str, ##__VA_ARGS__)
#endif

namespace chartgeom{

enum class Result{
	Success,
	Failure,
};

}
