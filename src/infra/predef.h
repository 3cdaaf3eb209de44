#if !defined(_FANMV_INFRA_PREDEF_H_INCLUDED_)
#define _FANMV_INFRA_PREDEF_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


//
// Make sure the following is true:
//
//  PLATFORM_LINUX
//
// fanmv depends on inotify, eventfd and statvfs, so only Linux is supported.
//
#if PLATFORM_LINUX
//  Build on Linux
#else
#   error "Unknown platform"
#endif


//
// Define some macros on Linux
//
#if PLATFORM_LINUX

#   if !defined(_GNU_SOURCE)
#       define _GNU_SOURCE 1
#   endif

#else
#   error "Unknown platform"

#endif


//
// Header files
//
#if PLATFORM_LINUX

#   include <sys/eventfd.h>
#   include <sys/inotify.h>
#   include <sys/stat.h>
#   include <sys/statvfs.h>
#   include <sys/types.h>
#   include <sys/wait.h>
#   include <fcntl.h>
#   include <poll.h>
#   include <semaphore.h>
#   include <spawn.h>
#   include <unistd.h>

#else
#   error "Unknown platform"

#endif


//
// Standard C headers
//
#include <cerrno>
#include <cinttypes>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>


//
// Common C++ headers
//
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <regex>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <unordered_map>
#include <utility>
#include <vector>


#if __has_include(<filesystem>)
#   include <filesystem>
    namespace stdfs = std::filesystem;
#elif __has_include(<experimental/filesystem>)
#   include <experimental/filesystem>
    namespace stdfs = std::experimental::filesystem;
#else
#   error "Can't find C++ filesystem implementation"
#endif


//
// Third-party headers
//

// Push: disable specific warnings for third-party libraries
#if COMPILER_GNU
#   pragma GCC diagnostic push

//  warning: implicit capture of 'this' via '[=]' is deprecated in C++20 [-Wdeprecated]
#   pragma GCC diagnostic ignored "-Wdeprecated"

#elif COMPILER_CLANG
#   pragma clang diagnostic push

//  See https://clang.llvm.org/docs/DiagnosticsReference.html#wdeprecated
#   pragma clang diagnostic ignored "-Wdeprecated"

#else
#   error "Unknown compiler"
#endif


// CLI11
#include <CLI/CLI.hpp>

// spdlog
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>


// Pop: restore specific warnings for third-party libraries
#if COMPILER_GNU
#   pragma GCC diagnostic pop

#elif COMPILER_CLANG
#   pragma clang diagnostic pop

#else
#   error "Unknown compiler"
#endif


#endif  // !defined(_FANMV_INFRA_PREDEF_H_INCLUDED_)
