//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_UTILITY
#define GRACEFUL_SHUTDOWN_UTILITY

#include <utility>
#include <functional>
#include <type_traits>

/// ensures dynamic linkage can see the marked variable
#ifdef _WIN32
    #define GSD_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define GSD_EXPORT __attribute__((visibility("default")))
#else
    #define GSD_EXPORT
#endif

namespace gsd {

/// type with no qualifiers
template <typename T>
using unqualified = typename std::decay<T>::type;

/// the return type of an arbitrary Callable
template <typename F, typename... Args>
using function_return_type = std::invoke_result_t<F, Args...>;

/// Callable accepting and returning no arguments
typedef std::function<void()> thunk;

}

#endif
