//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_LOGGING
#define GRACEFUL_SHUTDOWN_LOGGING

#include <utility>
#include <string>
#include <sstream>
#include <ostream>
#include <coroutine>
#include <typeinfo>
#include <type_traits>
#include <memory>
#include <optional>

#include <loguru.hpp>

#include "utility.hpp"

/**
 Logging is compiled in two steps. GSDLOGLIMIT decides at compile time which
 levels exist at all, a statement above the limit compiles to nothing. The
 thread local log level (see `gsd::logger::thread_log_level()`) decides at
 runtime which of the compiled statements are written to loguru.

 Levels from most to least severe, with their loguru verbosity:
 FATAL(-3) ERROR(-2) WARNING(-1) INFO(0) HIGH(2) MED(4) LOW(6) MIN(8) TRACE(9)

 Every level provides the same statement kinds:
 - `CONSTRUCTOR(args...)`, `DESTRUCTOR()`: object lifetime, inside a `gsd::printable`
 - `METHOD_ENTER(name, args...)`: a call, inside a `gsd::printable`
 - `METHOD_BODY(name, items...)`: a message, inside a `gsd::printable`
 - `FUNCTION_ENTER(name, args...)`, `FUNCTION_BODY(name, items...)`: anywhere
 - `LOG(fmt, args...)`: a `printf()` style line, anywhere
 - `GUARD(test, statements...)`: statements compiled only with the level

 `ENTER` arguments print like a call:
 ```
 GSD_INFO_FUNCTION_ENTER("my_function", "string", 3); // my_function(string, 3)
 ```

 `BODY` items are concatenated:
 ```
 GSD_INFO_FUNCTION_BODY("my_function", "hello ", 3); // my_function():hello 3
 ```
 */
#ifndef GSDLOGLIMIT
#define GSDLOGLIMIT -1
#endif

#if GSDLOGLIMIT < -9
#undef GSDLOGLIMIT
#define GSDLOGLIMIT -9
#endif

#if GSDLOGLIMIT > 9
#undef GSDLOGLIMIT
#define GSDLOGLIMIT 9
#endif

#define GSD_LEVEL_ON_(...) __VA_ARGS__
#define GSD_LEVEL_OFF_(...) (void)0

#define GSD_FATAL_V_ loguru::Verbosity_FATAL
#define GSD_ERROR_V_ loguru::Verbosity_ERROR
#define GSD_WARNING_V_ loguru::Verbosity_WARNING
#define GSD_INFO_V_ loguru::Verbosity_INFO
#define GSD_HIGH_V_ 2
#define GSD_MED_V_ 4
#define GSD_LOW_V_ 6
#define GSD_MIN_V_ 8
#define GSD_TRACE_V_ 9

#if GSDLOGLIMIT >= -3
#define GSD_FATAL_ON_ GSD_LEVEL_ON_
#else
#define GSD_FATAL_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= -2
#define GSD_ERROR_ON_ GSD_LEVEL_ON_
#else
#define GSD_ERROR_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= -1
#define GSD_WARNING_ON_ GSD_LEVEL_ON_
#else
#define GSD_WARNING_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= 0
#define GSD_INFO_ON_ GSD_LEVEL_ON_
#else
#define GSD_INFO_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= 2
#define GSD_HIGH_ON_ GSD_LEVEL_ON_
#else
#define GSD_HIGH_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= 4
#define GSD_MED_ON_ GSD_LEVEL_ON_
#else
#define GSD_MED_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= 6
#define GSD_LOW_ON_ GSD_LEVEL_ON_
#else
#define GSD_LOW_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= 8
#define GSD_MIN_ON_ GSD_LEVEL_ON_
#else
#define GSD_MIN_ON_ GSD_LEVEL_OFF_
#endif

#if GSDLOGLIMIT >= 9
#define GSD_TRACE_ON_ GSD_LEVEL_ON_
#else
#define GSD_TRACE_ON_ GSD_LEVEL_OFF_
#endif

// statement kinds, parameterized by level
#define GSD_CONSTRUCTOR_(L, ...) GSD_##L##_ON_(gsd::logger::constructor(this, GSD_##L##_V_, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__))
#define GSD_DESTRUCTOR_(L) GSD_##L##_ON_(gsd::logger::destructor(this, GSD_##L##_V_, __FILE__, __LINE__))
#define GSD_GUARD_(L, test, ...) GSD_##L##_ON_(if(test) { __VA_ARGS__; })
#define GSD_METHOD_ENTER_(L, ...) GSD_##L##_ON_(gsd::logger::method_enter(this, GSD_##L##_V_, __FILE__, __LINE__, __VA_ARGS__))
#define GSD_METHOD_BODY_(L, ...) GSD_##L##_ON_(gsd::logger::method_body(this, GSD_##L##_V_, __FILE__, __LINE__, __VA_ARGS__))
#define GSD_FUNCTION_ENTER_(L, ...) GSD_##L##_ON_(gsd::logger::function_enter(GSD_##L##_V_, __FILE__, __LINE__, __VA_ARGS__))
#define GSD_FUNCTION_BODY_(L, ...) GSD_##L##_ON_(gsd::logger::function_body(GSD_##L##_V_, __FILE__, __LINE__, __VA_ARGS__))
#define GSD_LOG_(L, ...) GSD_##L##_ON_(loguru::log(GSD_##L##_V_, __FILE__, __LINE__, __VA_ARGS__))

#define GSD_FATAL_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(FATAL __VA_OPT__(,) __VA_ARGS__)
#define GSD_FATAL_DESTRUCTOR() GSD_DESTRUCTOR_(FATAL)
#define GSD_FATAL_GUARD(...) GSD_GUARD_(FATAL, __VA_ARGS__)
#define GSD_FATAL_METHOD_ENTER(...) GSD_METHOD_ENTER_(FATAL, __VA_ARGS__)
#define GSD_FATAL_METHOD_BODY(...) GSD_METHOD_BODY_(FATAL, __VA_ARGS__)
#define GSD_FATAL_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(FATAL, __VA_ARGS__)
#define GSD_FATAL_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(FATAL, __VA_ARGS__)
#define GSD_FATAL_LOG(...) GSD_LOG_(FATAL, __VA_ARGS__)

#define GSD_ERROR_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(ERROR __VA_OPT__(,) __VA_ARGS__)
#define GSD_ERROR_DESTRUCTOR() GSD_DESTRUCTOR_(ERROR)
#define GSD_ERROR_GUARD(...) GSD_GUARD_(ERROR, __VA_ARGS__)
#define GSD_ERROR_METHOD_ENTER(...) GSD_METHOD_ENTER_(ERROR, __VA_ARGS__)
#define GSD_ERROR_METHOD_BODY(...) GSD_METHOD_BODY_(ERROR, __VA_ARGS__)
#define GSD_ERROR_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(ERROR, __VA_ARGS__)
#define GSD_ERROR_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(ERROR, __VA_ARGS__)
#define GSD_ERROR_LOG(...) GSD_LOG_(ERROR, __VA_ARGS__)

#define GSD_WARNING_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(WARNING __VA_OPT__(,) __VA_ARGS__)
#define GSD_WARNING_DESTRUCTOR() GSD_DESTRUCTOR_(WARNING)
#define GSD_WARNING_GUARD(...) GSD_GUARD_(WARNING, __VA_ARGS__)
#define GSD_WARNING_METHOD_ENTER(...) GSD_METHOD_ENTER_(WARNING, __VA_ARGS__)
#define GSD_WARNING_METHOD_BODY(...) GSD_METHOD_BODY_(WARNING, __VA_ARGS__)
#define GSD_WARNING_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(WARNING, __VA_ARGS__)
#define GSD_WARNING_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(WARNING, __VA_ARGS__)
#define GSD_WARNING_LOG(...) GSD_LOG_(WARNING, __VA_ARGS__)

#define GSD_INFO_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(INFO __VA_OPT__(,) __VA_ARGS__)
#define GSD_INFO_DESTRUCTOR() GSD_DESTRUCTOR_(INFO)
#define GSD_INFO_GUARD(...) GSD_GUARD_(INFO, __VA_ARGS__)
#define GSD_INFO_METHOD_ENTER(...) GSD_METHOD_ENTER_(INFO, __VA_ARGS__)
#define GSD_INFO_METHOD_BODY(...) GSD_METHOD_BODY_(INFO, __VA_ARGS__)
#define GSD_INFO_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(INFO, __VA_ARGS__)
#define GSD_INFO_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(INFO, __VA_ARGS__)
#define GSD_INFO_LOG(...) GSD_LOG_(INFO, __VA_ARGS__)

#define GSD_HIGH_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(HIGH __VA_OPT__(,) __VA_ARGS__)
#define GSD_HIGH_DESTRUCTOR() GSD_DESTRUCTOR_(HIGH)
#define GSD_HIGH_GUARD(...) GSD_GUARD_(HIGH, __VA_ARGS__)
#define GSD_HIGH_METHOD_ENTER(...) GSD_METHOD_ENTER_(HIGH, __VA_ARGS__)
#define GSD_HIGH_METHOD_BODY(...) GSD_METHOD_BODY_(HIGH, __VA_ARGS__)
#define GSD_HIGH_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(HIGH, __VA_ARGS__)
#define GSD_HIGH_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(HIGH, __VA_ARGS__)
#define GSD_HIGH_LOG(...) GSD_LOG_(HIGH, __VA_ARGS__)

#define GSD_MED_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(MED __VA_OPT__(,) __VA_ARGS__)
#define GSD_MED_DESTRUCTOR() GSD_DESTRUCTOR_(MED)
#define GSD_MED_GUARD(...) GSD_GUARD_(MED, __VA_ARGS__)
#define GSD_MED_METHOD_ENTER(...) GSD_METHOD_ENTER_(MED, __VA_ARGS__)
#define GSD_MED_METHOD_BODY(...) GSD_METHOD_BODY_(MED, __VA_ARGS__)
#define GSD_MED_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(MED, __VA_ARGS__)
#define GSD_MED_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(MED, __VA_ARGS__)
#define GSD_MED_LOG(...) GSD_LOG_(MED, __VA_ARGS__)

#define GSD_LOW_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(LOW __VA_OPT__(,) __VA_ARGS__)
#define GSD_LOW_DESTRUCTOR() GSD_DESTRUCTOR_(LOW)
#define GSD_LOW_GUARD(...) GSD_GUARD_(LOW, __VA_ARGS__)
#define GSD_LOW_METHOD_ENTER(...) GSD_METHOD_ENTER_(LOW, __VA_ARGS__)
#define GSD_LOW_METHOD_BODY(...) GSD_METHOD_BODY_(LOW, __VA_ARGS__)
#define GSD_LOW_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(LOW, __VA_ARGS__)
#define GSD_LOW_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(LOW, __VA_ARGS__)
#define GSD_LOW_LOG(...) GSD_LOG_(LOW, __VA_ARGS__)

#define GSD_MIN_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(MIN __VA_OPT__(,) __VA_ARGS__)
#define GSD_MIN_DESTRUCTOR() GSD_DESTRUCTOR_(MIN)
#define GSD_MIN_GUARD(...) GSD_GUARD_(MIN, __VA_ARGS__)
#define GSD_MIN_METHOD_ENTER(...) GSD_METHOD_ENTER_(MIN, __VA_ARGS__)
#define GSD_MIN_METHOD_BODY(...) GSD_METHOD_BODY_(MIN, __VA_ARGS__)
#define GSD_MIN_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(MIN, __VA_ARGS__)
#define GSD_MIN_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(MIN, __VA_ARGS__)
#define GSD_MIN_LOG(...) GSD_LOG_(MIN, __VA_ARGS__)

#define GSD_TRACE_CONSTRUCTOR(...) GSD_CONSTRUCTOR_(TRACE __VA_OPT__(,) __VA_ARGS__)
#define GSD_TRACE_DESTRUCTOR() GSD_DESTRUCTOR_(TRACE)
#define GSD_TRACE_GUARD(...) GSD_GUARD_(TRACE, __VA_ARGS__)
#define GSD_TRACE_METHOD_ENTER(...) GSD_METHOD_ENTER_(TRACE, __VA_ARGS__)
#define GSD_TRACE_METHOD_BODY(...) GSD_METHOD_BODY_(TRACE, __VA_ARGS__)
#define GSD_TRACE_FUNCTION_ENTER(...) GSD_FUNCTION_ENTER_(TRACE, __VA_ARGS__)
#define GSD_TRACE_FUNCTION_BODY(...) GSD_FUNCTION_BODY_(TRACE, __VA_ARGS__)
#define GSD_TRACE_LOG(...) GSD_LOG_(TRACE, __VA_ARGS__)

namespace gsd {

/**
 @brief readable type names for log lines

 Names are built from type information only, so the reason type `T` of a
 `gsd::shutdown<T>` can be printed without an instance. `typeid(T).name()` is
 the last resort because the standard does not make it readable.
 */
namespace type {

/// return the name of a type without namespace or template arguments
inline std::string basename(std::string name) {
    // namespaces inside template arguments must not be searched
    name = name.substr(0, name.find('<'));
    size_t pos = name.rfind("::");
    return pos == std::string::npos ? name : name.substr(pos + 2);
}

/**
 @brief name of an unqualified type `T`

 Types with a `static std::string info_name()` method name themselves. Others
 may specialize this template.
 */
template <typename T, typename = void>
struct info {
    static inline std::string name() {
        if constexpr(std::is_void_v<T>) { return "void"; }
        else if constexpr(std::is_same_v<T,bool>) { return "bool"; }
        else if constexpr(std::is_same_v<T,char>) { return "char"; }
        else if constexpr(std::is_same_v<T,int>) { return "int"; }
        else if constexpr(std::is_same_v<T,unsigned int>) { return "unsigned int"; }
        else if constexpr(std::is_same_v<T,long>) { return "long"; }
        else if constexpr(std::is_same_v<T,unsigned long>) { return "unsigned long"; }
        else if constexpr(std::is_same_v<T,long long>) { return "long long"; }
        else if constexpr(std::is_same_v<T,unsigned long long>) { return "unsigned long long"; }
        else if constexpr(std::is_same_v<T,double>) { return "double"; }
        else if constexpr(std::is_same_v<T,std::string>) { return "std::string"; }
        else { return typeid(T).name(); }
    }
};

template <typename T>
struct info<T, std::void_t<decltype(T::info_name())>> {
    static inline std::string name() { return T::info_name(); }
};

/// return a name of `T` including its cv, pointer and reference qualifiers
template <typename T>
inline std::string name() {
    typedef std::remove_reference_t<T> R;
    typedef std::remove_pointer_t<R> B;
    std::string s;

    if constexpr(std::is_const_v<B>) { s += "const "; }
    if constexpr(std::is_volatile_v<B>) { s += "volatile "; }

    s += info<std::remove_cv_t<B>>::name();

    if constexpr(std::is_pointer_v<R>) { s += "*"; }

    if constexpr(std::is_lvalue_reference_v<T>) { s += "&"; }
    else if constexpr(std::is_rvalue_reference_v<T>) { s += "&&"; }

    return s;
}

/**
 @brief append the names of template arguments to a string

 `gsd::type::templatize<int,std::string>("my_type")` returns
 "my_type<int,std::string>".
 */
template <typename T, typename... Ts>
inline std::string templatize(const std::string& s) {
    std::stringstream ss;
    ss << s << "<" << name<T>();
    ((ss << "," << name<Ts>()), ...);
    ss << ">";
    return ss.str();
}

template <typename P>
struct info<std::coroutine_handle<P>,void> {
    static inline std::string name() {
        return templatize<P>("std::coroutine_handle");
    }
};

}

/*
 @brief interface of an object which can describe itself in log lines

 A printable converts to "name@address[content]", and can be written to any
 `std::ostream`.
 */
struct printable {
    virtual ~printable() { }

    /// the namespaced and templatized name of the object's type
    virtual std::string name() const = 0;

    /// optional description of the object's state
    virtual inline std::string content() const { return {}; }

    inline std::string to_string() const {
        std::stringstream ss;
        ss << this->name() << "@" << (const void*)this;

        std::string c = this->content();
        if(!c.empty()) { ss << "[" << c << "]"; }

        return ss.str();
    }

    inline operator std::string() const { return to_string(); }
};

}

namespace std {

inline std::string to_string(const gsd::printable& p) { return p.to_string(); }

}

inline std::ostream& operator<<(std::ostream& out, const gsd::printable& p) {
    return out << p.to_string();
}

inline std::ostream& operator<<(std::ostream& out, const gsd::printable* p) {
    if(p) { return out << *p; }
    return out << "gsd::printable@nullptr";
}

template <typename P>
inline std::ostream& operator<<(std::ostream& out, const std::coroutine_handle<P>& h) {
    return out << gsd::type::name<std::coroutine_handle<P>>() << "@" << h.address();
}

namespace gsd {
namespace config {
namespace logging {

/**
 @brief the process wide default log level

 Set by the `gsd::lifecycle::config` while a lifecycle exists, otherwise the
 compile time GSDLOGLEVEL. Each thread starts at this level.
 */
int default_log_level();

}
}

/**
 @brief the functions behind the logging macros

 Every function checks the calling thread's log level before formatting
 anything.
 */
struct logger {
    /// return the calling thread's log level
    static int thread_log_level();

    /// set the calling thread's log level, clamped to [-9,9]
    static void thread_log_level(int level);

    template <typename... As>
    static inline void constructor(const printable* p, int verbosity,
                                   const char* file, int line, As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            write_(verbosity, file, line,
                   p->to_string() + "::" + type::basename(p->name()) +
                   "(" + arguments_(std::forward<As>(as)...) + ")");
        }
    }

    static inline void destructor(const printable* p, int verbosity,
                                  const char* file, int line) {
        if(verbosity <= logger::thread_log_level()) {
            write_(verbosity, file, line,
                   p->to_string() + "::~" + type::basename(p->name()) + "()");
        }
    }

    template <typename... As>
    static inline void method_enter(const printable* p, int verbosity,
                                    const char* file, int line,
                                    const std::string& method, As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            write_(verbosity, file, line,
                   p->to_string() + "::" + method +
                   "(" + arguments_(std::forward<As>(as)...) + ")");
        }
    }

    template <typename... As>
    static inline void method_body(const printable* p, int verbosity,
                                   const char* file, int line,
                                   const std::string& method, As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            write_(verbosity, file, line,
                   p->to_string() + "::" + method +
                   "():" + concatenate_(std::forward<As>(as)...));
        }
    }

    template <typename... As>
    static inline void function_enter(int verbosity, const char* file, int line,
                                      const std::string& function, As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            write_(verbosity, file, line,
                   function + "(" + arguments_(std::forward<As>(as)...) + ")");
        }
    }

    template <typename... As>
    static inline void function_body(int verbosity, const char* file, int line,
                                     const std::string& function, As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            write_(verbosity, file, line,
                   function + "():" + concatenate_(std::forward<As>(as)...));
        }
    }

private:
    logger(){}

    static int& tl_loglevel();

    static inline void write_(int verbosity, const char* file, int line,
                              const std::string& s) {
        loguru::log(verbosity, file, line, "%s", s.c_str());
    }

    // "a, b, c"
    template <typename... As>
    static inline std::string arguments_(As&&... as) {
        std::stringstream ss;
        const char* sep = "";
        ((ss << sep << std::forward<As>(as), sep = ", "), ...);
        return ss.str();
    }

    // "abc"
    template <typename... As>
    static inline std::string concatenate_(As&&... as) {
        std::stringstream ss;
        (ss << ... << std::forward<As>(as));
        return ss.str();
    }
};

}

#endif
