//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef GRACEFUL_SHUTDOWN_RESULT
#define GRACEFUL_SHUTDOWN_RESULT

#include <exception>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "utility.hpp"
#include "logging.hpp"

namespace gsd {

/**
 @brief thrown when `value()` is called on a `gsd::result` holding an error
 */
struct bad_result_access : public std::exception {
    bad_result_access(const std::string& result_name) :
        estr([&]() -> std::string {
            std::stringstream ss;
            ss << "value() called on " << result_name << " holding an error";
            return ss.str();
        }())
    { }

    inline const char* what() const noexcept { return estr.c_str(); }

private:
    const std::string estr;
};

/**
 @brief wrapper marking a value as the error of a `gsd::result`

 ```
 gsd::result<int,std::string> r = gsd::unexpected<std::string>("failed");
 ```
 */
template <typename E>
struct unexpected {
    template <typename G,
              typename = std::enable_if_t<
                  !std::is_same_v<unqualified<G>, unexpected<E>>>>
    explicit unexpected(G&& g) : error_(std::forward<G>(g)) { }

    unexpected(const unexpected<E>&) = default;
    unexpected(unexpected<E>&&) = default;

    inline const E& error() const & { return error_; }
    inline E& error() & { return error_; }
    inline E&& error() && { return std::move(error_); }

private:
    E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

/**
 @brief the outcome of an operation which can fail without being exceptional

 Holds either a value `V` or an error `E`. Errors are ordinary values: ignoring
 them is always safe. Accessing `value()` when an error is held throws
 `gsd::bad_result_access`, while `operator*` and `operator->` are unchecked.

 `V` may be a move-only type, in which case the result is move-only.
 */
template <typename V, typename E>
struct result : public printable {
    typedef V value_type;
    typedef E error_type;

    result(const V& v) : data_(std::in_place_index<0>, v) { }
    result(V&& v) : data_(std::in_place_index<0>, std::move(v)) { }

    template <typename G>
    result(const unexpected<G>& u) :
        data_(std::in_place_index<1>, u.error())
    { }

    template <typename G>
    result(unexpected<G>&& u) :
        data_(std::in_place_index<1>, std::move(u).error())
    { }

    result(const result<V,E>&) = default;
    result(result<V,E>&&) = default;
    virtual ~result() { }

    result<V,E>& operator=(const result<V,E>&) = default;
    result<V,E>& operator=(result<V,E>&&) = default;

    static inline std::string info_name() {
        return type::templatize<V,E>("gsd::result");
    }

    inline std::string name() const { return result<V,E>::info_name(); }

    inline std::string content() const {
        return has_value() ? std::string("value") : std::string("error");
    }

    /// return true if a value is held, else false
    inline bool has_value() const { return data_.index() == 0; }

    /// return true if a value is held, else false
    explicit inline operator bool() const { return has_value(); }

    inline V& value() & {
        check_();
        return std::get<0>(data_);
    }

    inline const V& value() const & {
        check_();
        return std::get<0>(data_);
    }

    inline V&& value() && {
        check_();
        return std::move(std::get<0>(data_));
    }

    inline V& operator*() & { return std::get<0>(data_); }
    inline const V& operator*() const & { return std::get<0>(data_); }
    inline V&& operator*() && { return std::move(std::get<0>(data_)); }

    inline V* operator->() { return &(std::get<0>(data_)); }
    inline const V* operator->() const { return &(std::get<0>(data_)); }

    /// it is an error to call this when `has_value() == true`
    inline E& error() & { return std::get<1>(data_); }
    inline const E& error() const & { return std::get<1>(data_); }
    inline E&& error() && { return std::move(std::get<1>(data_)); }

private:
    inline void check_() const {
        if(!has_value()) [[unlikely]] {
            GSD_ERROR_METHOD_BODY("value","holds an error");
            throw bad_result_access(name());
        }
    }

    std::variant<V,E> data_;
};

/// specialization for operations which produce no value on success
template <typename E>
struct result<void,E> : public printable {
    typedef void value_type;
    typedef E error_type;

    result() { }

    template <typename G>
    result(const unexpected<G>& u) : error_(u.error()) { }

    template <typename G>
    result(unexpected<G>&& u) : error_(std::move(u).error()) { }

    result(const result<void,E>&) = default;
    result(result<void,E>&&) = default;
    virtual ~result() { }

    result<void,E>& operator=(const result<void,E>&) = default;
    result<void,E>& operator=(result<void,E>&&) = default;

    static inline std::string info_name() {
        return type::templatize<void,E>("gsd::result");
    }

    inline std::string name() const { return result<void,E>::info_name(); }

    inline std::string content() const {
        return has_value() ? std::string("value") : std::string("error");
    }

    inline bool has_value() const { return !error_; }
    explicit inline operator bool() const { return has_value(); }

    /// throws `gsd::bad_result_access` if an error is held
    inline void value() const {
        if(!has_value()) [[unlikely]] {
            GSD_ERROR_METHOD_BODY("value","holds an error");
            throw bad_result_access(name());
        }
    }

    inline E& error() & { return *error_; }
    inline const E& error() const & { return *error_; }
    inline E&& error() && { return std::move(*error_); }

private:
    std::optional<E> error_;
};

namespace type {

template <typename E>
struct info<gsd::unexpected<E>,void> {
    static inline std::string name() {
        return templatize<E>("gsd::unexpected");
    }
};

}

}

#endif
