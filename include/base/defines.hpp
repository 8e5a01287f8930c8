#ifndef _BASE_DEFINES_H_
#define _BASE_DEFINES_H_

#include <cassert>
#include <cstdint>
#include <functional>
#include <memory>

#ifndef MESHRTC_EXPORT
#define MESHRTC_EXPORT
#endif

#define DISALLOW_COPY_AND_ASSIGN(TypeName)  \
    TypeName(const TypeName&) = delete;     \
    TypeName& operator=(const TypeName&) = delete

// RTC_NOTREACHED
#define RTC_NOTREACHED() \
    assert(false && "NOT REACHED")

// Milliseconds.
using TimeInterval = int64_t;

// overloaded helper for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// weak_bind
// WARNING: weak_bind DO NOT call in a constructor, since weak_from_this() is NOT allowed used in a constructor.
template <typename F, typename T, typename... Args> 
auto weak_bind(F&& f, T* t, Args&& ..._args) {
    return [bound = std::bind(f, t, _args...), weak_this = t->weak_from_this()](auto &&...args) {
        if (auto shared_this = weak_this.lock()) {
            return bound(args...);
        } else {
            return static_cast<decltype(bound(args...))>(false);
        }
    };
}

#endif
