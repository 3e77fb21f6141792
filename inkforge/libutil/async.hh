#pragma once
///@file
/// The builder runs on a single kj event loop. `AsyncIoRoot` owns it for
/// `main` and for tests; everything else reaches it through `AIO()`.
///
/// Coroutines return `kj::Promise<Result<T>>` and unwrap the results of
/// what they await with `TRY_AWAIT`, which rethrows a failure after noting
/// the await point in the exception's async trace.

#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/result.hh"
#include "inkforge/libutil/signals.hh"
#include <cassert>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/async.h>
#include <kj/time.h>
#include <optional>
#include <source_location>

namespace inkforge {

struct AsyncContext
{
    static inline thread_local AsyncContext * current = nullptr;

    kj::AsyncIoProvider & provider;
    kj::UnixEventPort & unixEventPort;

    explicit AsyncContext(kj::AsyncIoContext & aio)
        : provider(*aio.provider)
        , unixEventPort(aio.unixEventPort)
    {
        assert(current == nullptr);
        current = this;
    }

    ~AsyncContext()
    {
        current = nullptr;
    }

    KJ_DISALLOW_COPY_AND_MOVE(AsyncContext);
};

/**
 * Sets up the event loop for the calling thread. At most one may exist per
 * thread.
 */
struct AsyncIoRoot
{
    kj::AsyncIoContext kj;
    AsyncContext context;

    AsyncIoRoot() : kj(kj::setupAsyncIo()), context(kj) {}
    KJ_DISALLOW_COPY_AND_MOVE(AsyncIoRoot);

    /**
     * Run the loop until `promise` settles. A `Result` is unwrapped, so
     * failures come back as exceptions.
     */
    template<typename T>
    auto blockOn(
        kj::Promise<T> && promise, std::source_location call_site = std::source_location::current()
    );
};

inline AsyncContext & AIO()
{
    assert(AsyncContext::current != nullptr);
    return *AsyncContext::current;
}

namespace detail {
inline void materializeResult(Result<void> r)
{
    r.value();
}

template<typename T>
inline T materializeResult(Result<T> r)
{
    return std::move(r.value());
}

template<typename T>
T runAsyncUnwrap(T t)
{
    return t;
}
template<typename T>
T runAsyncUnwrap(Result<T> t)
{
    return std::move(t).value();
}
}
}

#define INKFORGE_TRY_AWAIT_CONTEXT(_l_ctx, ...)                                     \
    ({                                                                              \
        auto _inkforge_awaited = (co_await (__VA_ARGS__));                          \
        if (_inkforge_awaited.has_error()) {                                        \
            try {                                                                   \
                _inkforge_awaited.value();                                          \
            } catch (::inkforge::BaseException & e) {                               \
                e.addAsyncTrace(::std::source_location::current(), _l_ctx());       \
                throw;                                                              \
            } catch (...) {                                                         \
                auto fe = ::inkforge::ForeignException::wrapCurrent();              \
                fe.addAsyncTrace(::std::source_location::current(), _l_ctx());      \
                throw fe;                                                           \
            }                                                                       \
        }                                                                           \
        ::inkforge::detail::materializeResult(std::move(_inkforge_awaited));        \
    })

/**
 * Looked up by name at each `INKFORGE_TRY_AWAIT`. A coroutine can shadow it
 * with a local lambda to label its trace frames, as session tasks do with
 * their token.
 */
static constexpr std::optional<std::string> inkforgeAsyncTaskContext()
{
    return std::nullopt;
}

#define INKFORGE_TRY_AWAIT(...) INKFORGE_TRY_AWAIT_CONTEXT(inkforgeAsyncTaskContext, __VA_ARGS__)

#define TRY_AWAIT INKFORGE_TRY_AWAIT

template<typename T>
inline auto inkforge::AsyncIoRoot::blockOn(kj::Promise<T> && promise, std::source_location call_site)
try {
    // promises are cancellation-safe, so an interrupt can drop this one unstarted
    checkInterrupt();
    return detail::runAsyncUnwrap(promise.wait(kj.waitScope));
} catch (BaseException & e) {
    e.addAsyncTrace(call_site);
    throw;
} catch (...) {
    auto fe = ForeignException::wrapCurrent();
    fe.addAsyncTrace(call_site);
    throw fe;
}
