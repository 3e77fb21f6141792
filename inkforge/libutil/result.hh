#pragma once
///@file
/// Value-or-exception results for coroutines. A failed `Result` carries the
/// exception itself, so `TRY_AWAIT` and `AsyncIoRoot::blockOn` can rethrow
/// it unchanged.

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <exception>

namespace inkforge {

template<typename T, typename E = std::exception_ptr>
using Result = boost::outcome_v2::std_result<T, E>;

namespace result {

using boost::outcome_v2::success;
using boost::outcome_v2::failure;

/**
 * For the `catch (...)` block closing a coroutine: fail with whatever is
 * being handled.
 */
inline auto current_exception()
{
    return failure(std::current_exception());
}

}

}
