//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_DETAIL_CALL_MF_HPP
#define BOOST_TRYFILES_DETAIL_CALL_MF_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <utility>

namespace boost {
namespace tryfiles {

namespace detail {

// Invokes a member function on a bound object
template<class T, class MemFn>
class call_mf_impl
{
    T* obj_;
    MemFn memfn_;

public:
    call_mf_impl(T* obj, MemFn memfn) noexcept
        : obj_(obj)
        , memfn_(memfn)
    {
    }

    template<class... Args>
    auto operator()(Args&&... args) const ->
        decltype((std::declval<T*>()->*std::declval<MemFn>())(
            std::forward<Args>(args)...))
    {
        return (obj_->*memfn_)(std::forward<Args>(args)...);
    }
};

} // detail

/** Return a function object which calls a member function

    The object must outlive every invocation.
    This is used to create completion handlers.
*/
template<class MemFn, class T>
detail::call_mf_impl<T, MemFn>
call_mf(MemFn memfn, T* obj) noexcept
{
    return detail::call_mf_impl<T, MemFn>(obj, memfn);
}

} // tryfiles
} // boost

#endif
