//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_SERVER_FIXED_ARRAY_HPP
#define BOOST_TRYFILES_SERVER_FIXED_ARRAY_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/detail/except.hpp>
#include <boost/assert.hpp>
#include <cstddef>
#include <memory>
#include <new>
#include <utility>

namespace boost {
namespace tryfiles {

/** An append-only array with a fixed capacity

    Elements are constructed in place and never
    move, so they may hold references to each other
    or be the target of pending asynchronous
    operations. Elements are destroyed in reverse
    order of construction.
*/
template<class T>
class fixed_array
{
public:
    using value_type = T;
    using reference = T&;
    using iterator = T*;
    using const_reference = T const&;
    using const_iterator = T const*;

    ~fixed_array()
    {
        if(! t_)
            return;
        while(n_--)
            t_[n_].~T();
        std::allocator<T>{}.deallocate(t_, cap_);
    }

    fixed_array(fixed_array const&) = delete;
    fixed_array& operator=(fixed_array const&) = delete;

    /** Constructor

        @par Postconditions
        ```
        size() == 0 &&  capacity() == cap
        ```
    */
    explicit
    fixed_array(std::size_t cap)
        : t_(std::allocator<T>{}.allocate(cap))
        , n_(0)
        , cap_(cap)
    {
    }

    std::size_t
    capacity() const noexcept
    {
        return cap_;
    }

    std::size_t
    size() const noexcept
    {
        return n_;
    }

    bool
    is_full() const noexcept
    {
        return n_ >= cap_;
    }

    T* data() noexcept
    {
        return t_;
    }

    reference operator[](std::size_t i)
    {
        BOOST_ASSERT(i < n_);
        return t_[i];
    }

    const_reference operator[](std::size_t i) const
    {
        BOOST_ASSERT(i < n_);
        return t_[i];
    }

    template<class... Args>
    T& emplace_back(Args&&... args)
    {
        if(is_full())
            detail::throw_out_of_range();
        auto p = t_ + n_;
        ::new(p) T(std::forward<Args>(args)...);
        ++n_;
        return *p;
    }

    iterator begin() noexcept { return t_; }
    iterator end() noexcept { return t_ + n_; }
    const_iterator begin() const noexcept { return t_; }
    const_iterator end() const noexcept { return t_ + n_; }

private:
    T* t_ = nullptr;
    std::size_t n_;
    std::size_t cap_;
};

} // tryfiles
} // boost

#endif
