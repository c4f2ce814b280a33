//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_ASIO_IO_CONTEXT_HPP
#define BOOST_TRYFILES_ASIO_IO_CONTEXT_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/application.hpp>
#include <boost/asio/io_context.hpp>

namespace boost {
namespace tryfiles {

/** Asio's io_context as an application part

    When started, the part captures `SIGINT` and `SIGTERM`
    and calls @ref application::stop when one arrives.
*/
class BOOST_SYMBOL_VISIBLE
    asio_io_context
    : public application::part
{
public:
    using executor_type =
        asio::io_context::executor_type;

    /** Destructor
    */
    BOOST_TRYFILES_DECL
    ~asio_io_context();

    virtual
    executor_type
    get_executor() noexcept = 0;

    /** Return the concurrency level
    */
    virtual
    std::size_t
    concurrency() const noexcept = 0;

    /** Run the context

        This function attaches the current thread to I/O context
        so that it may be used for executing submitted function
        objects. Blocks the calling thread until the part is stopped
        and has no outstanding work.
    */
    virtual void attach() = 0;
};

/** Install an io_context run by the given number of threads

    One of the threads is the caller of
    @ref asio_io_context::attach.
*/
BOOST_TRYFILES_DECL
auto
install_asio_io_context(
    application& app,
    unsigned num_threads) ->
        asio_io_context&;

} // tryfiles
} // boost

#endif
