//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_SERVER_WORKERS_HPP
#define BOOST_TRYFILES_SERVER_WORKERS_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/detail/call_mf.hpp>
#include <boost/tryfiles/application.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/tryfiles/server/fixed_array.hpp>
#include <boost/asio/basic_socket_acceptor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/prepend.hpp>
#include <boost/assert.hpp>
#include <cstdint>

namespace boost {
namespace tryfiles {

class BOOST_SYMBOL_VISIBLE
    workers_base
{
public:
    virtual ~workers_base() = default;

    virtual application& app() noexcept = 0;

    /** Return a worker to the idle list

        This is called by a worker when its
        connection is closed.
    */
    virtual void do_idle(void* worker) = 0;
};

/** A listening socket and a fixed set of workers

    An array of workers created upon construction is used to
    accept incoming connections and handle their sessions.
    A worker serves one connection at a time, then returns
    to the idle list. When every worker is busy, pending
    connections wait in the listen backlog.

    @par Worker exemplar
    @code
    struct Worker
    {
        using executor_type = ...;
        using protocol_type = asio::ip::tcp;
        using socket_type = asio::basic_stream_socket<protocol_type, executor_type>;

        socket_type& socket() noexcept;
        typename protocol_type::endpoint& endpoint() noexcept;

        void on_accept();
        void cancel();
    };
    @endcode

    @tparam Worker The type of worker to use.
*/
template<class Worker>
class workers
    : public workers_base
{
public:
    using executor_type = typename Worker::executor_type;
    using protocol_type = typename Worker::protocol_type;
    using acceptor_type = asio::basic_socket_acceptor<protocol_type, executor_type>;
    using endpoint_type = typename protocol_type::endpoint;

    /** Constructor

        The listening socket is opened and bound here.

        @param app The @ref application which holds this part
        @param ex The executor to use for the acceptor
        @param ep The endpoint to listen on
        @param concurrency The number of accepts to keep outstanding
        @param num_workers The number of workers to construct
        @param args Arguments forwarded to each worker's constructor

        @throws system::system_error if the endpoint cannot be bound
    */
    template<class Executor1, class... Args>
    workers(
        application& app,
        Executor1 const& ex,
        endpoint_type const& ep,
        std::size_t concurrency,
        std::size_t num_workers,
        Args&&... args);

    /** Return the endpoint the acceptor is bound to
    */
    endpoint_type
    local_endpoint() const
    {
        return acceptor_.local_endpoint();
    }

    void start();
    void stop();

private:
    struct worker;

    application& app() noexcept override;
    void do_idle(void*) override;
    void do_accepts();
    void on_accept(worker*, system::error_code const&);
    void do_stop();

    application& app_;
    section sect_;
    executor_type ex_;
    acceptor_type acceptor_;
    fixed_array<worker> vw_;
    worker* idle_ = nullptr;
    std::size_t n_idle_ = 0;
    std::size_t need_;  // number of accepts we need
    bool stop_ = false;
};

//------------------------------------------------

template<class Worker>
struct workers<Worker>::
    worker
{
    worker* next;
    Worker w;

    template<class... Args>
    explicit worker(
        worker* next_, Args&&... args)
        : next(next_)
        , w(std::forward<Args>(args)...)
    {
    }
};

//------------------------------------------------

template<class Worker>
template<class Executor1, class... Args>
workers<Worker>::
workers(
    application& app,
    Executor1 const& ex,
    endpoint_type const& ep,
    std::size_t concurrency,
    std::size_t num_workers,
    Args&&... args)
    : app_(app)
    , sect_(app_.sections().get("workers"))
    , ex_(executor_type(ex))
    , acceptor_(ex_, ep, true)
    , vw_(num_workers)
    , need_(concurrency)
{
    while(! vw_.is_full())
        idle_ = &vw_.emplace_back(idle_, *this,
            std::forward<Args>(args)...);
    n_idle_ = vw_.size();
    LOG_INF(sect_)("listening on {} with {} workers",
        acceptor_.local_endpoint(), vw_.size());
}

template<class Worker>
application&
workers<Worker>::
app() noexcept
{
    return app_;
}

template<class Worker>
void
workers<Worker>::
do_idle(void* pw)
{
    asio::dispatch(ex_,
        [this, pw]()
        {
            // recover the `worker` pointer without using offsetof
            worker* w = vw_.data() + (
                reinterpret_cast<std::uintptr_t>(pw) -
                reinterpret_cast<std::uintptr_t>(vw_.data())) /
                sizeof(worker);
            // push
            w->next = idle_;
            idle_ = w;
            ++n_idle_;
            do_accepts();
        });
}

template<class Worker>
void
workers<Worker>::
start()
{
    asio::dispatch(ex_, call_mf(&workers::do_accepts, this));
}

template<class Worker>
void
workers<Worker>::
stop()
{
    asio::dispatch(ex_, call_mf(&workers::do_stop, this));
}

template<class Worker>
void
workers<Worker>::
do_accepts()
{
    BOOST_ASSERT(ex_.running_in_this_thread());
    if(stop_)
        return;
    while(need_ > 0)
    {
        if(! idle_)
        {
            // all workers are busy
            LOG_DBG(sect_)("all {} workers busy", vw_.size());
            return;
        }
        --need_;
        // pop
        auto pw = idle_;
        idle_ = idle_->next;
        --n_idle_;
        acceptor_.async_accept(pw->w.socket(), pw->w.endpoint(),
            asio::prepend(call_mf(&workers::on_accept, this), pw));
    }
}

template<class Worker>
void
workers<Worker>::
on_accept(
    worker* pw,
    system::error_code const& ec)
{
    BOOST_ASSERT(ex_.running_in_this_thread());
    ++need_;
    if(ec.failed())
    {
        // push
        pw->next = idle_;
        idle_ = pw;
        ++n_idle_;
        LOG_DBG(sect_)("async_accept: {}", ec.message());
        return do_accepts();
    }
    LOG_TRC(sect_)("accepted {}", pw->w.endpoint());
    do_accepts();
    asio::dispatch(pw->w.socket().get_executor(),
        call_mf(&Worker::on_accept, &pw->w));
}

template<class Worker>
void
workers<Worker>::
do_stop()
{
    stop_ = true;

    system::error_code ec;
    acceptor_.cancel(ec); // error ignored
    acceptor_.close(ec);
    for(auto& w : vw_)
        w.w.cancel();
    LOG_INF(sect_)("stopped accepting");
}

} // tryfiles
} // boost

#endif
