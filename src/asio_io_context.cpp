//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/asio_io_context.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/tryfiles/detail/call_mf.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <thread>
#include <vector>

namespace boost {
namespace tryfiles {

namespace {

class asio_io_context_impl
    : public asio_io_context
{
public:
    asio_io_context_impl(
        application& app,
        unsigned num_threads)
        : app_(app)
        , sect_(app.sections().get("application"))
        , num_threads_(num_threads > 0 ? num_threads : 1)
        , ioc_(static_cast<int>(num_threads_))
        , sigs_(ioc_.get_executor(), SIGINT, SIGTERM)
        , work_(ioc_.get_executor())
    {
        vt_.resize(num_threads_ - 1);
    }

    ~asio_io_context_impl()
    {
        // in case attach() was never called
        work_.reset();
        ioc_.stop();
        for(auto& t : vt_)
            if(t.joinable())
                t.join();
    }

    executor_type
    get_executor() noexcept override
    {
        return ioc_.get_executor();
    }

    std::size_t
    concurrency() const noexcept override
    {
        return num_threads_;
    }

    void attach() override
    {
        ioc_.run();

        for(auto& t : vt_)
            if(t.joinable())
                t.join();
    }

    void start() override
    {
        // Capture SIGINT and SIGTERM to
        // perform a clean shutdown
        sigs_.async_wait(call_mf(
            &asio_io_context_impl::on_signal, this));

        for(auto& t : vt_)
        {
            t = std::thread(
                [this]
                {
                    ioc_.run();
                });
        }
    }

    void stop() override
    {
        system::error_code ec;
        sigs_.cancel(ec); // error ignored
        work_.reset();
    }

private:
    void
    on_signal(
        system::error_code const& ec, int sig)
    {
        if(ec == asio::error::operation_aborted)
            return;
        LOG_INF(sect_)("signal {}, shutting down", sig);
        app_.stop();
    }

    application& app_;
    section sect_;
    unsigned num_threads_;
    asio::io_context ioc_;
    asio::signal_set sigs_;
    asio::executor_work_guard<
        asio::io_context::executor_type> work_;
    std::vector<std::thread> vt_;
};

} // (anon)

//------------------------------------------------

asio_io_context::
~asio_io_context() = default;

auto
install_asio_io_context(
    application& app,
    unsigned num_threads) ->
        asio_io_context&
{
    return app.emplace<
        asio_io_context_impl>(num_threads);
}

} // tryfiles
} // boost
