//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_SERVER_HTTP_SESSION_HPP
#define BOOST_TRYFILES_SERVER_HTTP_SESSION_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/tryfiles/detail/call_mf.hpp>
#include <boost/tryfiles/application.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/tryfiles/message.hpp>
#include <boost/tryfiles/read.hpp>
#include <boost/tryfiles/try_files.hpp>
#include <boost/tryfiles/write.hpp>
#include <boost/tryfiles/server/workers.hpp>
#include <boost/http_proto/field.hpp>
#include <boost/http_proto/method.hpp>
#include <boost/http_proto/request.hpp>
#include <boost/http_proto/request_parser.hpp>
#include <boost/http_proto/serializer.hpp>
#include <boost/http_proto/status.hpp>
#include <boost/http_proto/string_body.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <boost/asio/basic_stream_socket.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/assert.hpp>
#include <atomic>
#include <exception>
#include <memory>
#include <string>

namespace boost {
namespace tryfiles {

/** A worker which serves one HTTP/1.1 connection at a time

    Requests on a connection are read and answered in order.
    Producing a reply may block, so the @ref try_files
    dispatcher runs on the work pool, and the reply is
    written from the connection's executor.

    @tparam Executor The executor used by the socket. This
    is usually a strand.
*/
template<class Executor>
class http_session
{
public:
    using executor_type = Executor;
    using protocol_type = asio::ip::tcp;
    using socket_type =
        asio::basic_stream_socket<protocol_type, Executor>;

    template<class Executor0>
    http_session(
        workers_base& wb,
        Executor0 const& ex,
        try_files const& tf,
        asio::thread_pool& pool);

    socket_type&
    socket() noexcept
    {
        return sock_;
    }

    typename protocol_type::endpoint&
    endpoint() noexcept
    {
        return ep_;
    }

    /** Called when an incoming connection is accepted
    */
    void on_accept();

    /** Cancel all outstanding I/O

        The connection is closed after the
        reply currently being produced, if any,
        is written.
    */
    void cancel();

private:
    void do_read();
    void on_read(
        system::error_code ec,
        std::size_t bytes_transferred);
    void do_handle();
    void do_resume();
    void do_write();
    void on_write(
        system::error_code const& ec,
        std::size_t bytes_transferred);
    void do_cancel();
    void do_close();
    void do_fail(core::string_view s,
        system::error_code const& ec);

    std::string id() const
    {
        return std::string("[") + std::to_string(id_) + "]";
    }

    using work_guard =
        asio::executor_work_guard<Executor>;

    section sect_;
    std::size_t id_ = 0;
    workers_base& wb_;
    socket_type sock_;
    typename protocol_type::endpoint ep_;
    try_files const& tf_;
    asio::thread_pool& pool_;
    http::request_parser pr_;
    http::serializer sr_;
    http::request req_;
    urls::url_view url_;
    reply rep_;
    std::unique_ptr<work_guard> pwg_;
    bool head_ = false;
    bool stop_ = false;
};

//------------------------------------------------

template<class Executor>
template<class Executor0>
http_session<Executor>::
http_session(
    workers_base& wb,
    Executor0 const& ex,
    try_files const& tf,
    asio::thread_pool& pool)
    : sect_(wb.app().sections().get("http_session"))
    , id_(
        []() noexcept
        {
            static std::atomic<std::size_t> n{0};
            return ++n;
        }())
    , wb_(wb)
    , sock_(Executor(ex))
    , tf_(tf)
    , pool_(pool)
    , pr_(wb.app().services())
    , sr_(wb.app().services())
{
}

template<class Executor>
void
http_session<Executor>::
cancel()
{
    asio::dispatch(sock_.get_executor(),
        call_mf(&http_session::do_cancel, this));
}

template<class Executor>
void
http_session<Executor>::
do_cancel()
{
    stop_ = true;
    system::error_code ec;
    sock_.cancel(ec); // error ignored
}

template<class Executor>
void
http_session<Executor>::
on_accept()
{
    BOOST_ASSERT(sock_.get_executor().running_in_this_thread());
    LOG_TRC(sect_)("{} connection from {}", id(), ep_);
    pr_.reset();
    do_read();
}

template<class Executor>
void
http_session<Executor>::
do_read()
{
    if(stop_)
        return do_close();
    pr_.start();
    sr_.reset();
    tryfiles::async_read(sock_, pr_,
        call_mf(&http_session::on_read, this));
}

template<class Executor>
void
http_session<Executor>::
on_read(
    system::error_code ec,
    std::size_t bytes_transferred)
{
    if(ec.failed())
        return do_fail("http_session::on_read", ec);

    LOG_TRC(sect_)(
        "{} http_session::on_read bytes={}",
        id(), bytes_transferred);

    BOOST_ASSERT(pr_.is_complete());

    // url_ refers into this copy
    req_ = pr_.get();
    head_ = req_.method() == http::method::head;
    rep_.clear(req_.version());

    // parse the URL
    {
        auto rv = urls::parse_uri_reference(req_.target());
        if(rv.has_error())
        {
            rep_.message.set_status(
                http::status::bad_request);
            rep_.set_body(
                "Bad Request: " + rv.error().message());
            return do_write();
        }
        url_ = rv.value();
    }

    // keep the I/O context running while
    // the work pool produces the reply
    BOOST_ASSERT(! pwg_);
    pwg_.reset(new work_guard(sock_.get_executor()));
    asio::post(pool_,
        call_mf(&http_session::do_handle, this));
}

// Runs on the work pool
template<class Executor>
void
http_session<Executor>::
do_handle()
{
    request const req{ req_, url_, pr_.body() };
    try
    {
        tf_(req, rep_);
    }
    catch(std::exception const& e)
    {
        LOG_ERR(sect_)("{} {} {}: {}",
            id(), req_.method_text(), req_.target(), e.what());
        rep_.clear(req_.version());
        rep_.message.set_status(
            http::status::internal_server_error);
        rep_.set_body("Internal Server Error");
    }
    catch(...)
    {
        LOG_ERR(sect_)("{} {} {}: unknown exception",
            id(), req_.method_text(), req_.target());
        rep_.clear(req_.version());
        rep_.message.set_status(
            http::status::internal_server_error);
        rep_.set_body("Internal Server Error");
    }
    asio::dispatch(sock_.get_executor(),
        call_mf(&http_session::do_resume, this));
}

template<class Executor>
void
http_session<Executor>::
do_resume()
{
    BOOST_ASSERT(sock_.get_executor().running_in_this_thread());
    BOOST_ASSERT(pwg_.get() != nullptr);
    pwg_.reset();
    do_write();
}

template<class Executor>
void
http_session<Executor>::
do_write()
{
    auto& m = rep_.message;
    m.set_keep_alive(
        ! stop_ &&
        req_.keep_alive() &&
        m.keep_alive());

    LOG_DBG(sect_)("{} {} {} {}", id(),
        req_.method_text(), req_.target(), m.status_int());

    auto const st = m.status();
    if( head_ ||
        st == http::status::no_content ||
        st == http::status::not_modified)
    {
        rep_.body.clear();
        sr_.start(m);
    }
    else
    {
        if(! m.exists(http::field::content_length))
            m.set_payload_size(rep_.body.size());
        sr_.start(m,
            http::string_body(std::move(rep_.body)));
    }

    tryfiles::async_write(sock_, sr_,
        call_mf(&http_session::on_write, this));
}

template<class Executor>
void
http_session<Executor>::
on_write(
    system::error_code const& ec,
    std::size_t bytes_transferred)
{
    if(ec.failed())
        return do_fail("http_session::on_write", ec);

    BOOST_ASSERT(sr_.is_done());

    LOG_TRC(sect_)(
        "{} http_session::on_write bytes={}",
        id(), bytes_transferred);

    if(rep_.message.keep_alive())
        return do_read();

    do_close();
}

/** Close the connection to end the session
*/
template<class Executor>
void
http_session<Executor>::
do_close()
{
    system::error_code ec;
    sock_.shutdown(socket_type::shutdown_send, ec); // error ignored
    sock_.close(ec);

    // tidy up lingering objects
    pr_.reset();
    sr_.reset();
    rep_.body.clear();

    LOG_TRC(sect_)("{} closed", id());
    wb_.do_idle(this);
}

template<class Executor>
void
http_session<Executor>::
do_fail(
    core::string_view s,
    system::error_code const& ec)
{
    system::error_code ec2;
    sock_.close(ec2);

    pr_.reset();
    sr_.reset();
    rep_.body.clear();

    if(ec == asio::error::operation_aborted)
    {
        LOG_TRC(sect_)("{} {}: {}", id(), s, ec.message());
        // this means the worker was stopped, don't submit new work
        return;
    }

    LOG_DBG(sect_)("{} {}: {}", id(), s, ec.message());
    wb_.do_idle(this);
}

} // tryfiles
} // boost

#endif
