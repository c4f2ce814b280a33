//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/server/try_files_server.hpp>
#include <boost/tryfiles/asio_io_context.hpp>
#include <boost/tryfiles/file_system.hpp>
#include <boost/tryfiles/logger.hpp>
#include <boost/tryfiles/try_files.hpp>
#include <boost/tryfiles/server/http_session.hpp>
#include <boost/tryfiles/server/workers.hpp>
#include <boost/http_proto/request_parser.hpp>
#include <boost/http_proto/serializer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>

namespace boost {
namespace tryfiles {

try_files_server::
~try_files_server() = default;

namespace {

class try_files_server_impl
    : public try_files_server
{
    using strand_type =
        asio::strand<asio::io_context::executor_type>;
    using workers_type =
        workers<http_session<strand_type>>;

public:
    try_files_server_impl(
        application& app,
        asio_io_context& ioc,
        server_config cfg,
        fallback_handler fallback)
        : ioc_(ioc)
        , cfg_(std::move(cfg))
        , sect_(app.sections().get("try_files"))
        , tf_(cfg_, fs_, std::move(fallback), app.sections())
        , w_(app,
            ioc_.get_executor(),
            asio::ip::tcp::endpoint(
                asio::ip::make_address(cfg_.address),
                cfg_.port),
            ioc_.concurrency(),
            cfg_.max_connections,
            ioc_.get_executor(), tf_, pool_)
        , pool_(cfg_.work_threads > 0 ? cfg_.work_threads : 1)
    {
        LOG_INF(sect_)("serving {} (cors={}, cache={})",
            cfg_.files_dir,
            cfg_.cors.get_kind() == cors_policy::kind::disabled ?
                core::string_view("off") : cfg_.cors.source(),
            cfg_.memory_cache ? "on" : "off");
    }

    ~try_files_server_impl()
    {
        // no handler may run after the workers are gone
        pool_.join();
    }

    void
    start() override
    {
        w_.start();
    }

    void
    stop() override
    {
        if(! closing_.exchange(true))
        {
            if(cfg_.before_close)
                cfg_.before_close();
        }
        w_.stop();
    }

    void
    attach() override
    {
        ioc_.attach();
    }

    asio::ip::tcp::endpoint
    local_endpoint() const override
    {
        return w_.local_endpoint();
    }

    try_files const&
    dispatcher() const noexcept override
    {
        return tf_;
    }

private:
    asio_io_context& ioc_;
    server_config cfg_;
    section sect_;
    native_file_system fs_;
    try_files tf_;
    workers_type w_;
    asio::thread_pool pool_;
    std::atomic<bool> closing_{false};
};

} // (anon)

auto
install_try_files_server(
    application& app,
    server_config cfg,
    fallback_handler fallback) ->
        try_files_server&
{
    app.sections().set_threshold(
        static_cast<int>(cfg.level));

    // required by request_parser and serializer
    http::install_parser_service(app.services(),
        http::request_parser::config());
    http::install_serializer_service(app.services(),
        http::serializer::config());

    auto& ioc = install_asio_io_context(
        app, cfg.io_threads);
    return app.emplace<try_files_server_impl>(
        ioc, std::move(cfg), std::move(fallback));
}

} // tryfiles
} // boost
