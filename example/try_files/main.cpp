//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/application.hpp>
#include <boost/tryfiles/cors.hpp>
#include <boost/tryfiles/message.hpp>
#include <boost/tryfiles/server_config.hpp>
#include <boost/tryfiles/server/try_files_server.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

namespace boost {
namespace tryfiles {

int server_main( int argc, char* argv[] )
{
    try
    {
        // Check command line arguments.
        if (argc < 4 || argc > 8)
        {
            std::cerr <<
                "Usage: " << argv[0] <<
                " <address> <port> <doc_root>"
                " [io_threads] [max_connections] [cors] [cache]\n"
                "Example:\n"
                "    " << argv[0] << " 0.0.0.0 8080 public 1 64 \"*\" cache\n";
            return EXIT_FAILURE;
        }

        server_config cfg;
        cfg.address = argv[1];
        cfg.port = static_cast<unsigned short>(std::atoi(argv[2]));
        cfg.files_dir = argv[3];
        if(argc > 4)
            cfg.io_threads = static_cast<unsigned>(std::atoi(argv[4]));
        if(argc > 5)
            cfg.max_connections = static_cast<std::size_t>(std::atoi(argv[5]));
        if(argc > 6 && argv[6][0] != '\0')
            cfg.cors = cors_policy(argv[6]);
        if(argc > 7)
            cfg.memory_cache = std::strcmp(argv[7], "cache") == 0;
        cfg.before_close =
            []
            {
                std::cerr << "Shutting down\n";
            };

        application app;

        auto& srv = install_try_files_server(
            app, std::move(cfg), not_found_handler);

        app.start();
        srv.attach();
    }
    catch( std::exception const& e )
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // tryfiles
} // boost

int main(int argc, char* argv[])
{
    return boost::tryfiles::server_main( argc, argv );
}
