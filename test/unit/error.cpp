//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <boost/tryfiles/error.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace tryfiles {

struct error_test
{
    void
    check(error e, core::string_view msg)
    {
        system::error_code ec = e;
        BOOST_TEST(ec.failed());
        BOOST_TEST_EQ(ec.category().name(),
            core::string_view("boost.tryfiles"));
        BOOST_TEST_EQ(ec.message(), msg);
        BOOST_TEST(ec == e);
    }

    void
    run()
    {
        check(error::bad_path, "bad path");
        check(error::not_regular_file, "not a regular file");
        check(error::short_read, "short read");
        check(error::not_supported, "operation not supported");

        system::error_code ec = error::success;
        BOOST_TEST(! ec.failed());

        ec = BOOST_TRYFILES_ERR(error::short_read);
        BOOST_TEST(ec == error::short_read);
    }
};

TEST_SUITE(
    error_test,
    "boost.tryfiles.error");

} // tryfiles
} // boost
