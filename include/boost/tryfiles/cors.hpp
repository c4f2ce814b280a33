//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef BOOST_TRYFILES_CORS_HPP
#define BOOST_TRYFILES_CORS_HPP

#include <boost/tryfiles/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/http_proto/fields_base.hpp>
#include <memory>
#include <regex>
#include <string>

namespace boost {
namespace tryfiles {

/** The cross-origin resource sharing policy of a server

    A policy is one of three kinds, chosen once
    when the policy is constructed:

    @li disabled: no headers are added.

    @li wildcard: every origin may read the
        response with simple methods.

    @li pattern: a request whose `Origin` matches a
        regular expression is allowed to send
        credentials and use any common method.
*/
class cors_policy
{
public:
    enum class kind
    {
        disabled,
        wildcard,
        pattern
    };

    /** Constructor

        The policy is disabled.
    */
    cors_policy() = default;

    /** Constructor

        An empty string disables the policy, the string `*`
        selects the wildcard policy, and any other string is
        compiled as an ECMAScript regular expression which
        must be found somewhere in the request's origin.

        @throws std::invalid_argument `source` is not
        a valid regular expression.
    */
    BOOST_TRYFILES_DECL
    explicit
    cors_policy(
        core::string_view source);

    /** Return the wildcard policy
    */
    static
    cors_policy
    wildcard()
    {
        return cors_policy("*");
    }

    /** Return the kind of policy
    */
    kind
    get_kind() const noexcept
    {
        return kind_;
    }

    /** Return the string the policy was constructed from
    */
    core::string_view
    source() const noexcept
    {
        return source_;
    }

    /** Append the CORS headers for a request to a response

        @param req The fields of the request.

        @param res The fields of the response, to which
        headers are appended.
    */
    BOOST_TRYFILES_DECL
    void
    apply(
        http::fields_base const& req,
        http::fields_base& res) const;

private:
    kind kind_ = kind::disabled;
    std::string source_;
    std::shared_ptr<std::regex const> re_;
};

} // tryfiles
} // boost

#endif
