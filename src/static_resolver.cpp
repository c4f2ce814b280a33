//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/static_resolver.hpp>
#include <boost/tryfiles/error.hpp>
#include <boost/tryfiles/etag.hpp>
#include <boost/tryfiles/http_date.hpp>
#include <boost/tryfiles/mime_types.hpp>
#include <boost/tryfiles/detail/except.hpp>
#include <boost/http_proto/field.hpp>
#include <boost/http_proto/method.hpp>
#include <boost/http_proto/status.hpp>
#include <boost/url/pct_string_view.hpp>
#include <boost/system/errc.hpp>
#include <limits>

namespace boost {
namespace tryfiles {

namespace {

// saturates instead of overflowing
std::uint64_t
parse_u64(core::string_view s) noexcept
{
    auto constexpr max =
        (std::numeric_limits<std::uint64_t>::max)();
    std::uint64_t v = 0;
    for(char c : s)
    {
        unsigned const d = static_cast<unsigned>(c - '0');
        if(v > (max - d) / 10)
            return max;
        v = v * 10 + d;
    }
    return v;
}

bool
is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

// Finds the first "bytes=" followed by digits, a dash,
// and optional digits. `last` is empty when absent.
bool
find_byte_range(
    core::string_view s,
    core::string_view& first,
    core::string_view& last) noexcept
{
    core::string_view const prefix("bytes=");
    std::size_t pos = 0;
    for(;;)
    {
        pos = s.find(prefix, pos);
        if(pos == core::string_view::npos)
            return false;
        auto i = pos + prefix.size();
        auto j = i;
        while(j < s.size() && is_digit(s[j]))
            ++j;
        if(j > i && j < s.size() && s[j] == '-')
        {
            first = s.substr(i, j - i);
            auto k = ++j;
            while(k < s.size() && is_digit(s[k]))
                ++k;
            last = s.substr(j, k - j);
            return true;
        }
        ++pos;
    }
}

// Rejects paths which could name something
// outside of the files directory.
bool
is_safe_path(core::string_view path) noexcept
{
    if(path.empty() || path.front() != '/')
        return false;
    std::size_t pos = 0;
    while(pos < path.size())
    {
        auto const next = path.find('/', pos);
        auto const seg = path.substr(pos,
            next == core::string_view::npos ?
                core::string_view::npos : next - pos);
        if(seg == "..")
            return false;
        if(next == core::string_view::npos)
            break;
        pos = next + 1;
    }
    for(char c : path)
        if(c == '\0' || c == '\\')
            return false;
    return true;
}

// Append an HTTP rel-path to a local filesystem path.
// The returned path is normalized for the platform.
void
path_cat(
    std::string& result,
    core::string_view prefix,
    core::string_view suffix)
{
    result = std::string(prefix);

#ifdef BOOST_MSVC
    char constexpr path_separator = '\\';
#else
    char constexpr path_separator = '/';
#endif
    if( ! result.empty() &&
        result.back() == path_separator)
        result.resize(result.size() - 1); // remove trailing
#ifdef BOOST_MSVC
    for(auto& c : result)
        if( c == '/')
            c = path_separator;
#endif
    for(auto const& c : suffix)
    {
        if(c == '/')
            result.push_back(path_separator);
        else
            result.push_back(c);
    }
}

// Returns the value of a field, or null if absent
struct field_ref
{
    bool present = false;
    core::string_view value;

    explicit
    operator bool() const noexcept
    {
        return present;
    }
};

field_ref
get_field(
    http::fields_base const& f,
    http::field id)
{
    field_ref r;
    auto it = f.find(id);
    if(it == f.end())
        return r;
    r.present = true;
    r.value = it->value;
    return r;
}

std::string
slice(
    std::string const& bytes,
    range_spec const& r,
    system::error_code& ec)
{
    if(r.start + r.count > bytes.size())
    {
        // the file shrank after it was stat'ed
        ec = BOOST_TRYFILES_ERR(error::short_read);
        return {};
    }
    return bytes.substr(
        static_cast<std::size_t>(r.start),
        static_cast<std::size_t>(r.count));
}

} // (anon)

//------------------------------------------------

range_spec
parse_range(
    core::string_view value,
    std::uint64_t size,
    std::uint64_t chunk)
{
    range_spec r;
    r.count = size;
    if(size == 0)
        return r;

    core::string_view first;
    core::string_view second;
    bool const matched =
        find_byte_range(value, first, second);

    std::uint64_t start = 0;
    if(matched)
        start = parse_u64(first);
    if(start >= size)
        return r;

    std::uint64_t last;
    if(matched && ! second.empty())
    {
        last = parse_u64(second);
        if(last >= size)
            last = size - 1;
        if(last < start)
            return r;
    }
    else
    {
        if(chunk == 0)
            chunk = 1;
        last = size - 1;
        if(size - start > chunk)
            last = start + chunk - 1;
    }

    r.start = start;
    r.count = last - start + 1;
    r.partial = start > 0 || r.count < size;
    return r;
}

//------------------------------------------------

static_resolver::
static_resolver(
    server_config const& cfg,
    file_system& fs,
    content_cache* cache,
    section sect)
    : files_dir_(cfg.files_dir)
    , index_name_(cfg.index_name)
    , chunk_(cfg.byte_range_chunk)
    , fs_(fs)
    , cache_(cache)
    , sect_(std::move(sect))
{
    if(chunk_ == 0)
        detail::throw_invalid_argument(
            "byte_range_chunk == 0");
}

system::result<resolved_asset>
static_resolver::
lookup(core::string_view path) const
{
    if(! is_safe_path(path))
        return BOOST_TRYFILES_ERR(error::bad_path);

    resolved_asset asset;
    path_cat(asset.path, files_dir_, path);

    system::error_code ec;
    asset.info = fs_.stat(asset.path, ec);
    if(ec.failed())
        return ec;

    if(asset.info.is_directory)
    {
        if(asset.path.empty() || asset.path.back() != '/')
            asset.path.push_back('/');
        asset.path.append(index_name_);
        asset.info = fs_.stat(asset.path, ec);
        if(ec.failed())
            return ec;
        asset.is_index = true;
    }

    if(! asset.info.is_file)
        return BOOST_TRYFILES_ERR(error::not_regular_file);

    return asset;
}

bool
static_resolver::
resolve(
    request const& req,
    reply& rep) const
{
    auto const method = req.message.method();
    if( method != http::method::get &&
        method != http::method::head)
        return false;

    // strip one trailing slash, except from "/"
    core::string_view key = req.url.encoded_path();
    if(key.empty())
        key = "/";
    if(key.size() > 1 && key.back() == '/')
        key.remove_suffix(1);

    std::string path;
    {
        auto rv = urls::make_pct_string_view(key);
        if(rv.has_error())
            return false;
        path = rv->decode();
    }

    auto rv = lookup(path);
    if(rv.has_error())
    {
        auto const& ec = rv.error();
        if(ec != system::errc::no_such_file_or_directory)
            LOG_WRN(sect_)("lookup {}: {}", path, ec.message());
        return false;
    }
    auto const& asset = rv.value();
    auto const& info = asset.info;
    auto const version = req.message.version();

    // built here and moved into rep only on success
    http::response res;
    res.set_start_line(http::status::ok, version);

    // If-Modified-Since
    if(info.mtime)
    {
        res.append(http::field::last_modified,
            format_http_date(*info.mtime));
        auto const f = get_field(
            req.message, http::field::if_modified_since);
        if(f)
        {
            auto const t = parse_http_date(f.value);
            // 304 when the file is newer than the given date
            if(t && *info.mtime > *t * 1000)
            {
                res.set_status(http::status::not_modified);
                rep.message = std::move(res);
                rep.body.clear();
                return true;
            }
        }
    }

    res.set(http::field::accept_ranges, "bytes");
    range_spec r;
    r.count = info.size;
    if(! asset.is_index)
    {
        auto const f = get_field(
            req.message, http::field::range);
        if(f)
        {
            r = parse_range(f.value, info.size, chunk_);
            if(r.partial)
            {
                std::string s;
                format_to(s, "bytes {}-{}/{}",
                    r.start, r.last(), info.size);
                res.append(http::field::content_range, s);
            }
        }
    }
    res.append(http::field::content_length,
        std::to_string(r.count));

    bool const is_head = method == http::method::head;
    auto const inm = get_field(
        req.message, http::field::if_none_match);
    bool const need_etag = ! info.mtime || inm;

    // HEAD reads content only to compute the etag
    std::string body;
    if(! is_head || need_etag)
    {
        system::error_code ec;
        body = read_content(req, key, asset, r, ec);
        if(ec.failed())
        {
            LOG_ERR(sect_)("read {}: {}", asset.path, ec.message());
            return false;
        }
    }

    // If-None-Match
    if(need_etag)
    {
        auto const tag = make_etag(body);
        res.append(http::field::etag, tag);
        if(inm && inm.value.find(tag) != core::string_view::npos)
        {
            res.set_status(http::status::not_modified);
            rep.message = std::move(res);
            rep.body.clear();
            return true;
        }
    }

    auto const ext = file_extension(asset.path);
    if(! ext.empty() && ! asset.is_index)
        res.append(http::field::cache_control,
            "public, max-age=31536000");
    else
        res.append(http::field::cache_control, "no-cache");

    res.append(http::field::content_type, mime_type(ext));

    if(is_head)
    {
        res.set_status(http::status::no_content);
        body.clear();
    }
    else if(r.partial)
    {
        res.set_status(http::status::partial_content);
    }

    rep.message = std::move(res);
    rep.body = std::move(body);
    return true;
}

std::string
static_resolver::
read_content(
    request const& req,
    core::string_view key,
    resolved_asset const& asset,
    range_spec const& r,
    system::error_code& ec) const
{
    if(cache_ && ! asset.is_index)
    {
        // refreshed when the query string changes
        std::string version;
        if( req.url.has_query() &&
            ! req.url.encoded_query().empty())
        {
            version.push_back('?');
            version.append(
                req.url.encoded_query().data(),
                req.url.encoded_query().size());
        }

        auto bytes = cache_->find(key, version);
        if( ! bytes ||
            bytes->size() != asset.info.size)
        {
            auto s = fs_.read_all(asset.path, ec);
            if(ec.failed())
                return {};
            bytes = std::make_shared<
                std::string const>(std::move(s));
            cache_->insert(key, version, bytes);
            LOG_DBG(sect_)("cached {}{} ({} paths)",
                key, version, cache_->size());
        }
        return slice(*bytes, r, ec);
    }

    if(fs_.supports_positional_read())
    {
        auto s = fs_.read_range(
            asset.path, r.start, r.count, ec);
        if(ec.failed())
            return {};
        if(s.size() != r.count)
        {
            ec = BOOST_TRYFILES_ERR(error::short_read);
            return {};
        }
        return s;
    }

    auto const s = fs_.read_all(asset.path, ec);
    if(ec.failed())
        return {};
    return slice(s, r, ec);
}

} // tryfiles
} // boost
