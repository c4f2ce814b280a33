//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/http_date.hpp>
#include <cstdio>
#include <ctime>

namespace boost {
namespace tryfiles {

namespace {

char const* const wkday[] = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"
};

char const* const month_name[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

// https://howardhinnant.github.io/date_algorithms.html
std::int64_t
days_from_civil(
    std::int64_t y,
    unsigned m,
    unsigned d) noexcept
{
    y -= m <= 2;
    std::int64_t const era = (y >= 0 ? y : y - 399) / 400;
    unsigned const yoe = static_cast<unsigned>(y - era * 400);
    unsigned const doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    unsigned const doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool
is_leap(int y) noexcept
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int
days_in_month(int y, int m) noexcept
{
    static int const n[] = {
        31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if(m == 2 && is_leap(y))
        return 29;
    return n[m - 1];
}

class cursor
{
    char const* p_;
    char const* end_;

public:
    explicit
    cursor(core::string_view s) noexcept
        : p_(s.data())
        , end_(s.data() + s.size())
    {
    }

    bool
    done() const noexcept
    {
        return p_ == end_;
    }

    bool
    lit(char c) noexcept
    {
        if(p_ == end_ || *p_ != c)
            return false;
        ++p_;
        return true;
    }

    bool
    lit(core::string_view s) noexcept
    {
        if(static_cast<std::size_t>(end_ - p_) < s.size())
            return false;
        if(core::string_view(p_, s.size()) != s)
            return false;
        p_ += s.size();
        return true;
    }

    // exactly n digits
    bool
    digits(int n, int& v) noexcept
    {
        v = 0;
        while(n--)
        {
            if(p_ == end_ || *p_ < '0' || *p_ > '9')
                return false;
            v = v * 10 + (*p_++ - '0');
        }
        return true;
    }

    // a run of letters
    core::string_view
    word() noexcept
    {
        auto const p0 = p_;
        while( p_ != end_ &&
            ((*p_ >= 'a' && *p_ <= 'z') ||
             (*p_ >= 'A' && *p_ <= 'Z')))
            ++p_;
        return core::string_view(p0, p_ - p0);
    }

    bool
    month(int& m) noexcept
    {
        for(int i = 0; i < 12; ++i)
        {
            if(lit(month_name[i]))
            {
                m = i + 1;
                return true;
            }
        }
        return false;
    }

    // HH:MM:SS
    bool
    time_of_day(int& h, int& mi, int& s) noexcept
    {
        return
            digits(2, h) && lit(':') &&
            digits(2, mi) && lit(':') &&
            digits(2, s);
    }
};

struct date_parts
{
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// Sun, 06 Nov 1994 08:49:37 GMT
bool
parse_imf_fixdate(cursor& c, date_parts& d) noexcept
{
    return
        c.lit(' ') && c.digits(2, d.day) &&
        c.lit(' ') && c.month(d.month) &&
        c.lit(' ') && c.digits(4, d.year) &&
        c.lit(' ') && c.time_of_day(d.hour, d.minute, d.second) &&
        c.lit(" GMT") && c.done();
}

// Sunday, 06-Nov-94 08:49:37 GMT
bool
parse_rfc850(cursor& c, date_parts& d) noexcept
{
    int yy = 0;
    if(! (
        c.lit(' ') && c.digits(2, d.day) &&
        c.lit('-') && c.month(d.month) &&
        c.lit('-') && c.digits(2, yy) &&
        c.lit(' ') && c.time_of_day(d.hour, d.minute, d.second) &&
        c.lit(" GMT") && c.done()))
        return false;
    d.year = yy < 70 ? 2000 + yy : 1900 + yy;
    return true;
}

// Sun Nov  6 08:49:37 1994
bool
parse_asctime(cursor& c, date_parts& d) noexcept
{
    if(! (c.lit(' ') && c.month(d.month) && c.lit(' ')))
        return false;
    if(c.lit(' '))
    {
        if(! c.digits(1, d.day))
            return false;
    }
    else if(! c.digits(2, d.day))
    {
        return false;
    }
    return
        c.lit(' ') && c.time_of_day(d.hour, d.minute, d.second) &&
        c.lit(' ') && c.digits(4, d.year) &&
        c.done();
}

core::string_view
trim(core::string_view s) noexcept
{
    while(! s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while(! s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

} // (anon)

std::string
format_http_date(
    std::int64_t ms)
{
    // floor toward negative infinity
    std::int64_t secs = ms / 1000;
    if(ms % 1000 < 0)
        --secs;

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_utc{};
#if defined(_WIN32)
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif

    // Format strictly according to RFC 9110 (fixed-width, English locale)
    char buf[40];
    std::snprintf(
        buf, sizeof(buf),
        "%s, %02d %s %04d %02d:%02d:%02d GMT",
        wkday[tm_utc.tm_wday],
        tm_utc.tm_mday,
        month_name[tm_utc.tm_mon],
        tm_utc.tm_year + 1900,
        tm_utc.tm_hour,
        tm_utc.tm_min,
        tm_utc.tm_sec);

    return std::string(buf);
}

boost::optional<std::int64_t>
parse_http_date(
    core::string_view s) noexcept
{
    cursor c(trim(s));
    date_parts d;

    auto const day_name = c.word();
    bool ok;
    if(c.lit(','))
    {
        if(day_name.size() == 3)
            ok = parse_imf_fixdate(c, d);
        else
            ok = parse_rfc850(c, d);
    }
    else if(day_name.size() == 3)
    {
        ok = parse_asctime(c, d);
    }
    else
    {
        ok = false;
    }
    if(! ok)
        return boost::none;

    if( d.day < 1 ||
        d.day > days_in_month(d.year, d.month) ||
        d.hour > 23 ||
        d.minute > 59 ||
        d.second > 60)
        return boost::none;

    auto const days = days_from_civil(
        d.year,
        static_cast<unsigned>(d.month),
        static_cast<unsigned>(d.day));
    return
        days * 86400 +
        d.hour * 3600 +
        d.minute * 60 +
        d.second;
}

} // tryfiles
} // boost
