//
// Copyright (c) 2026 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/tryfiles/content_cache.hpp>
#include <mutex>
#include <unordered_map>

namespace boost {
namespace tryfiles {

struct content_cache::impl
{
    struct entry
    {
        std::string version;
        value_type bytes;
    };

    mutable std::mutex m;
    std::unordered_map<std::string, entry> map;
};

content_cache::
~content_cache() = default;

content_cache::
content_cache()
    : impl_(new impl)
{
}

auto
content_cache::
find(
    core::string_view path,
    core::string_view version) const ->
        value_type
{
    std::string const key(path);
    std::lock_guard<std::mutex> lock(impl_->m);
    auto it = impl_->map.find(key);
    if(it == impl_->map.end())
        return nullptr;
    if(core::string_view(it->second.version) != version)
        return nullptr;
    return it->second.bytes;
}

void
content_cache::
insert(
    core::string_view path,
    core::string_view version,
    value_type bytes)
{
    impl::entry e{ std::string(version), std::move(bytes) };
    std::string key(path);
    std::lock_guard<std::mutex> lock(impl_->m);
    impl_->map[std::move(key)] = std::move(e);
}

std::size_t
content_cache::
size() const
{
    std::lock_guard<std::mutex> lock(impl_->m);
    return impl_->map.size();
}

} // tryfiles
} // boost
