////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.01.17 Initial version.
//      2026.10.05 Accept well-known ports (TFTP listens on 69).
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/socket4_addr.hpp"
#include <pfs/integer.hpp>
#include <algorithm>
#include <system_error>

TFTP__NAMESPACE_BEGIN

pfs::optional<socket4_addr> socket4_addr::parse (char const * s, std::size_t n)
{
    auto delim_pos = std::find(s, s + n, ':');

    if (delim_pos == s + n)
        return pfs::nullopt;

    auto addr = inet4_addr::parse(s, static_cast<std::size_t>(delim_pos - s));

    if (!addr)
        return pfs::nullopt;

    if (delim_pos + 1 == s + n)
        return pfs::nullopt;

    std::error_code ec;
    auto port = pfs::to_integer(delim_pos + 1, s + n
        , std::uint16_t{1}, std::uint16_t{65535}, ec);

    if (ec)
        return pfs::nullopt;

    return socket4_addr{*addr, port};
}

pfs::optional<socket4_addr> socket4_addr::parse (std::string const & s)
{
    return parse(s.c_str(), s.size());
}

TFTP__NAMESPACE_END
