////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2022.08.15 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "inet4_addr.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <cstdint>
#include <string>

TFTP__NAMESPACE_BEGIN

class socket4_addr
{
public:
    inet4_addr    addr;
    std::uint16_t port {0};

public:
    /**
     * Parses socket address in form `ADDR:PORT` (port must be in range [1, 65535]).
     */
    static TFTP__EXPORT pfs::optional<socket4_addr> parse (char const * s, std::size_t n);
    static TFTP__EXPORT pfs::optional<socket4_addr> parse (std::string const & s);
};

inline std::string to_string (socket4_addr const & saddr)
{
    return to_string(saddr.addr) + ':' + std::to_string(saddr.port);
}

inline bool operator == (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr == b.addr && a.port == b.port;
}

inline bool operator != (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr != b.addr || a.port != b.port;
}

TFTP__NAMESPACE_END
