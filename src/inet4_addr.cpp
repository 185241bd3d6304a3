////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2017.07.03 Initial version.
//      2026.10.05 Parser rewritten without regular expressions.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/inet4_addr.hpp"
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <algorithm>
#include <system_error>

TFTP__NAMESPACE_BEGIN

constexpr std::uint32_t inet4_addr::any_addr_value;

pfs::optional<inet4_addr> inet4_addr::parse (char const * s, std::size_t n)
{
    std::uint8_t parts[4] = {0, 0, 0, 0};
    char const * first = s;
    char const * last = s + n;

    for (int i = 0; i < 4; i++) {
        auto pos = std::find(first, last, '.');

        if (i < 3 && pos == last)
            return pfs::nullopt;

        if (i == 3 && pos != last)
            return pfs::nullopt;

        // Up to three decimal digits per part
        if (pos == first || pos - first > 3)
            return pfs::nullopt;

        if (!std::all_of(first, pos, [] (char ch) { return ch >= '0' && ch <= '9'; }))
            return pfs::nullopt;

        std::error_code ec;
        parts[i] = pfs::to_integer(first, pos, std::uint8_t{0}, std::uint8_t{255}, ec);

        if (ec)
            return pfs::nullopt;

        first = (pos == last) ? last : pos + 1;
    }

    return inet4_addr{parts[0], parts[1], parts[2], parts[3]};
}

pfs::optional<inet4_addr> inet4_addr::parse (std::string const & s)
{
    return parse(s.c_str(), s.size());
}

std::string to_string (inet4_addr const & addr)
{
    auto value = static_cast<std::uint32_t>(addr);

    return fmt::format("{}.{}.{}.{}"
        , (value >> 24) & 0xFF
        , (value >> 16) & 0xFF
        , (value >> 8) & 0xFF
        , value & 0xFF);
}

TFTP__NAMESPACE_END
