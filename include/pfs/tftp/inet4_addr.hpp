////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2017.07.03 Initial version.
//      2026.10.05 Reduced to the dotted-decimal form used by `tftp-lib`.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <cstdint>
#include <string>

TFTP__NAMESPACE_BEGIN

/**
 * @brief IPv4 address stored in host byte order.
 */
class inet4_addr
{
public:
    static constexpr std::uint32_t any_addr_value = 0x00000000;

private:
    std::uint32_t _addr {0};

public:
    /**
     * @brief Constructs `any` (0.0.0.0) address.
     */
    inet4_addr () = default;

    inet4_addr (inet4_addr const & x) = default;
    inet4_addr (inet4_addr && x) = default;
    inet4_addr & operator = (inet4_addr const & x) = default;
    inet4_addr & operator = (inet4_addr && x) = default;

    /**
     * @brief Constructs inet4_addr from four numeric parts.
     *
     * @details Each of the four numeric parts specifies a byte of the address;
     *          the bytes are assigned in left-to-right order to produce the binary address.
     */
    inet4_addr (std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d)
        : _addr((static_cast<std::uint32_t>(a) << 24)
            | (static_cast<std::uint32_t>(b) << 16)
            | (static_cast<std::uint32_t>(c) << 8)
            | static_cast<std::uint32_t>(d))
    {}

    inet4_addr (std::uint32_t a) : _addr(a)
    {}

    explicit operator std::uint32_t () const noexcept
    {
        return _addr;
    }

public: // static
    /**
     * Parses IPv4 address in dotted-decimal notation (e.g. `192.168.1.1`).
     */
    static TFTP__EXPORT pfs::optional<inet4_addr> parse (char const * s, std::size_t n);
    static TFTP__EXPORT pfs::optional<inet4_addr> parse (std::string const & s);
};

/**
 * @brief Converts IPv4 address to dotted-decimal string.
 */
TFTP__EXPORT std::string to_string (inet4_addr const & addr);

inline bool operator == (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) == static_cast<std::uint32_t>(b);
}

inline bool operator != (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) != static_cast<std::uint32_t>(b);
}

inline bool operator < (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) < static_cast<std::uint32_t>(b);
}

/**
 * Checks if @a addr is loopback.
 */
inline bool is_loopback (inet4_addr const & addr)
{
    return (static_cast<std::uint32_t>(addr) >> 24) == 127;
}

TFTP__NAMESPACE_END
