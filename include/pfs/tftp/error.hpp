////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/error.hpp>
#include <string>
#include <system_error>

TFTP__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , invalid_argument
    , socket_error
    , poller_error
    , filesystem_error
    , bad_opcode         // Unexpected or unknown packet opcode
    , malformed_packet   // Truncated packet or missing zero terminator
    , empty_filename     // Read request with empty filename
    , unsupported_mode   // Transfer mode other than `octet`
    , bad_packet_size    // Packet size is out of bounds
    , payload_read_error // Payload stream read failure
};

class error_category : public std::error_category
{
public:
    TFTP__EXPORT virtual char const * name () const noexcept override;
    TFTP__EXPORT virtual std::string message (int ev) const override;
};

inline std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

TFTP__NAMESPACE_END
