////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// References:
//      [RFC 1350 - THE TFTP PROTOCOL (REVISION 2)](https://datatracker.ietf.org/doc/html/rfc1350)
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <chrono>
#include <cstdint>
#include <string>

TFTP__NAMESPACE_BEGIN

constexpr std::size_t kDatagramSize = 516; // Maximum supported datagram size
constexpr std::size_t kBlockSize    = 512; // Maximum payload size of the data packet
constexpr std::size_t kHeaderSize   = 4;   // Opcode + block number (or error code)

constexpr std::uint8_t kDefaultRetries = 10;
constexpr std::chrono::seconds kDefaultTimeout {6};

constexpr char const * kOctetMode = "octet";

/// Packet type
enum class opcode_enum: std::uint16_t
{
      rrq  = 1 /// Read request
    , wrq  = 2 /// Write request (reserved, not supported)
    , data = 3 /// Data block
    , ack  = 4 /// Acknowledgement
    , err  = 5 /// Error
};

enum class error_code_enum: std::uint16_t
{
      unknown             = 0 /// Not defined, see error message (if any)
    , not_found           = 1 /// File not found
    , access_violation    = 2
    , disk_full           = 3 /// Disk full or allocation exceeded
    , illegal_operation   = 4 /// Illegal TFTP operation
    , unknown_transfer_id = 5
    , file_already_exists = 6
    , no_such_user        = 7
};

inline bool is_valid_opcode (std::uint16_t value) noexcept
{
    return value >= static_cast<std::uint16_t>(opcode_enum::rrq)
        && value <= static_cast<std::uint16_t>(opcode_enum::err);
}

TFTP__EXPORT std::string to_string (opcode_enum op);
TFTP__EXPORT std::string to_string (error_code_enum code);

TFTP__NAMESPACE_END
