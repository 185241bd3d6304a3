////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include "payload.hpp"
#include "protocol.hpp"
#include <pfs/optional.hpp>
#include <pfs/variant.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

TFTP__NAMESPACE_BEGIN

// All decoders check the opcode first and fail closed on mismatch. On failure
// they return `pfs::nullopt` and store the reason in `*perr`, or throw
// `tftp::error` if `perr` is null.

/**
 * Extracts packet opcode without decoding the body.
 *
 * @return Opcode or @c pfs::nullopt if the datagram is truncated or opcode is unknown.
 */
TFTP__EXPORT pfs::optional<opcode_enum> peek_opcode (char const * data, std::size_t len);

////////////////////////////////////////////////////////////////////////////////////////////////////
// read_request
////////////////////////////////////////////////////////////////////////////////////////////////////
// +-------+----------+---+--------+---+
// | 0x01  | filename | 0 |  mode  | 0 |
// +-------+----------+---+--------+---+
//     2     variable   1  variable  1
//
struct read_request
{
    std::string filename;
    std::string mode;

    /**
     * Serializes request, empty mode is replaced by `octet`.
     */
    TFTP__EXPORT std::vector<char> encode () const;

    /**
     * Decodes read request.
     *
     * @details Fails with:
     *      - errc::malformed_packet if the datagram is truncated or a field lacks zero terminator;
     *      - errc::bad_opcode if opcode is not `rrq`;
     *      - errc::empty_filename if filename is empty;
     *      - errc::unsupported_mode if mode is not `octet` (case-insensitive).
     */
    static TFTP__EXPORT pfs::optional<read_request> decode (char const * data, std::size_t len
        , error * perr = nullptr);
};

inline bool operator == (read_request const & a, read_request const & b)
{
    return a.filename == b.filename && a.mode == b.mode;
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// ack_packet
////////////////////////////////////////////////////////////////////////////////////////////////////
// +-------+-------+
// | 0x04  | block |
// +-------+-------+
//     2       2
//
struct ack_packet
{
    std::uint16_t block {0};

    TFTP__EXPORT std::vector<char> encode () const;

    static TFTP__EXPORT pfs::optional<ack_packet> decode (char const * data, std::size_t len
        , error * perr = nullptr);
};

////////////////////////////////////////////////////////////////////////////////////////////////////
// error_packet
////////////////////////////////////////////////////////////////////////////////////////////////////
// +-------+------+---------+---+
// | 0x05  | code | message | 0 |
// +-------+------+---------+---+
//     2      2    variable   1
//
struct error_packet
{
    error_code_enum code {error_code_enum::unknown};
    std::string message;

    TFTP__EXPORT std::vector<char> encode () const;

    static TFTP__EXPORT pfs::optional<error_packet> decode (char const * data, std::size_t len
        , error * perr = nullptr);
};

////////////////////////////////////////////////////////////////////////////////////////////////////
// data_view
////////////////////////////////////////////////////////////////////////////////////////////////////
// +-------+-------+-------------+
// | 0x03  | block |   payload   |
// +-------+-------+-------------+
//     2       2     0..512 bytes
//
/**
 * Decoded data packet. The payload references the source buffer, so the view
 * is valid as long as the buffer is alive.
 */
struct data_view
{
    std::uint16_t block {0};
    char const * payload {nullptr};
    std::size_t size {0};

    bool is_final () const noexcept
    {
        return size < kBlockSize;
    }

    /**
     * Decodes data packet.
     *
     * @details Fails with errc::bad_packet_size if @a len is out of range [4, 516]
     *          and with errc::bad_opcode if opcode is not `data`.
     */
    static TFTP__EXPORT pfs::optional<data_view> decode (char const * data, std::size_t len
        , error * perr = nullptr);
};

////////////////////////////////////////////////////////////////////////////////////////////////////
// data_packet
////////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * Session-owned encoder of the data packets sequence.
 */
class data_packet
{
    std::unique_ptr<payload_stream> _payload;

    // Block number of the last encoded packet, wraps modulo 65536
    std::uint16_t _block {0};

    // Number of blocks encoded, does not wrap
    std::uint32_t _count {0};

    // Payload of the last encoded packet
    std::vector<char> _chunk;

public:
    TFTP__EXPORT explicit data_packet (std::unique_ptr<payload_stream> payload);

    data_packet (data_packet const &) = delete;
    data_packet & operator = (data_packet const &) = delete;

public:
    std::uint16_t block () const noexcept
    {
        return _block;
    }

    std::uint32_t count () const noexcept
    {
        return _count;
    }

    std::size_t payload_size () const noexcept
    {
        return _chunk.size();
    }

    /**
     * Checks if the last encoded packet terminates the transfer.
     */
    bool is_final () const noexcept
    {
        return _count > 0 && _chunk.size() < kBlockSize;
    }

    /**
     * Advances block number and reads up to 512 bytes of the payload into the next packet.
     *
     * @return Serialized packet or empty vector on payload read failure.
     */
    TFTP__EXPORT std::vector<char> encode (error * perr = nullptr);

    /**
     * Serializes the last encoded packet again, neither block number nor
     * payload position are changed.
     */
    TFTP__EXPORT std::vector<char> resend () const;

public: // static
    static TFTP__EXPORT std::vector<char> serialize (std::uint16_t block, char const * payload
        , std::size_t len);
};

////////////////////////////////////////////////////////////////////////////////////////////////////
// reply
////////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * Reply that is neither valid acknowledgement nor valid error packet.
 */
struct unrecognized_reply
{
    std::string reason;
};

using reply = pfs::variant<unrecognized_reply, ack_packet, error_packet>;

/**
 * Classifies the peer's reply to a data packet by its opcode.
 */
TFTP__EXPORT reply classify_reply (char const * data, std::size_t len);

TFTP__NAMESPACE_END
