////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/packet.hpp"
#include <pfs/binary_istream.hpp>
#include <pfs/binary_ostream.hpp>
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cctype>

TFTP__NAMESPACE_BEGIN

using serializer_type = pfs::binary_ostream<pfs::endian::network>;
using deserializer_type = pfs::binary_istream<pfs::endian::network>;

namespace {

template <typename T>
pfs::optional<T> decode_failure (error * perr, errc ec, std::string description)
{
    pfs::throw_or(perr, error {make_error_code(ec), std::move(description)});
    return pfs::nullopt;
}

/**
 * Reads two 16-bit header fields (opcode and block number or error code).
 */
bool read_header (char const * data, std::size_t len, std::uint16_t & op, std::uint16_t * second)
{
    if (len < (second == nullptr ? 2 : kHeaderSize))
        return false;

    deserializer_type in {data, len};
    in >> op;

    if (second != nullptr)
        in >> *second;

    return in.is_good();
}

/**
 * Extracts zero-terminated string starting at @a first.
 *
 * @return Position next to the terminator or @c nullptr if terminator not found.
 */
char const * read_string (char const * first, char const * last, std::string & result)
{
    auto pos = std::find(first, last, '\0');

    if (pos == last)
        return nullptr;

    result.assign(first, pos);
    return pos + 1;
}

bool equals_ignore_case (std::string const & a, char const * b)
{
    auto blen = std::char_traits<char>::length(b);

    if (a.size() != blen)
        return false;

    return std::equal(a.begin(), a.end(), b, [] (char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

void write_string (serializer_type & out, std::string const & s)
{
    out.write(s.data(), s.size());
    out << std::uint8_t{0};
}

// Body parsers expect the opcode already checked.

pfs::optional<ack_packet> parse_ack (char const * data, std::size_t len, error * perr)
{
    std::uint16_t op = 0;
    std::uint16_t block = 0;

    if (!read_header(data, len, op, & block))
        return decode_failure<ack_packet>(perr, errc::malformed_packet, tr::_("truncated ACK packet"));

    return ack_packet{block};
}

pfs::optional<error_packet> parse_error (char const * data, std::size_t len, error * perr)
{
    std::uint16_t op = 0;
    std::uint16_t code = 0;

    if (!read_header(data, len, op, & code))
        return decode_failure<error_packet>(perr, errc::malformed_packet, tr::_("truncated ERROR packet"));

    // Codes outside RFC 1350 range (extensions, vendor codes) are kept as is
    error_packet pkt;
    pkt.code = static_cast<error_code_enum>(code);

    if (read_string(data + kHeaderSize, data + len, pkt.message) == nullptr) {
        return decode_failure<error_packet>(perr, errc::malformed_packet
            , tr::_("no zero terminator for error message"));
    }

    return pkt;
}

} // namespace

pfs::optional<opcode_enum> peek_opcode (char const * data, std::size_t len)
{
    std::uint16_t op = 0;

    if (!read_header(data, len, op, nullptr) || !is_valid_opcode(op))
        return pfs::nullopt;

    return static_cast<opcode_enum>(op);
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// read_request
////////////////////////////////////////////////////////////////////////////////////////////////////
std::vector<char> read_request::encode () const
{
    serializer_type out;
    out << static_cast<std::uint16_t>(opcode_enum::rrq);
    write_string(out, filename);
    write_string(out, mode.empty() ? std::string{kOctetMode} : mode);
    return out.take();
}

pfs::optional<read_request> read_request::decode (char const * data, std::size_t len, error * perr)
{
    std::uint16_t op = 0;

    if (!read_header(data, len, op, nullptr))
        return decode_failure<read_request>(perr, errc::malformed_packet, tr::_("truncated request"));

    if (op != static_cast<std::uint16_t>(opcode_enum::rrq)) {
        return decode_failure<read_request>(perr, errc::bad_opcode
            , tr::f_("expected RRQ opcode, got: {}", op));
    }

    read_request rrq;
    auto last = data + len;
    auto pos = read_string(data + 2, last, rrq.filename);

    if (pos == nullptr) {
        return decode_failure<read_request>(perr, errc::malformed_packet
            , tr::_("no zero terminator for filename"));
    }

    if (rrq.filename.empty())
        return decode_failure<read_request>(perr, errc::empty_filename, tr::_("empty filename"));

    // Trailing bytes (e.g. option extensions) after the mode are ignored
    if (read_string(pos, last, rrq.mode) == nullptr) {
        return decode_failure<read_request>(perr, errc::malformed_packet
            , tr::_("no zero terminator for mode"));
    }

    if (!equals_ignore_case(rrq.mode, kOctetMode)) {
        return decode_failure<read_request>(perr, errc::unsupported_mode
            , tr::f_("only binary transfers supported, requested mode: '{}'", rrq.mode));
    }

    return rrq;
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// ack_packet
////////////////////////////////////////////////////////////////////////////////////////////////////
std::vector<char> ack_packet::encode () const
{
    serializer_type out;
    out << static_cast<std::uint16_t>(opcode_enum::ack) << block;
    return out.take();
}

pfs::optional<ack_packet> ack_packet::decode (char const * data, std::size_t len, error * perr)
{
    std::uint16_t op = 0;

    if (!read_header(data, len, op, nullptr))
        return decode_failure<ack_packet>(perr, errc::malformed_packet, tr::_("truncated ACK packet"));

    if (op != static_cast<std::uint16_t>(opcode_enum::ack))
        return decode_failure<ack_packet>(perr, errc::bad_opcode, tr::f_("expected ACK opcode, got: {}", op));

    return parse_ack(data, len, perr);
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// error_packet
////////////////////////////////////////////////////////////////////////////////////////////////////
std::vector<char> error_packet::encode () const
{
    serializer_type out;
    out << static_cast<std::uint16_t>(opcode_enum::err) << static_cast<std::uint16_t>(code);
    write_string(out, message);
    return out.take();
}

pfs::optional<error_packet> error_packet::decode (char const * data, std::size_t len, error * perr)
{
    std::uint16_t op = 0;

    if (!read_header(data, len, op, nullptr))
        return decode_failure<error_packet>(perr, errc::malformed_packet, tr::_("truncated ERROR packet"));

    if (op != static_cast<std::uint16_t>(opcode_enum::err)) {
        return decode_failure<error_packet>(perr, errc::bad_opcode
            , tr::f_("expected ERROR opcode, got: {}", op));
    }

    return parse_error(data, len, perr);
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// data_view
////////////////////////////////////////////////////////////////////////////////////////////////////
pfs::optional<data_view> data_view::decode (char const * data, std::size_t len, error * perr)
{
    if (len < kHeaderSize || len > kDatagramSize) {
        return decode_failure<data_view>(perr, errc::bad_packet_size
            , tr::f_("DATA packet size is out of bounds: {}", len));
    }

    std::uint16_t op = 0;
    std::uint16_t block = 0;

    if (!read_header(data, len, op, & block))
        return decode_failure<data_view>(perr, errc::malformed_packet, tr::_("truncated DATA packet"));

    if (op != static_cast<std::uint16_t>(opcode_enum::data))
        return decode_failure<data_view>(perr, errc::bad_opcode, tr::f_("expected DATA opcode, got: {}", op));

    return data_view{block, data + kHeaderSize, len - kHeaderSize};
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// data_packet
////////////////////////////////////////////////////////////////////////////////////////////////////
data_packet::data_packet (std::unique_ptr<payload_stream> payload)
    : _payload(std::move(payload))
{
    if (!_payload) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("payload stream is required")
        };
    }

    _chunk.reserve(kBlockSize);
}

std::vector<char> data_packet::encode (error * perr)
{
    char buffer[kBlockSize];
    std::size_t total = 0;

    // Stream may return less than requested before the end, so read until
    // the block is full or the end of stream is reached.
    while (total < kBlockSize) {
        error err;
        auto n = _payload->read(buffer + total, kBlockSize - total, & err);

        if (n < 0) {
            pfs::throw_or(perr, error {
                  make_error_code(errc::payload_read_error)
                , tr::f_("read block #{} from payload", static_cast<std::uint16_t>(_block + 1))
                , err.what()
            });

            return std::vector<char>{};
        }

        if (n == 0)
            break;

        total += static_cast<std::size_t>(n);
    }

    _block++;
    _count++;
    _chunk.assign(buffer, buffer + total);

    return serialize(_block, _chunk.data(), _chunk.size());
}

std::vector<char> data_packet::resend () const
{
    return serialize(_block, _chunk.data(), _chunk.size());
}

std::vector<char> data_packet::serialize (std::uint16_t block, char const * payload, std::size_t len)
{
    serializer_type out;
    out << static_cast<std::uint16_t>(opcode_enum::data) << block;

    if (len > 0)
        out.write(payload, len);

    return out.take();
}

////////////////////////////////////////////////////////////////////////////////////////////////////
// classify_reply
////////////////////////////////////////////////////////////////////////////////////////////////////
reply classify_reply (char const * data, std::size_t len)
{
    std::uint16_t op = 0;

    if (!read_header(data, len, op, nullptr))
        return unrecognized_reply{tr::f_("datagram too short: {} bytes", len)};

    error err;

    switch (op) {
        case static_cast<std::uint16_t>(opcode_enum::ack): {
            auto ack = parse_ack(data, len, & err);

            if (ack)
                return *ack;

            break;
        }

        case static_cast<std::uint16_t>(opcode_enum::err): {
            auto pkt = parse_error(data, len, & err);

            if (pkt)
                return *pkt;

            break;
        }

        default:
            return unrecognized_reply{tr::f_("unexpected opcode: {}", op)};
    }

    return unrecognized_reply{err.what()};
}

TFTP__NAMESPACE_END
