////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "datagram_channel.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include "packet.hpp"
#include "payload.hpp"
#include "protocol.hpp"
#include "socket4_addr.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

TFTP__NAMESPACE_BEGIN

struct session_options
{
    // Number of transmissions of one block without acknowledgement before the session aborts
    std::uint8_t retries {kDefaultRetries};

    // Time to wait for acknowledgement after each transmission
    std::chrono::milliseconds timeout {kDefaultTimeout};
};

enum class session_state
{
      idle
    , sending      // Encode and transmit next block
    , awaiting_ack // Wait for acknowledgement of the last transmitted block
    , retrying     // Retransmit the last block after timeout
    , done
    , aborted
};

enum class abort_reason
{
      none
    , exhausted_retries
    , send_failure
    , recv_failure
    , peer_error
    , payload_read_error
};

struct transfer_result
{
    session_state state {session_state::idle};
    abort_reason reason {abort_reason::none};

    // Number of blocks encoded (not wrapped)
    std::uint32_t blocks {0};

    // Number of data packets transmitted including retransmissions
    std::uint32_t transmissions {0};

    // Peer's error message or local failure description
    std::string message;
};

/**
 * Server side of one read transfer: sends the payload block by block waiting
 * for the acknowledgement of each one.
 */
class session
{
    using clock_type = std::chrono::steady_clock;

private:
    socket4_addr _peer;
    std::unique_ptr<datagram_channel> _channel;
    data_packet _data;
    session_options _opts;
    session_state _state {session_state::idle};
    transfer_result _result;

    // Retransmission context of the current block
    clock_type::time_point _deadline;
    int _attempts_left {0};

public:
    TFTP__EXPORT session (socket4_addr const & peer
        , std::unique_ptr<datagram_channel> channel
        , std::unique_ptr<payload_stream> payload
        , session_options const & opts);

    session (session const &) = delete;
    session & operator = (session const &) = delete;

public:
    socket4_addr const & peer () const noexcept
    {
        return _peer;
    }

    session_state state () const noexcept
    {
        return _state;
    }

    /**
     * Runs the transfer until it is done or aborted. The channel is released on return.
     */
    TFTP__EXPORT transfer_result run ();

private:
    void send_next ();
    void resend ();
    bool transmit (std::vector<char> const & datagram);
    void await_ack ();
    void abort (abort_reason reason, std::string message);
};

TFTP__EXPORT std::string to_string (abort_reason reason);

TFTP__NAMESPACE_END
