////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/session.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>

TFTP__NAMESPACE_BEGIN

static char const * TAG = "tftp";

session::session (socket4_addr const & peer
    , std::unique_ptr<datagram_channel> channel
    , std::unique_ptr<payload_stream> payload
    , session_options const & opts)
    : _peer(peer)
    , _channel(std::move(channel))
    , _data(std::move(payload))
    , _opts(opts)
{
    if (!_channel) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("session channel is required")
        };
    }

    if (_opts.retries == 0)
        _opts.retries = kDefaultRetries;

    if (_opts.timeout <= std::chrono::milliseconds{0})
        _opts.timeout = kDefaultTimeout;
}

transfer_result session::run ()
{
    _state = session_state::sending;

    while (_state != session_state::done && _state != session_state::aborted) {
        switch (_state) {
            case session_state::sending:
                send_next();
                break;

            case session_state::retrying:
                resend();
                break;

            case session_state::awaiting_ack:
                await_ack();
                break;

            default:
                abort(abort_reason::none, tr::_("unexpected session state"));
                break;
        }
    }

    _channel.reset();

    _result.state = _state;
    _result.blocks = _data.count();

    if (_state == session_state::done)
        LOGI(TAG, "[{}] sent {} blocks", to_string(_peer), _data.count());

    return _result;
}

void session::send_next ()
{
    error err;
    auto datagram = _data.encode(& err);

    if (datagram.empty()) {
        abort(abort_reason::payload_read_error, err.what());
        return;
    }

    _attempts_left = _opts.retries;

    if (transmit(datagram)) {
        _deadline = clock_type::now() + _opts.timeout;
        _state = session_state::awaiting_ack;
    }
}

void session::resend ()
{
    LOGW(TAG, "[{}] no ACK for block #{}, resending ({} attempts left)"
        , to_string(_peer), _data.block(), _attempts_left);

    if (transmit(_data.resend())) {
        _deadline = clock_type::now() + _opts.timeout;
        _state = session_state::awaiting_ack;
    }
}

bool session::transmit (std::vector<char> const & datagram)
{
    error err;
    auto res = _channel->send(datagram.data(), datagram.size(), & err);

    switch (res.state) {
        case send_status::good:
            break;

        // Datagram dropped locally, same as lost in the network: the timeout
        // triggers retransmission.
        case send_status::again:
        case send_status::overflow:
            LOGW(TAG, "[{}] block #{} dropped by the output queue", to_string(_peer), _data.block());
            break;

        case send_status::failure:
        default:
            abort(abort_reason::send_failure, err.what());
            return false;
    }

    _result.transmissions++;
    return true;
}

void session::await_ack ()
{
    char buffer[kDatagramSize];
    auto now = clock_type::now();
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(_deadline - now);
    recv_result res {recv_status::timeout, 0};
    error err;

    if (remaining > std::chrono::milliseconds{0})
        res = _channel->recv(buffer, sizeof(buffer), remaining, & err);

    switch (res.state) {
        case recv_status::timeout:
            if (--_attempts_left <= 0)
                abort(abort_reason::exhausted_retries, tr::f_("no ACK after {} attempts", _opts.retries));
            else
                _state = session_state::retrying;

            return;

        case recv_status::good:
            break;

        case recv_status::failure:
        default:
            abort(abort_reason::recv_failure, err.what());
            return;
    }

    auto r = classify_reply(buffer, static_cast<std::size_t>(res.n));

    if (auto ack = pfs::get_if<ack_packet>(& r)) {
        if (ack->block == _data.block()) {
            _state = _data.is_final() ? session_state::done : session_state::sending;
        } else {
            // Stray or duplicate ACK, keep waiting until the same deadline
            LOGD(TAG, "[{}] unexpected ACK #{}, waiting for ACK #{}"
                , to_string(_peer), ack->block, _data.block());
        }
    } else if (auto pkt = pfs::get_if<error_packet>(& r)) {
        LOGE(TAG, "[{}] received error: {} ({})", to_string(_peer), pkt->message
            , to_string(pkt->code));
        abort(abort_reason::peer_error, pkt->message);
    } else if (auto bad = pfs::get_if<unrecognized_reply>(& r)) {
        LOGW(TAG, "[{}] bad packet: {}", to_string(_peer), bad->reason);
    }
}

void session::abort (abort_reason reason, std::string message)
{
    if (reason != abort_reason::peer_error) {
        LOGE(TAG, "[{}] transfer aborted at block #{}: {}: {}", to_string(_peer), _data.block()
            , to_string(reason), message);
    }

    _state = session_state::aborted;
    _result.reason = reason;
    _result.message = std::move(message);
}

std::string to_string (abort_reason reason)
{
    switch (reason) {
        case abort_reason::none:
            return tr::_("none");
        case abort_reason::exhausted_retries:
            return tr::_("exhausted retries");
        case abort_reason::send_failure:
            return tr::_("send failure");
        case abort_reason::recv_failure:
            return tr::_("receive failure");
        case abort_reason::peer_error:
            return tr::_("peer error");
        case abort_reason::payload_read_error:
            return tr::_("payload read error");
        default: break;
    }

    return tr::_("unknown reason");
}

TFTP__NAMESPACE_END
