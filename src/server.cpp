////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/server.hpp"
#include "pfs/tftp/packet.hpp"
#include "pfs/tftp/session.hpp"
#include "pfs/tftp/posix/udp_channel.hpp"
#include "pfs/tftp/posix/udp_listener.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <system_error>
#include <thread>

TFTP__NAMESPACE_BEGIN

static char const * TAG = "tftp";

server::server (shared_content payload, server_options const & opts)
    : _payload(std::move(payload))
    , _opts(opts)
{
    if (!_payload) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("payload is required")
        };
    }

    if (_opts.retries == 0)
        _opts.retries = kDefaultRetries;

    if (_opts.timeout <= std::chrono::milliseconds{0})
        _opts.timeout = kDefaultTimeout;

    auto local_addr = _opts.listen_saddr.addr;

    make_channel = [local_addr] (socket4_addr const & peer) {
        return std::unique_ptr<datagram_channel>(new posix::udp_channel(local_addr, peer));
    };

    spawn = [] (std::function<void ()> task) {
        std::thread{std::move(task)}.detach();
    };
}

bool server::serve_once (datagram_listener & listener, error * perr)
{
    char buffer[kDatagramSize];
    socket4_addr peer;

    auto n = listener.recv_from(buffer, sizeof(buffer), & peer, perr);

    if (n < 0)
        return false;

    error err;
    auto rrq = read_request::decode(buffer, static_cast<std::size_t>(n), & err);

    if (!rrq) {
        LOGW(TAG, "[{}] bad request: {}", to_string(peer), err.what());

        std::string reason;
        auto op = peek_opcode(buffer, static_cast<std::size_t>(n));

        if (op && *op == opcode_enum::wrq)
            reason = tr::_("write requests are not supported");
        else if (err.code() == make_error_code(errc::unsupported_mode))
            reason = tr::_("only octet mode is supported");

        if (!reason.empty()) {
            auto reply = error_packet{error_code_enum::illegal_operation, reason}.encode();
            error send_err;
            auto res = listener.send_to(peer, reply.data(), reply.size(), & send_err);

            if (res.state == send_status::failure) {
                LOGE(TAG, "[{}] send error packet failure: {}", to_string(peer), send_err.what());
            }
        }

        return true;
    }

    LOGI(TAG, "[{}] requested file: {}", to_string(peer), rrq->filename);

    std::unique_ptr<datagram_channel> channel;

    try {
        channel = make_channel(peer);
    } catch (error const & ex) {
        LOGE(TAG, "[{}] create session channel failure: {}", to_string(peer), ex.what());
        return true;
    }

    session_options sopts;
    sopts.retries = _opts.retries;
    sopts.timeout = _opts.timeout;

    std::shared_ptr<session> sess = std::make_shared<session>(peer, std::move(channel)
        , std::unique_ptr<payload_stream>(new memory_payload(_payload)), sopts);

    try {
        spawn([sess] () { sess->run(); });
    } catch (std::system_error const & ex) {
        LOGE(TAG, "[{}] start session failure: {}", to_string(peer), ex.what());
    }

    return true;
}

bool server::serve (datagram_listener & listener, error * perr)
{
    while (serve_once(listener, perr))
        ;

    return false;
}

bool server::listen_and_serve (error * perr)
{
    std::unique_ptr<posix::udp_listener> listener;

    try {
        listener.reset(new posix::udp_listener(_opts.listen_saddr));
    } catch (error const & ex) {
        if (perr) {
            *perr = ex;
            return false;
        }

        throw;
    }

    LOGI(TAG, "Listening on {} ...", to_string(_opts.listen_saddr));

    return serve(*listener, perr);
}

TFTP__NAMESPACE_END
