////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2025.03.11 Initial version.
//      2026.10.05 Scripted datagram channel and listener.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "pfs/tftp/datagram_channel.hpp"
#include "pfs/tftp/packet.hpp"
#include "pfs/tftp/payload.hpp"
#include <algorithm>
#include <cstring>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace tools {

using datagram = std::vector<char>;

inline tftp::shared_content make_content (std::size_t size)
{
    auto content = std::make_shared<tftp::content_type>(size);

    for (std::size_t i = 0; i < size; i++)
        (*content)[i] = static_cast<char>(i % 251);

    return content;
}

inline datagram make_ack (std::uint16_t block)
{
    return tftp::ack_packet{block}.encode();
}

inline datagram make_rrq (std::string const & filename, std::string const & mode = "octet")
{
    return tftp::read_request{filename, mode}.encode();
}

/**
 * Payload returning full blocks for the first @a good_reads reads, failing after that.
 */
class faulty_payload: public tftp::payload_stream
{
    int _good_reads;

public:
    faulty_payload (int good_reads) : _good_reads(good_reads) {}

    std::streamsize read (char * buffer, std::size_t len, tftp::error * perr) override
    {
        if (_good_reads-- > 0) {
            std::fill(buffer, buffer + len, 'x');
            return static_cast<std::streamsize>(len);
        }

        if (perr)
            *perr = tftp::error {tftp::make_error_code(tftp::errc::filesystem_error), "I/O failure"};

        return -1;
    }
};

/**
 * Channel replaying scripted replies. Empty reply means timeout. When the
 * script is exhausted every receive times out immediately.
 */
class scripted_channel: public tftp::datagram_channel
{
public:
    struct journal
    {
        std::vector<datagram> sent;
        std::size_t recv_calls {0};
        bool released {false};
    };

private:
    std::deque<datagram> _replies;
    std::shared_ptr<journal> _journal;

    // Sends with index from the set report `failure`
    std::vector<std::size_t> _failing_sends;
    bool _fail_recv {false};

public:
    scripted_channel (std::deque<datagram> replies, std::shared_ptr<journal> j)
        : _replies(std::move(replies))
        , _journal(std::move(j))
    {}

    ~scripted_channel ()
    {
        _journal->released = true;
    }

    void fail_send_at (std::size_t index)
    {
        _failing_sends.push_back(index);
    }

    void fail_recv ()
    {
        _fail_recv = true;
    }

    tftp::send_result send (char const * data, std::size_t len, tftp::error * perr) override
    {
        auto index = _journal->sent.size();

        if (std::find(_failing_sends.begin(), _failing_sends.end(), index) != _failing_sends.end()) {
            if (perr) {
                *perr = tftp::error {tftp::make_error_code(tftp::errc::socket_error)
                    , "scripted send failure"};
            }

            return tftp::send_result{tftp::send_status::failure, -1};
        }

        _journal->sent.emplace_back(data, data + len);
        return tftp::send_result{tftp::send_status::good, static_cast<std::int64_t>(len)};
    }

    tftp::recv_result recv (char * data, std::size_t len, std::chrono::milliseconds
        , tftp::error * perr) override
    {
        _journal->recv_calls++;

        if (_fail_recv) {
            if (perr) {
                *perr = tftp::error {tftp::make_error_code(tftp::errc::socket_error)
                    , "scripted receive failure"};
            }

            return tftp::recv_result{tftp::recv_status::failure, -1};
        }

        if (_replies.empty())
            return tftp::recv_result{tftp::recv_status::timeout, 0};

        auto reply = std::move(_replies.front());
        _replies.pop_front();

        if (reply.empty())
            return tftp::recv_result{tftp::recv_status::timeout, 0};

        auto n = (std::min)(len, reply.size());
        std::memcpy(data, reply.data(), n);
        return tftp::recv_result{tftp::recv_status::good, static_cast<std::int64_t>(n)};
    }
};

/**
 * Channel acknowledging every data packet it receives.
 */
class acking_channel: public tftp::datagram_channel
{
    std::shared_ptr<scripted_channel::journal> _journal;
    datagram _pending;

public:
    acking_channel (std::shared_ptr<scripted_channel::journal> j)
        : _journal(std::move(j))
    {}

    ~acking_channel ()
    {
        _journal->released = true;
    }

    tftp::send_result send (char const * data, std::size_t len, tftp::error * perr) override
    {
        tftp::error err;
        auto view = tftp::data_view::decode(data, len, & err);

        if (!view) {
            if (perr)
                *perr = err;

            return tftp::send_result{tftp::send_status::failure, -1};
        }

        _journal->sent.emplace_back(data, data + len);
        _pending = make_ack(view->block);

        return tftp::send_result{tftp::send_status::good, static_cast<std::int64_t>(len)};
    }

    tftp::recv_result recv (char * data, std::size_t len, std::chrono::milliseconds
        , tftp::error *) override
    {
        _journal->recv_calls++;

        if (_pending.empty())
            return tftp::recv_result{tftp::recv_status::timeout, 0};

        auto n = (std::min)(len, _pending.size());
        std::memcpy(data, _pending.data(), n);
        _pending.clear();
        return tftp::recv_result{tftp::recv_status::good, static_cast<std::int64_t>(n)};
    }
};

/**
 * Listener replaying scripted requests. Fails when the script is exhausted.
 */
class scripted_listener: public tftp::datagram_listener
{
public:
    struct outgoing
    {
        tftp::socket4_addr dest;
        datagram data;
    };

private:
    std::deque<std::pair<tftp::socket4_addr, datagram>> _requests;

public:
    std::vector<outgoing> sent;

public:
    void push (tftp::socket4_addr const & from, datagram d)
    {
        _requests.emplace_back(from, std::move(d));
    }

    std::streamsize recv_from (char * data, std::size_t len, tftp::socket4_addr * saddr
        , tftp::error * perr) override
    {
        if (_requests.empty()) {
            if (perr) {
                *perr = tftp::error {tftp::make_error_code(tftp::errc::socket_error)
                    , "script exhausted"};
            }

            return -1;
        }

        auto req = std::move(_requests.front());
        _requests.pop_front();

        auto n = (std::min)(len, req.second.size());
        std::memcpy(data, req.second.data(), n);

        if (saddr)
            *saddr = req.first;

        return static_cast<std::streamsize>(n);
    }

    tftp::send_result send_to (tftp::socket4_addr const & dest, char const * data
        , std::size_t len, tftp::error *) override
    {
        sent.push_back(outgoing{dest, datagram(data, data + len)});
        return tftp::send_result{tftp::send_status::good, static_cast<std::int64_t>(len)};
    }
};

} // namespace tools
