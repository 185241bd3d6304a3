////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// License: see LICENSE file
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "tools.hpp"
#include "pfs/tftp/session.hpp"
#include <deque>
#include <memory>

using journal_type = tools::scripted_channel::journal;

namespace {

tftp::socket4_addr const kPeer {tftp::inet4_addr{127, 0, 0, 1}, 50000};

struct fixture
{
    std::shared_ptr<journal_type> journal {std::make_shared<journal_type>()};
    tools::scripted_channel * channel {nullptr};
    std::unique_ptr<tftp::session> sess;

    fixture (std::unique_ptr<tftp::payload_stream> payload, std::deque<tools::datagram> replies
        , tftp::session_options const & opts = tftp::session_options{})
    {
        auto ch = std::unique_ptr<tools::scripted_channel>(new tools::scripted_channel(std::move(replies), journal));
        channel = ch.get();

        sess.reset(new tftp::session(kPeer, std::move(ch), std::move(payload), opts));
    }

    fixture (std::size_t payload_size, std::deque<tools::datagram> replies
        , tftp::session_options const & opts = tftp::session_options{})
        : fixture(std::unique_ptr<tftp::payload_stream>(new tftp::memory_payload(tools::make_content(payload_size)))
            , std::move(replies), opts)
    {}

    std::uint16_t sent_block (std::size_t index) const
    {
        auto const & d = journal->sent.at(index);
        return tftp::data_view::decode(d.data(), d.size())->block;
    }

    std::size_t sent_size (std::size_t index) const
    {
        auto const & d = journal->sent.at(index);
        return tftp::data_view::decode(d.data(), d.size())->size;
    }
};

} // namespace

TEST_CASE("session options") {
    std::shared_ptr<journal_type> journal = std::make_shared<journal_type>();

    CHECK_THROWS_AS(tftp::session(kPeer, nullptr
        , std::unique_ptr<tftp::payload_stream>(new tftp::memory_payload(tools::make_content(1)))
        , tftp::session_options{}), tftp::error);

    CHECK_THROWS_AS(tftp::session(kPeer
        , std::unique_ptr<tftp::datagram_channel>(new tools::scripted_channel({}, journal))
        , nullptr, tftp::session_options{}), tftp::error);
}

TEST_CASE("transfer of 1000 bytes") {
    fixture f {1000, {tools::make_ack(1), tools::make_ack(2)}};

    CHECK_EQ(f.sess->state(), tftp::session_state::idle);

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::done);
    CHECK_EQ(result.reason, tftp::abort_reason::none);
    CHECK_EQ(result.blocks, 2u);
    CHECK_EQ(result.transmissions, 2u);

    REQUIRE_EQ(f.journal->sent.size(), 2u);
    CHECK_EQ(f.sent_block(0), 1);
    CHECK_EQ(f.sent_size(0), 512u);
    CHECK_EQ(f.sent_block(1), 2);
    CHECK_EQ(f.sent_size(1), 488u);

    // Channel released on completion
    CHECK(f.journal->released);
}

TEST_CASE("empty payload") {
    fixture f {0, {tools::make_ack(1)}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::done);
    REQUIRE_EQ(f.journal->sent.size(), 1u);
    CHECK_EQ(f.sent_block(0), 1);
    CHECK_EQ(f.sent_size(0), 0u);
}

TEST_CASE("exact multiple of block size") {
    fixture f {1024, {tools::make_ack(1), tools::make_ack(2), tools::make_ack(3)}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::done);
    CHECK_EQ(result.blocks, 3u);
    REQUIRE_EQ(f.journal->sent.size(), 3u);
    CHECK_EQ(f.sent_size(2), 0u);
}

TEST_CASE("client never acknowledges") {
    fixture f {1000, {}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::aborted);
    CHECK_EQ(result.reason, tftp::abort_reason::exhausted_retries);
    CHECK_EQ(result.transmissions, 10u);

    // Block #1 is transmitted exactly ten times, then nothing further
    REQUIRE_EQ(f.journal->sent.size(), 10u);

    for (std::size_t i = 0; i < f.journal->sent.size(); i++)
        CHECK_EQ(f.sent_block(i), 1);

    CHECK(f.journal->released);
}

TEST_CASE("custom retries") {
    tftp::session_options opts;
    opts.retries = 3;
    opts.timeout = std::chrono::milliseconds{10};

    fixture f {1000, {}, opts};

    auto result = f.sess->run();

    CHECK_EQ(result.reason, tftp::abort_reason::exhausted_retries);
    CHECK_EQ(f.journal->sent.size(), 3u);
}

TEST_CASE("zero retries means default") {
    tftp::session_options opts;
    opts.retries = 0;
    opts.timeout = std::chrono::milliseconds{0};

    fixture f {10, {}, opts};

    f.sess->run();
    CHECK_EQ(f.journal->sent.size(), static_cast<std::size_t>(tftp::kDefaultRetries));
}

TEST_CASE("retransmission after timeout") {
    // Timeout, then acknowledgement of the retransmitted block
    fixture f {600, {tools::datagram{}, tools::make_ack(1), tools::datagram{}, tools::datagram{}
        , tools::make_ack(2)}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::done);
    CHECK_EQ(result.blocks, 2u);
    CHECK_EQ(result.transmissions, 5u);

    REQUIRE_EQ(f.journal->sent.size(), 5u);
    CHECK_EQ(f.sent_block(0), 1);
    CHECK_EQ(f.sent_block(1), 1);
    CHECK_EQ(f.journal->sent[0], f.journal->sent[1]);
    CHECK_EQ(f.sent_block(2), 2);
    CHECK_EQ(f.sent_block(3), 2);
    CHECK_EQ(f.sent_block(4), 2);
}

TEST_CASE("retry budget resets for every block") {
    tftp::session_options opts;
    opts.retries = 2;

    // One timeout per block is within the budget of two transmissions
    fixture f {600, {tools::datagram{}, tools::make_ack(1), tools::datagram{}, tools::make_ack(2)}, opts};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::done);
    CHECK_EQ(result.transmissions, 4u);
}

TEST_CASE("stray acknowledgements") {
    tftp::session_options opts;
    opts.retries = 2;

    // Duplicate and future ACKs neither advance the transfer nor consume retries
    fixture f {600, {tools::make_ack(0), tools::make_ack(7), tools::make_ack(1)
        , tools::make_ack(1), tools::make_ack(1), tools::make_ack(2)}, opts};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::done);
    CHECK_EQ(result.transmissions, 2u);
    REQUIRE_EQ(f.journal->sent.size(), 2u);
    CHECK_EQ(f.sent_block(1), 2);
}

TEST_CASE("bad reply is ignored") {
    fixture f {10, {tools::datagram{'\x00'}, tftp::data_packet::serialize(1, "x", 1)
        , tools::datagram{'\x00', '\x05', '\x00', '\x01', 'x'}, tools::make_ack(1)}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::done);
    CHECK_EQ(result.transmissions, 1u);
}

TEST_CASE("peer error aborts transfer") {
    fixture f {2000, {tools::make_ack(1)
        , tftp::error_packet{tftp::error_code_enum::disk_full, "disk is full"}.encode()
        , tools::make_ack(2)}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::aborted);
    CHECK_EQ(result.reason, tftp::abort_reason::peer_error);
    CHECK_EQ(result.message, std::string{"disk is full"});

    // No blocks after the error
    CHECK_EQ(f.journal->sent.size(), 2u);
    CHECK(f.journal->released);
}

TEST_CASE("error code beyond standard range aborts transfer") {
    fixture f {1000, {tools::datagram{'\x00', '\x05', '\x00', '\x08', 'x', '\x00'}}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::aborted);
    CHECK_EQ(result.reason, tftp::abort_reason::peer_error);
    CHECK_EQ(result.message, std::string{"x"});
    CHECK_EQ(result.transmissions, 1u);
    CHECK_EQ(f.journal->sent.size(), 1u);
}

TEST_CASE("payload read failure aborts transfer") {
    fixture f {std::unique_ptr<tftp::payload_stream>(new tools::faulty_payload(1))
        , {tools::make_ack(1), tools::make_ack(2)}};

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::aborted);
    CHECK_EQ(result.reason, tftp::abort_reason::payload_read_error);
    CHECK_EQ(result.blocks, 1u);

    // Only block #1 is sent, nothing after the read failure
    REQUIRE_EQ(f.journal->sent.size(), 1u);
    CHECK_EQ(f.sent_block(0), 1);
    CHECK(f.journal->released);
}

TEST_CASE("send failure aborts transfer") {
    fixture f {2000, {tools::make_ack(1)}};
    f.channel->fail_send_at(1);

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::aborted);
    CHECK_EQ(result.reason, tftp::abort_reason::send_failure);
    CHECK_EQ(result.transmissions, 1u);
}

TEST_CASE("receive failure aborts transfer") {
    fixture f {2000, {}};
    f.channel->fail_recv();

    auto result = f.sess->run();

    CHECK_EQ(result.state, tftp::session_state::aborted);
    CHECK_EQ(result.reason, tftp::abort_reason::recv_failure);
    CHECK_EQ(f.journal->sent.size(), 1u);
}

TEST_CASE("abort reason names") {
    CHECK_EQ(tftp::to_string(tftp::abort_reason::exhausted_retries), std::string{"exhausted retries"});
    CHECK_EQ(tftp::to_string(tftp::abort_reason::peer_error), std::string{"peer error"});
}
