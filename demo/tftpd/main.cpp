////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include <pfs/argvapi.hpp>
#include <pfs/filesystem.hpp>
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <pfs/tftp/file.hpp>
#include <pfs/tftp/server.hpp>
#include <chrono>
#include <memory>

using pfs::to_string;
static char const * TAG = "tftpd";

static void print_usage (pfs::filesystem::path const & programName
    , std::string const & errorString = std::string{})
{
    if (!errorString.empty())
        LOGE(TAG, "{}", errorString);

    fmt::println("Usage:\n\n"
        "{0} --help | -h\n"
        "{0} [--addr=ADDR:PORT] [--payload=FILE] [--retries=N] [--timeout=SECONDS]\n\n"

        "Options:\n\n"
        "--help | -h\n"
        "\tPrint this help and exit\n"
        "--addr=ADDR:PORT | -a ADDR:PORT\n"
        "\tListen address (default is 127.0.0.1:69)\n"
        "--payload=FILE | -p FILE\n"
        "\tFile served to every client (default is payload.jpeg)\n"
        "--retries=N\n"
        "\tNumber of transmissions of one block from 1 to 255 (default is 10)\n"
        "--timeout=SECONDS\n"
        "\tAcknowledgement timeout from 1 to 255 seconds (default is 6)\n\n"

        "Examples:\n\n"
        "Serve picture on non-privileged port:\n"
        "  {0} --addr=0.0.0.0:6969 --payload=picture.jpeg\n"
        , programName);
}

int main (int argc, char * argv[])
{
    tftp::server_options opts;
    pfs::filesystem::path payloadPath {"payload.jpeg"};

    auto commandLine = pfs::make_argvapi(argc, argv);
    auto programName = commandLine.program_name();
    auto commandLineIterator = commandLine.begin();

    while (commandLineIterator.has_more()) {
        auto x = commandLineIterator.next();
        auto expectedArgError = false;

        if (x.is_option("help") || x.is_option("h")) {
            print_usage(programName);
            return EXIT_SUCCESS;
        } else if (x.is_option("addr") || x.is_option("a")) {
            if (x.has_arg()) {
                auto saddr = tftp::socket4_addr::parse(x.arg().data(), x.arg().size());

                if (!saddr) {
                    LOGE(TAG, "Bad address for '{}'", to_string(x.optname()));
                    return EXIT_FAILURE;
                }

                opts.listen_saddr = *saddr;
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("payload") || x.is_option("p")) {
            if (x.has_arg()) {
                payloadPath = pfs::filesystem::utf8_decode(to_string(x.arg()));
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("retries")) {
            if (x.has_arg()) {
                std::error_code ec;
                auto n = pfs::to_integer(x.arg().begin(), x.arg().end(), int{1}, int{255}, ec);

                if (ec) {
                    LOGE(TAG, "Bad retries: {}", ec.message());
                    return EXIT_FAILURE;
                }

                opts.retries = static_cast<std::uint8_t>(n);
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("timeout")) {
            if (x.has_arg()) {
                std::error_code ec;
                auto t = pfs::to_integer(x.arg().begin(), x.arg().end(), int{1}, int{255}, ec);

                if (ec) {
                    LOGE(TAG, "Bad timeout: {}", ec.message());
                    return EXIT_FAILURE;
                }

                opts.timeout = std::chrono::seconds{t};
            } else {
                expectedArgError = true;
            }
        } else {
            LOGE(TAG, "Bad arguments. Try --help option.");
            return EXIT_FAILURE;
        }

        if (expectedArgError) {
            print_usage(programName, "Expected argument for " + to_string(x.optname()));
            return EXIT_FAILURE;
        }
    }

    if (!pfs::filesystem::exists(payloadPath)) {
        LOGE(TAG, "File '{}' does not exist", pfs::filesystem::utf8_encode(payloadPath));
        return EXIT_FAILURE;
    }

    try {
        auto content = std::make_shared<tftp::content_type>(tftp::file::read_all(payloadPath));

        LOGI(TAG, "Loaded payload: {} ({} bytes)", pfs::filesystem::utf8_encode(payloadPath)
            , content->size());

        tftp::server srv {content, opts};
        srv.listen_and_serve();
    } catch (tftp::error const & ex) {
        LOGE(TAG, "{}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_FAILURE;
}
