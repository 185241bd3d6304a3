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
#include "pfs/tftp/file.hpp"
#include <fstream>

namespace fs = pfs::filesystem;

TEST_CASE("read whole file") {
    auto path = fs::temp_directory_path() / fs::utf8_decode("tftp-lib-file-test.bin");
    auto content = tools::make_content(10000);

    {
        std::ofstream out {fs::utf8_encode(path), std::ios::binary | std::ios::trunc};
        out.write(content->data(), static_cast<std::streamsize>(content->size()));
    }

    auto data = tftp::file::read_all(path);
    CHECK_EQ(data, *content);

    auto f = tftp::file::open_read_only(path);
    REQUIRE(f);

    char buffer[16];
    CHECK_EQ(f.read(buffer, 16), 16);
    CHECK_EQ(buffer[15], (*content)[15]);

    auto rest = f.read_all();
    CHECK_EQ(rest.size(), content->size() - 16);

    fs::remove(path);
}

TEST_CASE("missing file") {
    auto path = fs::temp_directory_path() / fs::utf8_decode("tftp-lib-no-such-file.bin");

    tftp::error err;
    auto f = tftp::file::open_read_only(path, & err);

    CHECK_FALSE(f);
    CHECK_EQ(err.code(), tftp::make_error_code(tftp::errc::filesystem_error));

    CHECK_THROWS_AS(tftp::file::read_all(path), tftp::error);
}
