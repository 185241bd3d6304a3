////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2023.03.15 Initial version.
//      2026.10.05 Reduced to read-only access.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/file.hpp"
#include <pfs/i18n.hpp>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

TFTP__NAMESPACE_BEGIN

constexpr int const file::INVALID_FILE_HANDLE;

namespace {

file::handle_type open_fd (fs::path const & path, error * perr)
{
    if (!fs::exists(path)) {
        pfs::throw_or(perr, error {
              make_error_code(errc::filesystem_error)
            , tr::f_("file not found: {}", fs::utf8_encode(path))
        });

        return file::INVALID_FILE_HANDLE;
    }

    file::handle_type h = ::open(fs::utf8_encode(path).c_str(), O_RDONLY);

    if (h < 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::filesystem_error)
            , tr::f_("open read only file: {}", fs::utf8_encode(path))
            , pfs::system_error_text()
        });

        return file::INVALID_FILE_HANDLE;
    }

    return h;
}

filesize_t read_fd (file::handle_type h, char * buffer, filesize_t len, error * perr)
{
    auto n = ::read(h, buffer, len);

    if (n < 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::filesystem_error)
            , tr::_("read from file")
            , pfs::system_error_text()
        });

        return -1;
    }

    return static_cast<filesize_t>(n);
}

} // namespace

file::file (handle_type h) : _h(h) {}
file::file () {}

file::file (file && f)
{
    _h = f._h;
    f._h = INVALID_FILE_HANDLE;
}

file & file::operator = (file && f)
{
    if (this != & f) {
        close();
        _h = f._h;
        f._h = INVALID_FILE_HANDLE;
    }

    return *this;
}

file::~file ()
{
    close();
}

void file::close () noexcept
{
    if (_h >= 0)
        ::close(_h);

    _h = INVALID_FILE_HANDLE;
}

filesize_t file::read (char * buffer, filesize_t len, error * perr) const
{
    if (len == 0)
        return 0;

    if (len < 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::invalid_argument)
            , tr::_("invalid buffer length")
        });

        return -1;
    }

    return read_fd(_h, buffer, len, perr);
}

content_type file::read_all (error * perr) const
{
    content_type result;
    char buffer[4096];

    auto n = read_fd(_h, buffer, sizeof(buffer), perr);

    while (n > 0) {
        result.insert(result.end(), buffer, buffer + n);
        n = read_fd(_h, buffer, sizeof(buffer), perr);
    }

    return n < 0 ? content_type{} : result;
}

file file::open_read_only (fs::path const & path, error * perr)
{
    return file{open_fd(path, perr)};
}

TFTP__NAMESPACE_END
