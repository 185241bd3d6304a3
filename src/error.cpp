////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/error.hpp"
#include <pfs/i18n.hpp>

TFTP__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "tftp::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::invalid_argument:
            return tr::_("invalid argument");
        case errc::socket_error:
            return tr::_("socket error");
        case errc::poller_error:
            return tr::_("poller error");
        case errc::filesystem_error:
            return tr::_("filesystem error");
        case errc::bad_opcode:
            return tr::_("bad opcode");
        case errc::malformed_packet:
            return tr::_("malformed packet");
        case errc::empty_filename:
            return tr::_("empty filename");
        case errc::unsupported_mode:
            return tr::_("unsupported transfer mode");
        case errc::bad_packet_size:
            return tr::_("bad packet size");
        case errc::payload_read_error:
            return tr::_("payload read error");

        default: return tr::_("unknown tftp error");
    }
}

TFTP__NAMESPACE_END
