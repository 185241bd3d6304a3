////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/protocol.hpp"
#include <pfs/i18n.hpp>

TFTP__NAMESPACE_BEGIN

std::string to_string (opcode_enum op)
{
    switch (op) {
        case opcode_enum::rrq:  return std::string{"RRQ"};
        case opcode_enum::wrq:  return std::string{"WRQ"};
        case opcode_enum::data: return std::string{"DATA"};
        case opcode_enum::ack:  return std::string{"ACK"};
        case opcode_enum::err:  return std::string{"ERROR"};
        default: break;
    }

    return std::string{"UNKNOWN"};
}

std::string to_string (error_code_enum code)
{
    switch (code) {
        case error_code_enum::unknown:
            return tr::_("not defined");
        case error_code_enum::not_found:
            return tr::_("file not found");
        case error_code_enum::access_violation:
            return tr::_("access violation");
        case error_code_enum::disk_full:
            return tr::_("disk full or allocation exceeded");
        case error_code_enum::illegal_operation:
            return tr::_("illegal TFTP operation");
        case error_code_enum::unknown_transfer_id:
            return tr::_("unknown transfer ID");
        case error_code_enum::file_already_exists:
            return tr::_("file already exists");
        case error_code_enum::no_such_user:
            return tr::_("no such user");
        default: break;
    }

    return tr::_("unknown error code");
}

TFTP__NAMESPACE_END
