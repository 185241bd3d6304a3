////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2021.10.26 Initial version.
//      2026.10.05 Added receive result.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <cstdint>

TFTP__NAMESPACE_BEGIN

enum class send_status {
      failure   = -1
    , good      =  0
    , again     =  1 // Socket is not ready for writing (EAGAIN/EWOULDBLOCK)
    , overflow  =  2 // Output queue is full (ENOBUFS), datagram dropped
};

struct send_result
{
    send_status state;
    std::int64_t n;
};

enum class recv_status {
      failure   = -1
    , good      =  0
    , timeout   =  1 // No datagram received until deadline
};

struct recv_result
{
    recv_status state;
    std::int64_t n;
};

TFTP__NAMESPACE_END
