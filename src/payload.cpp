////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/tftp/payload.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cstring>

TFTP__NAMESPACE_BEGIN

memory_payload::memory_payload (shared_content content)
    : _content(std::move(content))
{
    if (!_content) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::_("payload content is required")
        };
    }
}

std::streamsize memory_payload::read (char * buffer, std::size_t len, error * perr)
{
    (void)perr;

    auto n = (std::min)(len, _content->size() - _pos);

    if (n > 0) {
        std::memcpy(buffer, _content->data() + _pos, n);
        _pos += n;
    }

    return static_cast<std::streamsize>(n);
}

TFTP__NAMESPACE_END
