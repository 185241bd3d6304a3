////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include <ios>
#include <memory>
#include <vector>

TFTP__NAMESPACE_BEGIN

using content_type = std::vector<char>;
using shared_content = std::shared_ptr<content_type const>;

/**
 * Readable byte stream supplying the content of the served file.
 */
class payload_stream
{
public:
    virtual ~payload_stream () {}

    /**
     * Reads up to @a len bytes into @a buffer.
     *
     * @return Number of bytes actually read (zero at the end of stream) or -1 on failure.
     *         A short read is not an error.
     */
    virtual std::streamsize read (char * buffer, std::size_t len, error * perr = nullptr) = 0;
};

/**
 * Payload stream over the shared read-only content. Each instance has its own
 * read position, so one content may be served to any number of sessions.
 */
class memory_payload: public payload_stream
{
    shared_content _content;
    std::size_t _pos {0};

public:
    TFTP__EXPORT explicit memory_payload (shared_content content);

    memory_payload (memory_payload const &) = delete;
    memory_payload & operator = (memory_payload const &) = delete;

public:
    TFTP__EXPORT std::streamsize read (char * buffer, std::size_t len, error * perr = nullptr) override;

    std::size_t size () const noexcept
    {
        return _content->size();
    }

    std::size_t position () const noexcept
    {
        return _pos;
    }
};

TFTP__NAMESPACE_END
