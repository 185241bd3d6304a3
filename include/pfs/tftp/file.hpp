////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2021.10.20 Initial version.
//      2026.10.05 Reduced to read-only access.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include "payload.hpp"
#include <pfs/filesystem.hpp>
#include <cstdint>

TFTP__NAMESPACE_BEGIN

namespace fs = pfs::filesystem;

using filesize_t = std::int32_t;

/**
 * Read-only local file.
 */
class file
{
public:
    static constexpr int const INVALID_FILE_HANDLE = -1;
    using handle_type = int;

private:
    handle_type _h {INVALID_FILE_HANDLE};

private:
    file (handle_type h);

public:
    TFTP__EXPORT file ();

    file (file const & f) = delete;
    file & operator = (file const & f) = delete;

    TFTP__EXPORT file (file && f);
    TFTP__EXPORT file & operator = (file && f);
    TFTP__EXPORT ~file ();

    operator bool () const noexcept
    {
        return _h >= 0;
    }

    TFTP__EXPORT void close () noexcept;

    /**
     * Reads data chunk from file.
     *
     * @return Actually read chunk size or -1 on error.
     *
     * @note Limit maximum file size to 2,147,479,552 bytes.
     */
    TFTP__EXPORT filesize_t read (char * buffer, filesize_t len, error * perr = nullptr) const;

    /**
     * Reads all content from the current position.
     */
    TFTP__EXPORT content_type read_all (error * perr = nullptr) const;

public: // static
   /**
    * Opens file for reading.
    *
    * @return Valid file or invalid one on error. Error code is
    *         @c errc::filesystem_error if file not found or can't be opened.
    */
    TFTP__EXPORT static file open_read_only (fs::path const & path, error * perr = nullptr);

    static content_type read_all (fs::path const & path, error * perr = nullptr)
    {
        auto f = file::open_read_only(path, perr);

        if (f)
            return f.read_all(perr);

        return content_type{};
    }
};

TFTP__NAMESPACE_END
