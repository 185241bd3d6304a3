////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef TFTP__STATIC
#   ifndef TFTP__EXPORT
#       if _MSC_VER
#           if defined(TFTP__EXPORTS)
#               define TFTP__EXPORT __declspec(dllexport)
#           else
#               define TFTP__EXPORT __declspec(dllimport)
#           endif
#       else
#           define TFTP__EXPORT
#       endif
#   endif
#else
#   define TFTP__EXPORT
#endif // !TFTP__STATIC
