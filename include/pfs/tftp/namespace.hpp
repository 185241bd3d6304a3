////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `tftp-lib`.
//
// Changelog:
//      2026.10.05 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef TFTP__NAMESPACE_NAME
#   define TFTP__NAMESPACE_NAME tftp
#   define TFTP__NAMESPACE_BEGIN namespace TFTP__NAMESPACE_NAME {
#   define TFTP__NAMESPACE_END }
#endif
