// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2022-2024 Chilledheart  */

#ifndef H_NET_ASIO
#define H_NET_ASIO

#include <iosfwd>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wimplicit-fallthrough"

#if 0
#define ASIO_ENABLE_HANDLER_TRACKING
#endif

#include <asio.hpp>

#pragma GCC diagnostic pop

extern std::ostream& operator<<(std::ostream& o, asio::error_code);

#endif  // H_NET_ASIO
