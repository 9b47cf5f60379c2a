// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2022-2024 Chilledheart  */
#ifndef H_CORE_UTILS
#define H_CORE_UTILS

#include <stdint.h>

#include <string>
#include <string_view>

namespace relay {

bool SetCurrentThreadName(const std::string& name);

// Nanoseconds elapsed since the first call, never zero once returned
// from a successful call. Zero means "never observed".
uint64_t GetMonotonicTime();

#define NS_PER_SECOND (1000 * 1000 * 1000)

// A portable interface that returns the basename of the filename passed as an
// argument. It is similar to basename(3)
// <https://linux.die.net/man/3/basename>.
// For example:
//     Basename("a/b/prog/file.cc")
// returns "file.cc"
//     Basename("a/b/prog//")
// returns "prog"
//     Basename("////")
// returns "/"
std::string_view Basename(std::string_view path);

}  // namespace relay

#endif  // H_CORE_UTILS
