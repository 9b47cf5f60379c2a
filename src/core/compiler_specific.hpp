// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2022-2024 Chilledheart  */
#ifndef CORE_COMPILER_SPECIFIC_H
#define CORE_COMPILER_SPECIFIC_H

#include <absl/base/optimization.h>

// Branch prediction hints, spelled the same way across the tree.
#ifndef LIKELY
#define LIKELY(x) ABSL_PREDICT_TRUE(x)
#endif

#ifndef UNLIKELY
#define UNLIKELY(x) ABSL_PREDICT_FALSE(x)
#endif

#endif  // CORE_COMPILER_SPECIFIC_H
