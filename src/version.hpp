// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#ifndef LIBCARDGEN_VERSION
#  define LIBCARDGEN_VERSION "1.0.0"
#endif
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace cardgen {

inline constexpr const char *current_version = LIBCARDGEN_VERSION;

} // namespace cardgen
