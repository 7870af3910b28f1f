// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/* well-known HTTP header names in the lower-case form which
   #HeaderMap uses internally */

constexpr const char *cache_control_header = "cache-control";
constexpr const char *content_type_header = "content-type";
constexpr const char *x_cache_by_header = "x-cache-by";
