// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Names of the HTTP request attributes which carry CSRF tokens.
 * Client-side code must use the same names.
 */

#pragma once

namespace CsrfGuard {

/**
 * The default name of the form field containing the token.
 */
static constexpr const char *DEFAULT_TOKEN_FIELD = "csrf_token";

/**
 * The default name of the request header containing the token.
 */
static constexpr const char *DEFAULT_TOKEN_HEADER = "X-CSRF-Token";

/**
 * The default name of the cookie containing the token (if tokens are
 * stored in a cookie).
 */
static constexpr const char *DEFAULT_TOKEN_COOKIE = "csrf_token";

/**
 * The key under which a token getter is injected into template
 * render globals.
 */
static constexpr const char *RENDER_GLOBAL_NAME = "get_csrf_token";

} // namespace CsrfGuard
