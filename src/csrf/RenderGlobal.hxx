// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <functional>
#include <map>
#include <string>

struct CsrfRequest;

/**
 * Global callables which a template renderer exposes to templates.
 */
using RenderGlobals = std::map<std::string, std::function<std::string()>,
			       std::less<>>;

/**
 * To be called by the template renderer before rendering: if the
 * request has an active #CsrfPolicy, add a callable which returns the
 * current token under the name CsrfGuard::RENDER_GLOBAL_NAME, so
 * templates can embed it in hidden form fields.
 *
 * The callable keeps a reference to the request; it must not be
 * invoked after the request has been destroyed.
 *
 * @return true if the callable was added
 */
bool
InjectCsrfTokenGlobal(RenderGlobals &globals, CsrfRequest &request);
