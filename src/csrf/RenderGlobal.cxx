// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RenderGlobal.hxx"
#include "Request.hxx"
#include "Policy.hxx"

#include <csrf-guard/Protocol.hxx>

bool
InjectCsrfTokenGlobal(RenderGlobals &globals, CsrfRequest &request)
{
	const CsrfPolicy *policy = request.policy;
	if (policy == nullptr)
		return false;

	globals.insert_or_assign(CsrfGuard::RENDER_GLOBAL_NAME,
				 [policy, &request](){
		return policy->GetToken(request);
	});
	return true;
}
