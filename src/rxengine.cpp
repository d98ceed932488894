/*
 * The registry of engine backends
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxengine.h>
#include	<rxpcre2.h>
#include	<rxerror.h>

Ref<RxEngine>
rxCreateEngine(RxBackend backend, const RxEngineConfig& config)
{
	switch (backend)
	{
	case RxBackend::Pcre2:
		return new RxPcre2Engine(config);
	}
	throw RxUsageError(RXERR_NO_BACKEND, "No such regular expression backend");
}
