#if !defined(RXPCRE2_H)
#define RXPCRE2_H
/*
 * The PCRE2 engine, using the 8-bit library in UTF mode.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#if !defined(PCRE2_CODE_UNIT_WIDTH)
#define	PCRE2_CODE_UNIT_WIDTH	8
#endif
#include	<pcre2.h>

#include	<rxengine.h>

class RxPcre2Engine
: public RxEngine
{
public:
	RxPcre2Engine(const RxEngineConfig& config);
	~RxPcre2Engine();

	const char*	name() const { return "pcre2"; }
	bool		hasAnchoredVariants() const { return use_jit; }
	RxCodeHandle*	compile(const std::string& pattern, RxCompileOption options, RxCompileFailure& failure) const;
	void		release(RxCodeHandle* code) const;
	int		captureCount(const RxCodeHandle* code) const;
	void		nameTable(const RxCodeHandle* code, std::map<std::string, int>& names) const;
	RxScratch*	newScratch(const RxCodeHandle* code) const;
	RxOutcome	match(
				const RxCodeHandle* code,
				const char* subject,
				CharBytes length,
				CharBytes start,
				RxMatchOption options,
				RxScratch& scratch,
				std::vector<CharBytes>& captures
			) const;
	std::string	errorMessage(int code) const;

	static bool	jitSupported();

private:
	RxEngineConfig	config;
	bool		use_jit;
	pcre2_compile_context*	compile_any;	// Any Unicode newline
	pcre2_compile_context*	compile_lf;	// Only \n
};

#endif
