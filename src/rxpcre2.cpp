/*
 * The PCRE2 engine.
 *
 * Compiled handles are pcre2_code pointers. Compile contexts are created
 * once per engine and never modified afterwards, so concurrent compiles
 * may share them. Everything a match call mutates (match data, match
 * context and JIT stack) lives in an RxPcre2Scratch owned by one matcher.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxpcre2.h>
#include	<rxerror.h>

#include	<stdio.h>
#include	<memory>

#if	defined(RX_TRACE)
#define	TRACK(x)	printf x
#else
#define	TRACK(x)
#endif

class RxPcre2Scratch
: public RxScratch
{
public:
	RxPcre2Scratch()
	: match_data(0), match_context(0), jit_stack(0)
	{}
	~RxPcre2Scratch()
	{
		pcre2_match_data_free(match_data);
		pcre2_match_context_free(match_context);
		pcre2_jit_stack_free(jit_stack);
	}

	pcre2_match_data*	match_data;
	pcre2_match_context*	match_context;
	pcre2_jit_stack*	jit_stack;	// Null unless the pattern was JIT compiled

private:
	RxPcre2Scratch(const RxPcre2Scratch&);
	RxPcre2Scratch&	operator=(const RxPcre2Scratch&);
};

static inline pcre2_code*
code_of(RxCodeHandle* code)
{
	return reinterpret_cast<pcre2_code*>(code);
}

static inline const pcre2_code*
code_of(const RxCodeHandle* code)
{
	return reinterpret_cast<const pcre2_code*>(code);
}

bool
RxPcre2Engine::jitSupported()
{
	uint32_t	jit = 0;
	return pcre2_config(PCRE2_CONFIG_JIT, &jit) >= 0 && jit != 0;
}

RxPcre2Engine::RxPcre2Engine(const RxEngineConfig& c)
: config(c)
, use_jit(c.jit && jitSupported())
, compile_any(0)
, compile_lf(0)
{
	compile_any = pcre2_compile_context_create(0);
	compile_lf = pcre2_compile_context_create(0);
	if (!compile_any || !compile_lf)
	{
		pcre2_compile_context_free(compile_any);
		pcre2_compile_context_free(compile_lf);
		throw RxEngineError(PCRE2_ERROR_NOMEMORY, errorMessage(PCRE2_ERROR_NOMEMORY));
	}
	(void)pcre2_set_newline(compile_any, PCRE2_NEWLINE_ANY);
	(void)pcre2_set_newline(compile_lf, PCRE2_NEWLINE_LF);
	TRACK(("pcre2 engine created, JIT %s\n", use_jit ? "enabled" : "disabled"));
}

RxPcre2Engine::~RxPcre2Engine()
{
	pcre2_compile_context_free(compile_any);
	pcre2_compile_context_free(compile_lf);
}

RxCodeHandle*
RxPcre2Engine::compile(const std::string& pattern, RxCompileOption options, RxCompileFailure& failure) const
{
	uint32_t	opts = PCRE2_UTF;
	if (options & RxCompileOption::Caseless)	opts |= PCRE2_CASELESS;
	if (options & RxCompileOption::DotAll)		opts |= PCRE2_DOTALL;
	if (options & RxCompileOption::Multiline)	opts |= PCRE2_MULTILINE;
	if (options & RxCompileOption::Literal)		opts |= PCRE2_LITERAL;
	if (options & RxCompileOption::Extended)	opts |= PCRE2_EXTENDED;
	if (options & RxCompileOption::Ucp)		opts |= PCRE2_UCP;
	if (options & RxCompileOption::Anchored)	opts |= PCRE2_ANCHORED;
	if (options & RxCompileOption::EndAnchored)	opts |= PCRE2_ENDANCHORED;

	int		error_number = 0;
	PCRE2_SIZE	error_offset = 0;
	pcre2_code*	code = pcre2_compile(
				(PCRE2_SPTR)pattern.data(), pattern.size(),
				opts,
				&error_number, &error_offset,
				(options & RxCompileOption::NewlineLF) ? compile_lf : compile_any
			);
	if (!code)
	{
		failure.code = error_number;
		failure.offset = (CharBytes)error_offset;
		failure.message = errorMessage(error_number);
		return 0;
	}

	if (use_jit)
	{
		// A pattern the JIT cannot handle still runs in the interpreter
		int	rc = pcre2_jit_compile(code, PCRE2_JIT_COMPLETE | PCRE2_JIT_PARTIAL_SOFT);
		if (rc < 0)
		{
			TRACK(("JIT compile failed (%d), using the interpreter\n", rc));
		}
		(void)rc;
	}
	return reinterpret_cast<RxCodeHandle*>(code);
}

void
RxPcre2Engine::release(RxCodeHandle* code) const
{
	pcre2_code_free(code_of(code));		// Null is a no-op
}

int
RxPcre2Engine::captureCount(const RxCodeHandle* code) const
{
	uint32_t	count = 0;
	int		rc = pcre2_pattern_info(code_of(code), PCRE2_INFO_CAPTURECOUNT, &count);
	if (rc < 0)
		throw RxEngineError(rc, errorMessage(rc));
	return (int)count;
}

void
RxPcre2Engine::nameTable(const RxCodeHandle* code, std::map<std::string, int>& names) const
{
	uint32_t	name_count = 0;
	uint32_t	entry_size = 0;
	PCRE2_SPTR	table = 0;
	int		rc;

	if ((rc = pcre2_pattern_info(code_of(code), PCRE2_INFO_NAMECOUNT, &name_count)) < 0
	 || (rc = pcre2_pattern_info(code_of(code), PCRE2_INFO_NAMEENTRYSIZE, &entry_size)) < 0
	 || (rc = pcre2_pattern_info(code_of(code), PCRE2_INFO_NAMETABLE, &table)) < 0)
		throw RxEngineError(rc, errorMessage(rc));

	// Each entry is a two-byte big-endian group number then the NUL-terminated name
	for (uint32_t i = 0; i < name_count; i++, table += entry_size)
	{
		int	group = (table[0] << 8) | table[1];
		names.insert(std::make_pair(std::string((const char*)table+2), group));
	}
}

RxScratch*
RxPcre2Engine::newScratch(const RxCodeHandle* code) const
{
	RxPcre2Scratch*	scratch = new RxPcre2Scratch;
	std::unique_ptr<RxScratch>	guard(scratch);

	scratch->match_data = pcre2_match_data_create((uint32_t)captureCount(code)+1, 0);
	scratch->match_context = pcre2_match_context_create(0);
	if (!scratch->match_data || !scratch->match_context)
		throw RxEngineError(PCRE2_ERROR_NOMEMORY, errorMessage(PCRE2_ERROR_NOMEMORY));

	if (config.match_limit)
		(void)pcre2_set_match_limit(scratch->match_context, config.match_limit);
	if (config.depth_limit)
		(void)pcre2_set_depth_limit(scratch->match_context, config.depth_limit);
	if (config.heap_limit)
		(void)pcre2_set_heap_limit(scratch->match_context, config.heap_limit);

	size_t		jit_size = 0;
	if (use_jit
	 && pcre2_pattern_info(code_of(code), PCRE2_INFO_JITSIZE, &jit_size) == 0
	 && jit_size > 0)
	{
		scratch->jit_stack = pcre2_jit_stack_create(config.jit_stack_start, config.jit_stack_max, 0);
		if (!scratch->jit_stack)
			throw RxEngineError(PCRE2_ERROR_NOMEMORY, errorMessage(PCRE2_ERROR_NOMEMORY));
		pcre2_jit_stack_assign(scratch->match_context, 0, scratch->jit_stack);
	}
	return guard.release();
}

RxOutcome
RxPcre2Engine::match(
	const RxCodeHandle* code,
	const char* subject,
	CharBytes length,
	CharBytes start,
	RxMatchOption options,
	RxScratch& scratch,
	std::vector<CharBytes>& captures
) const
{
	RxPcre2Scratch&	s = static_cast<RxPcre2Scratch&>(scratch);
	uint32_t	opts = PCRE2_NO_UTF_CHECK;
	if (options & RxMatchOption::Anchored)		opts |= PCRE2_ANCHORED;
	if (options & RxMatchOption::EndAnchored)	opts |= PCRE2_ENDANCHORED;
	if (options & RxMatchOption::NotBOL)		opts |= PCRE2_NOTBOL;
	if (options & RxMatchOption::NotEOL)		opts |= PCRE2_NOTEOL;
	if (options & RxMatchOption::PartialSoft)	opts |= PCRE2_PARTIAL_SOFT;

	int		rc = pcre2_match(
				code_of(code),
				(PCRE2_SPTR)subject, length,
				start, opts,
				s.match_data, s.match_context
			);
	TRACK(("pcre2_match(length=%u, start=%u, options=%#x) = %d\n", (unsigned)length, (unsigned)start, opts, rc));

	if (rc == PCRE2_ERROR_NOMATCH)
		return RxOutcome::NoMatch;

	uint32_t	pairs = pcre2_get_ovector_count(s.match_data);
	PCRE2_SIZE*	ovector = pcre2_get_ovector_pointer(s.match_data);
	captures.assign(2*pairs, RX_UNSET);

	if (rc == PCRE2_ERROR_PARTIAL)
	{
		captures[0] = (CharBytes)ovector[0];
		captures[1] = (CharBytes)ovector[1];
		return RxOutcome::Partial;
	}

	switch (rc)
	{
	case PCRE2_ERROR_MATCHLIMIT:
	case PCRE2_ERROR_DEPTHLIMIT:
	case PCRE2_ERROR_HEAPLIMIT:
	case PCRE2_ERROR_JIT_STACKLIMIT:
		throw RxMatchLimitError(rc, errorMessage(rc));
	}
	if (rc < 0)
		throw RxEngineError(rc, errorMessage(rc));

	// rc is the highest set pair plus one, or zero if the ovector was too small (it never is)
	uint32_t	set = rc == 0 ? pairs : (uint32_t)rc;
	for (uint32_t i = 0; i < set && i < pairs; i++)
	{
		if (ovector[2*i] == PCRE2_UNSET)
			continue;
		captures[2*i] = (CharBytes)ovector[2*i];
		captures[2*i+1] = (CharBytes)ovector[2*i+1];
	}
	return RxOutcome::Matched;
}

std::string
RxPcre2Engine::errorMessage(int code) const
{
	PCRE2_UCHAR	buffer[256];
	int		len = pcre2_get_error_message(code, buffer, sizeof(buffer));
	if (len < 0)
		return "PCRE2 error "+std::to_string(code);
	return std::string((const char*)buffer, len);
}
