#if !defined(RXENGINE_H)
#define RXENGINE_H
/*
 * The capability set of an external regular expression engine.
 *
 * The engine compiles UTF-8 pattern text into an opaque handle, matches a
 * handle against a UTF-8 byte subject, and releases the handle. Everything
 * above this interface (offset translation, regions, anchoring, the match
 * state machine and replacement) is engine-independent.
 *
 * An engine is immutable after construction and may be shared by patterns
 * and matchers on any number of threads. Each matcher asks the engine for
 * its own RxScratch, which is never shared between concurrent calls.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stddef.h>
#include	<stdint.h>
#include	<map>
#include	<string>
#include	<vector>

#include	<refcount.h>
#include	<rxoffsets.h>

// Options applied when compiling
enum class RxCompileOption : uint32_t
{
	None		= 0x0000,
	Caseless	= 0x0001,	// Case-insensitive
	DotAll		= 0x0002,	// . matches line terminators too
	Multiline	= 0x0004,	// ^ and $ match at line terminators
	Literal		= 0x0008,	// No metacharacters
	Extended	= 0x0010,	// Whitespace and #comments ignored
	Ucp		= 0x0020,	// \w, \d, \s, \b and POSIX classes use Unicode properties
	NewlineLF	= 0x0040,	// Only \n is a line terminator (else any Unicode newline)
	Anchored	= 0x0100,	// Match only at the start offset
	EndAnchored	= 0x0200,	// Match must end at the end of the subject
};

// Options applied to a single match call
enum class RxMatchOption : uint32_t
{
	None		= 0x0000,
	Anchored	= 0x0001,	// Match only at the start offset
	EndAnchored	= 0x0002,	// Match must end at the end of the subject
	NotBOL		= 0x0004,	// Subject start is not the beginning of a line
	NotEOL		= 0x0008,	// Subject end is not the end of a line
	PartialSoft	= 0x0010,	// Report a partial match if no complete match exists
};

inline RxCompileOption	operator|(RxCompileOption a, RxCompileOption b)
			{ return (RxCompileOption)((uint32_t)a | (uint32_t)b); }
inline bool		operator&(RxCompileOption a, RxCompileOption b)
			{ return ((uint32_t)a & (uint32_t)b) != 0; }
inline RxMatchOption	operator|(RxMatchOption a, RxMatchOption b)
			{ return (RxMatchOption)((uint32_t)a | (uint32_t)b); }
inline bool		operator&(RxMatchOption a, RxMatchOption b)
			{ return ((uint32_t)a & (uint32_t)b) != 0; }

// The normalised result of one match call. Engine failures are thrown, not returned.
enum class RxOutcome
{
	Matched,
	NoMatch,
	Partial
};

#define	RX_UNSET	((CharBytes)~0)	// Byte offset of a group that did not participate

// Why a compile failed. The offset is in bytes of the pattern as the engine saw it.
struct RxCompileFailure
{
	RxCompileFailure() : code(0), offset(0) {}
	int		code;
	CharBytes	offset;
	std::string	message;
};

struct	RxCodeHandle;		// Opaque compiled form, defined only by each engine

/*
 * Per-matcher resources for match calls: match data, limits, and any
 * auxiliary execution stack. Owned by exactly one matcher.
 */
class RxScratch
{
public:
	virtual		~RxScratch() {}
};

/*
 * Engine configuration. Zero limits leave the engine's defaults in force.
 */
struct RxEngineConfig
{
	RxEngineConfig()
	: jit(true)
	, jit_stack_start(32*1024)
	, jit_stack_max(512*1024)
	, match_limit(0)
	, depth_limit(0)
	, heap_limit(0)
	{}
	bool		jit;			// Use JIT-compiled variants where the engine supports it
	size_t		jit_stack_start;	// Initial size of each matcher's JIT stack
	size_t		jit_stack_max;		// Maximum size of each matcher's JIT stack
	uint32_t	match_limit;		// Backtracking step limit
	uint32_t	depth_limit;		// Backtracking depth limit
	uint32_t	heap_limit;		// Heap limit in KiB
};

class RxEngine
: public RefCounted
{
public:
	virtual const char*	name() const = 0;

	// Whether anchored variants are worth compiling separately, rather than using match options
	virtual bool	hasAnchoredVariants() const = 0;

	// Returns null and fills in failure if the pattern does not compile
	virtual RxCodeHandle* compile(const std::string& pattern, RxCompileOption options, RxCompileFailure& failure) const = 0;

	// Null is ignored
	virtual void	release(RxCodeHandle* code) const = 0;

	virtual int	captureCount(const RxCodeHandle* code) const = 0;
	virtual void	nameTable(const RxCodeHandle* code, std::map<std::string, int>& names) const = 0;

	// Scratch suitable for any variant compiled from the same pattern text as code
	virtual RxScratch* newScratch(const RxCodeHandle* code) const = 0;

	/*
	 * Search subject[0, length) from byte offset start. On Matched, captures
	 * holds 2*(captureCount+1) byte offsets with RX_UNSET for groups that did
	 * not participate. On Partial, only the first pair is set.
	 * Any other engine result is thrown as RxEngineError (RxMatchLimitError for limits).
	 */
	virtual RxOutcome match(
				const RxCodeHandle* code,
				const char* subject,
				CharBytes length,
				CharBytes start,
				RxMatchOption options,
				RxScratch& scratch,
				std::vector<CharBytes>& captures
			) const = 0;

	virtual std::string errorMessage(int code) const = 0;
};

/*
 * The engine implementations that can be configured
 */
enum class RxBackend
{
	Pcre2		// PCRE2, 8-bit code units, UTF mode
};

Ref<RxEngine>	rxCreateEngine(RxBackend backend, const RxEngineConfig& config = RxEngineConfig());

#endif
