#if !defined(RXPATTERN_H)
#define RXPATTERN_H
/*
 * Compiled regular expressions.
 *
 * An RxPattern is a by-value handle on a shared, immutable RxPatternBody,
 * which owns the engine's compiled forms of one pattern text with one set
 * of flags. A body may be used by any number of matchers on any number of
 * threads; each matcher brings its own scratch space.
 *
 * Where the engine can precompile anchoring (e.g. with a JIT), three
 * variants are compiled: unanchored for find(), start-anchored for
 * lookingAt(), and anchored at both ends for matches(). Otherwise only
 * the unanchored form exists, and anchoring is requested per match call.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdint.h>
#include	<functional>
#include	<map>
#include	<string>
#include	<vector>

#include	<refcount.h>
#include	<rxengine.h>

enum class RxFlag : uint32_t
{
	None			= 0x000,
	UnixLines		= 0x001,	// Only \n terminates a line
	CaseInsensitive		= 0x002,
	Comments		= 0x004,	// Whitespace and #comments in the pattern are ignored
	Multiline		= 0x008,	// ^ and $ match at line terminators
	Literal			= 0x010,	// The pattern has no metacharacters
	DotAll			= 0x020,	// . matches line terminators too
	CanonEq			= 0x080,	// Canonically equivalent text matches
	UnicodeCharacterClass	= 0x100		// Predefined and POSIX classes use Unicode properties
};

inline RxFlag	operator|(RxFlag a, RxFlag b)
		{ return (RxFlag)((uint32_t)a | (uint32_t)b); }
inline bool	operator&(RxFlag a, RxFlag b)
		{ return ((uint32_t)a & (uint32_t)b) != 0; }

// Which compiled variant to use
enum class RxAnchor
{
	None = 0,	// find()
	Start = 1,	// lookingAt()
	Both = 2	// matches()
};

/*
 * Sole owner of one compiled handle. The engine must outlive it.
 */
class RxCode
{
public:
	RxCode() : engine(0), code(0) {}
	~RxCode() { reset(); }

	void		reset(const RxEngine* e = 0, RxCodeHandle* c = 0)
			{
				if (code)
					engine->release(code);
				engine = e;
				code = c;
			}
	const RxCodeHandle* get() const { return code; }

private:
	const RxEngine*	engine;
	RxCodeHandle*	code;

	RxCode(const RxCode&);
	RxCode&		operator=(const RxCode&);
};

class RxPatternBody
: public RefCounted
{
public:
	RxPatternBody(const Ref<RxEngine>& engine, const std::u16string& regex, RxFlag flags);

	const RxEngine&	engine() const { return *rx_engine; }
	const std::u16string& pattern() const { return source; }
	RxFlag		flags() const { return pattern_flags; }
	bool		canonical() const { return pattern_flags & RxFlag::CanonEq; }
	int		groupCount() const { return group_count; }
	const std::map<std::u16string, int>& namedGroups() const { return names; }
	int		groupNumber(const std::u16string& name) const;	// -1 if there's no such group

			// How the pattern text ends, for hitEnd() and requireEnd()
	bool		canExtendAtEnd() const { return can_extend; }	// Ends with a quantifier
	bool		hasSoftEndAnchor() const { return soft_end_anchor; }	// $ or \Z
	bool		hasEndAnchor() const { return end_anchor; }	// $, \Z or \z

			// The variant to run, and whether it has the anchoring compiled in
	const RxCodeHandle* variant(RxAnchor anchor) const;
	bool		isPrecompiled(RxAnchor anchor) const
			{ return variants[(int)anchor].get() != 0; }

	RxScratch*	newScratch() const;

private:
	Ref<RxEngine>	rx_engine;		// Must be destroyed after the variants
	std::u16string	source;
	RxFlag		pattern_flags;
	int		group_count;
	std::map<std::u16string, int> names;
	bool		can_extend;
	bool		soft_end_anchor;
	bool		end_anchor;
	RxCode		variants[3];		// Indexed by RxAnchor
};

class RxMatcher;

class RxPattern
{
public:
	RxPattern(const Ref<RxEngine>& engine, const std::u16string& regex, RxFlag flags = RxFlag::None);
	explicit RxPattern(const Ref<RxPatternBody>& b);	// b must not be null

	RxMatcher	matcher(const std::u16string& input) const;

	// Compile regex and match the whole of input
	static bool	matches(const Ref<RxEngine>& engine, const std::u16string& regex, const std::u16string& input);

	/*
	 * Split input around matches. With limit > 0, at most limit strings are
	 * returned and the last holds the remaining input. With limit == 0,
	 * trailing empty strings are dropped. A zero-length match at the start
	 * of input never produces a leading empty string.
	 */
	std::vector<std::u16string> split(const std::u16string& input, int limit = 0) const;

	// As split, but each matched delimiter follows the string it terminates
	std::vector<std::u16string> splitWithDelimiters(const std::u16string& input, int limit) const;

	// A pattern that matches text literally
	static std::u16string quote(const std::u16string& text);

	std::function<bool(const std::u16string&)> asPredicate() const;		// find()
	std::function<bool(const std::u16string&)> asMatchPredicate() const;	// matches()

	const std::u16string& pattern() const { return body->pattern(); }
	std::u16string	toString() const { return body->pattern(); }
	RxFlag		flags() const { return body->flags(); }
	int		groupCount() const { return body->groupCount(); }
	const std::map<std::u16string, int>& namedGroups() const { return body->namedGroups(); }

	const Ref<RxPatternBody>& getBody() const { return body; }

private:
	Ref<RxPatternBody> body;

	std::vector<std::u16string> splitter(const std::u16string& input, int limit, bool with_delimiters) const;
};

#endif
