#if !defined(RXMATCHER_H)
#define RXMATCHER_H
/*
 * A matcher runs one pattern over one subject, within a region of it.
 *
 * States:
 *	Fresh		no search since construction, reset() or region()
 *	HasMatch	the last search succeeded; the groups are available
 *	NoMatch		the last search failed; find() keeps failing until reset
 *
 * The engine only ever sees the bytes of the region, never the rest of the
 * subject, so lookaround and \b cannot look outside the region. With
 * anchoring bounds (the default) ^ and $ match at the region edges. Without
 * them, a region edge that isn't the real subject edge isn't a line edge.
 *
 * All offsets are in UTF-16 code units of the subject. A matcher is not
 * safe for use by more than one thread at a time. A matcher that has been
 * moved from throws RxUsageError on any search.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<functional>
#include	<cstddef>
#include	<iterator>
#include	<memory>
#include	<string>
#include	<vector>

#include	<refcount.h>
#include	<rxengine.h>
#include	<rxpattern.h>
#include	<rxresult.h>
#include	<rxsubject.h>

class RxMatchSequence;

typedef	std::function<std::u16string(const RxMatchResult&)>	RxReplacer;

class RxMatcher
{
public:
	RxMatcher(const RxPattern& pattern, const std::u16string& input);
	RxMatcher(RxMatcher&& other);
	~RxMatcher();

	RxPattern	pattern() const { return RxPattern(body); }
	void		usePattern(const RxPattern& pattern);	// Forgets any match

	bool		find();				// The next match in the region
	bool		find(CharNum start);		// reset(), then the first match at or after start
	bool		lookingAt();			// A match starting at the region start
	bool		matches();			// A match of the entire region

	RxMatcher&	region(CharNum start, CharNum end);
	CharNum		regionStart() const { return region_start; }
	CharNum		regionEnd() const { return region_end; }
	RxMatcher&	useAnchoringBounds(bool anchoring);
	bool		hasAnchoringBounds() const { return anchoring_bounds; }

			// Report when the subject ended during a possible match
	RxMatcher&	usePartialMatching(bool partial);
	bool		hitPartial() const { return hit_partial; }

	/*
	 * After a search, hitEnd() says whether the last search reached the region
	 * end, so more input might have changed its result. requireEnd() says a
	 * match was found but more input could lose it (an end anchor matched at
	 * the end). Both are judged from the shape of the pattern's end, and
	 * both keep their values across reset() until the next search.
	 */
	bool		hitEnd() const { return hit_end; }
	bool		requireEnd() const { return require_end; }

	RxMatcher&	reset();			// Region becomes the whole subject
	RxMatcher&	reset(const std::u16string& input);

	bool		hasMatch() const { return state == HasMatch; }
	int		groupCount() const { return body->groupCount(); }
	const std::map<std::u16string, int>& namedGroups() const { return body->namedGroups(); }

	CharNum		start(int group = 0) const { return current.start(group); }
	CharNum		end(int group = 0) const { return current.end(group); }
	RxSlice		group(int group = 0) const { return current.group(group); }
	CharNum		start(const std::u16string& name) const { return current.start(name); }
	CharNum		end(const std::u16string& name) const { return current.end(name); }
	RxSlice		group(const std::u16string& name) const { return current.group(name); }

	RxMatchResult	toMatchResult() const { return current; }

	/*
	 * The append protocol. appendReplacement copies the text from the append
	 * position to the match, then the expanded template, and moves the append
	 * position to the end of the match. A malformed template throws
	 * RxUsageError before this call appends anything, but whatever earlier
	 * calls appended stays in the sink.
	 */
	RxMatcher&	appendReplacement(std::u16string& sink, const std::u16string& replacement);
	std::u16string&	appendTail(std::u16string& sink);

			// These reset the matcher first. A replacer's result is a template.
	std::u16string	replaceAll(const std::u16string& replacement);
	std::u16string	replaceAll(const RxReplacer& replacer);
	std::u16string	replaceFirst(const std::u16string& replacement);
	std::u16string	replaceFirst(const RxReplacer& replacer);

	static std::u16string quoteReplacement(const std::u16string& text);

	// Every match from the region start, as a sequence that can be iterated again from scratch
	RxMatchSequence	results() const;

	std::u16string	toString() const;

private:
	enum State { Fresh, HasMatch, NoMatch };

	Ref<RxPatternBody> body;
	Ref<RxSubject>	subject;
	std::unique_ptr<RxScratch> scratch;
	CharNum		region_start;
	CharNum		region_end;
	bool		anchoring_bounds;
	bool		partial_matching;
	bool		hit_partial;
	bool		hit_end;
	bool		require_end;
	State		state;
	CharNum		last_search;		// Where the last failed search began
	CharNum		append_position;
	RxMatchResult	current;
	std::vector<CharBytes> captures;	// Engine results, reused between searches

	friend class	RxMatchSequence;
	friend class	RxMatchIterator;
	RxMatcher(const Ref<RxPatternBody>& pattern, const Ref<RxSubject>& input);

	bool		search(CharNum from, RxAnchor anchor);
	void		forget();
	void		appendPrefix(std::u16string& sink);

	RxMatcher(const RxMatcher&);
	RxMatcher&	operator=(const RxMatcher&);
};

/*
 * Iterates a sequence of matches. Each step is a find() on a matcher shared
 * by the copies of one iterator.
 */
class RxMatchIterator
{
public:
	typedef	std::input_iterator_tag	iterator_category;
	typedef	RxMatchResult		value_type;
	typedef	std::ptrdiff_t		difference_type;
	typedef	const RxMatchResult*	pointer;
	typedef	const RxMatchResult&	reference;

	RxMatchIterator() {}
	RxMatchIterator(const std::shared_ptr<RxMatcher>& m);

	const RxMatchResult& operator*() const { return matcher->current; }
	const RxMatchResult* operator->() const { return &matcher->current; }
	RxMatchIterator& operator++();
	bool		operator==(const RxMatchIterator& other) const { return matcher == other.matcher; }
	bool		operator!=(const RxMatchIterator& other) const { return matcher != other.matcher; }

private:
	std::shared_ptr<RxMatcher> matcher;	// Null at the end
};

/*
 * The matches of one pattern in one region of a subject. Each begin()
 * searches again from the region start with a matcher of its own.
 */
class RxMatchSequence
{
public:
	typedef	RxMatchIterator	iterator;

	RxMatchSequence(const RxMatcher& matcher);

	iterator	begin() const;
	iterator	end() const { return iterator(); }

private:
	Ref<RxPatternBody> body;
	Ref<RxSubject>	subject;
	CharNum		region_start;
	CharNum		region_end;
	bool		anchoring_bounds;
};

#endif
