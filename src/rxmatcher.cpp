/*
 * The match state machine: searching, regions, and the append protocol
 *
 * Each search hands the engine the bytes of the region only, with the
 * search start as a byte offset into them. Offsets coming back are
 * relative to the region and are rebased before conversion to code units.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxmatcher.h>
#include	<rxreplace.h>
#include	<rxerror.h>

#include	<stdio.h>

#if	defined(RX_TRACE)
#define	TRACK(x)	printf x
static const char*	anchor_names[] = { "find", "lookingAt", "matches" };
static const char*	outcome_names[] = { "matched", "no match", "partial" };
#else
#define	TRACK(x)
#endif

RxMatcher::RxMatcher(const RxPattern& pattern, const std::u16string& input)
: body(pattern.getBody())
, subject(new RxSubject(input, body->canonical()))
, scratch(body->newScratch())
, region_start(0)
, region_end(subject->length())
, anchoring_bounds(true)
, partial_matching(false)
, hit_partial(false)
, hit_end(false)
, require_end(false)
, state(Fresh)
, last_search(0)
, append_position(0)
, current(body, subject)
{
}

RxMatcher::RxMatcher(const Ref<RxPatternBody>& pattern, const Ref<RxSubject>& input)
: body(pattern)
, subject(input)
, scratch(body->newScratch())
, region_start(0)
, region_end(subject->length())
, anchoring_bounds(true)
, partial_matching(false)
, hit_partial(false)
, hit_end(false)
, require_end(false)
, state(Fresh)
, last_search(0)
, append_position(0)
, current(body, subject)
{
}

RxMatcher::RxMatcher(RxMatcher&& other)
: body(other.body)
, subject(other.subject)
, scratch(std::move(other.scratch))
, region_start(other.region_start)
, region_end(other.region_end)
, anchoring_bounds(other.anchoring_bounds)
, partial_matching(other.partial_matching)
, hit_partial(other.hit_partial)
, hit_end(other.hit_end)
, require_end(other.require_end)
, state(other.state)
, last_search(other.last_search)
, append_position(other.append_position)
, current(other.current)
, captures(std::move(other.captures))
{
}

RxMatcher::~RxMatcher()
{
}

void
RxMatcher::forget()
{
	state = Fresh;
	hit_partial = false;
	last_search = region_start;
	current = RxMatchResult(body, subject);
}

void
RxMatcher::usePattern(const RxPattern& pattern)
{
	bool		was_canonical = body->canonical();

	scratch.reset();		// Belongs to the old pattern's engine
	body = pattern.getBody();
	scratch.reset(body->newScratch());
	if (body->canonical() != was_canonical)
		subject = new RxSubject(subject->text(), body->canonical());
	forget();
}

RxMatcher&
RxMatcher::reset()
{
	region_start = 0;
	region_end = subject->length();
	append_position = 0;
	forget();
	return *this;
}

RxMatcher&
RxMatcher::reset(const std::u16string& input)
{
	subject = new RxSubject(input, body->canonical());
	return reset();
}

RxMatcher&
RxMatcher::region(CharNum start, CharNum end)
{
	if (start < 0 || start > end || end > subject->length())
		throw RxUsageError(RXERR_BAD_REGION,
			"Region "+std::to_string(start)+","+std::to_string(end)
			+" is outside 0,"+std::to_string(subject->length()));
	region_start = start;
	region_end = end;
	append_position = start;
	forget();
	return *this;
}

RxMatcher&
RxMatcher::useAnchoringBounds(bool anchoring)
{
	anchoring_bounds = anchoring;
	forget();
	return *this;
}

RxMatcher&
RxMatcher::usePartialMatching(bool partial)
{
	partial_matching = partial;
	hit_partial = false;
	return *this;
}

bool
RxMatcher::find()
{
	CharNum		from;
	switch (state)
	{
	case HasMatch:
		from = current.end();
		if (from == current.start())
			from = subject->nextUnit(from);	// Don't find the same empty match again
		break;
	case NoMatch:
		from = last_search;
		break;
	default:
		from = region_start;
		break;
	}
	if (from < region_start)
		from = region_start;
	return search(from, RxAnchor::None);
}

bool
RxMatcher::find(CharNum start)
{
	if (start < 0 || start > subject->length())
		throw RxUsageError(RXERR_BAD_INDEX,
			"Start "+std::to_string(start)+" is outside 0,"+std::to_string(subject->length()));
	reset();
	return search(start, RxAnchor::None);
}

bool
RxMatcher::lookingAt()
{
	return search(region_start, RxAnchor::Start);
}

bool
RxMatcher::matches()
{
	return search(region_start, RxAnchor::Both);
}

bool
RxMatcher::search(CharNum from, RxAnchor anchor)
{
	if (!scratch)
		throw RxUsageError(RXERR_MOVED_FROM, "This matcher has been moved from");

	hit_partial = false;
	hit_end = true;			// Until the engine shows otherwise
	require_end = false;
	last_search = from;
	state = NoMatch;
	current = RxMatchResult(body, subject);
	if (from > region_end)
		return false;

	CharBytes	base = subject->startByte(region_start);
	CharBytes	limit = subject->endByte(region_end);
	CharBytes	start = subject->startByte(from);
	if (limit < base)
		limit = base;		// The region lies within one decomposition segment
	if (start > limit)
		return false;

	RxMatchOption	options = RxMatchOption::None;
	if (!body->isPrecompiled(anchor))
	{
		if (anchor != RxAnchor::None)
			options = options | RxMatchOption::Anchored;
		if (anchor == RxAnchor::Both)
			options = options | RxMatchOption::EndAnchored;
	}
	if (!anchoring_bounds)
	{
		if (region_start > 0)
			options = options | RxMatchOption::NotBOL;
		if (region_end < subject->length())
			options = options | RxMatchOption::NotEOL;
	}
	// An anchored search only reaches the end through a partial match
	if (partial_matching || anchor != RxAnchor::None)
		options = options | RxMatchOption::PartialSoft;

	RxOutcome	outcome = body->engine().match(
				body->variant(anchor),
				subject->bytes().data()+base, limit-base,
				start-base,
				options,
				*scratch,
				captures
			);
	TRACK(("%s in bytes [%u, %u) from %u, options %#x: %s\n",
		anchor_names[(int)anchor], (unsigned)base, (unsigned)limit, (unsigned)start,
		(unsigned)options, outcome_names[(int)outcome]));

	if (outcome == RxOutcome::Partial && partial_matching)
		hit_partial = true;
	if (outcome != RxOutcome::Matched)
	{
		// A failed find() has tried every start up to the region end
		hit_end = anchor == RxAnchor::None || outcome == RxOutcome::Partial;
		return false;
	}

	int		pairs = body->groupCount()+1;
	std::vector<CharNum>	offsets(2*pairs, -1);
	for (int i = 0; i < pairs; i++)
	{
		if (captures[2*i] == RX_UNSET)
			continue;
		offsets[2*i] = subject->startUnit(captures[2*i]+base);
		offsets[2*i+1] = subject->endUnit(captures[2*i+1]+base);
	}
	current = RxMatchResult(body, subject, offsets);
	state = HasMatch;

	CharNum		match_end = offsets[1];
	hit_end = match_end == region_end && (body->canExtendAtEnd() || body->hasEndAnchor());

	// $ and \Z also match before a final line terminator
	CharNum		rest = region_end-match_end;
	const std::u16string&	text = subject->text();
	require_end = body->hasSoftEndAnchor()
		&& (rest == 0
		 || (rest == 1 && text[match_end] == u'\n')
		 || (rest == 2 && text[match_end] == u'\r' && text[match_end+1] == u'\n'));
	if (require_end)
		hit_end = true;
	return true;
}

void
RxMatcher::appendPrefix(std::u16string& sink)
{
	CharNum		match_start = current.start();		// Throws if there's no match
	if (match_start < append_position)
		throw RxUsageError(RXERR_BAD_INDEX, "The match starts before the append position");
	sink.append(subject->text(), append_position, match_start-append_position);
}

RxMatcher&
RxMatcher::appendReplacement(std::u16string& sink, const std::u16string& replacement)
{
	if (state != HasMatch)
		throw RxUsageError(RXERR_NO_MATCH, "No match available");
	RxReplacement	expansion(replacement, *body);

	appendPrefix(sink);
	expansion.expand(sink, current);
	append_position = current.end();
	return *this;
}

std::u16string&
RxMatcher::appendTail(std::u16string& sink)
{
	if (append_position < region_end)
		sink.append(subject->text(), append_position, region_end-append_position);
	return sink;
}

std::u16string
RxMatcher::replaceAll(const std::u16string& replacement)
{
	reset();
	RxReplacement	expansion(replacement, *body);
	std::u16string	result;

	while (find())
	{
		appendPrefix(result);
		expansion.expand(result, current);
		append_position = current.end();
	}
	return appendTail(result);
}

std::u16string
RxMatcher::replaceAll(const RxReplacer& replacer)
{
	reset();
	std::u16string	result;

	while (find())
		appendReplacement(result, replacer(current));
	return appendTail(result);
}

std::u16string
RxMatcher::replaceFirst(const std::u16string& replacement)
{
	reset();
	RxReplacement	expansion(replacement, *body);
	std::u16string	result;

	if (find())
	{
		appendPrefix(result);
		expansion.expand(result, current);
		append_position = current.end();
	}
	return appendTail(result);
}

std::u16string
RxMatcher::replaceFirst(const RxReplacer& replacer)
{
	reset();
	std::u16string	result;

	if (find())
		appendReplacement(result, replacer(current));
	return appendTail(result);
}

std::u16string
RxMatcher::quoteReplacement(const std::u16string& text)
{
	return RxReplacement::quote(text);
}

RxMatchSequence
RxMatcher::results() const
{
	return RxMatchSequence(*this);
}

std::u16string
RxMatcher::toString() const
{
	std::u16string	s(u"RxMatcher[pattern=");
	s += body->pattern();
	s += u" region=";
	s += UTF8ToUTF16(std::to_string(region_start)+","+std::to_string(region_end));
	s += u" lastmatch=";
	if (hasMatch())
		s += current.group().str();
	s += u"]";
	return s;
}

RxMatchIterator::RxMatchIterator(const std::shared_ptr<RxMatcher>& m)
: matcher(m)
{
}

RxMatchIterator&
RxMatchIterator::operator++()
{
	if (matcher && !matcher->find())
		matcher.reset();
	return *this;
}

RxMatchSequence::RxMatchSequence(const RxMatcher& m)
: body(m.body)
, subject(m.subject)
, region_start(m.region_start)
, region_end(m.region_end)
, anchoring_bounds(m.anchoring_bounds)
{
}

RxMatchSequence::iterator
RxMatchSequence::begin() const
{
	std::shared_ptr<RxMatcher>	matcher(new RxMatcher(body, subject));
	matcher->region(region_start, region_end);
	matcher->useAnchoringBounds(anchoring_bounds);
	if (!matcher->find())
		return iterator();
	return iterator(matcher);
}
