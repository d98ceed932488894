/*
 * Pattern compilation and the pattern-level conveniences
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxpattern.h>
#include	<rxmatcher.h>
#include	<rxsubject.h>
#include	<rxerror.h>

#include	<stdio.h>

#if	defined(RX_TRACE)
#define	TRACK(x)	printf x
#else
#define	TRACK(x)
#endif

static RxCompileOption
compile_options(RxFlag flags)
{
	RxCompileOption	options = RxCompileOption::None;
	if (flags & RxFlag::CaseInsensitive)
		options = options | RxCompileOption::Caseless;
	if (flags & RxFlag::DotAll)
		options = options | RxCompileOption::DotAll;
	if (flags & RxFlag::Multiline)
		options = options | RxCompileOption::Multiline;
	if (flags & RxFlag::Literal)
		options = options | RxCompileOption::Literal;
	if (flags & RxFlag::Comments)
		options = options | RxCompileOption::Extended;
	if (flags & RxFlag::UnicodeCharacterClass)
		options = options | RxCompileOption::Ucp;
	if (flags & RxFlag::UnixLines)
		options = options | RxCompileOption::NewlineLF;
	return options;
}

/*
 * Scan the pattern text for end anchors outside character classes, and
 * note whether its last atom is quantified. A closing parenthesis leaves
 * the answer of the atom before it. This reads the text, not the compiled
 * program, so alternations are judged by their last branch only.
 */
static void
analyse_end(const std::u16string& regex, bool extended, bool& can_extend, bool& soft_end_anchor, bool& end_anchor)
{
	int		class_depth = 0;
	size_t		len = regex.size();

	can_extend = soft_end_anchor = end_anchor = false;
	for (size_t i = 0; i < len; i++)
	{
		char16_t	c = regex[i];
		if (c == u'\\' && i+1 < len)
		{
			c = regex[++i];
			if (c == u'Q')
			{		// Quoted text runs to \E
				size_t	e = regex.find(u"\\E", i+1);
				i = e == std::u16string::npos ? len : e+1;
				can_extend = false;
				continue;
			}
			if (class_depth > 0)
				continue;
			if (c == u'Z')
				soft_end_anchor = true;
			else if (c == u'z')
				end_anchor = true;
			can_extend = false;
			continue;
		}
		if (class_depth > 0)
		{
			if (c == u'[')
				class_depth++;
			else if (c == u']')
				class_depth--;
			continue;
		}
		if (extended && (c == u' ' || c == u'\t' || c == u'\n' || c == u'\r'))
			continue;
		if (extended && c == u'#')
		{
			while (i+1 < len && regex[i+1] != u'\n')
				i++;
			continue;
		}

		switch (c)
		{
		case u'[':
			class_depth++;
			can_extend = false;
			break;
		case u'+': case u'*': case u'?': case u'}':
			can_extend = true;
			break;
		case u'$':
			soft_end_anchor = true;
			can_extend = false;
			break;
		case u')':
			break;
		default:
			can_extend = false;
			break;
		}
	}
	if (soft_end_anchor)
		end_anchor = true;
}

RxPatternBody::RxPatternBody(const Ref<RxEngine>& engine, const std::u16string& regex, RxFlag flags)
: rx_engine(engine)
, source(regex)
, pattern_flags(flags)
, group_count(0)
, can_extend(false)
, soft_end_anchor(false)
, end_anchor(false)
{
	if (!rx_engine)
		throw RxUsageError(RXERR_NULL_ARGUMENT, "A pattern needs an engine");

	// Under CanonEq the pattern is decomposed the same way subjects are
	RxSubject	text(regex, canonical());
	RxCompileOption	options = compile_options(flags);
	static const RxCompileOption	anchoring[3] = {
		RxCompileOption::None,
		RxCompileOption::Anchored,
		RxCompileOption::Anchored | RxCompileOption::EndAnchored
	};

	int		num_variants = rx_engine->hasAnchoredVariants() ? 3 : 1;
	for (int i = 0; i < num_variants; i++)
	{
		RxCompileFailure	failure;
		RxCodeHandle*	code = rx_engine->compile(text.bytes(), options | anchoring[i], failure);
		if (!code)
			throw RxCompileError(failure.message, regex, text.unitFloor(failure.offset));
		variants[i].reset(rx_engine, code);
	}

	group_count = rx_engine->captureCount(variants[0].get());

	std::map<std::string, int>	engine_names;
	rx_engine->nameTable(variants[0].get(), engine_names);
	for (std::map<std::string, int>::const_iterator it = engine_names.begin(); it != engine_names.end(); ++it)
		names[UTF8ToUTF16(it->first)] = it->second;

	if (!(flags & RxFlag::Literal))
		analyse_end(regex, flags & RxFlag::Comments, can_extend, soft_end_anchor, end_anchor);

	TRACK(("Compiled /%s/ as %d variant%s with %d groups, %d named\n",
		text.bytes().c_str(), num_variants, num_variants == 1 ? "" : "s",
		group_count, (int)names.size()));
}

int
RxPatternBody::groupNumber(const std::u16string& name) const
{
	std::map<std::u16string, int>::const_iterator	it = names.find(name);
	return it == names.end() ? -1 : it->second;
}

const RxCodeHandle*
RxPatternBody::variant(RxAnchor anchor) const
{
	const RxCodeHandle*	code = variants[(int)anchor].get();
	return code ? code : variants[(int)RxAnchor::None].get();
}

RxScratch*
RxPatternBody::newScratch() const
{
	return rx_engine->newScratch(variants[(int)RxAnchor::None].get());
}

RxPattern::RxPattern(const Ref<RxEngine>& engine, const std::u16string& regex, RxFlag flags)
: body(new RxPatternBody(engine, regex, flags))
{
}

RxPattern::RxPattern(const Ref<RxPatternBody>& b)
: body(b)
{
	if (!body)
		throw RxUsageError(RXERR_NULL_ARGUMENT, "A pattern needs a compiled body");
}

RxMatcher
RxPattern::matcher(const std::u16string& input) const
{
	return RxMatcher(*this, input);
}

bool
RxPattern::matches(const Ref<RxEngine>& engine, const std::u16string& regex, const std::u16string& input)
{
	return RxPattern(engine, regex).matcher(input).matches();
}

std::vector<std::u16string>
RxPattern::split(const std::u16string& input, int limit) const
{
	return splitter(input, limit, false);
}

std::vector<std::u16string>
RxPattern::splitWithDelimiters(const std::u16string& input, int limit) const
{
	return splitter(input, limit, true);
}

std::vector<std::u16string>
RxPattern::splitter(const std::u16string& input, int limit, bool with_delimiters) const
{
	std::vector<std::u16string>	list;
	RxMatcher	m = matcher(input);
	bool		limited = limit > 0;
	int		match_count = 0;
	CharNum		index = 0;

	while (m.find())
	{
		if (!limited || match_count < limit-1)
		{
			if (index == 0 && m.start() == 0 && m.end() == 0)
				continue;	// No leading empty string for a zero-length match at the start
			list.push_back(input.substr(index, m.start()-index));
			index = m.end();
			if (with_delimiters)
				list.push_back(input.substr(m.start(), index-m.start()));
			match_count++;
		}
		else if (match_count == limit-1)
		{		// The last one holds the remainder
			list.push_back(input.substr(index));
			index = m.end();
			match_count++;
		}
	}

	if (index == 0)		// No match
		return std::vector<std::u16string>(1, input);

	if (!limited || match_count < limit)
		list.push_back(input.substr(index));

	if (limit == 0)
		while (!list.empty() && list.back().empty())
			list.pop_back();
	return list;
}

std::u16string
RxPattern::quote(const std::u16string& text)
{
	static const std::u16string	end_quote(u"\\E");

	size_t		slash_e = text.find(end_quote);
	if (slash_e == std::u16string::npos)
		return u"\\Q" + text + u"\\E";

	// Close the quote around each \E, emit it escaped, and reopen
	std::u16string	result(u"\\Q");
	size_t		current = 0;
	while ((slash_e = text.find(end_quote, current)) != std::u16string::npos)
	{
		result.append(text, current, slash_e-current);
		current = slash_e+2;
		result.append(u"\\E\\\\E\\Q");
	}
	result.append(text, current, std::u16string::npos);
	result.append(u"\\E");
	return result;
}

std::function<bool(const std::u16string&)>
RxPattern::asPredicate() const
{
	RxPattern	pattern(*this);
	return [pattern](const std::u16string& input) -> bool
	{
		return pattern.matcher(input).find();
	};
}

std::function<bool(const std::u16string&)>
RxPattern::asMatchPredicate() const
{
	RxPattern	pattern(*this);
	return [pattern](const std::u16string& input) -> bool
	{
		return pattern.matcher(input).matches();
	};
}
