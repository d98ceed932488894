/*
 * Test program for pattern compilation: flags, groups, compile errors,
 * engine configuration, and release of compiled handles.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstdio>
#include	<cstring>
#include	<functional>

#include	<rxpattern.h>
#include	<rxmatcher.h>
#include	<rxerror.h>

bool		show_passes = false;
int		test_count;
int		failure_count;
const char*	new_group;

void		group_tables();
void		compile_errors();
void		pattern_flags();
void		canonical_patterns();
void		conveniences();
void		handle_release();
void		engine_limits();

Ref<RxEngine>	engine;

int
main(int argc, const char** argv)
{
	if (argc > 1 && 0 == strcmp("-p", argv[1]))
		show_passes = true;

	engine = rxCreateEngine(RxBackend::Pcre2);

	group_tables();
	compile_errors();
	pattern_flags();
	canonical_patterns();
	conveniences();
	handle_release();
	engine_limits();

	printf("Completed %d tests with %d failures\n", test_count, failure_count);
	return failure_count == 0 ? 0 : 1;
}

void
test_group(const char* group)
{
	new_group = group;
}

void
expect(const char* when, long result, long wanted = 1)
{
	test_count++;
	if (result != wanted)
	{
		if (new_group)
			printf("%s:\n", new_group);
		if (wanted != 1)
			printf("%d:\t%s: FAIL (wanted %ld got %ld)\n", test_count, when, wanted, result);
		else
			printf("%d:\t%s: FAIL\n", test_count, when);
		failure_count++;
		new_group = 0;
	}
	else if (show_passes)
	{
		if (new_group)
			printf("%s:\n", new_group);
		printf("%d:\t%s: PASS\n", test_count, when);
		new_group = 0;
	}
}

bool
raises(ErrNum num, std::function<void()> action)
{
	try {
		action();
	}
	catch (const RxException& e)
	{
		if (e.errNum() == num)
			return true;
		printf("\tunexpected error: %s\n", e.what());
	}
	return false;
}

bool
finds(const RxPattern& pattern, const std::u16string& input)
{
	return pattern.matcher(input).find();
}

/*
 * An engine that passes everything to another, counting compiled handles
 */
class CountingEngine
: public RxEngine
{
public:
	CountingEngine(const Ref<RxEngine>& e, bool anchored)
	: inner(e), anchored_variants(anchored), compiled(0), released(0)
	{}

	const char*	name() const { return "counting"; }
	bool		hasAnchoredVariants() const { return anchored_variants; }
	RxCodeHandle*	compile(const std::string& pattern, RxCompileOption options, RxCompileFailure& failure) const
			{
				RxCodeHandle*	code = inner->compile(pattern, options, failure);
				if (code)
					compiled++;
				return code;
			}
	void		release(RxCodeHandle* code) const
			{
				if (code)
					released++;
				inner->release(code);
			}
	int		captureCount(const RxCodeHandle* code) const
			{ return inner->captureCount(code); }
	void		nameTable(const RxCodeHandle* code, std::map<std::string, int>& names) const
			{ inner->nameTable(code, names); }
	RxScratch*	newScratch(const RxCodeHandle* code) const
			{ return inner->newScratch(code); }
	RxOutcome	match(const RxCodeHandle* code, const char* subject, CharBytes length, CharBytes start,
				RxMatchOption options, RxScratch& scratch, std::vector<CharBytes>& captures) const
			{ return inner->match(code, subject, length, start, options, scratch, captures); }
	std::string	errorMessage(int code) const
			{ return inner->errorMessage(code); }

	Ref<RxEngine>	inner;
	bool		anchored_variants;
	mutable int	compiled;
	mutable int	released;
};

void
group_tables()
{
	test_group("group counts and names");

	RxPattern	none(engine, u"abc");
	expect("no groups", none.groupCount(), 0);
	expect("no names", none.namedGroups().size(), 0);

	RxPattern	p(engine, u"(a)(?:b)(?<word>\\w+)(?<digit>\\d)?");
	expect("non-capturing groups are not counted", p.groupCount(), 3);
	expect("two names", p.namedGroups().size(), 2);
	expect("word is group 2", p.namedGroups().at(u"word"), 2);
	expect("digit is group 3", p.namedGroups().at(u"digit"), 3);
	expect("pattern text is kept", p.pattern() == u"(a)(?:b)(?<word>\\w+)(?<digit>\\d)?");
	expect("toString is the pattern text", p.toString() == p.pattern());
	expect("flags default to none", (long)p.flags(), (long)RxFlag::None);

	RxPattern	flagged(engine, u"x", RxFlag::Multiline | RxFlag::DotAll);
	expect("flags are kept", (long)flagged.flags(), (long)(RxFlag::Multiline | RxFlag::DotAll));
}

void
compile_errors()
{
	test_group("compile errors");

	int		index = -2;
	std::string	message;
	std::u16string	text;
	try {
		RxPattern	p(engine, u"a(b");
	}
	catch (const RxCompileError& e)
	{
		index = e.index();
		message = e.what();
		text = e.pattern();
		expect("compile error number", e.errNum() == RXERR_COMPILE);
		expect("compile error has a description", !e.description().empty());
	}
	expect("missing ) is reported at the end", index, 3);
	expect("pattern is reported", text == u"a(b");
	expect("message names the index", message.find("near index 3") != std::string::npos);
	expect("message shows the pattern", message.find("\na(b\n") != std::string::npos);

	index = -2;
	try {
		RxPattern	p(engine, u"\u00E9\U0001F600(");
	}
	catch (const RxCompileError& e)
	{
		index = e.index();
	}
	expect("error index counts code units, not bytes", index, 4);

	expect("unterminated class", raises(RXERR_COMPILE, []{ RxPattern p(engine, u"[ab"); }));
	expect("nothing to repeat", raises(RXERR_COMPILE, []{ RxPattern p(engine, u"*a"); }));
	expect("null engine", raises(RXERR_NULL_ARGUMENT, []{ RxPattern p(Ref<RxEngine>(), u"a"); }));
}

void
pattern_flags()
{
	test_group("pattern flags");

	expect("case sensitive by default", !finds(RxPattern(engine, u"abc"), u"xABC"));
	expect("case insensitive", finds(RxPattern(engine, u"abc", RxFlag::CaseInsensitive), u"xABC"));

	expect("dot excludes newline", !finds(RxPattern(engine, u"a.c"), u"a\nc"));
	expect("dot all", finds(RxPattern(engine, u"a.c", RxFlag::DotAll), u"a\nc"));

	expect("^ only at the start", !finds(RxPattern(engine, u"^b"), u"a\nb"));
	expect("multiline ^", finds(RxPattern(engine, u"^b", RxFlag::Multiline), u"a\nb"));

	expect("literal dot", !finds(RxPattern(engine, u"a.c", RxFlag::Literal), u"abc"));
	expect("literal text", finds(RxPattern(engine, u"a.c", RxFlag::Literal), u"xa.c"));

	expect("comments", finds(RxPattern(engine, u"a b  # comment", RxFlag::Comments), u"ab"));

	expect("ASCII word class", !finds(RxPattern(engine, u"^\\w$"), u"\u00E9"));
	expect("Unicode word class", finds(RxPattern(engine, u"^\\w$", RxFlag::UnicodeCharacterClass), u"\u00E9"));

	expect("carriage return ends a line", !finds(RxPattern(engine, u"a.c"), u"a\rc"));
	expect("Unix lines", finds(RxPattern(engine, u"a.c", RxFlag::UnixLines), u"a\rc"));
}

void
canonical_patterns()
{
	test_group("canonical equivalence");

	RxPattern	precomposed(engine, u"caf\u00E9", RxFlag::CanonEq);
	expect("precomposed pattern, decomposed subject", precomposed.matcher(u"cafe\u0301").matches());
	expect("precomposed pattern, precomposed subject", precomposed.matcher(u"caf\u00E9").matches());

	RxPattern	decomposed(engine, u"cafe\u0301", RxFlag::CanonEq);
	expect("decomposed pattern, precomposed subject", decomposed.matcher(u"caf\u00E9").matches());

	expect("without the flag, forms differ", !RxPattern(engine, u"caf\u00E9").matcher(u"cafe\u0301").matches());
}

void
conveniences()
{
	test_group("pattern conveniences");

	expect("static matches", RxPattern::matches(engine, u"a+b", u"aaab"));
	expect("static matches needs the whole input", !RxPattern::matches(engine, u"a+b", u"aaabc"));

	RxPattern	digits(engine, u"\\d+");
	std::function<bool(const std::u16string&)>	contains = digits.asPredicate();
	std::function<bool(const std::u16string&)>	is_all = digits.asMatchPredicate();
	expect("predicate finds", contains(u"ab12"));
	expect("predicate fails", !contains(u"abc"));
	expect("match predicate needs the whole input", !is_all(u"ab12"));
	expect("match predicate", is_all(u"12"));
}

void
handle_release()
{
	test_group("compiled handles are released exactly once");

	CountingEngine*	anchored = new CountingEngine(engine, true);
	Ref<RxEngine>	anchored_ref(anchored);
	{
		RxPattern	p(anchored_ref, u"a(b)c");
		RxPattern	copy(p);
		expect("three variants compiled", anchored->compiled, 3);
		RxMatcher	m = p.matcher(u"xabc");
		expect("find with the search variant", m.find());
		expect("lookingAt with the anchored variant", !m.lookingAt());
		m.region(1, 4);
		expect("matches with the fully anchored variant", m.matches());
		expect("nothing released while in use", anchored->released, 0);
	}
	expect("all variants released", anchored->released, 3);

	CountingEngine*	single = new CountingEngine(engine, false);
	Ref<RxEngine>	single_ref(single);
	{
		RxMatcher	m = RxPattern(single_ref, u"b+").matcher(u"abbc");
		expect("one variant compiled", single->compiled, 1);
		expect("the matcher holds the pattern", single->released, 0);
		expect("lookingAt by match options", !m.lookingAt());
		expect("find by match options", m.find() && m.start() == 1 && m.end() == 3);
		m.region(1, 3);
		expect("matches by match options", m.matches());
	}
	expect("the variant is released", single->released, 1);

	{
		int	before = single->compiled;
		expect("failed compile", raises(RXERR_COMPILE, [&]{ RxPattern p(single_ref, u"(a"); }));
		expect("a failed compile leaves nothing to release", single->compiled-before, 0);
	}

	RxEngineConfig	config;
	config.jit = false;
	expect("no anchored variants without the JIT", !rxCreateEngine(RxBackend::Pcre2, config)->hasAnchoredVariants());
}

void
engine_limits()
{
	test_group("engine limits");

	RxEngineConfig	config;
	config.jit = false;
	config.match_limit = 1000;
	Ref<RxEngine>	limited = rxCreateEngine(RxBackend::Pcre2, config);

	RxPattern	catastrophic(limited, u"(a+)+$");
	RxMatcher	m = catastrophic.matcher(u"aaaaaaaaaaaaaaaaaaaaaaaaaaaaab");
	bool		limit_error = false;
	try {
		m.find();
	}
	catch (const RxMatchLimitError& e)
	{
		limit_error = e.errNum() == RXERR_MATCH_LIMIT && e.engineCode() < 0;
	}
	expect("match limit raises a limit error", limit_error);

	RxMatcher	easy = catastrophic.matcher(u"aaa");
	expect("a cheap match is within the limit", easy.find());
}
