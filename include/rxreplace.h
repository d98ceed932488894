#if !defined(RXREPLACE_H)
#define RXREPLACE_H
/*
 * Replacement templates.
 *
 * A template is parsed once, left to right, against a pattern's groups:
 *	\X	the character X
 *	$n	group n. Further digits are taken while the number is still a group
 *	${n}	group n
 *	${name}	the named group
 * Anything else after $, a trailing \, an unterminated ${, or a reference
 * to a group that doesn't exist throws RxUsageError.
 * A group that did not participate in the match expands to nothing.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<string>
#include	<vector>

#include	<rxpattern.h>
#include	<rxresult.h>

class RxReplacement
{
public:
	RxReplacement(const std::u16string& replacement, const RxPatternBody& pattern);

	void		expand(std::u16string& sink, const RxMatchResult& match) const;

	// A template that produces text literally
	static std::u16string quote(const std::u16string& text);

private:
	struct Part
	{
		Part(int g) : group(g) {}
		int		group;		// -1 for literal text
		std::u16string	text;
	};
	std::vector<Part> parts;

	void		literal(char16_t c);
};

#endif
