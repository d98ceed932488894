#if !defined(RXRESULT_H)
#define RXRESULT_H
/*
 * The result of a match: capture offsets in code units, attached to the
 * subject and pattern they came from. An RxMatchResult never changes once
 * made; a matcher replaces its own wholesale on every search, so a copy
 * taken with toMatchResult() stays valid whatever the matcher does next.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<string>
#include	<vector>

#include	<refcount.h>
#include	<rxoffsets.h>
#include	<rxsubject.h>
#include	<rxpattern.h>

/*
 * The text of one capture group, or null if the group did not participate.
 * An empty group that did participate is not null.
 */
class RxSlice
{
public:
	RxSlice()
			: slice_start(-1), slice_end(-1) {}
	RxSlice(const Ref<RxSubject>& s, CharNum start, CharNum end)
			: subject(s), slice_start(start), slice_end(end) {}

	bool		isNull() const { return slice_start < 0; }
	CharNum		start() const { return slice_start; }
	CharNum		end() const { return slice_end; }
	CharNum		length() const { return isNull() ? 0 : slice_end-slice_start; }
	std::u16string	str() const
			{ return isNull() ? std::u16string() : subject->substr(slice_start, slice_end); }

	bool		operator==(const std::u16string& s) const
			{ return !isNull() && str() == s; }
	bool		operator!=(const std::u16string& s) const
			{ return !(*this == s); }

private:
	Ref<RxSubject>	subject;
	CharNum		slice_start;
	CharNum		slice_end;
};

class RxMatchResult
{
public:
	RxMatchResult(const Ref<RxPatternBody>& pattern, const Ref<RxSubject>& subject);	// No match
	RxMatchResult(const Ref<RxPatternBody>& pattern, const Ref<RxSubject>& subject, const std::vector<CharNum>& offsets);

	bool		hasMatch() const { return !captures.empty(); }
	int		groupCount() const { return pattern->groupCount(); }
	const std::map<std::u16string, int>& namedGroups() const { return pattern->namedGroups(); }

			// Offsets are -1 for a group that did not participate
	CharNum		start(int group = 0) const;
	CharNum		end(int group = 0) const;
	RxSlice		group(int group = 0) const;

	CharNum		start(const std::u16string& name) const { return start(groupNumber(name)); }
	CharNum		end(const std::u16string& name) const { return end(groupNumber(name)); }
	RxSlice		group(const std::u16string& name) const { return group(groupNumber(name)); }

private:
	Ref<RxPatternBody> pattern;
	Ref<RxSubject>	subject;
	std::vector<CharNum> captures;		// 2*(groupCount()+1) offsets, or empty for no match

	void		check(int group) const;
	int		groupNumber(const std::u16string& name) const;
};

#endif
