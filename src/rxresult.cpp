/*
 * Match results
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxresult.h>
#include	<rxerror.h>

RxMatchResult::RxMatchResult(const Ref<RxPatternBody>& p, const Ref<RxSubject>& s)
: pattern(p)
, subject(s)
{
}

RxMatchResult::RxMatchResult(const Ref<RxPatternBody>& p, const Ref<RxSubject>& s, const std::vector<CharNum>& offsets)
: pattern(p)
, subject(s)
, captures(offsets)
{
}

void
RxMatchResult::check(int n) const
{
	if (!hasMatch())
		throw RxUsageError(RXERR_NO_MATCH, "No match available");
	if (n < 0 || n > groupCount())
		throw RxUsageError(RXERR_NO_GROUP, "No group "+std::to_string(n));
}

int
RxMatchResult::groupNumber(const std::u16string& name) const
{
	if (!hasMatch())
		throw RxUsageError(RXERR_NO_MATCH, "No match available");
	int		group = pattern->groupNumber(name);
	if (group < 0)
		throw RxUsageError(RXERR_NO_GROUP_NAME, "No group with name <"+UTF16ToUTF8(name)+">");
	return group;
}

CharNum
RxMatchResult::start(int n) const
{
	check(n);
	return captures[2*n];
}

CharNum
RxMatchResult::end(int n) const
{
	check(n);
	return captures[2*n+1];
}

RxSlice
RxMatchResult::group(int n) const
{
	check(n);
	if (captures[2*n] < 0)
		return RxSlice();
	return RxSlice(subject, captures[2*n], captures[2*n+1]);
}
