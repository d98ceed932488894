/*
 * Match subjects, their UTF-8 encoding, and canonical decomposition
 *
 * Canonical equivalence is approximated by decomposing both the pattern
 * and the subject (NFD) before the engine sees them. The subject is split
 * into segments at every character that has a decomposition boundary
 * before it (a starter followed by its combining marks), and each segment
 * is decomposed separately, so every segment boundary in the decomposed
 * text corresponds to a known offset in the original.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxsubject.h>
#include	<rxerror.h>

#include	<algorithm>
#include	<unicode/normalizer2.h>
#include	<unicode/unistr.h>
#include	<unicode/utypes.h>

static void
check_icu(UErrorCode status)
{
	if (U_FAILURE(status))
		throw RxException(RXERR_NORMALIZATION, std::string("Canonical decomposition failed: ")+u_errorName(status));
}

RxSubject::RxSubject(const std::u16string& text, bool canonical)
: original(text)
{
	if (!canonical)
	{
		offsets = RxOffsetMap(original);
		return;
	}

	UErrorCode		status = U_ZERO_ERROR;
	const icu::Normalizer2*	nfd = icu::Normalizer2::getNFDInstance(status);
	check_icu(status);

	icu::UnicodeString	whole(false, original.data(), (int32_t)original.size());
	UBool			already = nfd->isNormalized(whole, status);
	check_icu(status);
	if (already)
	{
		offsets = RxOffsetMap(original);	// Offsets need no segment mapping
		return;
	}

	std::u16string	decomposed;
	const UTF16*	sp = original.data();
	const UTF16*	cp = sp;
	const UTF16*	ep = sp+original.size();
	while (cp < ep)
	{
		const UTF16*	seg_start = cp;

		(void)UTF16Get(cp, ep);		// A segment always holds at least one character
		while (cp < ep)
		{
			const UTF16*	next = cp;
			UCS4		ch = UTF16Get(next, ep);
			if (nfd->hasBoundaryBefore((UChar32)ch))
				break;
			cp = next;
		}

		icu::UnicodeString	segment(false, seg_start, (int32_t)(cp-seg_start));
		icu::UnicodeString	norm = nfd->normalize(segment, status);
		check_icu(status);

		seg_orig.push_back((CharNum)(seg_start-sp));
		seg_norm.push_back((CharNum)decomposed.size());
		decomposed.append(norm.getBuffer(), norm.length());
	}
	seg_orig.push_back((CharNum)original.size());
	seg_norm.push_back((CharNum)decomposed.size());

	offsets = RxOffsetMap(decomposed);
}

int
RxSubject::segmentOf(const std::vector<CharNum>& segs, CharNum index) const
{
	// The last segment starting at or before index. The final entry is the end, so it maps to itself.
	return (int)(std::upper_bound(segs.begin(), segs.end(), index)-segs.begin())-1;
}

CharNum
RxSubject::normFloor(CharNum index) const
{
	return seg_norm[segmentOf(seg_orig, index)];
}

CharNum
RxSubject::normCeil(CharNum index) const
{
	int	k = segmentOf(seg_orig, index);
	return seg_orig[k] == index ? seg_norm[k] : seg_norm[k+1];
}

CharBytes
RxSubject::startByte(CharNum index) const
{
	if (isDecomposed())
		return offsets.unitToByte(normCeil(index));
	if (!offsets.isBoundary(index))
		index++;
	return offsets.unitToByte(index);
}

CharBytes
RxSubject::endByte(CharNum index) const
{
	if (isDecomposed())
		return offsets.unitToByte(normFloor(index));
	if (!offsets.isBoundary(index))
		index--;
	return offsets.unitToByte(index);
}

CharNum
RxSubject::startUnit(CharBytes offset) const
{
	CharNum		n = offsets.byteToUnit(offset);
	if (!isDecomposed())
		return n;
	return seg_orig[segmentOf(seg_norm, n)];
}

CharNum
RxSubject::endUnit(CharBytes offset) const
{
	CharNum		n = offsets.byteToUnit(offset);
	if (!isDecomposed())
		return n;
	int		k = segmentOf(seg_norm, n);
	return seg_norm[k] == n ? seg_orig[k] : seg_orig[k+1];
}

CharNum
RxSubject::unitFloor(CharBytes offset) const
{
	CharNum		n = offsets.byteToUnitFloor(offset);
	if (!isDecomposed())
		return n;
	return seg_orig[segmentOf(seg_norm, n)];
}

CharNum
RxSubject::nextUnit(CharNum index) const
{
	if (index >= length())
		return index+1;
	if (isDecomposed())
		return seg_orig[segmentOf(seg_orig, index)+1];
	index++;
	if (!offsets.isBoundary(index))
		index++;
	return index;
}
