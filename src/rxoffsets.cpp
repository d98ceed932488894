/*
 * Translation between code unit offsets and byte offsets
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxoffsets.h>
#include	<rxerror.h>

#include	<algorithm>

RxOffsetMap::RxOffsetMap()
: unit_to_byte(1, 0)
{
}

RxOffsetMap::RxOffsetMap(const std::u16string& text)
{
	const UTF16*	sp = text.data();
	const UTF16*	cp = sp;
	const UTF16*	ep = sp+text.size();

	utf8.reserve(text.size());
	unit_to_byte.reserve(text.size()+1);
	while (cp < ep)
	{
		CharBytes	start = (CharBytes)utf8.size();
		const UTF16*	char_start = cp;

		UTF8Put(utf8, UTF16Get(cp, ep));

		// One entry per code unit consumed, all pointing at the character's first byte
		for (; char_start < cp; char_start++)
			unit_to_byte.push_back(start);
	}
	unit_to_byte.push_back((CharBytes)utf8.size());
}

CharNum
RxOffsetMap::byteToUnit(CharBytes offset) const
{
	std::vector<CharBytes>::const_iterator	found
		= std::lower_bound(unit_to_byte.begin(), unit_to_byte.end(), offset);

	if (found == unit_to_byte.end() || *found != offset)
		throw RxEngineError(0, "Byte offset "+std::to_string(offset)+" is not on a character boundary", RXERR_UNALIGNED_OFFSET);
	return (CharNum)(found-unit_to_byte.begin());
}

CharNum
RxOffsetMap::byteToUnitFloor(CharBytes offset) const
{
	if (offset >= numBytes())
		return length();

	// The last unit whose character starts at or before offset, then back to the first unit of that character
	std::vector<CharBytes>::const_iterator	found
		= std::upper_bound(unit_to_byte.begin(), unit_to_byte.end(), offset);
	CharBytes	start = *(found-1);
	return (CharNum)(std::lower_bound(unit_to_byte.begin(), found, start)-unit_to_byte.begin());
}

bool
RxOffsetMap::isBoundary(CharNum index) const
{
	return index <= 0 || index >= length() || unit_to_byte[index-1] != unit_to_byte[index];
}
