#if !defined(RXOFFSETS_H)
#define RXOFFSETS_H
/*
 * Translation between code unit offsets and byte offsets.
 *
 * Callers index a string by UTF-16 code unit. The engine indexes the UTF-8
 * encoding of the same string by byte. An RxOffsetMap is built once per
 * string by a single forward scan, and holds the UTF-8 encoding and the byte
 * offset of every code unit.
 *
 * Both code units of a surrogate pair record the byte offset where the
 * character starts. The entry after the pair advances by the full four
 * bytes. So the table is monotonic non-decreasing, and a byte offset that
 * starts a character always translates to the first unit of that character,
 * never to the middle of a pair.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdint.h>
#include	<string>
#include	<vector>

#include	<char_encoding.h>

typedef	uint32_t	CharBytes;	// Byte position (offset) within a UTF-8 string
typedef	int32_t		CharNum;	// Code unit position (offset) within a UTF-16 string, -1 for none

class RxOffsetMap
{
public:
	RxOffsetMap();
	RxOffsetMap(const std::u16string& text);

	const std::string& bytes() const { return utf8; }
	CharBytes	numBytes() const { return (CharBytes)utf8.size(); }
	CharNum		length() const { return (CharNum)unit_to_byte.size()-1; }

	// Byte offset of code unit. index must be in [0, length()].
	CharBytes	unitToByte(CharNum index) const { return unit_to_byte[index]; }

	// Code unit index starting at this byte offset. Throws RxEngineError if
	// the offset is out of range or does not start a character.
	CharNum		byteToUnit(CharBytes offset) const;

	// Code unit index of the character containing this byte offset (never throws for offsets in range)
	CharNum		byteToUnitFloor(CharBytes offset) const;

	// True if index is not the second unit of a surrogate pair
	bool		isBoundary(CharNum index) const;

private:
	std::string	utf8;
	std::vector<CharBytes>	unit_to_byte;	// length()+1 entries
};

#endif
