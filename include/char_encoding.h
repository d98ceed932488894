#if !defined(CHAR_ENCODING_H)
#define CHAR_ENCODING_H
/*
 * Encode/decode characters between UTF-8, UTF-16 and UCS4.
 *
 * Callers index strings by UTF-16 code unit, the engine indexes its subject
 * by UTF-8 byte. Both directions are needed, and only Unicode scalar values
 * (up to U+10FFFF) are ever produced: the engine runs in UTF mode and
 * rejects anything longer than four bytes.
 *
 * A UTF8 character is represented as 1-4 bytes.
 * A first byte with a most significant bit of zero is a single ASCII byte.
 * The bytes after the first always have most significant two bits == "10",
 * which never occurs in the first byte - thus it's possible to jump into
 * the middle of a UTF8 string and reliably find the start of a character.
 *
 * A lone surrogate in UTF-16 input cannot be encoded in UTF-8. It is
 * replaced by U+FFFD, which occupies three bytes for one code unit.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstdint>
#include	<string>

typedef char		UTF8;		// We don't assume un/signed
typedef char16_t	UTF16;		// One code unit of a std::u16string
typedef	char32_t	UCS4;		// A UCS4 character, aka UTF-32, aka Rune

#define	UCS4_REPLACEMENT ((UCS4)0x0000FFFD)	// substitute for an unencodable char

inline bool	UCS4IsUnicode(UCS4 ch) { return ch < 0x00110000; }

inline bool
UTF8Is1st(UTF8 ch)
{
	return (ch & 0xC0) != 0x80;	// A non-1st byte is always 0b10xx_xxxx
}

// Get length of UTF8 from UCS4
inline int
UTF8Len(UCS4 ch)
{
	if (ch < (1<<7))	// 7 bits:
		return 1;	// ASCII
	if (ch < (1<<11))	// 11 bits:
		return 2;	// two bytes
	if (ch < (1<<16))	// 16 bits
		return 3;	// three bytes
	if (UCS4IsUnicode(ch))	// 21 bits, but capped at U+10FFFF
		return 4;	// four bytes
	return 3;		// Stored as UCS4_REPLACEMENT
}

// From a UTF8 first byte, return the length of the UTF8 sequence it introduces (0 for a trailing byte)
inline int
UTF8CorrectLen(UTF8 c)
{
	if ((unsigned char)c < 0x80) return 1;		// 0b0xxx_xxxx
	if ((unsigned char)c < 0xC0) return 0;		// 0b10xx_xxxx, not a valid 1st byte
	if ((unsigned char)c < 0xE0) return 2;		// 0b110x_xxxx
	if ((unsigned char)c < 0xF0) return 3;		// 0b1110_xxxx
	return 4;					// 0b1111_0xxx
}

// Store UTF8 from UCS4
inline void
UTF8Put(std::string& out, UCS4 ch)
{
	if (!UCS4IsUnicode(ch))
		ch = UCS4_REPLACEMENT;
	switch (UTF8Len(ch))
	{
	case 1:			// Single byte
		out += (UTF8)ch;
		return;

	case 2:		// 5 data bits in 1st byte, 6 in next
		out += (UTF8)(0xC0 | ((ch >>  6) & 0x1F));
		out += (UTF8)(0x80 | ((ch >>  0) & 0x3F));
		return;

	case 3:		// 4 data bits in 1st byte, 6 in each of 2 more
		out += (UTF8)(0xE0 | ((ch >> 12) & 0x0F));
		out += (UTF8)(0x80 | ((ch >>  6) & 0x3F));
		out += (UTF8)(0x80 | ((ch >>  0) & 0x3F));
		return;

	case 4:		// 3 data bits in 1st byte, 6 in each of 3 more
		out += (UTF8)(0xF0 | ((ch >> 18) & 0x07));
		out += (UTF8)(0x80 | ((ch >> 12) & 0x3F));
		out += (UTF8)(0x80 | ((ch >>  6) & 0x3F));
		out += (UTF8)(0x80 | ((ch >>  0) & 0x3F));
		return;
	}
}

// Decode one character, advancing cp. An illegal sequence yields UCS4_REPLACEMENT and advances one byte.
inline UCS4
UTF8Get(const UTF8*& cp, const UTF8* ep)
{
	const	UTF8*	sp = cp;
	static	unsigned char	masks[] = { 0xFF, 0x7F, 0x1F, 0x0F, 0x07 };
	int		len = UTF8CorrectLen(*cp);
	UCS4		ch = *cp & masks[len];

	if (len == 0 || sp+len > ep)
		goto illegal;
	for (int i = 1; i < len; i++)
	{
		if (UTF8Is1st(sp[i]))
			goto illegal;
		ch = (ch << 6) | (sp[i]&0x3F);
	}
	cp = sp+len;
	return ch;

illegal:
	cp = sp+1;
	return UCS4_REPLACEMENT;
}

/*
 * UTF-16
 *
 * A UTF16 value isn't always a whole character, but may instead contain
 * a surrogate. Surrogates come in pairs, the first from a set of 1024
 * values which is disjoint from the second set, also of 1024.	This
 * extends UTF16 to a 20bit character set.  If you are breaking strings
 * up, you must not break in the middle of a surrogate pair.
 */
inline bool
UTF16IsSurrogate(UTF16 ch)
{
	return (ch & 0xF800) == 0xD800;
}

inline bool
UTF16Is1st(UTF16 ch)
{
	return (ch & 0xFC00) == 0xD800;
}

inline bool
UTF16Is2nd(UTF16 ch)
{
	return (ch & 0xFC00) == 0xDC00;
}

// Decode one character, advancing cp. A lone or reversed surrogate yields UCS4_REPLACEMENT.
inline UCS4
UTF16Get(const UTF16*& cp, const UTF16* ep)
{
	UTF16	c1 = *cp++;

	if (!UTF16IsSurrogate(c1))
		return c1;

	if (UTF16Is1st(c1) && cp < ep && UTF16Is2nd(*cp))
	{
		UTF16	c2 = *cp++;
		return (((UCS4) c1 & ~0xD800) << 10)
			+ ((UCS4) c2 & ~0xDC00)
			+ 0x10000;
	}

	return UCS4_REPLACEMENT;
}

inline void
UTF16Put(std::u16string& out, UCS4 ch)	// Store UTF16 from UCS4
{
	if (ch <= 0xFFFF)
	{
		out += (UTF16)ch;
		return;
	}
	if (UCS4IsUnicode(ch))
	{
		out += (UTF16)(0xD800 + ((ch - 0x10000) >> 10));
		out += (UTF16)(0xDC00 + (ch & 0x3FF));
	}
	else
		out += (UTF16)UCS4_REPLACEMENT;
}

// Whole-string conversions
std::string	UTF16ToUTF8(const std::u16string& text);
std::u16string	UTF8ToUTF16(const std::string& text);

#endif
