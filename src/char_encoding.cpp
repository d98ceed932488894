/*
 * Whole-string conversion between UTF-16 and UTF-8.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<char_encoding.h>

std::string
UTF16ToUTF8(const std::u16string& text)
{
	std::string	out;
	const UTF16*	cp = text.data();
	const UTF16*	ep = cp+text.size();

	out.reserve(text.size());
	while (cp < ep)
		UTF8Put(out, UTF16Get(cp, ep));
	return out;
}

std::u16string
UTF8ToUTF16(const std::string& text)
{
	std::u16string	out;
	const UTF8*	cp = text.data();
	const UTF8*	ep = cp+text.size();

	out.reserve(text.size());
	while (cp < ep)
		UTF16Put(out, UTF8Get(cp, ep));
	return out;
}
