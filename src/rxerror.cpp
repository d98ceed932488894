/*
 * Regular expression exceptions
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxerror.h>
#include	<char_encoding.h>

static std::string
compile_error_text(const std::string& description, const std::u16string& pattern, int index)
{
	std::string	text(description);

	if (index >= 0)
		text += " near index " + std::to_string(index);
	text += "\n";
	text += UTF16ToUTF8(pattern);
	if (index >= 0 && index <= (int)pattern.size())
	{
		text += "\n";
		text.append(index, ' ');	// Columns count code units, like the index
		text += "^";
	}
	return text;
}

RxCompileError::RxCompileError(const std::string& description, const std::u16string& pattern, int index)
: RxException(RXERR_COMPILE, compile_error_text(description, pattern, index))
, desc(description)
, regex(pattern)
, error_index(index)
{
}
