/*
 * Replacement template parsing and expansion
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rxreplace.h>
#include	<rxerror.h>

static inline bool
is_digit(char16_t c)
{
	return c >= u'0' && c <= u'9';
}

static void
bad_template(const std::string& why, const std::u16string& replacement)
{
	throw RxUsageError(RXERR_BAD_REPLACEMENT, why+" in replacement \""+UTF16ToUTF8(replacement)+"\"");
}

void
RxReplacement::literal(char16_t c)
{
	if (parts.empty() || parts.back().group >= 0)
		parts.push_back(Part(-1));
	parts.back().text.push_back(c);
}

RxReplacement::RxReplacement(const std::u16string& replacement, const RxPatternBody& pattern)
{
	int		group_count = pattern.groupCount();
	size_t		len = replacement.size();
	size_t		i = 0;

	while (i < len)
	{
		char16_t	c = replacement[i++];
		if (c == u'\\')
		{
			if (i == len)
				bad_template("Character to be escaped is missing", replacement);
			literal(replacement[i++]);
			continue;
		}
		if (c != u'$')
		{
			literal(c);
			continue;
		}

		if (i == len)
			bad_template("Group index is missing", replacement);
		c = replacement[i];

		int		group = 0;
		if (c == u'{')
		{
			size_t	close = replacement.find(u'}', ++i);
			if (close == std::u16string::npos)
				bad_template("Named capturing group is missing trailing '}'", replacement);
			std::u16string	name = replacement.substr(i, close-i);
			i = close+1;
			if (name.empty())
				bad_template("Named capturing group has 0 length name", replacement);

			if (is_digit(name[0]))
			{
				long	number = 0;
				for (size_t d = 0; d < name.size(); d++)
				{
					if (!is_digit(name[d]))
						bad_template("Illegal group reference", replacement);
					number = number*10 + (name[d]-u'0');
					if (number > group_count)
						throw RxUsageError(RXERR_NO_GROUP, "No group "+UTF16ToUTF8(name));
				}
				group = (int)number;
			}
			else if ((group = pattern.groupNumber(name)) < 0)
				throw RxUsageError(RXERR_NO_GROUP_NAME, "No group with name {"+UTF16ToUTF8(name)+"}");
		}
		else if (is_digit(c))
		{
			group = c-u'0';
			i++;
			if (group > group_count)
				throw RxUsageError(RXERR_NO_GROUP, "No group "+std::to_string(group));

			// Take more digits only while the number still names a group
			while (i < len && is_digit(replacement[i]))
			{
				int	longer = group*10 + (replacement[i]-u'0');
				if (longer > group_count)
					break;
				group = longer;
				i++;
			}
		}
		else
			bad_template("Illegal group reference", replacement);

		parts.push_back(Part(group));
	}
}

void
RxReplacement::expand(std::u16string& sink, const RxMatchResult& match) const
{
	for (std::vector<Part>::const_iterator it = parts.begin(); it != parts.end(); ++it)
	{
		if (it->group < 0)
		{
			sink.append(it->text);
			continue;
		}
		RxSlice		slice = match.group(it->group);
		if (!slice.isNull())
			sink.append(slice.str());
	}
}

std::u16string
RxReplacement::quote(const std::u16string& text)
{
	if (text.find_first_of(u"\\$") == std::u16string::npos)
		return text;

	std::u16string	result;
	result.reserve(text.size()+2);
	for (size_t i = 0; i < text.size(); i++)
	{
		if (text[i] == u'\\' || text[i] == u'$')
			result.push_back(u'\\');
		result.push_back(text[i]);
	}
	return result;
}
