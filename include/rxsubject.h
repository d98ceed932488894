#if !defined(RXSUBJECT_H)
#define RXSUBJECT_H
/*
 * The immutable subject of a match, with everything derived from it:
 * the UTF-8 bytes handed to the engine, the offset map, and (for canonical
 * equivalence) the decomposed text plus a map from decomposed offsets back
 * to the caller's offsets.
 *
 * An RxSubject is built once when a matcher is given a new subject, and is
 * shared (by reference count) with every match snapshot taken from it.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<string>
#include	<vector>

#include	<refcount.h>
#include	<rxoffsets.h>

class RxSubject
: public RefCounted
{
public:
	RxSubject(const std::u16string& text, bool canonical = false);

	const std::u16string& text() const { return original; }
	CharNum		length() const { return (CharNum)original.size(); }
	std::u16string	substr(CharNum start, CharNum end) const
			{ return original.substr(start, end-start); }

	// The engine's view
	const std::string& bytes() const { return offsets.bytes(); }
	CharBytes	numBytes() const { return offsets.numBytes(); }
	bool		isDecomposed() const { return !seg_orig.empty(); }

	/*
	 * Caller offsets to engine byte offsets. startByte rounds forward to the
	 * next character (or decomposition segment) start, endByte rounds back.
	 */
	CharBytes	startByte(CharNum index) const;
	CharBytes	endByte(CharNum index) const;

	/*
	 * Engine byte offsets to caller offsets. The bytes must start a character
	 * (RxEngineError otherwise). Inside a decomposition segment, a start maps
	 * to the segment start and an end maps to the segment end.
	 */
	CharNum		startUnit(CharBytes offset) const;
	CharNum		endUnit(CharBytes offset) const;

	// The caller offset of the character containing any byte offset, for diagnostics
	CharNum		unitFloor(CharBytes offset) const;

	// The first character start after index, for advancing past a zero-length match
	CharNum		nextUnit(CharNum index) const;

private:
	std::u16string	original;
	RxOffsetMap	offsets;		// Over the decomposed text if isDecomposed(), else over original

	// Decomposition segments. Entry k is the start of segment k, with a final entry for the end.
	std::vector<CharNum>	seg_orig;	// in original
	std::vector<CharNum>	seg_norm;	// in the decomposed text

	CharNum		normFloor(CharNum index) const;
	CharNum		normCeil(CharNum index) const;
	int		segmentOf(const std::vector<CharNum>& segs, CharNum index) const;
};

#endif
