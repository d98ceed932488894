#if !defined(RXERROR_H)
#define	RXERROR_H
/*
 * Error numbering and the exceptions thrown by the regular expression layer.
 *
 * Each subsystem is statically allocated a 16-bit subsystem "set" number.
 * Each set contains up to 16384 messages indicated by a 14-bit code.
 * The set number 0 corresponds to the system errno, and the msg codes are the errno codes.
 *
 * An Error carries the ErrNum and the formatted message text. Every failure
 * that reaches a caller of this library is thrown as an RxException holding
 * an Error, so callers can either catch by class or switch on the ErrNum.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdint.h>
#include	<exception>
#include	<string>

#include	<refcount.h>

class ErrNum
{
public:
	static const int32_t	ERR_FLAG = INT32_MIN;	// Sign bit is used to indicate an error, allowing quick checks
	static const int32_t	ERR_CUST = 0x40000000;	// Including this bit guarantees no collision with Microsoft subsystem codes

	constexpr ErrNum()
			: errnum(0) {}
	constexpr ErrNum(int set, int msg)
			: errnum(ERR_FLAG | ERR_CUST | ((set & 0xFFFF) << 14) | (msg & 0x3FFF)) {}
	constexpr int	set() const
			{ return (errnum >> 14) & 0xFFFF; }
	constexpr int	msg() const
			{ return errnum & 0x3FFF; }
	bool		operator==(ErrNum x) const
			{ return errnum == x.errnum; }
	bool		operator!=(ErrNum x) const
			{ return errnum != x.errnum; }
	constexpr operator int32_t() const		// Allows use in switch statements
			{ return errnum; }
private:
	int32_t		errnum;
};

/*
 * Error numbers in the regular expression subsystem
 */
#define	RXERR_SET		0x5258		// "RX"
#define	RXERR_COMPILE		ErrNum(RXERR_SET, 1)	// Pattern syntax error
#define	RXERR_ENGINE		ErrNum(RXERR_SET, 2)	// Engine failure during a match
#define	RXERR_MATCH_LIMIT	ErrNum(RXERR_SET, 3)	// Engine match, depth or heap limit exceeded
#define	RXERR_UNALIGNED_OFFSET	ErrNum(RXERR_SET, 4)	// Engine returned an offset inside a character
#define	RXERR_NORMALIZATION	ErrNum(RXERR_SET, 5)	// Canonical decomposition failed
#define	RXERR_NO_MATCH		ErrNum(RXERR_SET, 10)	// Capture state queried without a current match
#define	RXERR_NO_GROUP		ErrNum(RXERR_SET, 11)	// Group number out of range
#define	RXERR_NO_GROUP_NAME	ErrNum(RXERR_SET, 12)	// No group with this name
#define	RXERR_BAD_REGION	ErrNum(RXERR_SET, 13)	// Region bounds outside the subject or reversed
#define	RXERR_BAD_INDEX		ErrNum(RXERR_SET, 14)	// Search start outside the subject
#define	RXERR_BAD_REPLACEMENT	ErrNum(RXERR_SET, 15)	// Malformed replacement template
#define	RXERR_NULL_ARGUMENT	ErrNum(RXERR_SET, 16)	// A required argument was null
#define	RXERR_NO_BACKEND	ErrNum(RXERR_SET, 17)	// Engine backend unavailable
#define	RXERR_MOVED_FROM	ErrNum(RXERR_SET, 18)	// Search on a matcher whose state was moved away

class	Error
{
	class Body;
public:
	Error()
			: body(0) {}
	Error(ErrNum num, const std::string& text)
			: body(new Body(num, text)) {}
	Error(const Error& e)
			: body(e.body) {}
	Error&		operator=(const Error& e)
			{ body = e.body;  return *this; }
	operator ErrNum() const
			{ return body ? body->error_num() : ErrNum(); }
	const char*	text() const
			{ return body ? body->text().c_str() : ""; }

private:
	Ref<Body>	body;

	class Body
	: public RefCounted
	{
	public:
		Body(ErrNum n, const std::string& t)
		: num(n), msg(t)
		{}
		ErrNum		error_num() const { return num; }
		const std::string& text() const { return msg; }

	protected:
		ErrNum		num;
		std::string	msg;
	};
};

class RxException
: public std::exception
{
public:
	RxException(ErrNum num, const std::string& text)
			: error(num, text) {}
	const char*	what() const noexcept { return error.text(); }
	ErrNum		errNum() const { return error; }

protected:
	Error		error;
};

/*
 * Malformed pattern text. The index is a code unit offset into the pattern
 * the caller supplied (or -1 if the engine gave no position).
 */
class RxCompileError
: public RxException
{
public:
	RxCompileError(const std::string& description, const std::u16string& pattern, int index);

	const std::string&	description() const { return desc; }
	const std::u16string&	pattern() const { return regex; }
	int		index() const { return error_index; }

private:
	std::string	desc;
	std::u16string	regex;
	int		error_index;
};

/*
 * Any engine result other than a match, no match, or a partial match
 */
class RxEngineError
: public RxException
{
public:
	RxEngineError(int code, const std::string& text, ErrNum num = RXERR_ENGINE)
			: RxException(num, text), engine_code(code) {}
	int		engineCode() const { return engine_code; }

private:
	int		engine_code;
};

class RxMatchLimitError
: public RxEngineError
{
public:
	RxMatchLimitError(int code, const std::string& text)
			: RxEngineError(code, text, RXERR_MATCH_LIMIT) {}
};

/*
 * Incorrect use of the API by the caller
 */
class RxUsageError
: public RxException
{
public:
	RxUsageError(ErrNum num, const std::string& text)
			: RxException(num, text) {}
};

#endif
