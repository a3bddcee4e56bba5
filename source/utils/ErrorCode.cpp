#include "ErrorCode.hpp"

namespace b64kit{
namespace utils{

const std::map<errorcode_t, std::string> ErrorCode::strerrcode = {
	{SUCCESS, "Success"},
	{ERR_INVALID_CHARACTER, "Invalid Character"},
	{ERR_INVALID_PADDING, "Invalid Padding"},
	{ERR_NO_SPACE_LEFT, "No Space Left"},
	{ERR_INVALID_ALPHABET, "Invalid Alphabet"},
	{ERR_INVALID_IGNORE, "Invalid Ignore Set"},
	{ERR_INVALID_CONFIG, "Invalid Configuration"}
};

ErrorCode::ErrorCode() : ErrorCode(SUCCESS) {}

ErrorCode::ErrorCode(errorcode_t ec) : m_type(TYPE_CUSTOM), m_type_str("CustomCode")
{
	m_code = ec;
	auto msg = strerrcode.find(ec);
	if(msg == strerrcode.end())
		m_message = "Unknown Code";
	else
		m_message = msg->second;
}

ErrorCode::ErrorCode(int _errno) : m_type(TYPE_ERRNO), m_type_str("Errno")
{
	m_code = _errno;
	m_message = std::strerror(_errno);
}

ErrorCode::ErrorCode(const ErrorCode& copy)
{
	(*this) = copy;
}

void ErrorCode::SetMessage(std::string detail)
{
	m_message += " (" + detail + ")";
}

int ErrorCode::code() const { return m_code; }
std::string ErrorCode::message() const { return m_message; }
std::string ErrorCode::message_code() const { return "(" + std::to_string(m_code) + ") " + m_message; }
std::string ErrorCode::typestr() const { return m_type_str; }
int ErrorCode::typecode() const { return m_type; }

ErrorCode::operator bool() const { return isSuccessed(); }
ErrorCode &ErrorCode::operator=(const ErrorCode& copy)
{
	m_code = copy.m_code;
	m_type = copy.m_type;
	m_type_str = copy.m_type_str;
	m_message = copy.m_message;

	return *this;
}

bool ErrorCode::operator==(const ErrorCode& rhs) const
{
	return m_type == rhs.m_type && m_code == rhs.m_code;
}

bool ErrorCode::operator!=(const ErrorCode& rhs) const
{
	return !(*this == rhs);
}

bool ErrorCode::isSuccessed() const
{
	return m_code == 0;
}

}
}
