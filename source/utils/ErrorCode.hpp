#pragma once
#include <map>
#include <string>
#include <cerrno>
#include <cstring>
#include "Codes.hpp"

namespace b64kit{
namespace utils{

/**
 * @brief Integration of Error Code and Message types.
 * 
 */
class ErrorCode
{
	private:
		static const std::map<errorcode_t, std::string> strerrcode;
		
	private:
		int m_code;
		int m_type;
		std::string m_type_str;
		std::string m_message;

	public:
		static constexpr int TYPE_ERRNO = 0;
		static constexpr int TYPE_CUSTOM = 1;

		/**
		 * @brief Create new ErrorCode object with default code(SUCCESS, CustomCode).
		 * 
		 */
		ErrorCode();
		/**
		 * @brief Create new ErrorCode object with POSIX-Compatible system error code(errno).
		 * 
		 * @param _errno errno.
		 */
		ErrorCode(int _errno);
		/**
		 * @brief Create new ErrorCode object with Custom error code.
		 * @see Codes.hpp
		 * 
		 * @param ec Custom Error Code
		 */
		ErrorCode(errorcode_t ec);
		ErrorCode(const ErrorCode&);
		/**
		 * @brief Attach detail to the error message. The detail is appended in parenthesis.
		 * 
		 * @param detail detail of this error.
		 */
		void SetMessage(std::string detail);
		/**
		 * @brief Get Error Code Number.
		 * 
		 * @return int Error Code
		 */
		int code() const;
		/**
		 * @brief Get Error Message
		 * 
		 * @return std::string Error Message
		 */
		std::string message() const;
		/**
		 * @brief Get Error Message with Error Code
		 * 
		 * @return std::string Error Message
		 */
		std::string message_code() const;
		/**
		 * @brief Get Type of ErrorCode in string
		 * 
		 * @return std::string type
		 */
		std::string typestr() const;
		/**
		 * @brief Get Type of ErrorCode.
		 * 
		 * @return int type.
		 * @param 0 for posix
		 * @param 1 for custom
		 */
		int typecode() const;
		ErrorCode &operator=(const ErrorCode&);
		/**
		 * @brief Same type and same code. Messages are not compared.
		 * 
		 */
		bool operator==(const ErrorCode&) const;
		bool operator!=(const ErrorCode&) const;
		operator bool() const;
		/**
		 * @brief Get Success or not.
		 * 
		 * @return true if successed.
		 * @return false if failed.
		 */
		bool isSuccessed() const;
};

}
}
