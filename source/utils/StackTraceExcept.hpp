#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>
#include "ErrorCode.hpp"

#define __STACKINFO__	__FILE__, __FUNCTION__, __LINE__

namespace b64kit{
namespace utils{

/**
 * @brief Exception holding StackTrace Message.
 * 
 */
class StackTraceExcept : public std::exception
{
	private:
		static const std::string CR;
		static const std::string TAB;
		std::string stacktrace;

	protected:
		StackTraceExcept(std::string, std::string, std::string, std::string, int);

	public:
		/**
		 * @brief Constructor. use like 'StackTraceExcept("Message", __STACKINFO__)'
		 * 
		 */
		StackTraceExcept(std::string, std::string, std::string, int);
		/**
		 * @brief stack this call stack. use like 'stack(__STACKINFO__)'.
		 * 
		 */
		void stack(std::string, std::string, int);
		/**
		 * @brief Stack this call stack and throw itself. use like 'Propagate(__STACKINFO__)'.
		 * 
		 * @throw StackTraceExcept itself.
		 * 
		 */
		void Propagate(std::string, std::string, int);
		const char * what() const noexcept override;
};

/**
 * @brief StackTraceExcept holding ErrorCode.
 * 
 */
class ErrorCodeExcept : public StackTraceExcept
{
	private:
		ErrorCode m_ec;

	public:
		/**
		 * @brief Constructor of ErrorCode. use like 'throw ErrorCodeExcept(ec, __STACKINFO__)'.
		 * 
		 * @param ec ErrorCode
		 */
		ErrorCodeExcept(ErrorCode ec, std::string file, std::string func, int line) : StackTraceExcept(ec.typestr(), ec.message_code(), file, func, line), m_ec(ec) {}
		/**
		 * @brief Get the ErrorCode this exception was thrown with.
		 * 
		 * @return ErrorCode 
		 */
		ErrorCode error() const { return m_ec; }
		/**
		 * @brief Throw if the ErrorCode has failed. use like 'ThrowOnFail(ec, __STACKINFO__)'.
		 * 
		 * @param ec ErrorCode
		 */
		static void ThrowOnFail(ErrorCode ec, std::string, std::string, int);
};

/**
 * @brief Caller's destination memory is smaller than the data to be written into it.
 * 
 */
class BufferSizeExcept : public StackTraceExcept
{
	private:
		size_t m_required;
		size_t m_given;

	public:
		/**
		 * @brief Constructor. use like 'throw BufferSizeExcept(required, dest_len, __STACKINFO__)'.
		 * 
		 * @param required size needed to go on. it can be less than the whole output if the shortage is found midway.
		 * @param given size of caller's memory.
		 */
		BufferSizeExcept(size_t required, size_t given, std::string file, std::string func, int line);
		size_t required() const { return m_required; }
		size_t given() const { return m_given; }
};

}
}
