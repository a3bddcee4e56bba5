#include "StackTraceExcept.hpp"

namespace b64kit{
namespace utils{

const std::string StackTraceExcept::CR = "\r\n";
const std::string StackTraceExcept::TAB = "\t";

StackTraceExcept::StackTraceExcept(std::string name, std::string content, std::string file, std::string func, int line)
{
	stacktrace = "[" + name + "] " + content + CR + "[Stack Trace]" + CR;
	stack(file, func, line);
}

StackTraceExcept::StackTraceExcept(std::string content, std::string file, std::string func, int line)
 : StackTraceExcept("Except", content, file, func, line) {}

void StackTraceExcept::stack(std::string file, std::string func, int line)
{
	stacktrace += TAB + func + "(" + file + ":" + std::to_string(line) + ")" + CR;
}

void StackTraceExcept::Propagate(std::string file, std::string func, int line)
{
	stack(file, func, line);
	throw *this;
}

const char * StackTraceExcept::what() const noexcept
{
	return stacktrace.c_str();
}

void ErrorCodeExcept::ThrowOnFail(ErrorCode ec, std::string file, std::string func, int line)
{
	if(!ec)
		throw ErrorCodeExcept(ec, file, func, line);
}

BufferSizeExcept::BufferSizeExcept(size_t required, size_t given, std::string file, std::string func, int line)
 : StackTraceExcept("BufferSize", "destination has " + std::to_string(given) + " bytes, " + std::to_string(required) + " required", file, func, line), m_required(required), m_given(given) {}

}
}
