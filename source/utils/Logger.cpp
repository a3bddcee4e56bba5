#include "Logger.hpp"

namespace b64kit{
namespace utils{

std::unique_ptr<Logger> Logger::instance_ = nullptr;
std::mutex Logger::instance_mtx;
const std::string Logger::service_name = "b64kit";
Logger* Logger::instance()
{
	std::unique_lock<std::mutex> lk(instance_mtx);
	if(instance_ == nullptr)
		instance_ = std::make_unique<Logger>();
	return instance_.get();
}

Logger::Logger() : isOpened(false), isVerbose(false)
{
	static const LogType All[] = {default_type, info, error, debug};
	for(LogType t : All)
		ports.insert({t, LOG_USER | Level(t)});
}

Logger::~Logger()
{
	if(isOpened)
		closelog();
}

void Logger::OpenLog(bool _verbose){instance()->OpenLog_(_verbose);}
void Logger::ConfigPort(LogType type, int port){instance()->ConfigPort_(type, port);}
void Logger::log(std::string content, LogType type){instance()->log_(content, type);}
Logger::LogType Logger::GetType(std::string name)
{
	if(name == "default")	return default_type;
	if(name == "info")	return info;
	if(name == "error")	return error;
	if(name == "debug") return debug;
	return default_type;
}

void Logger::OpenLog_(bool _verbose)
{
	{
		std::unique_lock<std::mutex> lk(verbose_mtx);
		isVerbose = _verbose;
	}
	openlog(service_name.c_str(), LOG_PID, ports.at(default_type) & LOG_FACMASK);
	isOpened = true;
}

void Logger::ConfigPort_(LogType type, int port)
{
	ports[type] = GetLogPort(port) | Level(type);
}

void Logger::log_(std::string content, LogType type)
{
	static const std::map<LogType, std::string> type2str = {
		{LogType::info, "INFO"},
		{LogType::error, "ERROR"},
		{LogType::debug, "DEBUG"},
		{LogType::default_type, "DEFAULT"}
	};
	{
		std::unique_lock<std::mutex> lk(verbose_mtx);	//guards 'isVerbose' and std::cout
		if(isVerbose)
			std::cout << "[" << type2str.at(type) << "] " << content << std::endl;
	}
	syslog(ports.at(type), "%s", content.c_str());
}

int Logger::GetLogPort(int port)
{
	if(port < 0 || port > 7)
		return LOG_USER;
	return ((port + 16) << 3);	//(16<<3) == LOG_LOCAL0
}

int Logger::Level(LogType type)
{
	switch(type)
	{
		case error:
			return LOG_ERR;
		case debug:
			return LOG_DEBUG;
		case info:
		case default_type:
			break;
	}
	return LOG_INFO;
}

}
}
