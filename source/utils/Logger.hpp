#pragma once
#include <iostream>
#include <mutex>
#include <syslog.h>
#include <memory>
#include <cstring>
#include <string>
#include <map>

namespace b64kit{
namespace utils{

/**
 * @brief Logging Class using syslog.(Singleton Pattern). Every log type can be routed to one of Local 0~7 facilities, which must be set in syslog's configuration files first.
 * 
 */
class Logger
{
	public:
		enum LogType : int
		{
			default_type = -1,
			info = 0,
			error,
			debug
		};
	private:
		static std::unique_ptr<Logger> instance_;
		static std::mutex instance_mtx;
		static Logger* instance();
		static const std::string service_name;
		std::map<LogType, int> ports;
		bool isOpened;
		bool isVerbose;
		std::mutex verbose_mtx;

	public:
		Logger();
		~Logger();
		/**
		 * @brief Start logging. 'ConfigPort()' should be done before open.
		 * It can be called again while other threads are logging, to switch verbose output.
		 * 
		 * @param _verbose whether logging through standard output too or not.
		 */
		static void OpenLog(bool _verbose = false);
		/**
		 * @brief Assign local facility to log type. Not synchronized with 'log()', so call it before any thread logs.
		 * 
		 * @param type type of log
		 * @param port local facility number.(0 ~ 7). out of range means the default facility.
		 */
		static void ConfigPort(LogType type, int port);
		/**
		 * @brief Log message as 'type'
		 * 
		 * @param content string message to log
		 * @param type log type.
		 */
		static void log(std::string content, LogType type = LogType::info);
		/**
		 * @brief Get Log type by string name.
		 * 
		 * @param name type name
		 * @return LogType type enum.
		 */
		static LogType GetType(std::string name);
	
	private:
		void OpenLog_(bool);
		void ConfigPort_(LogType, int);
		void log_(std::string, LogType);
		int GetLogPort(int);
		static int Level(LogType);
};

}
}
