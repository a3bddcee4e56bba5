#pragma once
#include <string>
#include <unordered_map>
#include <fstream>
#include <functional>

namespace b64kit{
namespace utils{

/**
 * @brief a global class for Parsing Config file(.conf)
 * 
 */
class ConfigParser
{
	private:
		static std::unordered_map<std::string, std::string> dict;
	public:
		/**
		 * @brief read configuration file and store key-value data. A key that already exists is overwritten.
		 * 
		 * @param path configuration file path
		 * 
		 * @return true if successed.
		 * @return false if file cannot be accessed.(errno is left as set by the failed open)
		 */
		static bool ReadFile(const std::string &path);
		/**
		 * @brief Forget every stored key-value.
		 * 
		 */
		static void Clear();
		/**
		 * @brief Whether 'key' has been read.
		 * 
		 */
		static bool HasKey(const std::string &key);
		/**
		 * @brief Get a string value of 'key'
		 * 
		 * @param key key for search
		 * @param default_value default value if there is no 'key' in configuration.
		 * @return std::string value
		 */
		static std::string GetString(std::string key, std::string default_value = "");
	private:
		static bool check_line(const std::string&);
		static void trim(std::string&);
		static void delete_comment(std::string&);
		static std::pair<std::string, std::string> split(const std::string&);
};

}
}
