#include "ConfigParser.hpp"

namespace b64kit{
namespace utils{

std::unordered_map<std::string, std::string> ConfigParser::dict = std::unordered_map<std::string, std::string>();

bool ConfigParser::ReadFile(const std::string &path)
{
	std::ifstream openFile;
	openFile.open(path);
	if(!openFile.is_open())
		return false;
	std::string line;
	while(std::getline(openFile, line))
	{
		delete_comment(std::ref(line));
		trim(std::ref(line));
		if(!check_line(line))
			continue;
		auto [key, value] = split(line);
		if(key.length() <= 0)
			continue;
		dict[key] = value;
	}
	return true;
}

void ConfigParser::Clear()
{
	dict.clear();
}

bool ConfigParser::HasKey(const std::string &key)
{
	return dict.find(key) != dict.end();
}

std::string ConfigParser::GetString(std::string key, std::string default_value)
{
	auto it = dict.find(key);
	if(it == dict.end())
		return default_value;
	return it->second;
}

bool ConfigParser::check_line(const std::string &line)
{
	int max = line.length();
	char quotes = '\0';
	int num_of_equal = 0;
	for(int i = 0;i<max&&num_of_equal<2;i++)
	{
		if(quotes != '\0')
		{
			quotes = (quotes==line[i])?'\0':quotes;
			continue;
		}
		if(line[i] == '\"' || line[i] == '\'')
		{
			quotes = line[i];
			continue;
		}
		if(line[i] == '=')
		{
			num_of_equal++;
			continue;
		}
	}
	return num_of_equal == 1 && quotes == '\0';	//quotes must be closed.
}

void ConfigParser::trim(std::string &src)
{
	static std::string trimmer = " \t\n\r\f\v";
	//erase(0, std::string::npos) == erase(std::string::npos + 1) == erase(0) == clear()
	src.erase(src.find_last_not_of(trimmer) + 1);
	src.erase(0, src.find_first_not_of(trimmer));
}

void ConfigParser::delete_comment(std::string &src)
{
	char quotes = '\0';
	for(size_t i = 0;i<src.length();i++)
	{
		if(quotes != '\0')
		{
			quotes = (quotes==src[i])?'\0':quotes;
			continue;
		}
		if(src[i] == '\"' || src[i] == '\'')
		{
			quotes = src[i];
			continue;
		}
		if(src[i] == '#')
		{
			src.erase(i);
			return;
		}
	}
}

std::pair<std::string, std::string> ConfigParser::split(const std::string &src)
{
	//check_line() guarantees exactly one '=' outside of quotes.
	char quotes = '\0';
	size_t equal = std::string::npos;
	for(size_t i = 0;i<src.length();i++)
	{
		if(quotes != '\0')
		{
			quotes = (quotes==src[i])?'\0':quotes;
			continue;
		}
		if(src[i] == '\"' || src[i] == '\'')
			quotes = src[i];
		else if(src[i] == '=')
		{
			equal = i;
			break;
		}
	}
	if(equal == std::string::npos)
		return {"", src};
	std::string front = src.substr(0, equal);
	std::string end = src.substr(equal + 1);
	trim(front);
	trim(end);
	size_t open = end.find_first_of("\"\'");
	if(open != std::string::npos)
	{
		size_t close = end.find(end[open], open + 1);
		end = end.substr(open + 1, close - open - 1);
	}
	return {front, end};
}

}
}
