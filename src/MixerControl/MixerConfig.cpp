#include "MixerConfig.h"
#include "MixerExceptions.h"
#include "MixerTypes.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace MixerControl
{
	namespace
	{
		long parseInteger(const std::string &text, const std::string &what, const std::string &source)
		{
			size_t consumed = 0;
			long value = 0;
			try
			{
				value = std::stol(text, &consumed);
			}
			catch (const std::exception &)
			{
				throw ConfigurationException("Invalid " + what + " in " + source + ": \"" + text + "\"");
			}
			if (consumed != text.size())
			{
				throw ConfigurationException("Invalid " + what + " in " + source + ": \"" + text + "\"");
			}
			return value;
		}

		int jsonPort(const json &value, const std::string &key)
		{
			if (value.is_string())
			{
				return MixerConfigParser::parsePort(value.get<std::string>(), "config key " + key);
			}
			if (!value.is_number_integer())
			{
				throw ConfigurationException("Config key " + key + " must be an integer");
			}
			return MixerConfigParser::parsePort(std::to_string(value.get<long>()), "config key " + key);
		}

		std::chrono::milliseconds jsonMilliseconds(const json &value, const std::string &key)
		{
			if (!value.is_number_integer())
			{
				throw ConfigurationException("Config key " + key + " must be an integer number of milliseconds");
			}
			return MixerConfigParser::parseMilliseconds(std::to_string(value.get<long>()), "config key " + key);
		}

		std::string jsonString(const json &value, const std::string &key)
		{
			if (!value.is_string())
			{
				throw ConfigurationException("Config key " + key + " must be a string");
			}
			return value.get<std::string>();
		}
	}

	void MixerConfig::applyJson(const json &j)
	{
		if (!j.is_object())
		{
			throw ConfigurationException("Configuration must be a JSON object");
		}

		if (j.contains("targetIp"))
			host = jsonString(j["targetIp"], "targetIp");
		if (j.contains("host"))
			host = jsonString(j["host"], "host");

		if (j.contains("targetPort"))
			port = jsonPort(j["targetPort"], "targetPort");
		if (j.contains("port"))
			port = jsonPort(j["port"], "port");

		if (j.contains("queryTimeoutMs"))
			queryTimeout = jsonMilliseconds(j["queryTimeoutMs"], "queryTimeoutMs");

		if (j.contains("detectTimeoutMs"))
			detectTimeout = jsonMilliseconds(j["detectTimeoutMs"], "detectTimeoutMs");

		if (j.contains("keepaliveIntervalMs"))
			keepaliveInterval = jsonMilliseconds(j["keepaliveIntervalMs"], "keepaliveIntervalMs");

		if (j.contains("verbose"))
		{
			if (!j["verbose"].is_boolean())
				throw ConfigurationException("Config key verbose must be a boolean");
			verbose = j["verbose"].get<bool>();
		}

		if (host.empty())
		{
			throw ConfigurationException("Mixer host must not be empty");
		}
	}

	void MixerConfig::applyEnvironment()
	{
		if (const char *envHost = std::getenv("OSC_HOST"))
		{
			if (*envHost)
				host = envHost;
		}

		if (const char *envPort = std::getenv("OSC_PORT"))
		{
			if (*envPort)
				port = MixerConfigParser::parsePort(envPort, "OSC_PORT");
		}
	}

	json MixerConfig::toJson() const
	{
		json j;
		j["host"] = host;
		j["port"] = port;
		j["queryTimeoutMs"] = queryTimeout.count();
		j["detectTimeoutMs"] = detectTimeout.count();
		j["keepaliveIntervalMs"] = keepaliveInterval.count();
		j["verbose"] = verbose;
		return j;
	}

	std::string MixerConfig::toJsonString() const
	{
		return toJson().dump(4);
	}

	MixerConfig MixerConfig::fromJsonString(const std::string &jsonStr)
	{
		json j;
		try
		{
			j = json::parse(jsonStr);
		}
		catch (const json::parse_error &e)
		{
			throw ConfigurationException(std::string("JSON parsing error: ") + e.what());
		}

		MixerConfig config;
		config.applyJson(j);
		return config;
	}

	MixerConfig MixerConfig::loadFromFile(const std::string &filePath)
	{
		std::ifstream file(filePath);
		if (!file.is_open())
		{
			throw ConfigurationException("Failed to open configuration file: " + filePath);
		}

		std::stringstream buffer;
		buffer << file.rdbuf();
		file.close();

		MixerConfig config = fromJsonString(buffer.str());

		if (Log::verbose())
		{
			std::cout << "MixerConfig: Configuration loaded from: " << filePath << std::endl;
		}
		return config;
	}

	MixerConfig MixerConfigParser::resolve(int argc, char *argv[], std::vector<std::string> *unparsed)
	{
		MixerConfig config;

		for (int i = 1; i < argc; ++i)
		{
			std::string arg = argv[i];
			if (arg == "--config")
			{
				if (i + 1 >= argc)
				{
					throw ConfigurationException("--config requires a file path");
				}
				config = MixerConfig::loadFromFile(argv[++i]);
			}
		}

		config.applyEnvironment();

		std::vector<std::string> rest = parseCommandLine(argc, argv, config);
		if (unparsed)
		{
			*unparsed = std::move(rest);
		}
		return config;
	}

	std::vector<std::string> MixerConfigParser::parseCommandLine(int argc, char *argv[], MixerConfig &config)
	{
		std::vector<std::string> rest;

		auto requireValue = [&](int &i, const std::string &option) -> std::string
		{
			if (i + 1 >= argc)
			{
				throw ConfigurationException(option + " requires a value");
			}
			return argv[++i];
		};

		for (int i = 1; i < argc; ++i)
		{
			std::string arg = argv[i];

			if (arg == "--config")
			{
				requireValue(i, arg);
			}
			else if (arg == "--host" || arg == "-i")
			{
				config.host = requireValue(i, arg);
				if (config.host.empty())
				{
					throw ConfigurationException("Mixer host must not be empty");
				}
			}
			else if (arg == "--port" || arg == "-p")
			{
				config.port = parsePort(requireValue(i, arg), arg);
			}
			else if (arg == "--timeout")
			{
				config.queryTimeout = parseMilliseconds(requireValue(i, arg), arg);
			}
			else if (arg == "--verbose" || arg == "-v")
			{
				config.verbose = true;
			}
			else
			{
				rest.push_back(arg);
			}
		}

		return rest;
	}

	int MixerConfigParser::parsePort(const std::string &text, const std::string &source)
	{
		long value = parseInteger(text, "port", source);
		if (value < 1 || value > 65535)
		{
			throw ConfigurationException("Port out of range (1-65535) in " + source + ": " + text);
		}
		return static_cast<int>(value);
	}

	std::chrono::milliseconds MixerConfigParser::parseMilliseconds(const std::string &text, const std::string &source)
	{
		long value = parseInteger(text, "duration", source);
		if (value <= 0)
		{
			throw ConfigurationException("Duration must be positive in " + source + ": " + text);
		}
		return std::chrono::milliseconds(value);
	}
}
