#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MixerControl
{
	/**
	 * @brief Connection settings for one mixer session
	 *
	 * The family is never configured; it is always detected.
	 */
	struct MixerConfig
	{
		std::string host = "192.168.1.17";
		int port = 10024;
		std::chrono::milliseconds queryTimeout{1000};
		std::chrono::milliseconds detectTimeout{500};
		std::chrono::milliseconds keepaliveInterval{9000};
		bool verbose = false;

		/**
		 * @brief Overlay the keys present in a JSON object
		 *
		 * Recognized keys: host (or targetIp), port (or targetPort), queryTimeoutMs,
		 * detectTimeoutMs, keepaliveIntervalMs, verbose.
		 *
		 * @throws ConfigurationException for values of the wrong type or out of range
		 */
		void applyJson(const nlohmann::json &j);

		/**
		 * @brief Overlay OSC_HOST and OSC_PORT from the environment, when set
		 *
		 * @throws ConfigurationException if OSC_PORT is not a valid port
		 */
		void applyEnvironment();

		nlohmann::json toJson() const;

		std::string toJsonString() const;

		/**
		 * @brief Parse a configuration from JSON text, starting from the defaults
		 *
		 * @throws ConfigurationException if the text is not a valid configuration
		 */
		static MixerConfig fromJsonString(const std::string &jsonStr);

		/**
		 * @brief Load a configuration file, starting from the defaults
		 *
		 * @throws ConfigurationException if the file cannot be read or parsed
		 */
		static MixerConfig loadFromFile(const std::string &filePath);
	};

	/**
	 * @brief Builds a MixerConfig from a config file, the environment and the command line
	 */
	class MixerConfigParser
	{
	public:
		/**
		 * @brief Resolve the configuration of a process
		 *
		 * Precedence, lowest first: defaults, --config file, environment, command line.
		 *
		 * @param argc Argument count
		 * @param argv Argument values
		 * @param unparsed Receives the arguments that are not configuration options
		 * @return MixerConfig Resolved configuration
		 * @throws ConfigurationException for any invalid source
		 */
		static MixerConfig resolve(int argc, char *argv[], std::vector<std::string> *unparsed = nullptr);

		/**
		 * @brief Apply command-line options to a configuration
		 *
		 * Understands --host/-i, --port/-p, --timeout, --verbose/-v. --config and its
		 * value are skipped; resolve() handles them.
		 *
		 * @return std::vector<std::string> Arguments that are not configuration options
		 * @throws ConfigurationException for a missing or invalid option value
		 */
		static std::vector<std::string> parseCommandLine(int argc, char *argv[], MixerConfig &config);

		/**
		 * @brief Parse a UDP port number
		 *
		 * @param text Port as text
		 * @param source Where the value came from, for the error message
		 * @throws ConfigurationException unless text is an integer in 1..65535
		 */
		static int parsePort(const std::string &text, const std::string &source);

		/**
		 * @brief Parse a positive millisecond count
		 *
		 * @throws ConfigurationException unless text is a positive integer
		 */
		static std::chrono::milliseconds parseMilliseconds(const std::string &text, const std::string &source);
	};
}
