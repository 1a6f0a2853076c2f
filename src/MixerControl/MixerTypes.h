#pragma once

#include <any>
#include <atomic>
#include <string>
#include <vector>

namespace MixerControl
{
	/**
	 * @brief Argument list of a single OSC message (float, int, bool or std::string)
	 */
	using OscArgs = std::vector<std::any>;

	/**
	 * @brief Address/encoding dialect spoken by the connected mixer
	 */
	enum class MixerFamily
	{
		Unknown,
		X32, // Behringer X32 / Midas M32, identified by /info
		XAir // Behringer X-Air / Midas MR, identified by /xinfo
	};

	inline std::string familyName(MixerFamily family)
	{
		switch (family)
		{
		case MixerFamily::X32:
			return "x32";
		case MixerFamily::XAir:
			return "x-air";
		case MixerFamily::Unknown:
			break;
		}
		return "unknown";
	}

	/**
	 * @brief Verbosity switch for informational console output
	 *
	 * Warnings and errors always go to std::cerr; lifecycle lines on std::cout
	 * are only printed while verbose output is enabled.
	 */
	class Log
	{
	public:
		static bool verbose() { return flag().load(); }
		static void setVerbose(bool enabled) { flag().store(enabled); }

	private:
		static std::atomic<bool> &flag()
		{
			static std::atomic<bool> enabled(true);
			return enabled;
		}
	};

	/**
	 * @brief Render one OSC argument for console output
	 */
	std::string formatArg(const std::any &arg);

	/**
	 * @brief Convert a numeric OSC argument (float, double, int, int64, bool) to float
	 *
	 * @throws TypeMismatchException if the argument is empty or not numeric
	 */
	float argToFloat(const std::any &arg, const std::string &context);

	/**
	 * @brief Convert a string OSC argument to std::string
	 *
	 * @throws TypeMismatchException if the argument is not a string
	 */
	std::string argToString(const std::any &arg, const std::string &context);
}
