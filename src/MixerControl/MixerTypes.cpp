#include "MixerTypes.h"
#include "MixerExceptions.h"

#include <cstdint>
#include <sstream>

namespace MixerControl
{
	std::string formatArg(const std::any &arg)
	{
		std::ostringstream out;
		if (!arg.has_value())
		{
			out << "[none]";
		}
		else if (arg.type() == typeid(int))
		{
			out << std::any_cast<int>(arg);
		}
		else if (arg.type() == typeid(float))
		{
			out << std::any_cast<float>(arg);
		}
		else if (arg.type() == typeid(double))
		{
			out << std::any_cast<double>(arg);
		}
		else if (arg.type() == typeid(int64_t))
		{
			out << std::any_cast<int64_t>(arg);
		}
		else if (arg.type() == typeid(std::string))
		{
			out << "\"" << std::any_cast<const std::string &>(arg) << "\"";
		}
		else if (arg.type() == typeid(bool))
		{
			out << (std::any_cast<bool>(arg) ? "true" : "false");
		}
		else
		{
			out << "[unknown type]";
		}
		return out.str();
	}

	float argToFloat(const std::any &arg, const std::string &context)
	{
		if (arg.type() == typeid(float))
			return std::any_cast<float>(arg);
		if (arg.type() == typeid(int))
			return static_cast<float>(std::any_cast<int>(arg));
		if (arg.type() == typeid(double))
			return static_cast<float>(std::any_cast<double>(arg));
		if (arg.type() == typeid(int64_t))
			return static_cast<float>(std::any_cast<int64_t>(arg));
		if (arg.type() == typeid(bool))
			return std::any_cast<bool>(arg) ? 1.0f : 0.0f;

		throw TypeMismatchException("Expected a numeric value from " + context +
									", got " + formatArg(arg));
	}

	std::string argToString(const std::any &arg, const std::string &context)
	{
		if (arg.type() == typeid(std::string))
			return std::any_cast<std::string>(arg);

		throw TypeMismatchException("Expected a string value from " + context +
									", got " + formatArg(arg));
	}
}
