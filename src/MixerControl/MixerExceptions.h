#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace MixerControl
{
	/**
	 * @brief Base exception for every failure raised by the mixer control layer
	 */
	class MixerException : public std::runtime_error
	{
	public:
		/**
		 * @brief Error codes for mixer exceptions
		 */
		enum class ErrorCode
		{
			None = 0,
			ConnectionFailed,	// UDP endpoint could not be opened
			DeviceNotDetected,	// Neither identification probe replied
			NotConnected,		// Operation issued before detection
			Timeout,			// Query reply did not arrive in time
			InvalidIndex,		// Channel/bus/scene index outside the family range
			NetworkError,		// Datagram could not be sent
			TypeMismatch,		// Reply argument has an unusable type
			ConfigurationError, // Bad configuration file, environment or argument
			InvalidArgument		// Malformed request (internal misuse)
		};

		MixerException(const std::string &message, ErrorCode code = ErrorCode::None)
			: std::runtime_error(message), m_code(code) {}

		ErrorCode code() const { return m_code; }

		/**
		 * @brief Get a short description for an error code
		 */
		static std::string describe(ErrorCode code)
		{
			switch (code)
			{
			case ErrorCode::None:
				return "no error";
			case ErrorCode::ConnectionFailed:
				return "connection failed";
			case ErrorCode::DeviceNotDetected:
				return "device not detected";
			case ErrorCode::NotConnected:
				return "not connected";
			case ErrorCode::Timeout:
				return "timeout";
			case ErrorCode::InvalidIndex:
				return "invalid index";
			case ErrorCode::NetworkError:
				return "network error";
			case ErrorCode::TypeMismatch:
				return "type mismatch";
			case ErrorCode::ConfigurationError:
				return "configuration error";
			case ErrorCode::InvalidArgument:
				return "invalid argument";
			}
			return "unknown error";
		}

	private:
		ErrorCode m_code;
	};

	class ConnectionException : public MixerException
	{
	public:
		explicit ConnectionException(const std::string &message)
			: MixerException(message, ErrorCode::ConnectionFailed) {}
	};

	class DeviceNotDetectedException : public MixerException
	{
	public:
		explicit DeviceNotDetectedException(const std::string &message)
			: MixerException(message, ErrorCode::DeviceNotDetected) {}
	};

	class NotConnectedException : public MixerException
	{
	public:
		explicit NotConnectedException(const std::string &message)
			: MixerException(message, ErrorCode::NotConnected) {}
	};

	/**
	 * @brief Raised when a query's reply does not arrive within its window
	 */
	class QueryTimeoutException : public MixerException
	{
	public:
		QueryTimeoutException(const std::string &address, std::chrono::milliseconds timeout)
			: MixerException("Timeout waiting for response from " + address +
								 " after " + std::to_string(timeout.count()) + " ms",
							 ErrorCode::Timeout),
			  m_address(address), m_timeout(timeout) {}

		const std::string &address() const { return m_address; }
		std::chrono::milliseconds timeout() const { return m_timeout; }

	private:
		std::string m_address;
		std::chrono::milliseconds m_timeout;
	};

	class InvalidIndexException : public MixerException
	{
	public:
		explicit InvalidIndexException(const std::string &message)
			: MixerException(message, ErrorCode::InvalidIndex) {}
	};

	class NetworkException : public MixerException
	{
	public:
		explicit NetworkException(const std::string &message)
			: MixerException(message, ErrorCode::NetworkError) {}
	};

	class TypeMismatchException : public MixerException
	{
	public:
		explicit TypeMismatchException(const std::string &message)
			: MixerException(message, ErrorCode::TypeMismatch) {}
	};

	/**
	 * @brief Raised for a value that cannot be clamped into range (NaN, infinity)
	 */
	class InvalidParameterException : public MixerException
	{
	public:
		explicit InvalidParameterException(const std::string &message)
			: MixerException(message, ErrorCode::InvalidArgument) {}
	};

	class ConfigurationException : public MixerException
	{
	public:
		explicit ConfigurationException(const std::string &message)
			: MixerException(message, ErrorCode::ConfigurationError) {}
	};
}
