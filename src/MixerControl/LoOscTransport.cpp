#include "LoOscTransport.h"
#include "MixerExceptions.h"

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

// Include liblo for OSC communication
extern "C"
{
#include <lo/lo.h>
}

namespace MixerControl
{
	OscArgs decodeLoArguments(const char *types, lo_arg **argv, int argc)
	{
		OscArgs args;
		for (int i = 0; i < argc; i++)
		{
			char type = types ? types[i] : '\0';

			// Flag types carry no payload
			if (type == LO_TRUE || type == LO_FALSE)
			{
				args.push_back(std::any(type == LO_TRUE));
				continue;
			}

			if (!argv || !argv[i])
			{
				args.push_back(std::any());
				continue;
			}

			switch (type)
			{
			case LO_INT32:
				args.push_back(std::any(static_cast<int>(argv[i]->i)));
				break;
			case LO_FLOAT:
				args.push_back(std::any(argv[i]->f));
				break;
			case LO_DOUBLE:
				args.push_back(std::any(argv[i]->d));
				break;
			case LO_INT64:
				args.push_back(std::any(static_cast<int64_t>(argv[i]->h)));
				break;
			case LO_STRING:
			case LO_SYMBOL:
				args.push_back(std::any(std::string(&(argv[i]->s))));
				break;
			default:
				// Keep positions stable for types we do not decode
				args.push_back(std::any());
				break;
			}
		}
		return args;
	}

	struct LoCallbacks
	{
		static void onError(int num, const char *msg, const char *path)
		{
			std::cerr << "OSC error " << num << ": " << (msg ? msg : "unknown")
					  << " (" << (path ? path : "null") << ")" << std::endl;
		}

		static int onMessage(const char *path, const char *types, lo_arg **argv, int argc,
							 lo_message msg, void *user_data)
		{
			(void)msg;
			LoOscTransport *transport = static_cast<LoOscTransport *>(user_data);
			if (!transport || !path)
			{
				return 1;
			}

			transport->deliverInbound(path, decodeLoArguments(types, argv, argc));
			return 0;
		}
	};

	namespace
	{
		void appendArg(lo_message msg, const std::any &arg)
		{
			if (arg.type() == typeid(float))
			{
				lo_message_add_float(msg, std::any_cast<float>(arg));
			}
			else if (arg.type() == typeid(double))
			{
				lo_message_add_float(msg, static_cast<float>(std::any_cast<double>(arg)));
			}
			else if (arg.type() == typeid(int))
			{
				lo_message_add_int32(msg, std::any_cast<int>(arg));
			}
			else if (arg.type() == typeid(bool))
			{
				// Booleans are sent as integers (0/1) in OSC
				lo_message_add_int32(msg, std::any_cast<bool>(arg) ? 1 : 0);
			}
			else if (arg.type() == typeid(std::string))
			{
				lo_message_add_string(msg, std::any_cast<const std::string &>(arg).c_str());
			}
			else if (arg.type() == typeid(const char *))
			{
				lo_message_add_string(msg, std::any_cast<const char *>(arg));
			}
			else
			{
				throw TypeMismatchException(std::string("Unsupported OSC argument type: ") + arg.type().name());
			}
		}
	}

	LoOscTransport::LoOscTransport(const std::string &host, int port)
		: m_host(host), m_port(port)
	{
		m_oscAddress = lo_address_new(host.c_str(), std::to_string(port).c_str());
		if (!m_oscAddress)
		{
			throw ConnectionException("Failed to create OSC address for " + remoteDescription());
		}

		// Passing no port lets the OS pick an ephemeral one
		m_oscServer = lo_server_thread_new(nullptr, &LoCallbacks::onError);
		if (!m_oscServer)
		{
			cleanup();
			throw ConnectionException("Failed to open local OSC endpoint for " + remoteDescription());
		}

		lo_server_thread_add_method(m_oscServer, nullptr, nullptr, &LoCallbacks::onMessage, this);

		if (lo_server_thread_start(m_oscServer) < 0)
		{
			cleanup();
			throw ConnectionException("Failed to start OSC receive thread for " + remoteDescription());
		}

		if (Log::verbose())
		{
			std::cout << "LoOscTransport: UDP port " << localPort() << " ready for "
					  << remoteDescription() << std::endl;
		}
	}

	LoOscTransport::~LoOscTransport()
	{
		cleanup();
	}

	void LoOscTransport::cleanup()
	{
		if (m_oscServer)
		{
			lo_server_thread_stop(m_oscServer);
			lo_server_thread_free(m_oscServer);
			m_oscServer = nullptr;
		}

		if (m_oscAddress)
		{
			lo_address_free(m_oscAddress);
			m_oscAddress = nullptr;
		}
	}

	void LoOscTransport::send(const std::string &address, const OscArgs &args)
	{
		lo_message msg = lo_message_new();
		if (!msg)
		{
			throw NetworkException("Failed to create OSC message for " + address);
		}

		try
		{
			for (const auto &arg : args)
			{
				appendArg(msg, arg);
			}
		}
		catch (const MixerException &)
		{
			lo_message_free(msg);
			throw;
		}

		int result = 0;
		std::string error;
		{
			std::lock_guard<std::mutex> lock(m_sendMutex);
			result = lo_send_message_from(m_oscAddress, lo_server_thread_get_server(m_oscServer),
										  address.c_str(), msg);
			if (result == -1)
			{
				const char *errstr = lo_address_errstr(m_oscAddress);
				error = errstr ? errstr : "unknown error";
			}
		}
		lo_message_free(msg);

		if (result == -1)
		{
			throw NetworkException("Failed to send OSC message to " + address + ": " + error);
		}
	}

	void LoOscTransport::setInboundHandler(InboundHandler handler)
	{
		std::lock_guard<std::mutex> lock(m_handlerMutex);
		m_inboundHandler = std::move(handler);
	}

	void LoOscTransport::deliverInbound(const std::string &address, const OscArgs &args)
	{
		// Held across the call so that replacing the handler waits for a dispatch in progress
		std::lock_guard<std::mutex> lock(m_handlerMutex);
		if (!m_inboundHandler)
		{
			return;
		}

		try
		{
			m_inboundHandler(address, args);
		}
		catch (const std::exception &e)
		{
			// Never let an exception unwind into liblo's C receive loop
			std::cerr << "LoOscTransport: Inbound handler failed for " << address << ": "
					  << e.what() << std::endl;
		}
	}

	std::string LoOscTransport::remoteDescription() const
	{
		return m_host + ":" + std::to_string(m_port);
	}

	int LoOscTransport::localPort() const
	{
		return m_oscServer ? lo_server_thread_get_port(m_oscServer) : 0;
	}
}
