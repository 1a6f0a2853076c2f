#pragma once

#include "OscTransport.h"

#include <mutex>
#include <string>

extern "C"
{
#include <lo/lo_osc_types.h>
#include <lo/lo_types.h>
}

namespace MixerControl
{
	/**
	 * @brief Convert a liblo argument list to OscArgs
	 *
	 * Produces exactly argc entries; arguments that cannot be decoded become
	 * an empty std::any so later positions keep their index.
	 */
	OscArgs decodeLoArguments(const char *types, lo_arg **argv, int argc);

	/**
	 * @brief UDP transport built on liblo
	 *
	 * Binds one server thread to an ephemeral local port and sends every
	 * message from that socket, so the mixer's replies come back to it.
	 */
	class LoOscTransport : public OscTransport
	{
	public:
		/**
		 * @brief Open the local endpoint and start the receive thread
		 *
		 * @param host Mixer host name or IP address
		 * @param port Mixer OSC port (10023 on X32, 10024 on X-Air)
		 * @throws ConnectionException if the endpoint cannot be opened
		 */
		LoOscTransport(const std::string &host, int port);

		/**
		 * @brief Stop the receive thread and release liblo resources
		 */
		~LoOscTransport() override;

		LoOscTransport(const LoOscTransport &) = delete;
		LoOscTransport &operator=(const LoOscTransport &) = delete;

		void send(const std::string &address, const OscArgs &args) override;
		void setInboundHandler(InboundHandler handler) override;
		std::string remoteDescription() const override;

		/**
		 * @brief Local UDP port the endpoint is bound to
		 */
		int localPort() const;

	private:
		// liblo C callbacks, defined next to the implementation
		friend struct LoCallbacks;

		void deliverInbound(const std::string &address, const OscArgs &args);

		void cleanup();

		std::string m_host;
		int m_port = 0;
		lo_address m_oscAddress = nullptr;	  // liblo address of the mixer
		lo_server_thread m_oscServer = nullptr; // liblo server on the ephemeral port

		mutable std::mutex m_sendMutex;
		mutable std::mutex m_handlerMutex;
		InboundHandler m_inboundHandler;
	};
}
