#pragma once

#include "MixerTypes.h"

#include <functional>
#include <string>

namespace MixerControl
{
	/**
	 * @brief Datagram transport between the client and one mixer
	 *
	 * Sends are fire-and-forget. Every inbound message is handed to the
	 * installed inbound handler; the transport itself does no correlation.
	 */
	class OscTransport
	{
	public:
		/**
		 * @brief Callback for inbound messages (address, decoded arguments)
		 */
		using InboundHandler = std::function<void(const std::string &, const OscArgs &)>;

		virtual ~OscTransport() = default;

		/**
		 * @brief Send one OSC message to the mixer
		 *
		 * @param address OSC address (e.g., "/ch/01/mix/fader")
		 * @param args Message arguments (float, int, bool, std::string)
		 * @throws NetworkException if the datagram could not be sent
		 * @throws TypeMismatchException for an unsupported argument type
		 */
		virtual void send(const std::string &address, const OscArgs &args) = 0;

		/**
		 * @brief Install the handler that receives every inbound message
		 *
		 * Called from the transport's receive thread.
		 */
		virtual void setInboundHandler(InboundHandler handler) = 0;

		/**
		 * @brief Describe the remote endpoint (e.g., "192.168.1.17:10024")
		 */
		virtual std::string remoteDescription() const = 0;
	};
}
