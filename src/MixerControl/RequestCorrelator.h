#pragma once

#include "OscTransport.h"

#include <any>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace MixerControl
{
	/**
	 * @brief Matches outbound queries to their single inbound reply
	 *
	 * OSC over UDP has no request identifiers, so a query is keyed by its wire
	 * address: the first inbound message on that address (or on a sub-path of
	 * it) resolves the pending request, later ones are dropped.
	 *
	 * A query issued while another query to the same address is still in
	 * flight joins it instead of sending a second datagram; both callers
	 * receive the same reply, each under its own timeout.
	 */
	class RequestCorrelator
	{
	public:
		/**
		 * @brief Inbound traffic counters
		 */
		struct Counters
		{
			uint64_t queriesSent = 0;
			uint64_t queriesJoined = 0;
			uint64_t received = 0;
			uint64_t matched = 0;
			uint64_t dropped = 0;
			uint64_t timeouts = 0;
		};

		/**
		 * @brief Construct a correlator sending through the given transport
		 *
		 * The caller routes the transport's inbound messages to dispatch().
		 */
		explicit RequestCorrelator(OscTransport &transport);

		RequestCorrelator(const RequestCorrelator &) = delete;
		RequestCorrelator &operator=(const RequestCorrelator &) = delete;

		/**
		 * @brief Send a query and block until its reply arrives
		 *
		 * The waiter is registered before the datagram is sent.
		 *
		 * @param address OSC address to query
		 * @param timeout How long to wait for the reply
		 * @param args Optional query arguments
		 * @return std::any First argument of the reply (empty if the reply had none)
		 * @throws QueryTimeoutException if no reply arrived within the timeout
		 * @throws NetworkException if the query could not be sent
		 */
		std::any query(const std::string &address, std::chrono::milliseconds timeout,
					   const OscArgs &args = {});

		/**
		 * @brief Like query(), but returns every argument of the reply
		 */
		OscArgs queryArguments(const std::string &address, std::chrono::milliseconds timeout,
							   const OscArgs &args = {});

		/**
		 * @brief Deliver an inbound message to the waiter of its address
		 *
		 * @return true if a pending request was resolved
		 * @return false if nothing was waiting and the message was dropped
		 */
		bool dispatch(const std::string &address, const OscArgs &args);

		/**
		 * @brief Number of addresses with a query in flight
		 */
		size_t pendingCount() const;

		Counters counters() const;

	private:
		struct PendingRequest
		{
			std::condition_variable resolvedSignal;
			bool resolved = false;
			OscArgs reply;
			std::string sendError; // set when the datagram could not be sent
			int waiters = 0;
		};

		using PendingMap = std::map<std::string, std::shared_ptr<PendingRequest>>;

		OscArgs awaitReply(const std::string &address, std::chrono::milliseconds timeout, const OscArgs &args);

		PendingMap::iterator findWaiter(const std::string &address);

		void forget(const std::string &address, const std::shared_ptr<PendingRequest> &request);

		OscTransport &m_transport;

		mutable std::mutex m_mutex; // guards the table, every PendingRequest and the counters
		PendingMap m_pending;
		Counters m_counters;
	};
}
