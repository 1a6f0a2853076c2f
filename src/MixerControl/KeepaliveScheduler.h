#pragma once

#include "OscTransport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace MixerControl
{
	/**
	 * @brief Keeps the mixer's push-update subscription alive
	 *
	 * Both families drop a client's subscription roughly ten seconds after its
	 * last /xremote, so the scheduler re-sends it on a fixed interval from its
	 * own thread until stopped.
	 */
	class KeepaliveScheduler
	{
	public:
		static constexpr std::chrono::milliseconds kDefaultInterval{9000};

		KeepaliveScheduler(OscTransport &transport, std::string address,
						   std::chrono::milliseconds interval = kDefaultInterval);

		/**
		 * @brief Stop the thread (if running)
		 */
		~KeepaliveScheduler();

		KeepaliveScheduler(const KeepaliveScheduler &) = delete;
		KeepaliveScheduler &operator=(const KeepaliveScheduler &) = delete;

		/**
		 * @brief Send the keepalive now and then once per interval
		 *
		 * @return true if the thread was started, false if it was already running
		 */
		bool start();

		/**
		 * @brief Stop the thread and wait for it to exit
		 */
		void stop();

		bool isRunning() const { return m_running.load(); }

		/**
		 * @brief Number of keepalives handed to the transport successfully
		 */
		uint64_t sentCount() const { return m_sentCount.load(); }

		/**
		 * @brief Number of keepalive sends that failed
		 */
		uint64_t failedCount() const { return m_failedCount.load(); }

	private:
		void run();

		void sendOnce();

		OscTransport &m_transport;
		std::string m_address;
		std::chrono::milliseconds m_interval;

		std::thread m_thread;
		std::mutex m_mutex;
		std::condition_variable m_wakeup;
		bool m_stopRequested = false;
		std::atomic<bool> m_running{false};

		std::atomic<uint64_t> m_sentCount{0};
		std::atomic<uint64_t> m_failedCount{0};
	};
}
