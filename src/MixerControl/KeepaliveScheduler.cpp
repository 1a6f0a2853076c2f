#include "KeepaliveScheduler.h"
#include "MixerExceptions.h"

#include <iostream>
#include <utility>

namespace MixerControl
{
	KeepaliveScheduler::KeepaliveScheduler(OscTransport &transport, std::string address,
										   std::chrono::milliseconds interval)
		: m_transport(transport), m_address(std::move(address)), m_interval(interval)
	{
	}

	KeepaliveScheduler::~KeepaliveScheduler()
	{
		stop();
	}

	bool KeepaliveScheduler::start()
	{
		if (m_running)
		{
			return false;
		}

		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_stopRequested = false;
		}

		m_running = true;
		m_thread = std::thread(&KeepaliveScheduler::run, this);

		if (Log::verbose())
		{
			std::cout << "KeepaliveScheduler: Sending " << m_address << " every "
					  << m_interval.count() << " ms" << std::endl;
		}
		return true;
	}

	void KeepaliveScheduler::stop()
	{
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_stopRequested = true;
		}
		m_wakeup.notify_all();

		if (m_thread.joinable())
		{
			m_thread.join();
		}
		m_running = false;
	}

	void KeepaliveScheduler::run()
	{
		std::unique_lock<std::mutex> lock(m_mutex);
		while (!m_stopRequested)
		{
			lock.unlock();
			sendOnce();
			lock.lock();

			m_wakeup.wait_for(lock, m_interval, [this]
							  { return m_stopRequested; });
		}
	}

	void KeepaliveScheduler::sendOnce()
	{
		try
		{
			m_transport.send(m_address, {});
			m_sentCount++;
		}
		catch (const MixerException &e)
		{
			// A lost keepalive is recovered by the next one
			m_failedCount++;
			std::cerr << "KeepaliveScheduler: Failed to send " << m_address << ": " << e.what() << std::endl;
		}
	}
}
