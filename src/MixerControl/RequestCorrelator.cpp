#include "RequestCorrelator.h"
#include "MixerExceptions.h"

namespace MixerControl
{
	RequestCorrelator::RequestCorrelator(OscTransport &transport)
		: m_transport(transport)
	{
	}

	std::any RequestCorrelator::query(const std::string &address, std::chrono::milliseconds timeout,
									  const OscArgs &args)
	{
		OscArgs reply = awaitReply(address, timeout, args);
		return reply.empty() ? std::any() : reply.front();
	}

	OscArgs RequestCorrelator::queryArguments(const std::string &address, std::chrono::milliseconds timeout,
											  const OscArgs &args)
	{
		return awaitReply(address, timeout, args);
	}

	OscArgs RequestCorrelator::awaitReply(const std::string &address, std::chrono::milliseconds timeout,
										  const OscArgs &args)
	{
		const auto deadline = std::chrono::steady_clock::now() + timeout;

		std::unique_lock<std::mutex> lock(m_mutex);

		std::shared_ptr<PendingRequest> request;
		auto it = m_pending.find(address);
		bool joined = it != m_pending.end();
		if (joined)
		{
			request = it->second;
			m_counters.queriesJoined++;
		}
		else
		{
			request = std::make_shared<PendingRequest>();
			m_pending.emplace(address, request);
			m_counters.queriesSent++;
		}
		request->waiters++;

		if (!joined)
		{
			// The reply may arrive before send() returns; the waiter is already in place
			lock.unlock();
			try
			{
				m_transport.send(address, args);
			}
			catch (const MixerException &e)
			{
				lock.lock();
				request->sendError = e.what();
				request->waiters--;
				forget(address, request);
				request->resolvedSignal.notify_all();
				throw;
			}
			lock.lock();
		}

		bool done = request->resolvedSignal.wait_until(lock, deadline, [&request]
													   { return request->resolved || !request->sendError.empty(); });
		request->waiters--;

		if (!done)
		{
			m_counters.timeouts++;
			if (request->waiters == 0)
			{
				forget(address, request);
			}
			throw QueryTimeoutException(address, timeout);
		}

		if (!request->resolved)
		{
			throw NetworkException("Query to " + address + " was not sent: " + request->sendError);
		}

		return request->reply;
	}

	bool RequestCorrelator::dispatch(const std::string &address, const OscArgs &args)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_counters.received++;

		auto it = findWaiter(address);
		if (it == m_pending.end())
		{
			m_counters.dropped++;
			return false;
		}

		std::shared_ptr<PendingRequest> request = it->second;
		m_pending.erase(it);

		request->reply = args;
		request->resolved = true;
		request->resolvedSignal.notify_all();

		m_counters.matched++;
		return true;
	}

	RequestCorrelator::PendingMap::iterator RequestCorrelator::findWaiter(const std::string &address)
	{
		auto exact = m_pending.find(address);
		if (exact != m_pending.end())
		{
			return exact;
		}

		// Some replies carry the queried node's sub-path, e.g. /-snap/01/name/01 for /-snap/01/name
		for (auto it = m_pending.begin(); it != m_pending.end(); ++it)
		{
			std::string prefix = it->first;
			if (!prefix.empty() && prefix.back() == '/')
				prefix.pop_back();
			prefix += '/';

			if (address.compare(0, prefix.size(), prefix) == 0)
			{
				return it;
			}
		}

		return m_pending.end();
	}

	void RequestCorrelator::forget(const std::string &address, const std::shared_ptr<PendingRequest> &request)
	{
		auto it = m_pending.find(address);
		if (it != m_pending.end() && it->second == request)
		{
			m_pending.erase(it);
		}
	}

	size_t RequestCorrelator::pendingCount() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_pending.size();
	}

	RequestCorrelator::Counters RequestCorrelator::counters() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_counters;
	}
}
