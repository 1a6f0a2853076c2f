#pragma once

#include "MixerControl/MixerExceptions.h"
#include "MixerControl/OscTransport.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace MixerControl
{
	/**
	 * @brief In-memory mixer for unit tests
	 *
	 * Records every message the client sends and answers argument-less
	 * messages (queries) on addresses that have a scripted reply. Replies are
	 * delivered on the sending thread, or from a helper thread when a delay is
	 * scripted.
	 */
	class FakeMixer : public OscTransport
	{
	public:
		struct Message
		{
			std::string address;
			OscArgs args;
		};

		FakeMixer() = default;

		~FakeMixer() override
		{
			std::vector<std::thread> pending;
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				pending.swap(m_replyThreads);
			}
			for (auto &t : pending)
			{
				if (t.joinable())
					t.join();
			}
		}

		/**
		 * @brief Mixer that identifies as X-Air (answers /xinfo only)
		 */
		static std::unique_ptr<FakeMixer> xair()
		{
			auto mixer = std::make_unique<FakeMixer>();
			mixer->script("/xinfo", {std::string("192.168.1.17"), std::string("XR18-0A-1B-2C"),
									 std::string("XR18"), std::string("1.17")});
			return mixer;
		}

		/**
		 * @brief Mixer that identifies as X32 (answers /info only)
		 */
		static std::unique_ptr<FakeMixer> x32()
		{
			auto mixer = std::make_unique<FakeMixer>();
			mixer->script("/info", {std::string("V2.07"), std::string("osc-server"),
									std::string("X32"), std::string("4.06")});
			return mixer;
		}

		/**
		 * @brief Answer queries of an address
		 *
		 * @param replyAddress Address the reply carries; empty to echo the query address
		 */
		void script(const std::string &address, OscArgs reply,
					std::chrono::milliseconds delay = std::chrono::milliseconds(0),
					const std::string &replyAddress = std::string())
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_script[address] = Script{std::move(reply), delay, replyAddress.empty() ? address : replyAddress};
		}

		/**
		 * @brief Stop answering an address
		 */
		void silence(const std::string &address)
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_script.erase(address);
		}

		/**
		 * @brief Make every send fail with a NetworkException
		 */
		void failSends(bool fail)
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_failSends = fail;
		}

		/**
		 * @brief Deliver an unsolicited message to the client
		 */
		void inject(const std::string &address, const OscArgs &args)
		{
			deliver(address, args);
		}

		void send(const std::string &address, const OscArgs &args) override
		{
			Script script;
			bool answer = false;
			{
				std::lock_guard<std::mutex> lock(m_mutex);
				if (m_failSends)
				{
					throw NetworkException("Failed to send OSC message to " + address + ": fake network down");
				}
				m_sent.push_back({address, args});

				auto it = m_script.find(address);
				if (it != m_script.end() && args.empty())
				{
					script = it->second;
					answer = true;
				}
			}

			if (!answer)
				return;

			if (script.delay.count() == 0)
			{
				deliver(script.replyAddress, script.reply);
				return;
			}

			std::lock_guard<std::mutex> lock(m_mutex);
			m_replyThreads.emplace_back([this, script]
										{
				std::this_thread::sleep_for(script.delay);
				deliver(script.replyAddress, script.reply); });
		}

		void setInboundHandler(InboundHandler handler) override
		{
			std::lock_guard<std::mutex> lock(m_handlerMutex);
			m_handler = std::move(handler);
		}

		std::string remoteDescription() const override { return "fake-mixer:10024"; }

		/**
		 * @brief Messages sent so far, keepalives excluded
		 */
		std::vector<Message> sent() const
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			std::vector<Message> result;
			for (const auto &m : m_sent)
			{
				if (m.address != "/xremote")
					result.push_back(m);
			}
			return result;
		}

		/**
		 * @brief Number of messages sent to an address
		 */
		size_t countSent(const std::string &address) const
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			size_t count = 0;
			for (const auto &m : m_sent)
			{
				if (m.address == address)
					count++;
			}
			return count;
		}

		void clearSent()
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_sent.clear();
		}

	private:
		struct Script
		{
			OscArgs reply;
			std::chrono::milliseconds delay;
			std::string replyAddress;
		};

		void deliver(const std::string &address, const OscArgs &args)
		{
			std::lock_guard<std::mutex> lock(m_handlerMutex);
			if (m_handler)
				m_handler(address, args);
		}

		mutable std::mutex m_mutex;
		std::map<std::string, Script> m_script;
		std::vector<Message> m_sent;
		std::vector<std::thread> m_replyThreads;
		bool m_failSends = false;

		std::mutex m_handlerMutex;
		InboundHandler m_handler;
	};

	/**
	 * @brief Poll until a condition holds or the timeout passes
	 */
	inline bool waitUntil(const std::function<bool()> &condition,
						  std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
	{
		auto deadline = std::chrono::steady_clock::now() + timeout;
		while (std::chrono::steady_clock::now() < deadline)
		{
			if (condition())
				return true;
			std::this_thread::sleep_for(std::chrono::milliseconds(5));
		}
		return condition();
	}
}
