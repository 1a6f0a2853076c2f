#pragma once

#include "AddressTranslator.h"
#include "FamilyProfile.h"
#include "KeepaliveScheduler.h"
#include "MixerConfig.h"
#include "OscTransport.h"
#include "RequestCorrelator.h"
#include "SceneManager.h"

#include <any>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace MixerControl
{
	/**
	 * @brief Identity of one mixer session
	 */
	struct SessionInfo
	{
		std::string host;
		int port = 0;
		MixerFamily family = MixerFamily::Unknown; // write-once, set by connect()
		bool connected = false;
	};

	/**
	 * @brief Snapshot returned by MixerClient::status()
	 */
	struct MixerStatus
	{
		bool connected = false;
		std::string host;
		int port = 0;
		MixerFamily family = MixerFamily::Unknown;

		// Human index ranges of the detected family, e.g. "1-16"
		std::string channelsRange;
		std::string busesRange;
		std::string effectsRange;
		std::string scenesRange;

		std::vector<std::string> info; // arguments of the identification reply
		std::string error;			   // set when the mixer could not be reached

		uint64_t messagesSent = 0;
		uint64_t keepalivesSent = 0;
		RequestCorrelator::Counters traffic;

		nlohmann::json toJson() const;
	};

	/**
	 * @brief One control session with a Behringer/Midas digital mixer
	 *
	 * Owns the transport, the request correlator, the detected family profile
	 * and the keepalive. Nothing is global; several clients may talk to
	 * different mixers in the same process.
	 *
	 * Every operation takes 1-based human indices. Mutations are fire-and-forget;
	 * queries block for at most the configured query timeout. Controls the
	 * detected family does not have are silently skipped on set and return a
	 * neutral placeholder on get.
	 */
	class MixerClient
	{
	public:
		/**
		 * @brief Open a UDP endpoint towards the configured mixer
		 *
		 * @throws ConnectionException if the endpoint cannot be opened
		 */
		explicit MixerClient(const MixerConfig &config);

		/**
		 * @brief Use an existing transport (in-memory transports in tests)
		 */
		MixerClient(std::unique_ptr<OscTransport> transport, const MixerConfig &config);

		/**
		 * @brief Stop the keepalive and detach from the transport
		 */
		~MixerClient();

		MixerClient(const MixerClient &) = delete;
		MixerClient &operator=(const MixerClient &) = delete;

		/**
		 * @brief Detect the mixer family and start the keepalive
		 *
		 * Detection runs once; calling connect() again on a connected client does nothing.
		 *
		 * @throws DeviceNotDetectedException if neither family answers
		 */
		void connect();

		bool isConnected() const { return m_connected.load(); }

		SessionInfo session() const;

		MixerFamily family() const;

		/**
		 * @brief Profile of the detected family
		 *
		 * @throws NotConnectedException before connect()
		 */
		const FamilyProfile &profile() const;

		// Channel strip
		void setChannelFader(int channel, float level);
		float getChannelFader(int channel);
		void setChannelMute(int channel, bool muted);
		bool getChannelMute(int channel);
		void setChannelPan(int channel, float pan);
		float getChannelPan(int channel);
		void setChannelName(int channel, const std::string &name);
		std::string getChannelName(int channel);
		void setChannelColor(int channel, int color);

		/**
		 * @brief Select the input feeding a channel, clamped to the family's source range
		 */
		void setChannelSource(int channel, int source);
		int getChannelSource(int channel);

		// Low cut (high-pass filter)
		void setLowCutOn(int channel, bool on);
		bool getLowCutOn(int channel);
		void setLowCutFrequency(int channel, float hz);
		float getLowCutFrequency(int channel);

		// Channel EQ
		void setEqGain(int channel, int band, float gainDb);
		float getEqGain(int channel, int band);
		void setEqFrequency(int channel, int band, float hz);
		float getEqFrequency(int channel, int band);
		void setEqQ(int channel, int band, float q);
		void setEqType(int channel, int band, int type);
		void setEqOn(int channel, bool on);

		// Gate
		void setGateThreshold(int channel, float thresholdDb);
		float getGateThreshold(int channel);
		void setGateRange(int channel, float range);
		void setGateAttack(int channel, float attack);
		void setGateHold(int channel, float hold);
		void setGateRelease(int channel, float release);
		void setGateOn(int channel, bool on);

		// Compressor
		void setCompressor(int channel, float thresholdDb, float ratio);
		float getCompressorThreshold(int channel);
		void setCompressorAttack(int channel, float attack);
		void setCompressorRelease(int channel, float release);
		void setCompressorKnee(int channel, float knee);
		void setCompressorGain(int channel, float gain);
		void setCompressorOn(int channel, bool on);

		// Sends
		void setSendLevel(int channel, int bus, float level);
		float getSendLevel(int channel, int bus);
		void setSendPrePost(int channel, int bus, bool pre);

		/**
		 * @brief Set a channel's send into an effect (X-Air only)
		 */
		void setFxSendLevel(int channel, int effect, float level);
		float getFxSendLevel(int channel, int effect);

		/**
		 * @brief Set a channel's effect send in dB as shown by the mixer's editor (X-Air only)
		 */
		void setFxSendDb(int channel, int effect, float db);

		// Mix buses
		void setBusFader(int bus, float level);
		float getBusFader(int bus);
		void setBusMute(int bus, bool muted);
		bool getBusMute(int bus);
		void setBusPan(int bus, float pan);
		void setBusName(int bus, const std::string &name);

		// Main stereo mix
		void setMainFader(float level);
		float getMainFader();
		void setMainMute(bool muted);
		bool getMainMute();
		void setMainPan(float pan);

		// Aux inputs and matrix outputs (X32 only)
		void setAuxFader(int aux, float level);
		float getAuxFader(int aux);
		void setAuxMute(int aux, bool muted);
		void setMatrixFader(int matrix, float level);
		float getMatrixFader(int matrix);
		void setMatrixMute(int matrix, bool muted);

		// Effects rack
		void setEffectOn(int effect, bool on);
		void setEffectMix(int effect, float mix);
		void setEffectParam(int effect, int param, float value);

		// Scenes
		void recallScene(int scene);
		void saveScene(int scene, const std::string &name = std::string());
		std::string getSceneName(int scene);
		int getCurrentScene();

		/**
		 * @brief Probe the mixer and report the session state
		 *
		 * Never throws: an unreachable mixer is reported with connected=false
		 * and the error text.
		 */
		MixerStatus status();

		/**
		 * @brief Send an arbitrary OSC message
		 *
		 * @throws NotConnectedException before connect()
		 */
		void sendCustom(const std::string &address, const OscArgs &args = {});

		/**
		 * @brief Query an arbitrary address and return the raw first reply argument
		 *
		 * @throws QueryTimeoutException if the mixer does not answer
		 */
		std::any queryCustom(const std::string &address, const OscArgs &args = {});

		RequestCorrelator::Counters counters() const { return m_correlator.counters(); }

		uint64_t messagesSent() const { return m_messagesSent.load(); }

		/** @brief Keepalives sent since connect, 0 before the first connect */
		uint64_t keepalivesSent() const { return m_keepalive ? m_keepalive->sentCount() : 0; }

	private:
		/**
		 * @throws NotConnectedException before connect()
		 */
		void requireConnected() const;

		const AddressTranslator &translator() const;

		/**
		 * @brief Encode and send a mutation; unsupported controls are skipped
		 */
		void set(Control control, const IndexMap &indices, const std::any &value);

		/**
		 * @brief Query and decode a control; unsupported controls yield the placeholder
		 */
		std::any get(Control control, const IndexMap &indices);

		float getFloat(Control control, const IndexMap &indices);
		bool getBool(Control control, const IndexMap &indices);
		int getInt(Control control, const IndexMap &indices);
		std::string getString(Control control, const IndexMap &indices);

		void sendMessage(const std::string &address, const OscArgs &args);

		void onInbound(const std::string &address, const OscArgs &args);

		MixerConfig m_config;
		std::unique_ptr<OscTransport> m_transport;
		RequestCorrelator m_correlator;

		std::mutex m_connectMutex;
		std::atomic<bool> m_connected{false};
		const FamilyProfile *m_profile = nullptr;
		std::unique_ptr<AddressTranslator> m_translator;
		std::unique_ptr<SceneManager> m_scenes;
		std::unique_ptr<KeepaliveScheduler> m_keepalive;

		std::atomic<uint64_t> m_messagesSent{0};
	};
}
