#include "MixerClient.h"
#include "FamilyDetector.h"
#include "LoOscTransport.h"
#include "MixerExceptions.h"

#include <iostream>
#include <utility>

namespace MixerControl
{
	namespace
	{
		std::string rangeText(const FamilyProfile &profile, IndexKind kind)
		{
			int limit = profile.limit(kind);
			return limit > 0 ? "1-" + std::to_string(limit) : std::string("none");
		}
	}

	nlohmann::json MixerStatus::toJson() const
	{
		nlohmann::json j;
		j["connected"] = connected;
		j["host"] = host;
		j["port"] = port;
		j["mixerFamily"] = familyName(family);

		if (family != MixerFamily::Unknown)
		{
			j["channelsRange"] = channelsRange;
			j["busesRange"] = busesRange;
			j["effectsRange"] = effectsRange;
			j["scenesRange"] = scenesRange;
		}

		if (!info.empty())
			j["info"] = info;
		if (!error.empty())
			j["error"] = error;

		j["counters"] = {
			{"messagesSent", messagesSent},
			{"keepalivesSent", keepalivesSent},
			{"queriesSent", traffic.queriesSent},
			{"queriesJoined", traffic.queriesJoined},
			{"received", traffic.received},
			{"matched", traffic.matched},
			{"dropped", traffic.dropped},
			{"timeouts", traffic.timeouts}};
		return j;
	}

	MixerClient::MixerClient(const MixerConfig &config)
		: MixerClient(std::make_unique<LoOscTransport>(config.host, config.port), config)
	{
	}

	MixerClient::MixerClient(std::unique_ptr<OscTransport> transport, const MixerConfig &config)
		: m_config(config), m_transport(std::move(transport)), m_correlator(*m_transport)
	{
		m_transport->setInboundHandler([this](const std::string &address, const OscArgs &args)
									   { onInbound(address, args); });
	}

	MixerClient::~MixerClient()
	{
		if (m_keepalive)
		{
			m_keepalive->stop();
		}
		// Waits for any inbound dispatch still running against this client
		m_transport->setInboundHandler(nullptr);
	}

	void MixerClient::connect()
	{
		std::lock_guard<std::mutex> lock(m_connectMutex);
		if (m_connected)
		{
			return;
		}

		if (Log::verbose())
		{
			std::cout << "MixerClient: Detecting mixer at " << m_transport->remoteDescription() << std::endl;
		}

		FamilyDetector detector(m_correlator, m_config.detectTimeout);
		const FamilyProfile &detected = detector.detect();

		m_profile = &detected;
		m_translator = std::make_unique<AddressTranslator>(detected);
		m_scenes = std::make_unique<SceneManager>(
			*m_translator,
			[this](const std::string &address, const OscArgs &args)
			{ sendMessage(address, args); },
			m_correlator, m_config.queryTimeout);
		m_keepalive = std::make_unique<KeepaliveScheduler>(
			*m_transport, detected.fixedAddress(Control::Keepalive), m_config.keepaliveInterval);

		m_connected = true;
		m_keepalive->start();

		if (Log::verbose())
		{
			std::cout << "MixerClient: Connected to " << detected.name() << " mixer at "
					  << m_transport->remoteDescription() << std::endl;
		}
	}

	SessionInfo MixerClient::session() const
	{
		SessionInfo info;
		info.host = m_config.host;
		info.port = m_config.port;
		info.connected = m_connected;
		info.family = m_connected ? m_profile->family() : MixerFamily::Unknown;
		return info;
	}

	MixerFamily MixerClient::family() const
	{
		return m_connected ? m_profile->family() : MixerFamily::Unknown;
	}

	const FamilyProfile &MixerClient::profile() const
	{
		return translator().profile();
	}

	void MixerClient::requireConnected() const
	{
		if (!m_connected)
		{
			throw NotConnectedException("Mixer at " + m_transport->remoteDescription() + " is not connected");
		}
	}

	const AddressTranslator &MixerClient::translator() const
	{
		requireConnected();
		return *m_translator;
	}

	void MixerClient::set(Control control, const IndexMap &indices, const std::any &value)
	{
		auto command = translator().encodeSet(control, indices, value);
		if (!command)
		{
			if (Log::verbose())
			{
				std::cout << "MixerClient: Control not available on " << profile().name() << ", skipped" << std::endl;
			}
			return;
		}
		sendMessage(command->address, command->args);
	}

	std::any MixerClient::get(Control control, const IndexMap &indices)
	{
		const AddressTranslator &tr = translator();
		auto address = tr.queryAddress(control, indices);
		if (!address)
		{
			return tr.placeholder(control);
		}
		return tr.decode(control, m_correlator.query(*address, m_config.queryTimeout));
	}

	float MixerClient::getFloat(Control control, const IndexMap &indices)
	{
		return std::any_cast<float>(get(control, indices));
	}

	bool MixerClient::getBool(Control control, const IndexMap &indices)
	{
		return std::any_cast<bool>(get(control, indices));
	}

	int MixerClient::getInt(Control control, const IndexMap &indices)
	{
		return std::any_cast<int>(get(control, indices));
	}

	std::string MixerClient::getString(Control control, const IndexMap &indices)
	{
		return std::any_cast<std::string>(get(control, indices));
	}

	void MixerClient::sendMessage(const std::string &address, const OscArgs &args)
	{
		m_transport->send(address, args);
		m_messagesSent++;
	}

	void MixerClient::onInbound(const std::string &address, const OscArgs &args)
	{
		m_correlator.dispatch(address, args);
	}

	// Channel strip

	void MixerClient::setChannelFader(int channel, float level)
	{
		set(Control::ChannelFader, {{IndexKind::Channel, channel}}, level);
	}

	float MixerClient::getChannelFader(int channel)
	{
		return getFloat(Control::ChannelFader, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setChannelMute(int channel, bool muted)
	{
		set(Control::ChannelMute, {{IndexKind::Channel, channel}}, muted);
	}

	bool MixerClient::getChannelMute(int channel)
	{
		return getBool(Control::ChannelMute, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setChannelPan(int channel, float pan)
	{
		set(Control::ChannelPan, {{IndexKind::Channel, channel}}, pan);
	}

	float MixerClient::getChannelPan(int channel)
	{
		return getFloat(Control::ChannelPan, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setChannelName(int channel, const std::string &name)
	{
		set(Control::ChannelName, {{IndexKind::Channel, channel}}, name);
	}

	std::string MixerClient::getChannelName(int channel)
	{
		return getString(Control::ChannelName, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setChannelColor(int channel, int color)
	{
		set(Control::ChannelColor, {{IndexKind::Channel, channel}}, color);
	}

	void MixerClient::setChannelSource(int channel, int source)
	{
		set(Control::ChannelSource, {{IndexKind::Channel, channel}}, source);
	}

	int MixerClient::getChannelSource(int channel)
	{
		return getInt(Control::ChannelSource, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setLowCutOn(int channel, bool on)
	{
		set(Control::LowCutOn, {{IndexKind::Channel, channel}}, on);
	}

	bool MixerClient::getLowCutOn(int channel)
	{
		return getBool(Control::LowCutOn, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setLowCutFrequency(int channel, float hz)
	{
		set(Control::LowCutFrequency, {{IndexKind::Channel, channel}}, hz);
	}

	float MixerClient::getLowCutFrequency(int channel)
	{
		return getFloat(Control::LowCutFrequency, {{IndexKind::Channel, channel}});
	}

	// Channel EQ

	void MixerClient::setEqGain(int channel, int band, float gainDb)
	{
		set(Control::EqGain, {{IndexKind::Channel, channel}, {IndexKind::Band, band}}, gainDb);
	}

	float MixerClient::getEqGain(int channel, int band)
	{
		return getFloat(Control::EqGain, {{IndexKind::Channel, channel}, {IndexKind::Band, band}});
	}

	void MixerClient::setEqFrequency(int channel, int band, float hz)
	{
		set(Control::EqFrequency, {{IndexKind::Channel, channel}, {IndexKind::Band, band}}, hz);
	}

	float MixerClient::getEqFrequency(int channel, int band)
	{
		return getFloat(Control::EqFrequency, {{IndexKind::Channel, channel}, {IndexKind::Band, band}});
	}

	void MixerClient::setEqQ(int channel, int band, float q)
	{
		set(Control::EqQ, {{IndexKind::Channel, channel}, {IndexKind::Band, band}}, q);
	}

	void MixerClient::setEqType(int channel, int band, int type)
	{
		set(Control::EqType, {{IndexKind::Channel, channel}, {IndexKind::Band, band}}, type);
	}

	void MixerClient::setEqOn(int channel, bool on)
	{
		set(Control::EqOn, {{IndexKind::Channel, channel}}, on);
	}

	// Gate

	void MixerClient::setGateThreshold(int channel, float thresholdDb)
	{
		set(Control::GateThreshold, {{IndexKind::Channel, channel}}, thresholdDb);
	}

	float MixerClient::getGateThreshold(int channel)
	{
		return getFloat(Control::GateThreshold, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setGateRange(int channel, float range)
	{
		set(Control::GateRange, {{IndexKind::Channel, channel}}, range);
	}

	void MixerClient::setGateAttack(int channel, float attack)
	{
		set(Control::GateAttack, {{IndexKind::Channel, channel}}, attack);
	}

	void MixerClient::setGateHold(int channel, float hold)
	{
		set(Control::GateHold, {{IndexKind::Channel, channel}}, hold);
	}

	void MixerClient::setGateRelease(int channel, float release)
	{
		set(Control::GateRelease, {{IndexKind::Channel, channel}}, release);
	}

	void MixerClient::setGateOn(int channel, bool on)
	{
		set(Control::GateOn, {{IndexKind::Channel, channel}}, on);
	}

	// Compressor

	void MixerClient::setCompressor(int channel, float thresholdDb, float ratio)
	{
		set(Control::CompressorThreshold, {{IndexKind::Channel, channel}}, thresholdDb);
		set(Control::CompressorRatio, {{IndexKind::Channel, channel}}, ratio);
	}

	float MixerClient::getCompressorThreshold(int channel)
	{
		return getFloat(Control::CompressorThreshold, {{IndexKind::Channel, channel}});
	}

	void MixerClient::setCompressorAttack(int channel, float attack)
	{
		set(Control::CompressorAttack, {{IndexKind::Channel, channel}}, attack);
	}

	void MixerClient::setCompressorRelease(int channel, float release)
	{
		set(Control::CompressorRelease, {{IndexKind::Channel, channel}}, release);
	}

	void MixerClient::setCompressorKnee(int channel, float knee)
	{
		set(Control::CompressorKnee, {{IndexKind::Channel, channel}}, knee);
	}

	void MixerClient::setCompressorGain(int channel, float gain)
	{
		set(Control::CompressorGain, {{IndexKind::Channel, channel}}, gain);
	}

	void MixerClient::setCompressorOn(int channel, bool on)
	{
		set(Control::CompressorOn, {{IndexKind::Channel, channel}}, on);
	}

	// Sends

	void MixerClient::setSendLevel(int channel, int bus, float level)
	{
		set(Control::SendLevel, {{IndexKind::Channel, channel}, {IndexKind::SendBus, bus}}, level);
	}

	float MixerClient::getSendLevel(int channel, int bus)
	{
		return getFloat(Control::SendLevel, {{IndexKind::Channel, channel}, {IndexKind::SendBus, bus}});
	}

	void MixerClient::setSendPrePost(int channel, int bus, bool pre)
	{
		set(Control::SendPrePost, {{IndexKind::Channel, channel}, {IndexKind::SendBus, bus}}, pre);
	}

	void MixerClient::setFxSendLevel(int channel, int effect, float level)
	{
		set(Control::FxSendLevel, {{IndexKind::Channel, channel}, {IndexKind::FxSend, effect}}, level);
	}

	float MixerClient::getFxSendLevel(int channel, int effect)
	{
		return getFloat(Control::FxSendLevel, {{IndexKind::Channel, channel}, {IndexKind::FxSend, effect}});
	}

	void MixerClient::setFxSendDb(int channel, int effect, float db)
	{
		set(Control::FxSendDb, {{IndexKind::Channel, channel}, {IndexKind::FxSend, effect}}, db);
	}

	// Mix buses

	void MixerClient::setBusFader(int bus, float level)
	{
		set(Control::BusFader, {{IndexKind::Bus, bus}}, level);
	}

	float MixerClient::getBusFader(int bus)
	{
		return getFloat(Control::BusFader, {{IndexKind::Bus, bus}});
	}

	void MixerClient::setBusMute(int bus, bool muted)
	{
		set(Control::BusMute, {{IndexKind::Bus, bus}}, muted);
	}

	bool MixerClient::getBusMute(int bus)
	{
		return getBool(Control::BusMute, {{IndexKind::Bus, bus}});
	}

	void MixerClient::setBusPan(int bus, float pan)
	{
		set(Control::BusPan, {{IndexKind::Bus, bus}}, pan);
	}

	void MixerClient::setBusName(int bus, const std::string &name)
	{
		set(Control::BusName, {{IndexKind::Bus, bus}}, name);
	}

	// Main stereo mix

	void MixerClient::setMainFader(float level)
	{
		set(Control::MainFader, {}, level);
	}

	float MixerClient::getMainFader()
	{
		return getFloat(Control::MainFader, {});
	}

	void MixerClient::setMainMute(bool muted)
	{
		set(Control::MainMute, {}, muted);
	}

	bool MixerClient::getMainMute()
	{
		return getBool(Control::MainMute, {});
	}

	void MixerClient::setMainPan(float pan)
	{
		set(Control::MainPan, {}, pan);
	}

	// Aux inputs and matrix outputs

	void MixerClient::setAuxFader(int aux, float level)
	{
		set(Control::AuxFader, {{IndexKind::Aux, aux}}, level);
	}

	float MixerClient::getAuxFader(int aux)
	{
		return getFloat(Control::AuxFader, {{IndexKind::Aux, aux}});
	}

	void MixerClient::setAuxMute(int aux, bool muted)
	{
		set(Control::AuxMute, {{IndexKind::Aux, aux}}, muted);
	}

	void MixerClient::setMatrixFader(int matrix, float level)
	{
		set(Control::MatrixFader, {{IndexKind::Matrix, matrix}}, level);
	}

	float MixerClient::getMatrixFader(int matrix)
	{
		return getFloat(Control::MatrixFader, {{IndexKind::Matrix, matrix}});
	}

	void MixerClient::setMatrixMute(int matrix, bool muted)
	{
		set(Control::MatrixMute, {{IndexKind::Matrix, matrix}}, muted);
	}

	// Effects rack

	void MixerClient::setEffectOn(int effect, bool on)
	{
		set(Control::FxOn, {{IndexKind::Effect, effect}}, on);
	}

	void MixerClient::setEffectMix(int effect, float mix)
	{
		set(Control::FxMix, {{IndexKind::Effect, effect}}, mix);
	}

	void MixerClient::setEffectParam(int effect, int param, float value)
	{
		set(Control::FxParam, {{IndexKind::Effect, effect}, {IndexKind::FxParam, param}}, value);
	}

	// Scenes

	void MixerClient::recallScene(int scene)
	{
		requireConnected();
		m_scenes->recall(scene);
	}

	void MixerClient::saveScene(int scene, const std::string &name)
	{
		requireConnected();
		m_scenes->save(scene, name);
	}

	std::string MixerClient::getSceneName(int scene)
	{
		requireConnected();
		return m_scenes->name(scene);
	}

	int MixerClient::getCurrentScene()
	{
		requireConnected();
		return m_scenes->current();
	}

	// Status and custom messages

	MixerStatus MixerClient::status()
	{
		MixerStatus st;
		st.host = m_config.host;
		st.port = m_config.port;
		st.family = family();
		st.messagesSent = m_messagesSent;

		if (!m_connected)
		{
			st.error = "Not connected";
		}
		else
		{
			const FamilyProfile &p = *m_profile;
			st.channelsRange = rangeText(p, IndexKind::Channel);
			st.busesRange = rangeText(p, IndexKind::Bus);
			st.effectsRange = rangeText(p, IndexKind::Effect);
			st.scenesRange = rangeText(p, IndexKind::Scene);

			try
			{
				OscArgs reply = m_correlator.queryArguments(p.fixedAddress(Control::Info), m_config.queryTimeout);
				for (const auto &arg : reply)
				{
					st.info.push_back(arg.type() == typeid(std::string) ? std::any_cast<std::string>(arg)
																		 : formatArg(arg));
				}
				st.connected = true;
			}
			catch (const MixerException &e)
			{
				st.error = e.what();
			}
		}

		st.keepalivesSent = keepalivesSent();
		st.traffic = m_correlator.counters();
		return st;
	}

	void MixerClient::sendCustom(const std::string &address, const OscArgs &args)
	{
		requireConnected();
		sendMessage(address, args);
	}

	std::any MixerClient::queryCustom(const std::string &address, const OscArgs &args)
	{
		requireConnected();
		return m_correlator.query(address, m_config.queryTimeout, args);
	}
}
