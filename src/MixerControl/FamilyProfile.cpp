#include "FamilyProfile.h"
#include "MixerExceptions.h"

#include <iomanip>
#include <sstream>
#include <utility>

namespace MixerControl
{
	namespace
	{
		const std::map<std::string, IndexKind> &placeholderKinds()
		{
			static const std::map<std::string, IndexKind> kinds = {
				{"ch", IndexKind::Channel},
				{"band", IndexKind::Band},
				{"bus", IndexKind::Bus},
				{"send", IndexKind::SendBus},
				{"fxsend", IndexKind::FxSend},
				{"fx", IndexKind::Effect},
				{"par", IndexKind::FxParam},
				{"scene", IndexKind::Scene},
				{"aux", IndexKind::Aux},
				{"mtx", IndexKind::Matrix}};
			return kinds;
		}

		// Controls whose address and encoding are identical on every family
		std::map<Control, ControlSpec> commonControls()
		{
			return {
				{Control::Keepalive, {"/xremote", Encoding::Raw}},

				{Control::ChannelFader, {"/ch/{ch}/mix/fader", Encoding::Level}},
				{Control::ChannelMute, {"/ch/{ch}/mix/on", Encoding::Mute}},
				{Control::ChannelPan, {"/ch/{ch}/mix/pan", Encoding::Pan}},
				{Control::ChannelName, {"/ch/{ch}/config/name", Encoding::Text}},
				{Control::ChannelColor, {"/ch/{ch}/config/color", Encoding::Integer, 0, 15}},
				{Control::LowCutOn, {"/ch/{ch}/preamp/hpon", Encoding::Switch}},

				{Control::EqOn, {"/ch/{ch}/eq/on", Encoding::Switch}},
				{Control::EqGain, {"/ch/{ch}/eq/{band}/g", Encoding::EqGain}},
				{Control::EqFrequency, {"/ch/{ch}/eq/{band}/f", Encoding::Frequency}},
				{Control::EqQ, {"/ch/{ch}/eq/{band}/q", Encoding::Raw}},
				{Control::EqType, {"/ch/{ch}/eq/{band}/type", Encoding::Integer, 0, 5}},

				{Control::GateOn, {"/ch/{ch}/gate/on", Encoding::Switch}},
				{Control::GateThreshold, {"/ch/{ch}/gate/thr", Encoding::GateThreshold}},
				{Control::GateRange, {"/ch/{ch}/gate/range", Encoding::Raw}},
				{Control::GateAttack, {"/ch/{ch}/gate/attack", Encoding::Raw}},
				{Control::GateHold, {"/ch/{ch}/gate/hold", Encoding::Raw}},
				{Control::GateRelease, {"/ch/{ch}/gate/release", Encoding::Raw}},

				{Control::CompressorOn, {"/ch/{ch}/dyn/on", Encoding::Switch}},
				{Control::CompressorThreshold, {"/ch/{ch}/dyn/thr", Encoding::CompressorThreshold}},
				{Control::CompressorRatio, {"/ch/{ch}/dyn/ratio", Encoding::CompressorRatio}},
				{Control::CompressorAttack, {"/ch/{ch}/dyn/attack", Encoding::Raw}},
				{Control::CompressorRelease, {"/ch/{ch}/dyn/release", Encoding::Raw}},
				{Control::CompressorKnee, {"/ch/{ch}/dyn/knee", Encoding::Raw}},
				{Control::CompressorGain, {"/ch/{ch}/dyn/gain", Encoding::Raw}},

				{Control::SendLevel, {"/ch/{ch}/mix/{send}/level", Encoding::Level}},
				{Control::SendPrePost, {"/ch/{ch}/mix/{send}/preamp", Encoding::Switch}},

				{Control::BusFader, {"/bus/{bus}/mix/fader", Encoding::Level}},
				{Control::BusMute, {"/bus/{bus}/mix/on", Encoding::Mute}},
				{Control::BusPan, {"/bus/{bus}/mix/pan", Encoding::Pan}},
				{Control::BusName, {"/bus/{bus}/config/name", Encoding::Text}},

				{Control::FxParam, {"/fx/{fx}/par/{par}", Encoding::Raw}},

				{Control::SceneLoad, {"/-snap/load", Encoding::Integer}}};
		}

		std::map<Control, ControlSpec> merge(std::map<Control, ControlSpec> specific)
		{
			std::map<Control, ControlSpec> controls = commonControls();
			for (auto &entry : specific)
			{
				controls[entry.first] = std::move(entry.second);
			}
			return controls;
		}
	}

	FamilyProfile::FamilyProfile(MixerFamily family, std::string name, SceneNaming sceneNaming,
								 std::map<IndexKind, IndexFormat> formats,
								 std::map<Control, ControlSpec> controls)
		: m_family(family), m_name(std::move(name)), m_sceneNaming(sceneNaming),
		  m_formats(std::move(formats)), m_controls(std::move(controls))
	{
	}

	const FamilyProfile &FamilyProfile::x32()
	{
		static const FamilyProfile profile(
			MixerFamily::X32, "x32", SceneNaming::PerIndex,
			{
				{IndexKind::Channel, {32, 2, 1}},
				{IndexKind::Band, {4, 0, 1}},
				{IndexKind::Bus, {16, 2, 1}},
				{IndexKind::SendBus, {16, 2, 1}},
				{IndexKind::FxSend, {0, 0, 1}},
				{IndexKind::Effect, {8, 0, 1}},
				{IndexKind::FxParam, {64, 2, 1}},
				{IndexKind::Scene, {100, 3, 0}},
				{IndexKind::Aux, {8, 2, 1}},
				{IndexKind::Matrix, {6, 2, 1}},
			},
			merge({
				{Control::Info, {"/info", Encoding::Text}},
				{Control::ChannelSource, {"/ch/{ch}/config/source", Encoding::Integer, 0, 64}},
				{Control::LowCutFrequency, {"/ch/{ch}/preamp/hpf", Encoding::LowCut}},
				{Control::MainFader, {"/main/st/mix/fader", Encoding::Level}},
				{Control::MainMute, {"/main/st/mix/on", Encoding::Mute}},
				{Control::MainPan, {"/main/st/mix/pan", Encoding::Pan}},
				{Control::AuxFader, {"/auxin/{aux}/mix/fader", Encoding::Level}},
				{Control::AuxMute, {"/auxin/{aux}/mix/on", Encoding::Mute}},
				{Control::MatrixFader, {"/mtx/{mtx}/mix/fader", Encoding::Level}},
				{Control::MatrixMute, {"/mtx/{mtx}/mix/on", Encoding::Mute}},
				{Control::FxOn, {"/fx/{fx}/on", Encoding::Switch}},
				{Control::SceneSave, {"/-snap/store", Encoding::Integer}},
				{Control::SceneName, {"/-snap/{scene}/name", Encoding::Text}},
				{Control::SceneActiveIndex, {"/-show/prepos/current", Encoding::Integer}},
			}));
		return profile;
	}

	const FamilyProfile &FamilyProfile::xair()
	{
		static const FamilyProfile profile(
			MixerFamily::XAir, "x-air", SceneNaming::ActiveOnly,
			{
				{IndexKind::Channel, {16, 2, 1}},
				{IndexKind::Band, {4, 0, 1}},
				{IndexKind::Bus, {6, 0, 1}},
				{IndexKind::SendBus, {6, 2, 1}},
				// FX 1-4 are fed from send slots 07-10
				{IndexKind::FxSend, {4, 2, 7}},
				{IndexKind::Effect, {4, 0, 1}},
				{IndexKind::FxParam, {64, 2, 1}},
				{IndexKind::Scene, {64, 0, 1}},
				{IndexKind::Aux, {0, 0, 1}},
				{IndexKind::Matrix, {0, 0, 1}},
			},
			merge({
				{Control::Info, {"/xinfo", Encoding::Text}},
				{Control::ChannelSource, {"/ch/{ch}/config/insrc", Encoding::Integer, 0, 15}},
				{Control::LowCutFrequency, {"/ch/{ch}/preamp/hpf", Encoding::LowCutNudged}},
				{Control::FxSendLevel, {"/ch/{ch}/mix/{fxsend}/level", Encoding::Level}},
				{Control::FxSendDb, {"/ch/{ch}/mix/{fxsend}/level", Encoding::FxSendDb}},
				{Control::MainFader, {"/lr/mix/fader", Encoding::Level}},
				{Control::MainMute, {"/lr/mix/on", Encoding::Mute}},
				{Control::MainPan, {"/lr/mix/pan", Encoding::Pan}},
				{Control::FxOn, {"/fx/{fx}/insert", Encoding::Switch}},
				{Control::FxMix, {"/fx/{fx}/mix", Encoding::Raw}},
				{Control::SceneSave, {"/-snap/save", Encoding::Integer}},
				{Control::SceneActiveName, {"/-snap/name", Encoding::Text}},
				{Control::SceneActiveIndex, {"/-snap/index", Encoding::Integer}},
			}));
		return profile;
	}

	const FamilyProfile &FamilyProfile::forFamily(MixerFamily family)
	{
		switch (family)
		{
		case MixerFamily::X32:
			return x32();
		case MixerFamily::XAir:
			return xair();
		case MixerFamily::Unknown:
			break;
		}
		throw NotConnectedException("Mixer family has not been detected");
	}

	std::vector<const FamilyProfile *> FamilyProfile::detectionOrder()
	{
		return {&xair(), &x32()};
	}

	const ControlSpec *FamilyProfile::find(Control control) const
	{
		auto it = m_controls.find(control);
		if (it == m_controls.end())
			return nullptr;
		return &it->second;
	}

	std::string FamilyProfile::fixedAddress(Control control) const
	{
		const ControlSpec *spec = find(control);
		return spec ? spec->addressTemplate : std::string();
	}

	const IndexFormat &FamilyProfile::format(IndexKind kind) const
	{
		static const IndexFormat none;
		auto it = m_formats.find(kind);
		return it == m_formats.end() ? none : it->second;
	}

	int FamilyProfile::wireIndex(IndexKind kind, int humanIndex) const
	{
		const IndexFormat &fmt = format(kind);
		if (humanIndex < 1 || humanIndex > fmt.limit)
		{
			std::ostringstream msg;
			msg << "Invalid " << indexKindName(kind) << " " << humanIndex << " for " << m_name;
			if (fmt.limit > 0)
				msg << " (valid 1-" << fmt.limit << ")";
			else
				msg << " (not available)";
			throw InvalidIndexException(msg.str());
		}
		return humanIndex - 1 + fmt.base;
	}

	std::string FamilyProfile::formatIndex(IndexKind kind, int humanIndex) const
	{
		int wire = wireIndex(kind, humanIndex);
		std::ostringstream out;
		int width = format(kind).width;
		if (width > 0)
			out << std::setw(width) << std::setfill('0');
		out << wire;
		return out.str();
	}

	std::string FamilyProfile::expand(const std::string &addressTemplate, const IndexMap &indices) const
	{
		std::string address;
		address.reserve(addressTemplate.size() + 8);

		size_t pos = 0;
		while (pos < addressTemplate.size())
		{
			size_t open = addressTemplate.find('{', pos);
			if (open == std::string::npos)
			{
				address.append(addressTemplate, pos, std::string::npos);
				break;
			}
			size_t close = addressTemplate.find('}', open);
			if (close == std::string::npos)
			{
				throw MixerException("Unterminated placeholder in " + addressTemplate,
									 MixerException::ErrorCode::InvalidArgument);
			}

			address.append(addressTemplate, pos, open - pos);

			std::string placeholder = addressTemplate.substr(open + 1, close - open - 1);
			auto kind = placeholderKinds().find(placeholder);
			if (kind == placeholderKinds().end())
			{
				throw MixerException("Unknown placeholder {" + placeholder + "} in " + addressTemplate,
									 MixerException::ErrorCode::InvalidArgument);
			}
			auto index = indices.find(kind->second);
			if (index == indices.end())
			{
				throw MixerException("Missing " + indexKindName(kind->second) + " index for " + addressTemplate,
									 MixerException::ErrorCode::InvalidArgument);
			}

			address += formatIndex(kind->second, index->second);
			pos = close + 1;
		}

		return address;
	}

	std::string indexKindName(IndexKind kind)
	{
		switch (kind)
		{
		case IndexKind::Channel:
			return "channel";
		case IndexKind::Band:
			return "EQ band";
		case IndexKind::Bus:
			return "bus";
		case IndexKind::SendBus:
			return "send bus";
		case IndexKind::FxSend:
			return "FX send";
		case IndexKind::Effect:
			return "effect";
		case IndexKind::FxParam:
			return "effect parameter";
		case IndexKind::Scene:
			return "scene";
		case IndexKind::Aux:
			return "aux input";
		case IndexKind::Matrix:
			return "matrix";
		}
		return "index";
	}
}
