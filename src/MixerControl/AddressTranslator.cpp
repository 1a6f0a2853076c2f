#include "AddressTranslator.h"
#include "MixerExceptions.h"

#include <algorithm>
#include <iostream>

namespace MixerControl
{
	namespace
	{
		// Controls that share an Encoding but are not part of the same family table
		Encoding fallbackEncoding(Control control)
		{
			switch (control)
			{
			case Control::ChannelMute:
			case Control::BusMute:
			case Control::MainMute:
			case Control::AuxMute:
			case Control::MatrixMute:
				return Encoding::Mute;
			case Control::LowCutOn:
			case Control::EqOn:
			case Control::GateOn:
			case Control::CompressorOn:
			case Control::SendPrePost:
			case Control::FxOn:
				return Encoding::Switch;
			case Control::ChannelName:
			case Control::BusName:
			case Control::SceneName:
			case Control::SceneActiveName:
			case Control::Info:
				return Encoding::Text;
			case Control::ChannelColor:
			case Control::ChannelSource:
			case Control::EqType:
			case Control::SceneActiveIndex:
				return Encoding::Integer;
			case Control::FxSendDb:
				return Encoding::FxSendDb;
			default:
				return Encoding::Level;
			}
		}
	}

	AddressTranslator::AddressTranslator(const FamilyProfile &profile)
		: m_profile(profile)
	{
	}

	const ControlSpec &AddressTranslator::require(Control control) const
	{
		const ControlSpec *spec = m_profile.find(control);
		if (!spec)
		{
			throw MixerException("Control not available on " + m_profile.name(),
								 MixerException::ErrorCode::InvalidArgument);
		}
		return *spec;
	}

	std::optional<WireCommand> AddressTranslator::encodeSet(Control control, const IndexMap &indices,
															const std::any &value) const
	{
		const ControlSpec *spec = m_profile.find(control);
		if (!spec)
		{
			return std::nullopt;
		}

		WireCommand command;
		command.address = m_profile.expand(spec->addressTemplate, indices);

		std::any wire = ValueCodec::encode(spec->encoding, value);
		if (spec->encoding == Encoding::Integer && spec->intMax > spec->intMin)
		{
			int raw = std::any_cast<int>(wire);
			int clamped = std::max(spec->intMin, std::min(spec->intMax, raw));
			if (clamped != raw)
			{
				std::cerr << "AddressTranslator: " << command.address << " clamped from " << raw
						  << " to " << clamped << std::endl;
			}
			wire = std::any(clamped);
		}

		command.args.push_back(wire);
		return command;
	}

	std::optional<std::string> AddressTranslator::queryAddress(Control control, const IndexMap &indices) const
	{
		const ControlSpec *spec = m_profile.find(control);
		if (!spec)
		{
			return std::nullopt;
		}
		return m_profile.expand(spec->addressTemplate, indices);
	}

	std::any AddressTranslator::decode(Control control, const std::any &wire) const
	{
		return ValueCodec::decode(require(control).encoding, wire);
	}

	std::any AddressTranslator::placeholder(Control control) const
	{
		return ValueCodec::placeholder(encodingOf(control));
	}

	Encoding AddressTranslator::encodingOf(Control control) const
	{
		const ControlSpec *spec = m_profile.find(control);
		return spec ? spec->encoding : fallbackEncoding(control);
	}
}
