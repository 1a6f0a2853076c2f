#include "ValueCodec.h"
#include "MixerExceptions.h"
#include "MixerTypes.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace MixerControl
{
	namespace ValueCodec
	{
		namespace
		{
			// log10(20000 / 20): the frequency scale spans three decades
			const float kFrequencyDecades = std::log10(kFrequencyMaxHz / kFrequencyMinHz);
			const float kLowCutDecades = std::log10(kLowCutMaxHz / kLowCutMinHz);

			bool humanToBool(const std::any &value)
			{
				if (value.type() == typeid(bool))
					return std::any_cast<bool>(value);
				return argToFloat(value, "switch value") != 0.0f;
			}
		}

		float clamp(float value, float lo, float hi)
		{
			if (!std::isfinite(value))
			{
				throw InvalidParameterException("Value " + std::to_string(value) + " is not a finite number");
			}
			return std::max(lo, std::min(hi, value));
		}

		int roundToInt(const std::any &value, const std::string &context)
		{
			if (value.type() == typeid(int))
				return std::any_cast<int>(value);

			double number = 0.0;
			if (value.type() == typeid(double))
				number = std::any_cast<double>(value);
			else if (value.type() == typeid(int64_t))
				number = static_cast<double>(std::any_cast<int64_t>(value));
			else
				number = argToFloat(value, context);

			if (std::isnan(number))
			{
				throw InvalidParameterException("NaN is not a valid " + context);
			}

			// Saturate before narrowing so large values clamp to the nearest bound
			constexpr double kIntMin = std::numeric_limits<int>::min();
			constexpr double kIntMax = std::numeric_limits<int>::max();
			number = std::max(kIntMin, std::min(kIntMax, number));
			return static_cast<int>(std::llround(number));
		}

		float encodeLevel(float level)
		{
			return clamp(level, 0.0f, 1.0f);
		}

		float decodeLevel(float wire)
		{
			return wire;
		}

		int encodeMute(bool muted)
		{
			return muted ? 0 : 1;
		}

		bool decodeMute(float wire)
		{
			return wire == 0.0f;
		}

		int encodeSwitch(bool on)
		{
			return on ? 1 : 0;
		}

		bool decodeSwitch(float wire)
		{
			return wire == 1.0f;
		}

		float encodePan(float pan)
		{
			return (clamp(pan, -1.0f, 1.0f) + 1.0f) / 2.0f;
		}

		float decodePan(float wire)
		{
			return wire * 2.0f - 1.0f;
		}

		float encodeEqGain(float gainDb)
		{
			return (clamp(gainDb, kEqGainMinDb, kEqGainMaxDb) + 15.0f) / 30.0f;
		}

		float decodeEqGain(float wire)
		{
			return wire * 30.0f - 15.0f;
		}

		float encodeFrequency(float hz)
		{
			float clamped = clamp(hz, kFrequencyMinHz, kFrequencyMaxHz);
			return std::log10(clamped / kFrequencyMinHz) / kFrequencyDecades;
		}

		float decodeFrequency(float wire)
		{
			return kFrequencyMinHz * std::pow(10.0f, wire * kFrequencyDecades);
		}

		float encodeGateThreshold(float thresholdDb)
		{
			return (clamp(thresholdDb, kGateThresholdMinDb, 0.0f) + 80.0f) / 80.0f;
		}

		float decodeGateThreshold(float wire)
		{
			return wire * 80.0f - 80.0f;
		}

		float encodeCompressorThreshold(float thresholdDb)
		{
			return (clamp(thresholdDb, kCompThresholdMinDb, 0.0f) + 60.0f) / 60.0f;
		}

		float decodeCompressorThreshold(float wire)
		{
			return wire * 60.0f - 60.0f;
		}

		float encodeCompressorRatio(float ratio)
		{
			return (clamp(ratio, kCompRatioMin, kCompRatioMax) - 1.0f) / 19.0f;
		}

		float decodeCompressorRatio(float wire)
		{
			return wire * 19.0f + 1.0f;
		}

		float encodeLowCut(float hz, bool nudge)
		{
			float clamped = clamp(hz, kLowCutMinHz, kLowCutMaxHz);
			if (nudge && clamped < kLowCutNudgeBelowHz)
			{
				clamped = std::min(kLowCutMaxHz, clamped + kLowCutNudgeHz);
			}
			return std::log10(clamped / kLowCutMinHz) / kLowCutDecades;
		}

		float decodeLowCut(float wire)
		{
			return kLowCutMinHz * std::pow(10.0f, wire * kLowCutDecades);
		}

		float encodeFxSendDb(float db)
		{
			if (db <= kFxSendSilenceDb)
				return 0.0f;
			return clamp(std::pow(10.0f, (db - kFxSendDbOffset) / kFxSendDbScale), 0.0f, 1.0f);
		}

		float decodeFxSendDb(float wire)
		{
			if (wire <= 0.0f)
				return -std::numeric_limits<float>::infinity();
			return kFxSendDbScale * std::log10(wire) + kFxSendDbOffset;
		}

		std::any encode(Encoding encoding, const std::any &value)
		{
			switch (encoding)
			{
			case Encoding::Level:
				return std::any(encodeLevel(argToFloat(value, "level")));
			case Encoding::Mute:
				return std::any(encodeMute(humanToBool(value)));
			case Encoding::Switch:
				return std::any(encodeSwitch(humanToBool(value)));
			case Encoding::Pan:
				return std::any(encodePan(argToFloat(value, "pan")));
			case Encoding::EqGain:
				return std::any(encodeEqGain(argToFloat(value, "EQ gain")));
			case Encoding::Frequency:
				return std::any(encodeFrequency(argToFloat(value, "frequency")));
			case Encoding::GateThreshold:
				return std::any(encodeGateThreshold(argToFloat(value, "gate threshold")));
			case Encoding::CompressorThreshold:
				return std::any(encodeCompressorThreshold(argToFloat(value, "compressor threshold")));
			case Encoding::CompressorRatio:
				return std::any(encodeCompressorRatio(argToFloat(value, "compressor ratio")));
			case Encoding::LowCut:
				return std::any(encodeLowCut(argToFloat(value, "low cut"), false));
			case Encoding::LowCutNudged:
				return std::any(encodeLowCut(argToFloat(value, "low cut"), true));
			case Encoding::FxSendDb:
				return std::any(encodeFxSendDb(argToFloat(value, "FX send")));
			case Encoding::Raw:
				return std::any(clamp(argToFloat(value, "parameter"), 0.0f, 1.0f));
			case Encoding::Integer:
				return std::any(roundToInt(value, "integer parameter"));
			case Encoding::Text:
				return std::any(argToString(value, "text parameter"));
			}
			throw MixerException("Unhandled encoding", MixerException::ErrorCode::InvalidArgument);
		}

		std::any decode(Encoding encoding, const std::any &wire)
		{
			if (encoding == Encoding::Text)
			{
				return std::any(argToString(wire, "text reply"));
			}

			float value = argToFloat(wire, "reply");
			switch (encoding)
			{
			case Encoding::Level:
				return std::any(decodeLevel(value));
			case Encoding::Mute:
				return std::any(decodeMute(value));
			case Encoding::Switch:
				return std::any(decodeSwitch(value));
			case Encoding::Pan:
				return std::any(decodePan(value));
			case Encoding::EqGain:
				return std::any(decodeEqGain(value));
			case Encoding::Frequency:
				return std::any(decodeFrequency(value));
			case Encoding::GateThreshold:
				return std::any(decodeGateThreshold(value));
			case Encoding::CompressorThreshold:
				return std::any(decodeCompressorThreshold(value));
			case Encoding::CompressorRatio:
				return std::any(decodeCompressorRatio(value));
			case Encoding::LowCut:
			case Encoding::LowCutNudged:
				return std::any(decodeLowCut(value));
			case Encoding::FxSendDb:
				return std::any(decodeFxSendDb(value));
			case Encoding::Raw:
				return std::any(value);
			case Encoding::Integer:
				return std::any(roundToInt(wire, "integer reply"));
			case Encoding::Text:
				break;
			}
			throw MixerException("Unhandled encoding", MixerException::ErrorCode::InvalidArgument);
		}

		std::any placeholder(Encoding encoding)
		{
			switch (encoding)
			{
			case Encoding::Mute:
			case Encoding::Switch:
				return std::any(false);
			case Encoding::Integer:
				return std::any(0);
			case Encoding::Text:
				return std::any(std::string());
			default:
				return std::any(0.0f);
			}
		}
	}
}
