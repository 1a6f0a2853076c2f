#pragma once

#include <any>
#include <string>

namespace MixerControl
{
	/**
	 * @brief Conversion rule between a human unit and the device's wire value
	 */
	enum class Encoding
	{
		Level,				 // 0.0 = -inf dB, 0.75 = 0 dB, 1.0 = +10 dB; passed through
		Mute,				 // muted flag, sent inverted on the "on" switch
		Switch,				 // on/off flag sent as 1/0
		Pan,				 // -1.0 (left) .. 1.0 (right)
		EqGain,				 // -15 .. +15 dB
		Frequency,			 // 20 .. 20000 Hz, logarithmic
		GateThreshold,		 // -80 .. 0 dB
		CompressorThreshold, // -60 .. 0 dB
		CompressorRatio,	 // 1 .. 20
		LowCut,				 // 20 .. 400 Hz, logarithmic
		LowCutNudged,		 // 20 .. 400 Hz, logarithmic, quantization compensated
		FxSendDb,			 // send level in dB, calibrated against the editor display
		Raw,				 // already normalized 0 .. 1
		Integer,			 // enumerated or integral value
		Text				 // string value
	};

	namespace ValueCodec
	{
		// Documented device ranges
		constexpr float kEqGainMinDb = -15.0f;
		constexpr float kEqGainMaxDb = 15.0f;
		constexpr float kFrequencyMinHz = 20.0f;
		constexpr float kFrequencyMaxHz = 20000.0f;
		constexpr float kGateThresholdMinDb = -80.0f;
		constexpr float kCompThresholdMinDb = -60.0f;
		constexpr float kCompRatioMin = 1.0f;
		constexpr float kCompRatioMax = 20.0f;
		constexpr float kLowCutMinHz = 20.0f;
		constexpr float kLowCutMaxHz = 400.0f;

		// The mixer quantizes the low cut coarsely; below this frequency a +1 Hz nudge
		// lands the control on the requested step. Measured on hardware.
		constexpr float kLowCutNudgeBelowHz = 250.0f;
		constexpr float kLowCutNudgeHz = 1.0f;

		// FX send calibration read off the editor display: dB ~= 66*log10(v) + 8
		constexpr float kFxSendDbScale = 66.0f;
		constexpr float kFxSendDbOffset = 8.0f;
		constexpr float kFxSendSilenceDb = -100.0f;

		/**
		 * @brief Clamp to [lo, hi]
		 *
		 * @throws InvalidParameterException for NaN or infinity
		 */
		float clamp(float value, float lo, float hi);

		/**
		 * @brief Round a numeric value to the nearest int, saturating at the int range
		 *
		 * @throws InvalidParameterException for NaN
		 * @throws TypeMismatchException for a non-numeric value
		 */
		int roundToInt(const std::any &value, const std::string &context);

		float encodeLevel(float level);
		float decodeLevel(float wire);

		int encodeMute(bool muted);
		bool decodeMute(float wire);

		int encodeSwitch(bool on);
		bool decodeSwitch(float wire);

		float encodePan(float pan);
		float decodePan(float wire);

		float encodeEqGain(float gainDb);
		float decodeEqGain(float wire);

		float encodeFrequency(float hz);
		float decodeFrequency(float wire);

		float encodeGateThreshold(float thresholdDb);
		float decodeGateThreshold(float wire);

		float encodeCompressorThreshold(float thresholdDb);
		float decodeCompressorThreshold(float wire);

		float encodeCompressorRatio(float ratio);
		float decodeCompressorRatio(float wire);

		float encodeLowCut(float hz, bool nudge);
		float decodeLowCut(float wire);

		float encodeFxSendDb(float db);
		float decodeFxSendDb(float wire);

		/**
		 * @brief Encode a human value for the wire
		 *
		 * @param encoding Rule to apply
		 * @param value float/double/int for numeric rules, bool for Mute/Switch, string for Text
		 * @return std::any float, int or std::string ready to be sent
		 * @throws TypeMismatchException if the value type does not fit the rule
		 */
		std::any encode(Encoding encoding, const std::any &value);

		/**
		 * @brief Decode a wire value back to its human unit
		 *
		 * @return std::any float for numeric rules, bool for Mute/Switch, int for Integer,
		 *         std::string for Text
		 * @throws TypeMismatchException if the reply type does not fit the rule
		 */
		std::any decode(Encoding encoding, const std::any &wire);

		/**
		 * @brief Value returned by queries the active family cannot answer
		 */
		std::any placeholder(Encoding encoding);
	}
}
