#pragma once

#include "MixerTypes.h"
#include "ValueCodec.h"

#include <map>
#include <string>
#include <vector>

namespace MixerControl
{
	/**
	 * @brief Logical controls exposed by the client, independent of the wire dialect
	 */
	enum class Control
	{
		// Identification and subscription
		Info,
		Keepalive,

		// Channel strip
		ChannelFader,
		ChannelMute,
		ChannelPan,
		ChannelName,
		ChannelColor,
		ChannelSource,
		LowCutOn,
		LowCutFrequency,

		// Channel EQ
		EqOn,
		EqGain,
		EqFrequency,
		EqQ,
		EqType,

		// Channel dynamics
		GateOn,
		GateThreshold,
		GateRange,
		GateAttack,
		GateHold,
		GateRelease,
		CompressorOn,
		CompressorThreshold,
		CompressorRatio,
		CompressorAttack,
		CompressorRelease,
		CompressorKnee,
		CompressorGain,

		// Channel sends
		SendLevel,
		SendPrePost,
		FxSendLevel,
		FxSendDb,

		// Mix buses
		BusFader,
		BusMute,
		BusPan,
		BusName,

		// Main stereo mix
		MainFader,
		MainMute,
		MainPan,

		// Aux inputs and matrix outputs (full-size consoles only)
		AuxFader,
		AuxMute,
		MatrixFader,
		MatrixMute,

		// Effects rack
		FxOn,
		FxMix,
		FxParam,

		// Snapshots
		SceneLoad,
		SceneSave,
		SceneName,		 // name of a scene addressed by index
		SceneActiveName, // name of the currently loaded scene
		SceneActiveIndex
	};

	/**
	 * @brief Kinds of index that can appear in an address template
	 */
	enum class IndexKind
	{
		Channel, // {ch}
		Band,	 // {band}
		Bus,	 // {bus}
		SendBus, // {send}  bus slot of a channel send
		FxSend,	 // {fxsend} send slot feeding an effect
		Effect,	 // {fx}
		FxParam, // {par}
		Scene,	 // {scene}
		Aux,	 // {aux}
		Matrix	 // {mtx}
	};

	/**
	 * @brief Human (1-based) indices for one request
	 */
	using IndexMap = std::map<IndexKind, int>;

	/**
	 * @brief How an index is written on the wire for one family
	 */
	struct IndexFormat
	{
		int limit = 0; // highest valid human index; 0 means the family has none
		int width = 0; // zero-padded width, 0 for no padding
		int base = 1;  // wire value of human index 1
	};

	/**
	 * @brief Address template and encoding of one control on one family
	 */
	struct ControlSpec
	{
		std::string addressTemplate; // e.g. "/ch/{ch}/mix/fader"
		Encoding encoding = Encoding::Raw;
		int intMin = 0; // clamp range for Encoding::Integer
		int intMax = 0;
	};

	/**
	 * @brief How the family exposes snapshot names
	 */
	enum class SceneNaming
	{
		PerIndex,  // every slot has its own name address
		ActiveOnly // only the currently loaded snapshot's name is addressable
	};

	/**
	 * @brief Immutable address/encoding table for one mixer family
	 *
	 * Every family difference (address grammar, index padding and base, limits,
	 * unit encodings) is data held here, so adding a family means adding a table.
	 */
	class FamilyProfile
	{
	public:
		/**
		 * @brief Profile for X32/M32 consoles
		 */
		static const FamilyProfile &x32();

		/**
		 * @brief Profile for X-Air/MR rack mixers
		 */
		static const FamilyProfile &xair();

		/**
		 * @brief Look up the profile of a detected family
		 *
		 * @throws NotConnectedException for MixerFamily::Unknown
		 */
		static const FamilyProfile &forFamily(MixerFamily family);

		/**
		 * @brief Profiles in the order their identification address is probed
		 */
		static std::vector<const FamilyProfile *> detectionOrder();

		MixerFamily family() const { return m_family; }
		const std::string &name() const { return m_name; }
		SceneNaming sceneNaming() const { return m_sceneNaming; }

		/**
		 * @brief Get the address template and encoding of a control
		 *
		 * @return const ControlSpec* nullptr when the family has no equivalent
		 */
		const ControlSpec *find(Control control) const;

		bool supports(Control control) const { return find(control) != nullptr; }

		/**
		 * @brief Address of a control that takes no index (identification, keepalive, main mix)
		 *
		 * @return std::string empty if unsupported
		 */
		std::string fixedAddress(Control control) const;

		const IndexFormat &format(IndexKind kind) const;

		int limit(IndexKind kind) const { return format(kind).limit; }

		/**
		 * @brief Validate a human index and convert it to its wire number
		 *
		 * @throws InvalidIndexException if the index is outside 1..limit
		 */
		int wireIndex(IndexKind kind, int humanIndex) const;

		/**
		 * @brief Validate and render a human index as it appears inside an address
		 *
		 * @throws InvalidIndexException if the index is outside 1..limit
		 */
		std::string formatIndex(IndexKind kind, int humanIndex) const;

		/**
		 * @brief Expand an address template with validated, formatted indices
		 *
		 * @throws InvalidIndexException for out-of-range indices
		 * @throws MixerException (InvalidArgument) if the template names an index not supplied
		 */
		std::string expand(const std::string &addressTemplate, const IndexMap &indices) const;

	private:
		FamilyProfile(MixerFamily family, std::string name, SceneNaming sceneNaming,
					  std::map<IndexKind, IndexFormat> formats,
					  std::map<Control, ControlSpec> controls);

		MixerFamily m_family;
		std::string m_name;
		SceneNaming m_sceneNaming;
		std::map<IndexKind, IndexFormat> m_formats;
		std::map<Control, ControlSpec> m_controls;
	};

	/**
	 * @brief Human-readable name of an index kind, used in error messages
	 */
	std::string indexKindName(IndexKind kind);
}
