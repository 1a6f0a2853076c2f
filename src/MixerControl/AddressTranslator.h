#pragma once

#include "FamilyProfile.h"

#include <any>
#include <optional>
#include <string>

namespace MixerControl
{
	/**
	 * @brief One fully resolved OSC message
	 */
	struct WireCommand
	{
		std::string address;
		OscArgs args;
	};

	/**
	 * @brief Maps logical controls to wire addresses and values for one family
	 *
	 * Pure: nothing here touches the network. Unsupported controls come back as
	 * std::nullopt so callers can turn them into silent no-ops.
	 */
	class AddressTranslator
	{
	public:
		explicit AddressTranslator(const FamilyProfile &profile);

		const FamilyProfile &profile() const { return m_profile; }

		bool supports(Control control) const { return m_profile.supports(control); }

		/**
		 * @brief Resolve a mutation
		 *
		 * @param control Control to set
		 * @param indices Human (1-based) indices named by the control's address
		 * @param value Human value (clamped to the control's range before encoding)
		 * @return std::optional<WireCommand> std::nullopt if the family has no equivalent
		 * @throws InvalidIndexException if an index is outside the family's range
		 */
		std::optional<WireCommand> encodeSet(Control control, const IndexMap &indices,
											 const std::any &value) const;

		/**
		 * @brief Resolve the address to query for a control
		 *
		 * @return std::optional<std::string> std::nullopt if the family has no equivalent
		 * @throws InvalidIndexException if an index is outside the family's range
		 */
		std::optional<std::string> queryAddress(Control control, const IndexMap &indices) const;

		/**
		 * @brief Decode a reply value into the control's human unit
		 */
		std::any decode(Control control, const std::any &wire) const;

		/**
		 * @brief Value reported for a query the family cannot answer
		 */
		std::any placeholder(Control control) const;

		/**
		 * @brief Encoding rule of a control on this family
		 */
		Encoding encodingOf(Control control) const;

	private:
		const ControlSpec &require(Control control) const;

		const FamilyProfile &m_profile;
	};
}
