#pragma once

#include "AddressTranslator.h"
#include "RequestCorrelator.h"

#include <chrono>
#include <functional>
#include <string>

namespace MixerControl
{
	/**
	 * @brief Snapshot recall, save and naming for the detected family
	 *
	 * Scenes are always numbered from 1 by the caller. X32 consoles address
	 * every slot's name directly and number slots from 0 on the wire; X-Air
	 * mixers number slots from 1 and only expose the name of the loaded slot,
	 * so saving with a name first loads the target slot.
	 */
	class SceneManager
	{
	public:
		/**
		 * @brief Sends one mutation to the mixer
		 */
		using Sender = std::function<void(const std::string &, const OscArgs &)>;

		// Timeout of each query in the X-Air name lookup
		static constexpr std::chrono::milliseconds kSceneProbeTimeout{600};

		SceneManager(const AddressTranslator &translator, Sender sender,
					 RequestCorrelator &correlator, std::chrono::milliseconds queryTimeout);

		/**
		 * @brief Load a stored scene
		 *
		 * @throws InvalidIndexException if the scene is outside the family range
		 */
		void recall(int scene);

		/**
		 * @brief Store the current mix into a scene slot
		 *
		 * @param scene Target slot (1-based)
		 * @param name New scene name; an empty name keeps the slot's existing one
		 * @throws InvalidIndexException if the scene is outside the family range
		 */
		void save(int scene, const std::string &name = std::string());

		/**
		 * @brief Get the name of a scene
		 *
		 * On X-Air only the loaded scene's name can be read; any other slot
		 * yields an empty string.
		 *
		 * @throws QueryTimeoutException if the mixer does not answer
		 */
		std::string name(int scene);

		/**
		 * @brief Get the 1-based number of the loaded scene
		 *
		 * @return int Scene number, 0 when the mixer reports no loaded scene
		 * @throws QueryTimeoutException if the mixer does not answer
		 */
		int current();

	private:
		void sendSet(Control control, const IndexMap &indices, const std::any &value);

		std::any query(Control control, const IndexMap &indices, std::chrono::milliseconds timeout);

		const AddressTranslator &m_translator;
		Sender m_sender;
		RequestCorrelator &m_correlator;
		std::chrono::milliseconds m_queryTimeout;
	};
}
