#pragma once

#include "FamilyProfile.h"
#include "RequestCorrelator.h"

#include <chrono>

namespace MixerControl
{
	/**
	 * @brief Identifies the mixer family by probing each family's info address
	 */
	class FamilyDetector
	{
	public:
		static constexpr std::chrono::milliseconds kDefaultProbeTimeout{500};

		explicit FamilyDetector(RequestCorrelator &correlator,
								std::chrono::milliseconds probeTimeout = kDefaultProbeTimeout);

		/**
		 * @brief Probe /xinfo, then /info, and return the profile of the first family that answers
		 *
		 * Probes are not retried.
		 *
		 * @return const FamilyProfile& Profile of the detected family
		 * @throws DeviceNotDetectedException if no probe is answered
		 * @throws NetworkException if a probe could not be sent
		 */
		const FamilyProfile &detect();

		/**
		 * @brief First argument of the identification reply from the last successful detect()
		 */
		const std::any &identification() const { return m_identification; }

	private:
		RequestCorrelator &m_correlator;
		std::chrono::milliseconds m_probeTimeout;
		std::any m_identification;
	};
}
