#include "FamilyDetector.h"
#include "MixerExceptions.h"

#include <iostream>

namespace MixerControl
{
	FamilyDetector::FamilyDetector(RequestCorrelator &correlator, std::chrono::milliseconds probeTimeout)
		: m_correlator(correlator), m_probeTimeout(probeTimeout)
	{
	}

	const FamilyProfile &FamilyDetector::detect()
	{
		std::string probed;
		m_identification.reset();

		for (const FamilyProfile *profile : FamilyProfile::detectionOrder())
		{
			std::string address = profile->fixedAddress(Control::Info);
			if (!probed.empty())
				probed += ", ";
			probed += address;

			try
			{
				m_identification = m_correlator.query(address, m_probeTimeout);
			}
			catch (const QueryTimeoutException &)
			{
				if (Log::verbose())
				{
					std::cout << "FamilyDetector: No reply to " << address << std::endl;
				}
				continue;
			}

			if (Log::verbose())
			{
				std::cout << "FamilyDetector: Detected " << profile->name() << " mixer";
				if (m_identification.has_value())
					std::cout << " (" << formatArg(m_identification) << ")";
				std::cout << std::endl;
			}
			return *profile;
		}

		throw DeviceNotDetectedException("No mixer answered " + probed);
	}
}
