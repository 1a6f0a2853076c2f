#include "SceneManager.h"
#include "MixerExceptions.h"

#include <iostream>
#include <utility>

namespace MixerControl
{
	SceneManager::SceneManager(const AddressTranslator &translator, Sender sender,
							   RequestCorrelator &correlator, std::chrono::milliseconds queryTimeout)
		: m_translator(translator), m_sender(std::move(sender)), m_correlator(correlator),
		  m_queryTimeout(queryTimeout)
	{
	}

	void SceneManager::recall(int scene)
	{
		int slot = m_translator.profile().wireIndex(IndexKind::Scene, scene);
		sendSet(Control::SceneLoad, {}, slot);

		if (Log::verbose())
		{
			std::cout << "SceneManager: Recalled scene " << scene << std::endl;
		}
	}

	void SceneManager::save(int scene, const std::string &name)
	{
		const FamilyProfile &profile = m_translator.profile();
		int slot = profile.wireIndex(IndexKind::Scene, scene);

		if (profile.sceneNaming() == SceneNaming::PerIndex)
		{
			sendSet(Control::SceneSave, {}, slot);
			if (!name.empty())
			{
				sendSet(Control::SceneName, {{IndexKind::Scene, scene}}, name);
			}
		}
		else
		{
			// The name address only reaches the loaded slot
			sendSet(Control::SceneLoad, {}, slot);
			if (!name.empty())
			{
				sendSet(Control::SceneActiveName, {}, name);
			}
			sendSet(Control::SceneSave, {}, slot);
		}

		if (Log::verbose())
		{
			std::cout << "SceneManager: Saved scene " << scene;
			if (!name.empty())
				std::cout << " as \"" << name << "\"";
			std::cout << std::endl;
		}
	}

	std::string SceneManager::name(int scene)
	{
		const FamilyProfile &profile = m_translator.profile();
		int slot = profile.wireIndex(IndexKind::Scene, scene);

		if (profile.sceneNaming() == SceneNaming::PerIndex)
		{
			std::any reply = query(Control::SceneName, {{IndexKind::Scene, scene}}, m_queryTimeout);
			return std::any_cast<std::string>(m_translator.decode(Control::SceneName, reply));
		}

		std::any index = query(Control::SceneActiveIndex, {}, kSceneProbeTimeout);
		int loaded = std::any_cast<int>(m_translator.decode(Control::SceneActiveIndex, index));
		if (loaded != slot)
		{
			return std::string();
		}

		std::any reply = query(Control::SceneActiveName, {}, kSceneProbeTimeout);
		return std::any_cast<std::string>(m_translator.decode(Control::SceneActiveName, reply));
	}

	int SceneManager::current()
	{
		std::any reply = query(Control::SceneActiveIndex, {}, m_queryTimeout);
		int slot = std::any_cast<int>(m_translator.decode(Control::SceneActiveIndex, reply));

		const IndexFormat &fmt = m_translator.profile().format(IndexKind::Scene);
		int scene = slot - fmt.base + 1;
		if (scene < 1 || scene > fmt.limit)
		{
			return 0;
		}
		return scene;
	}

	void SceneManager::sendSet(Control control, const IndexMap &indices, const std::any &value)
	{
		auto command = m_translator.encodeSet(control, indices, value);
		if (!command)
		{
			throw MixerException("Scene control missing from the " + m_translator.profile().name() + " profile",
								 MixerException::ErrorCode::InvalidArgument);
		}
		m_sender(command->address, command->args);
	}

	std::any SceneManager::query(Control control, const IndexMap &indices, std::chrono::milliseconds timeout)
	{
		auto address = m_translator.queryAddress(control, indices);
		if (!address)
		{
			throw MixerException("Scene control missing from the " + m_translator.profile().name() + " profile",
								 MixerException::ErrorCode::InvalidArgument);
		}
		return m_correlator.query(*address, timeout);
	}
}
