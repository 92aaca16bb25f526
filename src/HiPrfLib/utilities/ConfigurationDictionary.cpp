// ================================================================================================
//
// If not explicitly stated: Copyright (C) 2016, all rights reserved,
//      Rüdiger Göbl
//		Email r.goebl@tum.de
//      Chair for Computer Aided Medical Procedures
//      Technische Universität München
//      Boltzmannstr. 3, 85748 Garching b. München, Germany
//
// ================================================================================================

#include "ConfigurationDictionary.h"

#include <cstdint>

namespace hiprf
{
	ConfigurationDictionary::ConfigurationDictionary()
		: m_pValueRangeDictionary(nullptr)
	{
	}

	bool ConfigurationDictionary::hasKey(const std::string& key) const
	{
		return m_mapEntries.find(key) != m_mapEntries.end();
	}

	void ConfigurationDictionary::remove(const std::string& key)
	{
		m_mapEntries.erase(key);
	}

	std::vector<std::string> ConfigurationDictionary::getKeys() const
	{
		std::vector<std::string> keys;
		for (const auto& entry : m_mapEntries)
		{
			keys.push_back(entry.first);
		}
		return keys;
	}

	void ConfigurationDictionary::setValueRangeDictionary(const ValueRangeDictionary* valueRangeDictionary)
	{
		m_pValueRangeDictionary = valueRangeDictionary;
	}

	bool ConfigurationDictionary::isValidEntry(const std::string& key, const std::shared_ptr<const ConfigurationEntryBase>& entry) const
	{
		const ValueRangeEntryBase* rangeBase = m_pValueRangeDictionary->getBase(key);
		if (!rangeBase)
		{
			return false;
		}
		return matchesRange<bool>(rangeBase, entry) ||
			matchesRange<int32_t>(rangeBase, entry) ||
			matchesRange<uint32_t>(rangeBase, entry) ||
			matchesRange<double>(rangeBase, entry) ||
			matchesRange<std::string>(rangeBase, entry);
	}

	size_t ConfigurationDictionary::checkEntries()
	{
		if (!m_pValueRangeDictionary)
		{
			return 0;
		}

		size_t numRemoved = 0;
		for (auto iter = m_mapEntries.begin(); iter != m_mapEntries.end();)
		{
			if (!isValidEntry(iter->first, iter->second))
			{
				logging::log_warn("ConfigurationDictionary: Removing invalid or unknown parameter '", iter->first, "'");
				iter = m_mapEntries.erase(iter);
				numRemoved++;
			}
			else
			{
				++iter;
			}
		}
		return numRemoved;
	}
}
