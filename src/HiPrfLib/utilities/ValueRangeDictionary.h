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

#ifndef __VALUERANGEDICTIONARY_H__
#define __VALUERANGEDICTIONARY_H__

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Logging.h"

namespace hiprf
{
	class ValueRangeEntryBase
	{
	public:
		virtual ~ValueRangeEntryBase() {}
		virtual bool isUnrestricted() const = 0;
		virtual bool isContinuous() const = 0;
		virtual const std::string& getDisplayName() const = 0;
	};

	/// The allowed values of one parameter: either a continuous range [lowerBound, upperBound],
	/// a discrete set of values, or anything (unrestricted). Every entry has a default value.
	template <typename ValueType>
	class ValueRangeEntry : public ValueRangeEntryBase
	{
	public:
		ValueRangeEntry(const std::vector<ValueType>& discreteRange, const ValueType& defaultValue, const std::string& displayName)
			: m_discreteRange(discreteRange)
			, m_continuousRange(defaultValue, defaultValue)
			, m_defaultValue(defaultValue)
			, m_displayName(displayName)
			, m_continuous(false)
			, m_unrestricted(false)
		{
		}

		ValueRangeEntry(const ValueType& lowerBound, const ValueType& upperBound, const ValueType& defaultValue, const std::string& displayName)
			: m_continuousRange(lowerBound, upperBound)
			, m_defaultValue(defaultValue)
			, m_displayName(displayName)
			, m_continuous(true)
			, m_unrestricted(false)
		{
		}

		ValueRangeEntry(const ValueType& defaultValue, const std::string& displayName)
			: m_continuousRange(defaultValue, defaultValue)
			, m_defaultValue(defaultValue)
			, m_displayName(displayName)
			, m_continuous(false)
			, m_unrestricted(true)
		{
		}

		virtual bool isUnrestricted() const { return m_unrestricted; }
		virtual bool isContinuous() const { return m_continuous; }
		virtual const std::string& getDisplayName() const { return m_displayName; }

		const std::vector<ValueType>& getDiscrete() const { return m_discreteRange; }
		const std::pair<ValueType, ValueType>& getContinuous() const { return m_continuousRange; }
		const ValueType& getDefaultValue() const { return m_defaultValue; }

		bool isInRange(const ValueType& value) const
		{
			if (m_unrestricted)
			{
				return true;
			}
			if (m_continuous)
			{
				return !(value < m_continuousRange.first) && !(m_continuousRange.second < value);
			}
			return std::find(m_discreteRange.begin(), m_discreteRange.end(), value) != m_discreteRange.end();
		}

	private:
		std::vector<ValueType> m_discreteRange;
		std::pair<ValueType, ValueType> m_continuousRange;
		ValueType m_defaultValue;
		std::string m_displayName;
		bool m_continuous;
		bool m_unrestricted;
	};

	/// Describes the parameters an object exposes, their value ranges and defaults
	class ValueRangeDictionary
	{
	public:
		template <typename ValueType>
		void set(const std::string& key, const std::vector<ValueType>& discreteRange, const ValueType& defaultValue, const std::string& displayName)
		{
			m_mapEntries[key] = std::make_shared<ValueRangeEntry<ValueType> >(discreteRange, defaultValue, displayName);
		}

		template <typename ValueType>
		void set(const std::string& key, const ValueType& lowerBound, const ValueType& upperBound, const ValueType& defaultValue, const std::string& displayName)
		{
			m_mapEntries[key] = std::make_shared<ValueRangeEntry<ValueType> >(lowerBound, upperBound, defaultValue, displayName);
		}

		template <typename ValueType>
		void set(const std::string& key, const ValueType& defaultValue, const std::string& displayName)
		{
			m_mapEntries[key] = std::make_shared<ValueRangeEntry<ValueType> >(defaultValue, displayName);
		}

		bool hasKey(const std::string& key) const
		{
			return m_mapEntries.find(key) != m_mapEntries.end();
		}

		void remove(const std::string& key)
		{
			m_mapEntries.erase(key);
		}

		std::vector<std::string> getKeys() const
		{
			std::vector<std::string> keys;
			for (const auto& entry : m_mapEntries)
			{
				keys.push_back(entry.first);
			}
			return keys;
		}

		/// Returns nullptr if the key is unknown or was declared with another type
		template <typename ValueType>
		const ValueRangeEntry<ValueType>* get(const std::string& key) const
		{
			auto iter = m_mapEntries.find(key);
			if (iter == m_mapEntries.end())
			{
				return nullptr;
			}
			auto entry = std::dynamic_pointer_cast<const ValueRangeEntry<ValueType> >(iter->second);
			if (!entry)
			{
				logging::log_error("ValueRangeDictionary: Type mismatch for parameter '", key, "'");
			}
			return entry.get();
		}

		const ValueRangeEntryBase* getBase(const std::string& key) const
		{
			auto iter = m_mapEntries.find(key);
			if (iter == m_mapEntries.end())
			{
				return nullptr;
			}
			return iter->second.get();
		}

	private:
		std::map<std::string, std::shared_ptr<const ValueRangeEntryBase> > m_mapEntries;
	};
}

#endif //!__VALUERANGEDICTIONARY_H__
