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

#ifndef __CONFIGURATIONDICTIONARY_H__
#define __CONFIGURATIONDICTIONARY_H__

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "Logging.h"
#include "ValueRangeDictionary.h"

namespace hiprf
{
	class ConfigurationEntryBase
	{
	public:
		virtual ~ConfigurationEntryBase() {}
	};

	template <typename ValueType>
	class ConfigurationEntry : public ConfigurationEntryBase
	{
	public:
		ConfigurationEntry(const ValueType& value)
			: m_value(value) {}

		const ValueType& get() const { return m_value; }

	private:
		ValueType m_value;
	};

	/// Typed key-value store holding the configuration of one object.
	/// If a ValueRangeDictionary is attached, values are validated against it and
	/// missing or invalid values are replaced by the declared defaults.
	class ConfigurationDictionary
	{
	public:
		ConfigurationDictionary();

		template <typename ValueType>
		void set(const std::string& key, const ValueType& value)
		{
			m_mapEntries[key] = std::make_shared<ConfigurationEntry<ValueType> >(value);
		}

		void set(const std::string& key, const char* value)
		{
			set<std::string>(key, std::string(value));
		}

		template <typename ValueType>
		ValueType get(const std::string& key, const ValueType& defaultValue) const
		{
			auto iter = m_mapEntries.find(key);
			if (iter == m_mapEntries.end())
			{
				return defaultValue;
			}
			auto entry = std::dynamic_pointer_cast<const ConfigurationEntry<ValueType> >(iter->second);
			if (!entry)
			{
				logging::log_warn("ConfigurationDictionary: Type mismatch for parameter '", key, "', using default");
				return defaultValue;
			}
			return entry->get();
		}

		/// Returns the configured value, or the default of the attached value range if the
		/// value is missing or out of range. Throws std::invalid_argument for parameters that
		/// are neither configured nor declared.
		template <typename ValueType>
		ValueType get(const std::string& key) const
		{
			const ValueRangeEntry<ValueType>* range = nullptr;
			if (m_pValueRangeDictionary)
			{
				range = m_pValueRangeDictionary->get<ValueType>(key);
			}

			auto iter = m_mapEntries.find(key);
			if (iter != m_mapEntries.end())
			{
				auto entry = std::dynamic_pointer_cast<const ConfigurationEntry<ValueType> >(iter->second);
				if (entry && (!range || range->isInRange(entry->get())))
				{
					return entry->get();
				}
				logging::log_warn("ConfigurationDictionary: Invalid value for parameter '", key, "', using default");
			}

			if (range)
			{
				return range->getDefaultValue();
			}
			logging::log_error("ConfigurationDictionary: Parameter '", key, "' is neither configured nor declared");
			throw std::invalid_argument("ConfigurationDictionary: unknown parameter '" + key + "'");
		}

		bool hasKey(const std::string& key) const;
		void remove(const std::string& key);
		std::vector<std::string> getKeys() const;

		void setValueRangeDictionary(const ValueRangeDictionary* valueRangeDictionary);
		const ValueRangeDictionary* getValueRangeDictionary() const { return m_pValueRangeDictionary; }

		/// Removes all entries that are not declared in the attached value range dictionary
		/// or whose value lies outside the declared range. Returns the number of removed entries.
		size_t checkEntries();

	private:
		template <typename ValueType>
		static bool matchesRange(const ValueRangeEntryBase* rangeBase, const std::shared_ptr<const ConfigurationEntryBase>& entry)
		{
			auto range = dynamic_cast<const ValueRangeEntry<ValueType>*>(rangeBase);
			auto typedEntry = std::dynamic_pointer_cast<const ConfigurationEntry<ValueType> >(entry);
			return range && typedEntry && range->isInRange(typedEntry->get());
		}

		bool isValidEntry(const std::string& key, const std::shared_ptr<const ConfigurationEntryBase>& entry) const;

		std::map<std::string, std::shared_ptr<const ConfigurationEntryBase> > m_mapEntries;
		const ValueRangeDictionary* m_pValueRangeDictionary;
	};
}

#endif //!__CONFIGURATIONDICTIONARY_H__
