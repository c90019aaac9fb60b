#ifndef _GGPKRES_CONFIG_H_
#define _GGPKRES_CONFIG_H_

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Common.h"
#include "Logger.h"
#include "Internal/CallOnDestruction.h"
#include "Internal/ListenerManager.h"

namespace GgpkRes {
	class Config {
	public:
		template<typename T>
		class Item;

		class ItemBase {
			friend class Config;
			template<typename T>
			friend class Item;
			const char* m_pszName;

		protected:
			Config* const m_pConfig;

			ItemBase(Config* pConfig, const char* pszName);

			virtual bool LoadFrom(const nlohmann::json&, bool announceChanged = false) = 0;
			virtual void SaveTo(nlohmann::json&) const = 0;

			void AnnounceChanged() {
				OnChangeListener(*this);
			}

		public:
			virtual ~ItemBase() = default;

			[[nodiscard]] auto Name() const { return m_pszName; }

			Internal::ListenerManager<ItemBase, ItemBase&> OnChangeListener;
		};

		template<typename T>
		class Item : public ItemBase {
			friend class Config;
			T m_value;
			const std::function<T(const T&)> m_fnValidator;

		protected:
			Item(Config* pConfig, const char* pszName, T defaultValue, std::function<T(const T&)> validator = nullptr)
				: ItemBase(pConfig, pszName)
				, m_value(std::move(defaultValue))
				, m_fnValidator(std::move(validator)) {
			}

			bool Assign(const T& rv) {
				const auto sanitized = m_fnValidator ? m_fnValidator(rv) : rv;
				m_value = sanitized;
				return sanitized == rv;
			}

			bool LoadFrom(const nlohmann::json& data, bool announceChanged = false) override {
				const auto it = data.find(Name());
				if (it == data.end())
					return true;

				T newValue;
				try {
					newValue = it->template get<T>();
				} catch (const nlohmann::json::exception& e) {
					m_pConfig->ReportInvalidValue(Name(), e.what());
					return true;
				}

				const auto prev = m_value;
				const auto valid = Assign(newValue);
				if (announceChanged && !(prev == m_value))
					AnnounceChanged();
				return !valid;
			}

			void SaveTo(nlohmann::json& data) const override {
				data[Name()] = m_value;
			}

		public:
			~Item() override = default;

			Item<T>& operator=(const T& rv) {
				if (m_value == rv)
					return *this;

				Assign(rv);
				AnnounceChanged();
				return *this;
			}

			[[nodiscard]] operator T() const& {
				return m_value;
			}

			[[nodiscard]] const T& Value() const {
				return m_value;
			}
		};

	private:
		bool m_loaded = false;
		bool m_bSuppressSave = false;
		const std::filesystem::path m_sConfigPath;
		const std::shared_ptr<Logger> m_logger;

		std::vector<ItemBase*> m_allItems;
		std::vector<Internal::CallOnDestruction> m_destructionCallbacks;

		void ReportInvalidValue(const char* pszName, const char* pszError);

		template<typename T, typename ... Args>
		static Item<T> CreateConfigItem(Config* pConfig, const char* pszName, T defaultValue, Args&& ... args) {
			return Item<T>(pConfig, pszName, std::move(defaultValue), std::forward<Args>(args)...);
		}

	public:
		/// \brief Creates a configuration backed by a JSON file and loads it.
		/// An empty path keeps every item at its default and never touches the disk.
		explicit Config(std::filesystem::path path = {});
		Config(const Config&) = delete;
		Config(Config&&) = delete;
		Config& operator=(const Config&) = delete;
		Config& operator=(Config&&) = delete;
		~Config();

		[[nodiscard]] auto Loaded() const { return m_loaded; }
		[[nodiscard]] const std::filesystem::path& GetConfigPath() const { return m_sConfigPath; }

		void Save();
		void Reload(bool announceChange = false);
		void SuppressSave(bool suppress);

		// Name of the folder, directly under the archive root, that holds bundle payloads.
		Item<std::string> BundleFolderName = CreateConfigItem(this, "BundleFolderName", std::string(DefaultBundleFolderName), std::function<std::string(const std::string&)>([](const std::string& v) {
			return v.empty() ? std::string(DefaultBundleFolderName) : v;
		}));

		Item<std::string> IndexFileName = CreateConfigItem(this, "IndexFileName", std::string(DefaultIndexFileName), std::function<std::string(const std::string&)>([](const std::string& v) {
			return v.empty() ? std::string(DefaultIndexFileName) : v;
		}));

		// Checks SHA-256 of data read from records that carry a hash.
		Item<bool> VerifyContentHash = CreateConfigItem(this, "VerifyContentHash", true);

		Item<LogLevel> MinimumLogLevel = CreateConfigItem(this, "MinimumLogLevel", LogLevel::Info);

		// Empty to disable.
		Item<std::string> LogFilePath = CreateConfigItem(this, "LogFilePath", std::string());

		Item<uint64_t> MinimumArchiveSize = CreateConfigItem(this, "MinimumArchiveSize", uint64_t{ 1024 });

		/// \brief Applies the logging items to the logger now and whenever they change.
		[[nodiscard]] Internal::CallOnDestruction::Multiple BindLogger(const std::shared_ptr<Logger>& logger);
	};
}

#endif
