#include "Config.h"

#include <fstream>
#include <iterator>

static nlohmann::json ParseJsonFromFile(const std::filesystem::path& path, size_t maxSize = 16 * 1048576) {
	if (const auto size = file_size(path); size > maxSize)
		throw std::runtime_error("File too big");

	std::ifstream in(path, std::ios::binary);
	if (!in)
		throw std::runtime_error("Failed to open " + path.string());
	return nlohmann::json::parse(std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()));
}

static void SaveJsonToFile(const std::filesystem::path& path, const nlohmann::json& json) {
	if (path.has_parent_path())
		create_directories(path.parent_path());

	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out)
		throw std::runtime_error("Failed to open " + path.string() + " for writing");
	out << json.dump(1, '\t');
	if (!out)
		throw std::runtime_error("Failed to write " + path.string());
}

GgpkRes::Config::ItemBase::ItemBase(Config* pConfig, const char* pszName)
	: m_pszName(pszName)
	, m_pConfig(pConfig) {
	pConfig->m_allItems.push_back(this);
}

GgpkRes::Config::Config(std::filesystem::path path)
	: m_sConfigPath(std::move(path))
	, m_logger(Logger::Acquire()) {
	Reload();
}

GgpkRes::Config::~Config() = default;

void GgpkRes::Config::ReportInvalidValue(const char* pszName, const char* pszError) {
	m_logger->Format<LogLevel::Warning>(LogCategory::Config, "Ignoring invalid value for ", pszName, ": ", pszError);
}

void GgpkRes::Config::Reload(bool announceChange) {
	m_loaded = true;

	bool changed = false;
	nlohmann::json totalConfig = nlohmann::json::object();
	if (m_sConfigPath.empty()) {
		// nothing to load; items keep their defaults
	} else if (exists(m_sConfigPath)) {
		try {
			totalConfig = ParseJsonFromFile(m_sConfigPath);
			if (totalConfig.type() != nlohmann::json::value_t::object)
				throw std::runtime_error("Root must be an object.");
		} catch (const std::exception& e) {
			totalConfig = nlohmann::json::object();
			changed = true;
			m_logger->Format<LogLevel::Warning>(LogCategory::Config, "Failed to load configuration from ", m_sConfigPath.string(), ": ", e.what());
		}
	} else {
		changed = true;
		m_logger->Format(LogCategory::Config, "Creating new configuration file at ", m_sConfigPath.string());
	}

	m_destructionCallbacks.clear();
	for (const auto& item : m_allItems) {
		changed |= item->LoadFrom(totalConfig, announceChange);
		m_destructionCallbacks.push_back(item->OnChangeListener([this](ItemBase&) { Save(); }));
	}

	if (changed)
		Save();
}

void GgpkRes::Config::SuppressSave(bool suppress) {
	m_bSuppressSave = suppress;
}

void GgpkRes::Config::Save() {
	if (m_sConfigPath.empty() || m_bSuppressSave)
		return;

	nlohmann::json totalConfig;
	try {
		totalConfig = ParseJsonFromFile(m_sConfigPath);
		if (totalConfig.type() != nlohmann::json::value_t::object)
			throw std::runtime_error("Root must be an object.");
	} catch (const std::exception&) {
		// unreadable or missing; rewritten from scratch below
		totalConfig = nlohmann::json::object();
	}

	for (const auto& item : m_allItems)
		item->SaveTo(totalConfig);

	try {
		SaveJsonToFile(m_sConfigPath, totalConfig);
	} catch (const std::exception& e) {
		m_logger->Format<LogLevel::Error>(LogCategory::Config, "Failed to save configuration to ", m_sConfigPath.string(), ": ", e.what());
	}
}

GgpkRes::Internal::CallOnDestruction::Multiple GgpkRes::Config::BindLogger(const std::shared_ptr<Logger>& logger) {
	const auto applyLevel = [this, logger]() {
		logger->SetMinimumLevel(MinimumLogLevel.Value());
	};
	const auto applyFile = [this, logger]() {
		try {
			logger->SetLogFile(LogFilePath.Value());
		} catch (const std::exception& e) {
			logger->Format<LogLevel::Error>(LogCategory::Config, "Failed to use log file ", LogFilePath.Value(), ": ", e.what());
		}
	};

	applyLevel();
	applyFile();

	Internal::CallOnDestruction::Multiple callbacks;
	callbacks += MinimumLogLevel.OnChangeListener([applyLevel](ItemBase&) { applyLevel(); });
	callbacks += LogFilePath.OnChangeListener([applyFile](ItemBase&) { applyFile(); });
	return callbacks;
}
