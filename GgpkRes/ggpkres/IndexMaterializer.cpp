#include "IndexMaterializer.h"

#include "ErrorContext.h"
#include "Internal/PathUtils.h"

GgpkRes::IndexMaterializer::IndexMaterializer(std::shared_ptr<ArchiveFacade> facade, std::shared_ptr<Config> config)
	: m_facade(std::move(facade))
	, m_config(config ? std::move(config) : std::make_shared<Config>())
	, m_logger(Logger::Acquire()) {
	if (!m_facade)
		throw std::invalid_argument("facade must not be null");
}

bool GgpkRes::IndexMaterializer::HasIndex() const {
	return m_facade->HasIndex();
}

std::vector<GgpkRes::Node> GgpkRes::IndexMaterializer::DecompressIndex() const {
	return m_facade->WithIndex([this](const TreeSource* index) {
		if (!index)
			throw std::logic_error("No bundled GGPK or index available");

		try {
			auto result = index->Children({});
			m_logger->Format<LogLevel::Debug>(LogCategory::IndexMaterializer, "Converted ", result.size(), " root nodes from index");
			return result;
		} catch (...) {
			const auto ep = std::current_exception();
			auto context = MakeErrorContext(ep, ErrorCategory::BundleDecompression);
			m_logger->Log(LogCategory::IndexMaterializer, "Failed to decompress index", LogLevel::Error, context);
			throw BundleDecompressionException(m_config->IndexFileName.Value(), "Failed to decompress index file", ep, std::move(context));
		}
	});
}

std::vector<GgpkRes::Node> GgpkRes::IndexMaterializer::GetNodesForPath(const std::string& path) const {
	return m_facade->WithIndex([this, &path](const TreeSource* index) -> std::vector<Node> {
		if (!index) {
			m_logger->Format<LogLevel::Debug>(LogCategory::IndexMaterializer, "No index available for ", path);
			return {};
		}

		try {
			return index->Children(path);
		} catch (...) {
			const auto ep = std::current_exception();
			auto context = MakeErrorContext(ep, ErrorCategory::BundleDecompression);
			context["Path"] = path;
			m_logger->Log(LogCategory::IndexMaterializer, "Failed to get index nodes for " + path, LogLevel::Error, context);
			throw BundleDecompressionException(m_config->IndexFileName.Value(), "Failed to get nodes for path: " + path, ep, std::move(context));
		}
	});
}

std::optional<GgpkRes::Node> GgpkRes::IndexMaterializer::FindNode(const std::string& path) const {
	return m_facade->WithIndex([this, &path](const TreeSource* index) -> std::optional<Node> {
		if (!index)
			return std::nullopt;

		try {
			return index->Find(path);
		} catch (...) {
			const auto ep = std::current_exception();
			auto context = MakeErrorContext(ep, ErrorCategory::BundleDecompression);
			context["Path"] = path;
			throw BundleDecompressionException(m_config->IndexFileName.Value(), "Failed to look up path: " + path, ep, std::move(context));
		}
	});
}

std::vector<uint8_t> GgpkRes::IndexMaterializer::ReadFile(const std::string& path) const {
	return m_facade->WithIndex([this, &path](const TreeSource* index) {
		const auto normalized = Internal::NormalizePath(path);
		if (!index)
			throw BundleDecompressionException(m_config->IndexFileName.Value(), "No bundled GGPK or index available to read " + normalized);

		try {
			return index->Read(normalized);
		} catch (...) {
			const auto ep = std::current_exception();
			auto context = MakeErrorContext(ep, ClassifyReadFailure(ep));
			context["FilePath"] = normalized;
			m_logger->Log(LogCategory::IndexMaterializer, "Failed to read " + normalized + " from bundles", LogLevel::Error, context);
			throw BundleDecompressionException(m_config->IndexFileName.Value(), "Failed to read bundled file: " + normalized, ep, std::move(context));
		}
	});
}
