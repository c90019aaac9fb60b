#include "ArchiveFacade.h"

#include "Common.h"
#include "ErrorContext.h"
#include "Internal/PathUtils.h"

GgpkRes::ArchiveFacade::ArchiveFacade(std::shared_ptr<Backend::Library> library, std::shared_ptr<Config> config)
	: m_library(std::move(library))
	, m_config(config ? std::move(config) : std::make_shared<Config>())
	, m_logger(Logger::Acquire()) {
	if (!m_library)
		throw std::invalid_argument("library must not be null");
}

GgpkRes::ArchiveFacade::~ArchiveFacade() {
	std::lock_guard lock(m_mtx);
	CloseLocked();
}

bool GgpkRes::ArchiveFacade::Open(const std::filesystem::path& path) {
	std::optional<std::filesystem::path> closed;
	std::optional<ArchiveOpenedEvent> opened;

	{
		std::lock_guard lock(m_mtx);
		closed = CloseLocked();

		try {
			std::shared_ptr<Backend::BundleIndex> index;
			try {
				auto bundled = m_library->OpenBundled(path);
				if (bundled) {
					index = bundled->Index();
					m_archive = std::move(bundled);
					m_bundled = true;
				}
			} catch (const Backend::MissingIndexDirectoryException& e) {
				m_logger->Format(LogCategory::ArchiveFacade, "No bundle folder in ", path.string(), " (", e.what(), "); opening as a plain archive");
				m_archive = m_library->OpenPlain(path);
			} catch (const Backend::MissingIndexFileException& e) {
				m_logger->Format(LogCategory::ArchiveFacade, "No bundle index in ", path.string(), " (", e.what(), "); opening as a plain archive");
				m_archive = m_library->OpenPlain(path);
			}

			if (!m_archive) {
				m_logger->Format<LogLevel::Warning>(LogCategory::ArchiveFacade, "Failed to open ", path.string(), " for an unknown reason");
				CloseLocked();
			} else {
				m_records = std::make_unique<RecordTreeSource>(m_archive->Root(), m_config->VerifyContentHash.Value());
				if (index)
					m_index = std::make_unique<IndexTreeSource>(std::move(index), m_config->BundleFolderName.Value());
				m_root = m_records->Root();
				m_version = m_archive->Version();
				m_filePath = path;
				opened = ArchiveOpenedEvent{ m_filePath, m_bundled, !!m_index, m_version };

				m_logger->Log(LogCategory::ArchiveFacade, "Opened " + path.string(), LogLevel::Info, nlohmann::json{
					{"FilePath", path.string()},
					{"IsBundled", m_bundled},
					{"HasIndex", !!m_index},
					{"Version", m_version},
				});
			}
		} catch (...) {
			const auto ep = std::current_exception();
			const auto category = ClassifyOpenFailure(ep);
			auto context = MakeErrorContext(ep, category);
			context["FilePath"] = path.string();
			context["IsBundled"] = m_bundled;
			AddFileSystemContext(context, path);

			CloseLocked();
			m_logger->Log(LogCategory::ArchiveFacade, "Failed to open " + path.string(), LogLevel::Error, context);
			throw ArchiveOpenException("Failed to open GGPK file: " + path.string(), category, std::move(context), ep);
		}
	}

	if (closed)
		OnClosed(*closed);
	if (!opened)
		return false;
	OnOpened(*opened);
	return true;
}

void GgpkRes::ArchiveFacade::Close() {
	std::optional<std::filesystem::path> closed;
	{
		std::lock_guard lock(m_mtx);
		closed = CloseLocked();
	}
	if (closed)
		OnClosed(*closed);
}

std::optional<std::filesystem::path> GgpkRes::ArchiveFacade::CloseLocked() {
	const auto wasOpen = !!m_archive;
	auto path = std::move(m_filePath);

	m_index.reset();
	m_records.reset();
	m_archive.reset();
	m_root.reset();
	m_filePath.clear();
	m_bundled = false;
	m_version = 0;

	if (!wasOpen)
		return std::nullopt;

	m_logger->Format(LogCategory::ArchiveFacade, "Closed ", path.string());
	return path;
}

void GgpkRes::ArchiveFacade::ThrowIfNotOpen() const {
	if (!m_archive)
		throw std::logic_error("No GGPK file is currently open");
}

bool GgpkRes::ArchiveFacade::IsOpen() const {
	std::lock_guard lock(m_mtx);
	return !!m_archive;
}

bool GgpkRes::ArchiveFacade::IsBundled() const {
	std::lock_guard lock(m_mtx);
	return m_bundled;
}

bool GgpkRes::ArchiveFacade::HasIndex() const {
	std::lock_guard lock(m_mtx);
	return !!m_index;
}

uint32_t GgpkRes::ArchiveFacade::Version() const {
	std::lock_guard lock(m_mtx);
	return m_version;
}

std::filesystem::path GgpkRes::ArchiveFacade::FilePath() const {
	std::lock_guard lock(m_mtx);
	return m_filePath;
}

std::optional<GgpkRes::Node> GgpkRes::ArchiveFacade::Root() const {
	std::lock_guard lock(m_mtx);
	return m_root;
}

std::vector<GgpkRes::Node> GgpkRes::ArchiveFacade::GetChildrenLocked(const std::string& path) const {
	ThrowIfNotOpen();
	try {
		return m_records->Children(path);
	} catch (...) {
		const auto ep = std::current_exception();
		auto context = MakeErrorContext(ep, ErrorCategory::DirectoryTraversal);
		context["DirectoryPath"] = Internal::NormalizePath(path);
		context["IsBundled"] = m_bundled;
		m_logger->Log(LogCategory::ArchiveFacade, "Failed to enumerate " + Internal::NormalizePath(path), LogLevel::Error, context);
		throw GgpkException("Failed to enumerate directory: " + Internal::NormalizePath(path), std::move(context), ep);
	}
}

std::vector<GgpkRes::Node> GgpkRes::ArchiveFacade::GetChildren(const Node& directory) const {
	std::lock_guard lock(m_mtx);
	ThrowIfNotOpen();
	if (!directory.IsDirectory())
		return {};
	return GetChildrenLocked(directory.FullPath());
}

std::vector<GgpkRes::Node> GgpkRes::ArchiveFacade::GetChildren(const std::string& directoryPath) const {
	std::lock_guard lock(m_mtx);
	return GetChildrenLocked(directoryPath);
}

std::vector<uint8_t> GgpkRes::ArchiveFacade::ReadLocked(const TreeSource& source, const std::string& path) const {
	const auto normalized = Internal::NormalizePath(path);
	try {
		auto data = source.Read(normalized);
		m_logger->Format<LogLevel::Debug>(LogCategory::ArchiveFacade, "Read ", data.size(), " bytes from ", normalized);
		return data;
	} catch (...) {
		const auto ep = std::current_exception();
		const auto category = ClassifyReadFailure(ep);
		auto context = MakeErrorContext(ep, category);
		context["FilePath"] = normalized;
		context["IsBundled"] = m_bundled;
		context["ArchivePath"] = m_filePath.string();
		m_logger->Log(LogCategory::ArchiveFacade, "Failed to read " + normalized, LogLevel::Error, context);

		const auto slash = normalized.find_last_of('/');
		const auto name = slash == std::string::npos ? normalized : normalized.substr(slash + 1);
		throw FileOperationException(normalized, FileOperationType::Read, "Failed to read file: " + name, ep, std::move(context));
	}
}

std::vector<uint8_t> GgpkRes::ArchiveFacade::ReadFile(const Node& file) const {
	if (file.Type() != NodeType::BundleFile)
		return ReadFile(file.FullPath());

	std::lock_guard lock(m_mtx);
	ThrowIfNotOpen();
	if (!m_index)
		throw FileOperationException(file.FullPath(), FileOperationType::Read, "Failed to read file: " + file.Name() + " (archive has no bundle index)");
	return ReadLocked(*m_index, file.FullPath());
}

std::vector<uint8_t> GgpkRes::ArchiveFacade::ReadFile(const std::string& filePath) const {
	std::lock_guard lock(m_mtx);
	ThrowIfNotOpen();
	return ReadLocked(*m_records, filePath);
}

std::optional<GgpkRes::Node> GgpkRes::ArchiveFacade::FindFile(const std::string& path) const {
	std::lock_guard lock(m_mtx);
	if (!m_archive || Internal::IsRootPath(path))
		return std::nullopt;

	try {
		auto node = m_records->Find(path);
		if (!node || node->IsDirectory())
			return std::nullopt;
		return node;
	} catch (...) {
		const auto ep = std::current_exception();
		auto context = MakeErrorContext(ep, ErrorCategory::DirectoryTraversal);
		context["FilePath"] = Internal::NormalizePath(path);
		throw GgpkException("Failed to look up file: " + Internal::NormalizePath(path), std::move(context), ep);
	}
}

std::optional<GgpkRes::Node> GgpkRes::ArchiveFacade::FindDirectory(const std::string& path) const {
	std::lock_guard lock(m_mtx);
	if (!m_archive)
		return std::nullopt;
	if (Internal::IsRootPath(path))
		return m_root;

	try {
		auto node = m_records->Find(path);
		if (!node || !node->IsDirectory())
			return std::nullopt;
		return node;
	} catch (...) {
		const auto ep = std::current_exception();
		auto context = MakeErrorContext(ep, ErrorCategory::DirectoryTraversal);
		context["DirectoryPath"] = Internal::NormalizePath(path);
		throw GgpkException("Failed to look up directory: " + Internal::NormalizePath(path), std::move(context), ep);
	}
}
