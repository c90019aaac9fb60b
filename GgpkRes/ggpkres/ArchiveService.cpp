#include "ArchiveService.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <ios>
#include <new>
#include <span>
#include <system_error>

#include "Common.h"
#include "ErrorContext.h"
#include "Internal/PathUtils.h"
#include "Internal/Sha256.h"

// Every record starts with a uint32 length followed by a four-character tag.
static constexpr size_t RecordTagOffset = 4;
static constexpr std::array<char, 4> ArchiveRecordTag{ 'G', 'G', 'P', 'K' };
static constexpr size_t HeaderProbeSize = 16;

static void WriteAllBytes(const std::filesystem::path& path, std::span<const uint8_t> data) {
	if (path.has_parent_path())
		create_directories(path.parent_path());

	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out)
		throw std::runtime_error("Failed to open " + path.string() + " for writing");
	out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
	if (!out)
		throw std::runtime_error("Failed to write " + path.string());
}

static bool HasTrailingSeparator(const std::string& path) {
	return !path.empty() && (path.back() == '/' || path.back() == '\\');
}

GgpkRes::ArchiveService::ArchiveService(std::shared_ptr<Backend::Library> library, std::shared_ptr<Config> config)
	: m_config(config ? std::move(config) : std::make_shared<Config>())
	, m_logger(Logger::Acquire())
	, m_facade(std::make_shared<ArchiveFacade>(std::move(library), m_config))
	, m_materializer(std::make_shared<IndexMaterializer>(m_facade, m_config))
	, m_loggerBinding(m_config->BindLogger(m_logger)) {
}

GgpkRes::ArchiveService::~ArchiveService() = default;

void GgpkRes::ArchiveService::ThrowIfNotLoaded() const {
	if (!m_facade->IsOpen())
		throw std::logic_error("No GGPK file is currently loaded");
}

void GgpkRes::ArchiveService::ReportError(const std::exception_ptr& ep, bool recoverable, const std::string& operation, const std::string& filePath) {
	const auto converted = ToGgpkException(ep, filePath, operation);
	m_logger->Log(LogCategory::ArchiveService, operation + ": " + DescribeException(converted), recoverable ? LogLevel::Warning : LogLevel::Error);
	OnError(ErrorEvent{ converted, recoverable, operation });
}

bool GgpkRes::ArchiveService::OpenArchive(const std::filesystem::path& path) {
	if (path.empty())
		throw std::invalid_argument("File path cannot be empty");
	if (!exists(path))
		throw FileOperationException(path.string(), FileOperationType::Read, "GGPK file not found: " + path.string());

	try {
		if (!m_facade->Open(path)) {
			m_logger->Format<LogLevel::Warning>(LogCategory::ArchiveService, "GGPK file failed to open: ", path.string());
			return false;
		}
	} catch (const std::exception&) {
		ReportError(std::current_exception(), false, "Opening GGPK file", path.string());
		return false;
	}

	const auto bundled = m_facade->IsBundled();
	const auto version = m_facade->Version();
	m_logger->Format(LogCategory::ArchiveService, "GGPK file opened: version ", version, ", bundled ", bundled ? "yes" : "no");
	OnLoaded(ArchiveLoadedEvent{ path, bundled, version });
	return true;
}

void GgpkRes::ArchiveService::CloseArchive() {
	m_facade->Close();
}

bool GgpkRes::ArchiveService::IsLoaded() const {
	return m_facade->IsOpen();
}

bool GgpkRes::ArchiveService::IsBundled() const {
	return m_facade->IsBundled();
}

std::optional<std::filesystem::path> GgpkRes::ArchiveService::CurrentFilePath() const {
	if (!m_facade->IsOpen())
		return std::nullopt;
	return m_facade->FilePath();
}

std::optional<uint32_t> GgpkRes::ArchiveService::Version() const {
	if (!m_facade->IsOpen())
		return std::nullopt;
	return m_facade->Version();
}

std::vector<GgpkRes::Node> GgpkRes::ArchiveService::GetChildren(const std::string& path) {
	ThrowIfNotLoaded();

	if (m_materializer->HasIndex()) {
		try {
			return m_materializer->GetNodesForPath(path);
		} catch (const std::exception&) {
			ReportError(std::current_exception(), true, "Getting index children", path);
		}
	}

	try {
		return m_facade->GetChildren(path);
	} catch (const std::exception&) {
		ReportError(std::current_exception(), false, "Getting children", path);
		return {};
	}
}

std::optional<GgpkRes::Node> GgpkRes::ArchiveService::GetNodeInfo(const std::string& path) {
	ThrowIfNotLoaded();
	if (Internal::IsRootPath(path))
		return GetRoot();

	if (m_materializer->HasIndex()) {
		try {
			if (auto node = m_materializer->FindNode(path); node && (!HasTrailingSeparator(path) || node->IsDirectory()))
				return node;
		} catch (const std::exception&) {
			ReportError(std::current_exception(), true, "Getting node from index", path);
		}
	}

	try {
		if (!HasTrailingSeparator(path)) {
			if (auto file = m_facade->FindFile(path))
				return file;
		}
		return m_facade->FindDirectory(path);
	} catch (const std::exception&) {
		ReportError(std::current_exception(), false, "Getting node info", path);
		throw;
	}
}

GgpkRes::FileProperties GgpkRes::ArchiveService::GetFileProperties(const std::string& path) {
	auto node = GetNodeInfo(path);
	if (!node)
		throw FileOperationException(Internal::NormalizePath(path), FileOperationType::GetProperties, "Path not found: " + path);

	return FileProperties{
		std::move(*node),
		nlohmann::json{
			{"GGPKVersion", m_facade->Version()},
			{"IsBundled", m_facade->IsBundled()},
		},
	};
}

bool GgpkRes::ArchiveService::Exists(const std::string& path) {
	return GetNodeInfo(path).has_value();
}

GgpkRes::Node GgpkRes::ArchiveService::GetRoot() const {
	auto root = m_facade->Root();
	if (!root)
		throw std::logic_error("No GGPK file is currently loaded");
	return std::move(*root);
}

std::vector<uint8_t> GgpkRes::ArchiveService::ReadEntry(const Node& entry) const {
	if (entry.Type() == NodeType::BundleFile)
		return m_materializer->ReadFile(entry.FullPath());
	return m_facade->ReadFile(entry);
}

std::vector<uint8_t> GgpkRes::ArchiveService::ReadFile(const std::string& path) {
	ThrowIfNotLoaded();

	try {
		if (m_materializer->HasIndex()) {
			if (const auto node = m_materializer->FindNode(path); node && node->Type() == NodeType::BundleFile)
				return ReadEntry(*node);
		}

		if (const auto file = m_facade->FindFile(path))
			return ReadEntry(*file);

		throw FileOperationException(Internal::NormalizePath(path), FileOperationType::Read, "File not found: " + path);
	} catch (const std::exception&) {
		ReportError(std::current_exception(), false, "Reading file", path);
		throw;
	}
}

void GgpkRes::ArchiveService::ExtractFile(const std::string& path, const std::filesystem::path& destination) {
	const auto data = ReadFile(path);
	try {
		WriteAllBytes(destination, data);
	} catch (const std::exception& e) {
		auto context = MakeErrorContext(std::current_exception(), ErrorCategory::FileAccess);
		context["Destination"] = destination.string();
		throw FileOperationException(Internal::NormalizePath(path), FileOperationType::Extract, std::string("Failed to extract file: ") + e.what(), std::current_exception(), std::move(context));
	}
	m_logger->Format<LogLevel::Debug>(LogCategory::ArchiveService, "Extracted ", path, " to ", destination.string());
}

void GgpkRes::ArchiveService::CollectIndexFiles(const std::string& directoryPath, std::vector<Node>& result) const {
	for (auto& node : m_materializer->GetNodesForPath(directoryPath)) {
		if (node.IsDirectory())
			CollectIndexFiles(node.FullPath(), result);
		else
			result.emplace_back(std::move(node));
	}
}

void GgpkRes::ArchiveService::CollectRecordFiles(const std::string& directoryPath, std::vector<Node>& result) const {
	for (auto& node : m_facade->GetChildren(directoryPath)) {
		if (node.IsDirectory())
			CollectRecordFiles(node.FullPath(), result);
		else
			result.emplace_back(std::move(node));
	}
}

size_t GgpkRes::ArchiveService::ExtractDirectory(const std::string& path, const std::filesystem::path& destination) {
	ThrowIfNotLoaded();
	const auto directoryPath = Internal::NormalizePath(path);

	try {
		std::vector<Node> files;
		if (m_materializer->HasIndex()) {
			if (!directoryPath.empty()) {
				if (const auto directory = m_materializer->FindNode(directoryPath); !directory || !directory->IsDirectory())
					throw FileOperationException(directoryPath, FileOperationType::Extract, "Directory not found: " + path);
			}
			CollectIndexFiles(directoryPath, files);
		} else {
			if (!m_facade->FindDirectory(directoryPath))
				throw FileOperationException(directoryPath, FileOperationType::Extract, "Directory not found: " + path);
			CollectRecordFiles(directoryPath, files);
		}

		if (files.empty()) {
			m_logger->Format(LogCategory::ArchiveService, "Nothing to extract under ", directoryPath.empty() ? "/" : directoryPath);
			return 0;
		}

		create_directories(destination);

		size_t extracted = 0;
		for (const auto& file : files) {
			try {
				const auto target = destination / std::filesystem::path(Internal::RelativePath(directoryPath, file.FullPath()));
				WriteAllBytes(target, ReadEntry(file));
				++extracted;
			} catch (const std::exception& e) {
				m_logger->Format<LogLevel::Warning>(LogCategory::ArchiveService, "Skipping ", file.FullPath(), ": ", e.what());
			}
		}

		m_logger->Format(LogCategory::ArchiveService, "Extracted ", extracted, " of ", files.size(), " files from ", directoryPath.empty() ? "/" : directoryPath);
		return extracted;
	} catch (const std::exception&) {
		ReportError(std::current_exception(), false, "Extracting directory", path);
		throw;
	}
}

GgpkRes::ValidationReport GgpkRes::ArchiveService::ValidateArchiveFile(const std::filesystem::path& path) const {
	ValidationReport report;
	report.Details["FilePath"] = path.string();

	const auto fail = [this, &report](const char* corruptionType, std::string error) {
		report.Valid = false;
		report.CorruptionType = corruptionType;
		report.Error = std::move(error);
		report.Details["CorruptionType"] = report.CorruptionType;
		report.Details["ValidationError"] = report.Error;
		m_logger->Log(LogCategory::ArchiveService, "Archive validation failed: " + report.Error, LogLevel::Warning, report.Details);
		return report;
	};

	try {
		if (!exists(path))
			return fail("FileNotFound", "File does not exist");

		const auto size = file_size(path);
		const auto minimumSize = m_config->MinimumArchiveSize.Value();
		report.Details["FileSize"] = size;
		if (size < minimumSize) {
			report.Details["MinimumExpectedSize"] = minimumSize;
			return fail("InvalidFileSize", "File too small to be valid GGPK");
		}

		std::array<char, HeaderProbeSize> header{};
		std::ifstream in(path, std::ios::binary);
		if (!in)
			return fail("HeaderReadFailure", "Cannot open file for reading");
		in.read(header.data(), static_cast<std::streamsize>(header.size()));
		if (const auto read = static_cast<size_t>(in.gcount()); read < header.size()) {
			report.Details["BytesRead"] = read;
			report.Details["ExpectedBytes"] = header.size();
			return fail("HeaderReadFailure", "Cannot read GGPK header");
		}

		const auto tag = std::string(header.data() + RecordTagOffset, ArchiveRecordTag.size());
		if (!std::equal(ArchiveRecordTag.begin(), ArchiveRecordTag.end(), header.begin() + RecordTagOffset)) {
			report.Details["ExpectedSignature"] = std::string(ArchiveRecordTag.begin(), ArchiveRecordTag.end());
			report.Details["HeaderBytes"] = Internal::ToHexString(std::span(reinterpret_cast<const uint8_t*>(header.data()), header.size()));
			return fail("InvalidSignature", "Invalid GGPK signature");
		}

		report.Valid = true;
		report.Details["HeaderSignature"] = tag;
		report.Details["ValidationSuccessful"] = true;
		return report;
	} catch (const std::exception& e) {
		report.Details["ExceptionType"] = ExceptionTypeName(std::current_exception());
		return fail("ValidationException", e.what());
	}
}

std::exception_ptr GgpkRes::ArchiveService::ToGgpkException(const std::exception_ptr& ep, const std::string& filePath, const std::string& operation) const {
	if (!ep)
		return nullptr;

	const auto loaded = m_facade->IsOpen();
	auto context = nlohmann::json{
		{"OriginalExceptionType", ExceptionTypeName(ep)},
		{"OriginalMessage", DescribeException(ep)},
		{"Context", operation},
		{"FilePath", filePath.empty() ? "Unknown" : filePath},
		{"ThreadId", CurrentThreadId()},
		{"Timestamp", FormatUtcTimestamp(std::chrono::system_clock::now())},
		{"IsGGPKLoaded", loaded},
		{"IsBundled", loaded && m_facade->IsBundled()},
	};
	if (loaded)
		context["GGPKVersion"] = m_facade->Version();
	else
		context["GGPKVersion"] = "Not loaded";
	if (!filePath.empty())
		AddFileSystemContext(context, filePath);

	const auto path = filePath.empty() ? std::string("Unknown") : filePath;
	const auto message = DescribeException(ep);

	try {
		std::rethrow_exception(ep);
	} catch (const GgpkException&) {
		return ep;
	} catch (const std::filesystem::filesystem_error& e) {
		if (e.code() == std::errc::no_such_file_or_directory)
			return std::make_exception_ptr(FileOperationException(path, FileOperationType::Read, "GGPK file not found: " + path, ep, std::move(context)));
		if (e.code() == std::errc::permission_denied || e.code() == std::errc::operation_not_permitted)
			return std::make_exception_ptr(FileOperationException(path, FileOperationType::Read, "Access denied to GGPK file: " + path + ". Check file permissions.", ep, std::move(context)));
		return std::make_exception_ptr(GgpkException("IO error while processing GGPK file: " + message, std::move(context), ep));
	} catch (const std::bad_alloc&) {
		return std::make_exception_ptr(GgpkException("Insufficient memory to process GGPK file. Try closing other applications or working with smaller files.", std::move(context), ep));
	} catch (const std::ios_base::failure&) {
		if (Internal::ContainsIgnoreCase(message, "corrupt") || Internal::ContainsIgnoreCase(message, "invalid"))
			return std::make_exception_ptr(CorruptDataException("GGPK file corruption detected: " + message, -1, std::move(context), ep));
		return std::make_exception_ptr(GgpkException("IO error while processing GGPK file: " + message, std::move(context), ep));
	} catch (const std::exception&) {
		if (Internal::ContainsIgnoreCase(message, "bundle") || Internal::ContainsIgnoreCase(message, "oo2core") || Internal::ContainsIgnoreCase(message, "decompression"))
			return std::make_exception_ptr(BundleDecompressionException(std::filesystem::path(path).filename().string(), "Bundle decompression failed: " + message, ep, std::move(context)));
		if (Internal::ContainsIgnoreCase(message, "corrupt") || Internal::ContainsIgnoreCase(message, "invalid data"))
			return std::make_exception_ptr(CorruptDataException("Invalid data in GGPK file: " + message, -1, std::move(context), ep));
		if (Internal::ContainsIgnoreCase(message, "thread"))
			return std::make_exception_ptr(GgpkException("Threading error in GGPK operation: " + message, std::move(context), ep));
	} catch (...) {
		// non-standard exception types fall through to the generic wrapper below
	}

	return std::make_exception_ptr(GgpkException("Unexpected error in " + operation + ": " + message, std::move(context), ep));
}
