#ifndef _GGPKRES_ARCHIVESERVICE_H_
#define _GGPKRES_ARCHIVESERVICE_H_

#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ArchiveFacade.h"
#include "Backend.h"
#include "Config.h"
#include "IndexMaterializer.h"
#include "Logger.h"
#include "Node.h"
#include "Internal/CallOnDestruction.h"
#include "Internal/ListenerManager.h"

namespace GgpkRes {
	struct ArchiveLoadedEvent {
		std::filesystem::path FilePath;
		bool IsBundled;
		uint32_t Version;
	};

	struct ErrorEvent {
		// Always holds a GgpkException or one of its subclasses.
		std::exception_ptr Error;
		bool Recoverable;
		std::string Operation;
	};

	struct FileProperties {
		Node Entry;
		nlohmann::json Metadata;
	};

	struct ValidationReport {
		bool Valid = false;

		// One of FileNotFound, InvalidFileSize, HeaderReadFailure, InvalidSignature, ValidationException; empty if valid.
		std::string CorruptionType;
		std::string Error;
		nlohmann::json Details = nlohmann::json::object();
	};

	/// \brief Browsing, reading and extraction over one archive at a time.
	/// Prefers the bundle index where the archive has one and falls back to the directory records.
	class ArchiveService {
		const std::shared_ptr<Config> m_config;
		const std::shared_ptr<Logger> m_logger;
		const std::shared_ptr<ArchiveFacade> m_facade;
		const std::shared_ptr<IndexMaterializer> m_materializer;
		Internal::CallOnDestruction::Multiple m_loggerBinding;

		void ThrowIfNotLoaded() const;
		void ReportError(const std::exception_ptr& ep, bool recoverable, const std::string& operation, const std::string& filePath);

		[[nodiscard]] std::vector<uint8_t> ReadEntry(const Node& entry) const;
		void CollectIndexFiles(const std::string& directoryPath, std::vector<Node>& result) const;
		void CollectRecordFiles(const std::string& directoryPath, std::vector<Node>& result) const;

	public:
		explicit ArchiveService(std::shared_ptr<Backend::Library> library, std::shared_ptr<Config> config = nullptr);
		ArchiveService(const ArchiveService&) = delete;
		ArchiveService& operator=(const ArchiveService&) = delete;
		~ArchiveService();

		/// \brief Opens an archive, replacing the current one.
		/// Failures to open are reported through OnError and produce false.
		/// \throws std::invalid_argument if path is empty.
		/// \throws FileOperationException if path does not exist.
		bool OpenArchive(const std::filesystem::path& path);
		void CloseArchive();

		[[nodiscard]] bool IsLoaded() const;
		[[nodiscard]] bool IsBundled() const;
		[[nodiscard]] std::optional<std::filesystem::path> CurrentFilePath() const;
		[[nodiscard]] std::optional<uint32_t> Version() const;

		/// \brief Lists a directory. Errors are reported through OnError and yield an empty vector.
		/// \throws std::logic_error if no archive is loaded.
		[[nodiscard]] std::vector<Node> GetChildren(const std::string& path);

		/// \returns Node at path, or std::nullopt. A trailing separator restricts the lookup to directories.
		[[nodiscard]] std::optional<Node> GetNodeInfo(const std::string& path);

		/// \throws FileOperationException if path does not exist.
		[[nodiscard]] FileProperties GetFileProperties(const std::string& path);

		[[nodiscard]] bool Exists(const std::string& path);
		[[nodiscard]] Node GetRoot() const;

		/// \throws FileOperationException, BundleDecompressionException
		[[nodiscard]] std::vector<uint8_t> ReadFile(const std::string& path);

		/// \brief Writes one entry to destination, creating parent directories as needed.
		void ExtractFile(const std::string& path, const std::filesystem::path& destination);

		/// \brief Writes every file under a directory to destination, keeping the layout relative to that directory.
		/// Files that fail are logged and skipped.
		/// \returns Number of files written.
		size_t ExtractDirectory(const std::string& path, const std::filesystem::path& destination);

		/// \brief Cheap checks run before handing a file to the library.
		[[nodiscard]] ValidationReport ValidateArchiveFile(const std::filesystem::path& path) const;

		/// \brief Maps any failure onto the GgpkException family, attaching archive state to its context.
		/// A GgpkException is returned unchanged.
		[[nodiscard]] std::exception_ptr ToGgpkException(const std::exception_ptr& ep, const std::string& filePath, const std::string& operation) const;

		[[nodiscard]] const std::shared_ptr<ArchiveFacade>& Facade() const { return m_facade; }
		[[nodiscard]] const std::shared_ptr<IndexMaterializer>& Materializer() const { return m_materializer; }

		Internal::ListenerManager<ArchiveService, const ArchiveLoadedEvent&> OnLoaded;
		Internal::ListenerManager<ArchiveService, const ErrorEvent&> OnError;
	};
}

#endif
