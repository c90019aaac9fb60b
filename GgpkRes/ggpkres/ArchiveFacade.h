#ifndef _GGPKRES_ARCHIVEFACADE_H_
#define _GGPKRES_ARCHIVEFACADE_H_

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Backend.h"
#include "Config.h"
#include "Logger.h"
#include "Node.h"
#include "TreeSource.h"
#include "Internal/ListenerManager.h"

namespace GgpkRes {
	struct ArchiveOpenedEvent {
		std::filesystem::path FilePath;
		bool IsBundled;
		bool HasIndex;
		uint32_t Version;
	};

	/// \brief Owns one archive handle from a Backend::Library and serializes every access to it.
	///
	/// All public operations hold the same mutex for their whole duration, including calls into the library,
	/// so no two library calls made through one facade ever overlap. Listeners are fired after the mutex is released.
	class ArchiveFacade {
		const std::shared_ptr<Backend::Library> m_library;
		const std::shared_ptr<Config> m_config;
		const std::shared_ptr<Logger> m_logger;

		mutable std::mutex m_mtx;
		std::unique_ptr<Backend::Archive> m_archive;
		std::unique_ptr<TreeSource> m_records;
		std::unique_ptr<TreeSource> m_index;
		std::optional<Node> m_root;
		std::filesystem::path m_filePath;
		bool m_bundled = false;
		uint32_t m_version = 0;

		// Requires m_mtx. Returns the path of the archive that was open, if any.
		std::optional<std::filesystem::path> CloseLocked();

		// Requires m_mtx.
		void ThrowIfNotOpen() const;

		[[nodiscard]] std::vector<Node> GetChildrenLocked(const std::string& path) const;
		[[nodiscard]] std::vector<uint8_t> ReadLocked(const TreeSource& source, const std::string& path) const;

	public:
		explicit ArchiveFacade(std::shared_ptr<Backend::Library> library, std::shared_ptr<Config> config = nullptr);
		ArchiveFacade(const ArchiveFacade&) = delete;
		ArchiveFacade(ArchiveFacade&&) = delete;
		ArchiveFacade& operator=(const ArchiveFacade&) = delete;
		ArchiveFacade& operator=(ArchiveFacade&&) = delete;
		~ArchiveFacade();

		/// \brief Opens path, closing whatever was open before.
		/// Tries the bundled layout first and falls back to a plain archive when the library reports that the index is absent.
		/// \returns false if the library produced no archive without reporting why.
		/// \throws ArchiveOpenException if the archive could not be opened in either layout. The facade is closed afterwards.
		bool Open(const std::filesystem::path& path);

		/// \brief Releases the archive handle. Does nothing if no archive is open.
		void Close();

		[[nodiscard]] bool IsOpen() const;
		[[nodiscard]] bool IsBundled() const;
		[[nodiscard]] bool HasIndex() const;
		[[nodiscard]] uint32_t Version() const;
		[[nodiscard]] std::filesystem::path FilePath() const;
		[[nodiscard]] std::optional<Node> Root() const;

		/// \brief Lists the directory records under a directory.
		/// \throws std::logic_error if no archive is open.
		[[nodiscard]] std::vector<Node> GetChildren(const Node& directory) const;
		[[nodiscard]] std::vector<Node> GetChildren(const std::string& directoryPath) const;

		/// \brief Reads an entry in full. Bundle files are read through the index, everything else through the records.
		/// \throws std::logic_error if no archive is open.
		/// \throws FileOperationException if the entry could not be read or does not exist.
		[[nodiscard]] std::vector<uint8_t> ReadFile(const Node& file) const;
		[[nodiscard]] std::vector<uint8_t> ReadFile(const std::string& filePath) const;

		[[nodiscard]] std::optional<Node> FindFile(const std::string& path) const;
		[[nodiscard]] std::optional<Node> FindDirectory(const std::string& path) const;

		/// \brief Runs fn with the index tree of the open archive while holding the facade mutex.
		/// fn receives nullptr if no archive is open or the archive has no index.
		template<typename Fn>
		auto WithIndex(Fn&& fn) const {
			std::lock_guard lock(m_mtx);
			return fn(static_cast<const TreeSource*>(m_index.get()));
		}

		Internal::ListenerManager<ArchiveFacade, const ArchiveOpenedEvent&> OnOpened;
		Internal::ListenerManager<ArchiveFacade, const std::filesystem::path&> OnClosed;
	};
}

#endif
