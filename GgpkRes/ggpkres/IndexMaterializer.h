#ifndef _GGPKRES_INDEXMATERIALIZER_H_
#define _GGPKRES_INDEXMATERIALIZER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ArchiveFacade.h"
#include "Config.h"
#include "Logger.h"
#include "Node.h"

namespace GgpkRes {
	/// \brief Materializes the bundle index of an archive one directory at a time.
	/// Every failure from the index layer surfaces as BundleDecompressionException naming the index file.
	class IndexMaterializer {
		const std::shared_ptr<ArchiveFacade> m_facade;
		const std::shared_ptr<Config> m_config;
		const std::shared_ptr<Logger> m_logger;

	public:
		explicit IndexMaterializer(std::shared_ptr<ArchiveFacade> facade, std::shared_ptr<Config> config = nullptr);

		[[nodiscard]] bool HasIndex() const;

		/// \brief Converts the children of the index root.
		/// \throws std::logic_error if the open archive has no index.
		[[nodiscard]] std::vector<Node> DecompressIndex() const;

		/// \returns Children of the directory at path, [the file] if path names a file,
		/// or an empty vector if path is absent or no index is available.
		[[nodiscard]] std::vector<Node> GetNodesForPath(const std::string& path) const;

		/// \returns Node at path inside the index, or std::nullopt if absent or no index is available.
		[[nodiscard]] std::optional<Node> FindNode(const std::string& path) const;

		/// \throws BundleDecompressionException if the entry could not be read or does not exist.
		[[nodiscard]] std::vector<uint8_t> ReadFile(const std::string& path) const;
	};
}

#endif
