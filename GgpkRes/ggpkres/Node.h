#ifndef _GGPKRES_NODE_H_
#define _GGPKRES_NODE_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace GgpkRes {
	enum class NodeType {
		Directory,
		File,
		BundleFile,
	};

	enum class CompressionType {
		None,
		Oodle,
		Other,
	};

	[[nodiscard]] const char* NodeTypeName(NodeType type);
	[[nodiscard]] const char* CompressionTypeName(CompressionType type);

	struct CompressionDescriptor {
		CompressionType Type = CompressionType::None;
		uint64_t CompressedSize = 0;
		uint64_t UncompressedSize = 0;
		std::string AdditionalInfo;

		[[nodiscard]] double Ratio() const {
			return UncompressedSize > 0 ? static_cast<double>(CompressedSize) / static_cast<double>(UncompressedSize) : 0.;
		}
	};

	/// \brief Immutable snapshot of an archive entry.
	/// Holds no reference into the archive it came from; safe to keep after the archive is closed.
	class Node {
		std::string m_name;
		std::string m_fullPath;
		NodeType m_type = NodeType::Directory;
		uint64_t m_size = 0;
		bool m_hasChildren = false;
		std::optional<std::chrono::system_clock::time_point> m_modifiedTime;
		std::optional<std::string> m_hash;
		std::optional<int64_t> m_offset;
		std::optional<CompressionDescriptor> m_compression;

		Node() = default;

	public:
		static Node Directory(std::string name, std::string fullPath, bool hasChildren);
		static Node File(std::string name, std::string fullPath, uint64_t size);
		static Node BundleFile(std::string name, std::string fullPath, uint64_t size, std::optional<CompressionDescriptor> compression);

		Node& WithHash(std::optional<std::string> hash);
		Node& WithOffset(std::optional<int64_t> offset);
		Node& WithModifiedTime(std::optional<std::chrono::system_clock::time_point> modifiedTime);

		[[nodiscard]] const std::string& Name() const { return m_name; }
		[[nodiscard]] const std::string& FullPath() const { return m_fullPath; }
		[[nodiscard]] NodeType Type() const { return m_type; }
		[[nodiscard]] uint64_t Size() const { return m_size; }
		[[nodiscard]] bool HasChildren() const { return m_hasChildren; }
		[[nodiscard]] const std::optional<std::chrono::system_clock::time_point>& ModifiedTime() const { return m_modifiedTime; }
		[[nodiscard]] const std::optional<std::string>& Hash() const { return m_hash; }
		[[nodiscard]] const std::optional<int64_t>& Offset() const { return m_offset; }
		[[nodiscard]] const std::optional<CompressionDescriptor>& Compression() const { return m_compression; }

		[[nodiscard]] bool IsDirectory() const { return m_type == NodeType::Directory; }
		[[nodiscard]] bool IsRoot() const { return m_type == NodeType::Directory && m_fullPath.empty(); }
	};

	void to_json(nlohmann::json& j, const CompressionDescriptor& value);
	void to_json(nlohmann::json& j, const Node& value);
}

#endif
