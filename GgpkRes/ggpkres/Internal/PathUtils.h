#ifndef _GGPKRES_INTERNAL_PATHUTILS_H_
#define _GGPKRES_INTERNAL_PATHUTILS_H_

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace GgpkRes::Internal {
	[[nodiscard]] inline bool EqualsIgnoreCase(std::string_view l, std::string_view r) {
		if (l.size() != r.size())
			return false;
		for (size_t i = 0; i < l.size(); ++i) {
			if (std::tolower(static_cast<uint8_t>(l[i])) != std::tolower(static_cast<uint8_t>(r[i])))
				return false;
		}
		return true;
	}

	[[nodiscard]] inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
		if (needle.empty())
			return true;
		const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char l, char r) {
			return std::tolower(static_cast<uint8_t>(l)) == std::tolower(static_cast<uint8_t>(r));
		});
		return it != haystack.end();
	}

	// Empty components are dropped, so "/a//b/" yields {"a", "b"}. Backslashes count as separators.
	[[nodiscard]] inline std::vector<std::string> SplitPath(std::string_view path) {
		std::vector<std::string> result;
		size_t begin = 0;
		for (size_t i = 0; i <= path.size(); ++i) {
			if (i == path.size() || path[i] == '/' || path[i] == '\\') {
				if (i > begin)
					result.emplace_back(path.substr(begin, i - begin));
				begin = i + 1;
			}
		}
		return result;
	}

	[[nodiscard]] inline bool IsRootPath(std::string_view path) {
		return std::all_of(path.begin(), path.end(), [](char c) { return c == '/' || c == '\\'; });
	}

	/// \brief Converts any accepted spelling of an archive path to the canonical form:
	/// forward slashes, no leading or trailing separator, root as "".
	[[nodiscard]] inline std::string NormalizePath(std::string_view path) {
		std::string result;
		for (const auto& part : SplitPath(path)) {
			if (!result.empty())
				result += '/';
			result += part;
		}
		return result;
	}

	[[nodiscard]] inline std::string JoinPath(std::string_view parent, std::string_view name) {
		auto result = NormalizePath(parent);
		if (!result.empty())
			result += '/';
		result += name;
		return result;
	}

	/// \brief Path of `fullPath` relative to `directory`; returns fullPath unchanged when it is not under directory.
	[[nodiscard]] inline std::string RelativePath(std::string_view directory, std::string_view fullPath) {
		const auto dir = NormalizePath(directory);
		const auto full = NormalizePath(fullPath);
		if (dir.empty())
			return full;
		if (full.size() > dir.size() && full[dir.size()] == '/' && EqualsIgnoreCase(std::string_view(full).substr(0, dir.size()), dir))
			return full.substr(dir.size() + 1);
		return full;
	}
}

#endif
