#ifndef _GGPKRES_ERRORCONTEXT_H_
#define _GGPKRES_ERRORCONTEXT_H_

#include <chrono>
#include <exception>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "Common.h"

namespace GgpkRes {
	/// \brief Classifies a failure raised while opening an archive.
	/// Typed failures are recognized first; anything else falls back to inspecting the message text.
	/// The result only drives the suggested remedy shown to the user.
	[[nodiscard]] ErrorCategory ClassifyOpenFailure(const std::exception_ptr& ep);

	/// \brief Classifies a failure raised while reading an entry.
	[[nodiscard]] ErrorCategory ClassifyReadFailure(const std::exception_ptr& ep);

	[[nodiscard]] std::string DescribeException(const std::exception_ptr& ep);
	[[nodiscard]] std::string ExceptionTypeName(const std::exception_ptr& ep);

	[[nodiscard]] std::string CurrentThreadId();
	[[nodiscard]] std::string FormatUtcTimestamp(std::chrono::system_clock::time_point tp);

	/// \brief Builds the common diagnostic fields attached to every wrapped failure.
	[[nodiscard]] nlohmann::json MakeErrorContext(const std::exception_ptr& ep, ErrorCategory category);

	/// \brief Adds existence, size and modification time of a file on disk, if they can be read.
	void AddFileSystemContext(nlohmann::json& context, const std::filesystem::path& path);
}

#endif
