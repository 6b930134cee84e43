#pragma once
/// @file FileIo.hpp
/// @brief Whole-file read and crash-safe replace of a file's content

#include <string>
#include <system_error>

namespace FwFile::util {

/// @brief Reads the complete content of path into out
/// @return false with ec from errno on any OS failure
bool readWholeFile(const std::string& path, std::string& out, std::error_code& ec);

/// @brief Replaces path with data without ever writing into path itself
/// @details Steps: refuse symlink targets, mkstemp beside the target, write all
///          bytes, fsync, copy the target's permission bits, rename over the
///          target, fsync the directory. The temporary file is unlinked on every
///          failure before the rename, so the original content stays intact.
///          A failed directory fsync after the rename only logs a warning: the
///          file is already replaced and the call reports success.
/// @return false with ec only when path still holds its previous content
/// @note No lock is taken. Callers must not run two writers on one path.
bool atomicWriteFile(const std::string& path, const std::string& data, std::error_code& ec);

} // namespace FwFile::util
