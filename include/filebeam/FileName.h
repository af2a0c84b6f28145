#pragma once

#include <string>

namespace FileBeam {

// Reduces a peer-provided name to a single safe local file name.
// Keeps only the last path component ('/' and '\\' both separate components;
// empty and "." components are skipped). Returns FALLBACK_FILE_NAME when no
// component remains or the last one is "..". Never fails.
std::string sanitizeFileName(const std::string& rawName);

// Returns true if the name is usable as-is: non-empty, not "." or "..",
// and free of path separators and NUL bytes.
bool isSafeFileName(const std::string& name);

}  // namespace FileBeam
