// Placeholder expansion for protocol argument templates.
//
//   {filePath}      standalone: one argument per file; inline: first file only
//   {fileListPath}  path of a temp file listing one file per line
//                   (sexyz style "@{fileListPath}")
//   {targetDir}     upload directory, always with a trailing separator
//
// When neither {filePath} nor {fileListPath} is used, the files are appended
// after the template.
#pragma once
#include <string>
#include <vector>

namespace termxfer {

struct ExpandedArgs {
    std::vector<std::string> args;
    // Non-empty when a file list was written; the caller deletes it once the
    // external process has exited.
    std::string fileListPath;
};

ExpandedArgs expandArgs(const std::vector<std::string> &tmpl,
                        const std::vector<std::string> &filePaths,
                        const std::string &targetDir);

// Writes one path per line into a new file in the temp directory.
// Returns an empty string on failure.
std::string writeFileList(const std::vector<std::string> &paths);

} // namespace termxfer
