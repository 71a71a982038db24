#include "termxfer/ArgExpander.hpp"
#include "termxfer/Logging.hpp"

#include <QDir>
#include <QTemporaryFile>

namespace termxfer {

namespace {

const std::string kFilePath = "{filePath}";
const std::string kFileListPath = "{fileListPath}";
const std::string kTargetDir = "{targetDir}";

void replaceAll(std::string &s, const std::string &from, const std::string &to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool contains(const std::string &s, const std::string &needle) {
    return s.find(needle) != std::string::npos;
}

} // namespace

std::string writeFileList(const std::vector<std::string> &paths) {
    QTemporaryFile f(QDir::tempPath() +
                     QStringLiteral("/termxfer-filelist-XXXXXX.txt"));
    f.setAutoRemove(false);
    if (!f.open()) {
        qCWarning(txRegistry) << "failed to create file list:" << f.errorString();
        return {};
    }
    for (const auto &p : paths) {
        const QByteArray line = QByteArray::fromStdString(p) + '\n';
        if (f.write(line) != line.size()) {
            qCWarning(txRegistry) << "failed to write file list:"
                                  << f.errorString();
            f.close();
            f.remove();
            return {};
        }
    }
    const std::string name = f.fileName().toStdString();
    f.close();
    return name;
}

ExpandedArgs expandArgs(const std::vector<std::string> &tmpl,
                        const std::vector<std::string> &filePaths,
                        const std::string &targetDir) {
    ExpandedArgs out;
    bool filePathUsed = false;

    // Some drivers (sexyz) concatenate directory + file name without adding
    // a separator, so the separator is forced on.
    std::string dir = targetDir;
    if (!dir.empty() && dir.back() != '/')
        dir += '/';

    auto ensureList = [&]() {
        if (out.fileListPath.empty() && !filePaths.empty())
            out.fileListPath = writeFileList(filePaths);
    };

    for (const auto &arg : tmpl) {
        if (arg == kFilePath) {
            out.args.insert(out.args.end(), filePaths.begin(), filePaths.end());
            filePathUsed = true;
        } else if (arg == kTargetDir) {
            out.args.push_back(dir);
        } else if (arg == kFileListPath) {
            ensureList();
            out.args.push_back(out.fileListPath);
            filePathUsed = true;
        } else {
            std::string a = arg;
            if (!filePaths.empty() && contains(a, kFileListPath)) {
                ensureList();
                replaceAll(a, kFileListPath, out.fileListPath);
                filePathUsed = true;
            }
            if (!filePaths.empty() && contains(a, kFilePath)) {
                replaceAll(a, kFilePath, filePaths.front());
                filePathUsed = true;
            }
            replaceAll(a, kTargetDir, dir);
            out.args.push_back(std::move(a));
        }
    }

    if (!filePathUsed && !filePaths.empty())
        out.args.insert(out.args.end(), filePaths.begin(), filePaths.end());
    return out;
}

} // namespace termxfer
