#include "ImageScanner.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QFileInfo>
#include <algorithm>

namespace {

const QStringList kImageExtensions = {"png", "jpg", "jpeg", "bmp", "webp"};

} // namespace

QString ImageRecord::display_path() const {
    return relative_path.isEmpty() ? filename : relative_path + "/" + filename;
}

bool ImageScanner::is_supported_image(const QString& filename) {
    const int dot = filename.lastIndexOf('.');
    if (dot < 0) return false;
    return kImageExtensions.contains(filename.mid(dot + 1).toLower());
}

QStringList ImageScanner::supported_extensions() {
    return kImageExtensions;
}

ScanResult ImageScanner::scan(const QString& root_dir, bool recursive) {
    ScanResult result;

    QFileInfo root_info(root_dir);
    if (root_dir.isEmpty() || !root_info.exists() || !root_info.isDir()) {
        result.error = QString("Source folder not found: %1").arg(root_dir);
        LOG_ERROR("Scanner", result.error);
        return result;
    }
    if (!root_info.isReadable()) {
        result.error = QString("Source folder is not readable: %1").arg(root_dir);
        LOG_ERROR("Scanner", result.error);
        return result;
    }

    scan_directory(root_info.absoluteFilePath(), QString(), recursive, result);

    std::sort(result.records.begin(), result.records.end(),
              [](const ImageRecord& a, const ImageRecord& b) {
                  return a.full_path < b.full_path;
              });

    LOG_INFO("Scanner", QString("Found %1 image(s) in %2%3")
             .arg(result.records.size())
             .arg(root_dir, recursive ? QString(" (recursive)") : QString()));
    return result;
}

void ImageScanner::scan_directory(const QString& dir_path, const QString& relative_path,
                                  bool recursive, ScanResult& result) {
    QDir dir(dir_path);

    // Symlinked files are followed, like any other file
    const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                                                  QDir::Name);
    for (const QFileInfo& info : files) {
        if (!is_supported_image(info.fileName())) continue;

        ImageRecord record;
        record.filename = info.fileName();
        record.relative_path = relative_path;
        record.full_path = info.absoluteFilePath();
        result.records.push_back(record);
    }

    if (!recursive) return;

    const QFileInfoList subdirs = dir.entryInfoList(QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot,
                                                    QDir::Name);
    for (const QFileInfo& info : subdirs) {
        // Linked directories can form cycles
        if (info.isSymLink()) {
            LOG_DEBUG("Scanner", QString("Not following linked directory %1").arg(info.filePath()));
            continue;
        }
        if (relative_path.isEmpty() && info.fileName() == kRejectsFolderName) {
            continue;
        }
        if (!info.isReadable() || !info.isExecutable()) {
            LOG_WARN("Scanner", QString("Permission denied: %1").arg(info.absoluteFilePath()));
            result.skipped_directories << info.absoluteFilePath();
            continue;
        }

        const QString child_relative = relative_path.isEmpty()
            ? info.fileName()
            : relative_path + "/" + info.fileName();
        scan_directory(info.absoluteFilePath(), child_relative, recursive, result);
    }
}
