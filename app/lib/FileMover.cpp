#include "FileMover.hpp"
#include "AppLogger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>

QString FileMover::unique_destination_path(const QString& dir, const QString& filename) {
    const QDir dest_dir(dir);
    QString dest_path = dest_dir.filePath(filename);
    if (!QFileInfo::exists(dest_path) && !QFileInfo(dest_path).isSymLink()) {
        return dest_path;
    }

    // Split at the last dot so "photo.final.png" becomes photo.final_1.png
    const int dot = filename.lastIndexOf('.');
    const QString base = dot > 0 ? filename.left(dot) : filename;
    const QString ext = dot > 0 ? filename.mid(dot + 1) : QString();

    for (int counter = 1; counter <= kMaxRenameAttempts; ++counter) {
        const QString candidate = ext.isEmpty()
            ? QString("%1_%2").arg(base, QString::number(counter))
            : QString("%1_%2.%3").arg(base, QString::number(counter), ext);
        dest_path = dest_dir.filePath(candidate);
        if (!QFileInfo::exists(dest_path) && !QFileInfo(dest_path).isSymLink()) {
            return dest_path;
        }
    }
    return QString();
}

bool FileMover::move_file(const QString& source, const QString& dest, QString& error) {
    if (QFile::rename(source, dest)) {
        return true;
    }

    // Rename fails across filesystems; fall back to copy + delete
    QFile source_file(source);
    if (!source_file.copy(dest)) {
        error = QString("Failed to move %1 to %2: %3").arg(source, dest, source_file.errorString());
        return false;
    }
    if (!QFile::remove(source)) {
        // Keep a single copy: drop the one we just made
        QFile::remove(dest);
        error = QString("Copied %1 but could not remove the original").arg(source);
        return false;
    }
    return true;
}

MoveResult FileMover::move_into(const ImageRecord& record, const QString& destination_root) {
    MoveResult result;

    if (!QFileInfo::exists(record.full_path)) {
        result.error_message = QString("Source file no longer exists: %1").arg(record.full_path);
        LOG_ERROR("Mover", result.error_message);
        return result;
    }

    QString target_dir = destination_root;
    if (!record.relative_path.isEmpty()) {
        target_dir = QDir(destination_root).filePath(record.relative_path);
    }
    if (!QDir().mkpath(target_dir)) {
        result.error_message = QString("Failed to create folder: %1").arg(target_dir);
        LOG_ERROR("Mover", result.error_message);
        return result;
    }

    const QString dest_path = unique_destination_path(target_dir, record.filename);
    if (dest_path.isEmpty()) {
        result.error_message = QString("Failed to generate unique name for: %1").arg(record.full_path);
        LOG_ERROR("Mover", result.error_message);
        return result;
    }

    QString error;
    if (!move_file(record.full_path, dest_path, error)) {
        result.error_message = error;
        LOG_ERROR("Mover", error);
        return result;
    }

    result.success = true;
    result.destination_path = dest_path;
    LOG_INFO("Mover", QString("Moved %1 to %2").arg(record.display_path(), destination_root));
    return result;
}
