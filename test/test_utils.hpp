#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>

// Writes content to path, creating parent folders as needed
inline bool write_file(const QString& path, const QByteArray& content = "data") {
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) return false;
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;
    return file.write(content) == content.size();
}

inline QByteArray read_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QByteArray();
    return file.readAll();
}

#endif // TEST_UTILS_HPP
