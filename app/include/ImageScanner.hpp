#ifndef IMAGE_SCANNER_HPP
#define IMAGE_SCANNER_HPP

#include <QString>
#include <QStringList>
#include <vector>

// One scanned image. relative_path is the '/'-separated directory under the
// scan root ("" for files directly in the root).
struct ImageRecord {
    QString filename;
    QString relative_path;
    QString full_path;

    // "sub/dir/name.png", or just the name for root files
    QString display_path() const;
};

inline bool operator==(const ImageRecord& a, const ImageRecord& b) {
    return a.filename == b.filename && a.relative_path == b.relative_path &&
           a.full_path == b.full_path;
}

struct ScanResult {
    std::vector<ImageRecord> records;   // sorted by full_path
    QStringList skipped_directories;    // unreadable subtrees left out of a recursive walk
    QString error;                      // set when the root itself could not be listed

    bool success() const { return error.isEmpty(); }
};

class ImageScanner {
public:
    // Folder the session moves rejected images into; never scanned.
    static constexpr const char* kRejectsFolderName = "_REJECTS";

    static ScanResult scan(const QString& root_dir, bool recursive);

    static bool is_supported_image(const QString& filename);
    static QStringList supported_extensions();

private:
    static void scan_directory(const QString& dir_path, const QString& relative_path,
                               bool recursive, ScanResult& result);
};

#endif // IMAGE_SCANNER_HPP
