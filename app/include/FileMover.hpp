#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include "ImageScanner.hpp"
#include <QString>

struct MoveResult {
    bool success = false;
    QString destination_path;   // where the file ended up
    QString error_message;      // set when success is false
};

// Moves scanned images into a destination root, mirroring their
// relative_path and never overwriting an existing file.
class FileMover {
public:
    static constexpr int kMaxRenameAttempts = 10000;

    static MoveResult move_into(const ImageRecord& record, const QString& destination_root);

    // First free path for filename inside dir: name.ext, name_1.ext, name_2.ext, ...
    // Returns an empty string when kMaxRenameAttempts is exhausted.
    static QString unique_destination_path(const QString& dir, const QString& filename);

private:
    static bool move_file(const QString& source, const QString& dest, QString& error);
};

#endif // FILE_MOVER_HPP
