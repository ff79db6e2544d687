#ifndef IMAGE_LOADER_HPP
#define IMAGE_LOADER_HPP

#include <QImage>
#include <QSize>
#include <QString>

enum class LoadStatus {
    Ok,
    NotFound,
    DecodeFailed
};

struct LoadResult {
    LoadStatus status = LoadStatus::DecodeFailed;
    QImage image;
    QString error_message;

    bool ok() const { return status == LoadStatus::Ok; }
};

class ImageLoader {
public:
    // Decodes path, downscaled to fit bounds with aspect ratio kept.
    // An invalid or empty bounds loads at full size. Never upscales.
    static LoadResult load(const QString& path, const QSize& bounds = QSize());

    static QSize fitted_size(const QSize& image_size, const QSize& bounds);
};

#endif // IMAGE_LOADER_HPP
