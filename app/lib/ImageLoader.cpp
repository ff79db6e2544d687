#include "ImageLoader.hpp"
#include "AppLogger.hpp"
#include <QFileInfo>
#include <QImageReader>

QSize ImageLoader::fitted_size(const QSize& image_size, const QSize& bounds) {
    if (!bounds.isValid() || bounds.isEmpty() || !image_size.isValid()) {
        return image_size;
    }
    if (image_size.width() <= bounds.width() && image_size.height() <= bounds.height()) {
        return image_size;
    }
    return image_size.scaled(bounds, Qt::KeepAspectRatio);
}

LoadResult ImageLoader::load(const QString& path, const QSize& bounds) {
    LoadResult result;

    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        result.status = LoadStatus::NotFound;
        result.error_message = QString("File not found: %1").arg(path);
        return result;
    }

    QImageReader reader(path);
    reader.setAutoTransform(true);

    // Let the decoder scale where it can (JPEG decodes straight to size)
    QSize source_size = reader.size();
    if (source_size.isValid()) {
        if (reader.transformation() & QImageIOHandler::TransformationRotate90) {
            source_size.transpose();
        }
        const QSize target = fitted_size(source_size, bounds);
        if (target != source_size) {
            QSize scaled = target;
            if (reader.transformation() & QImageIOHandler::TransformationRotate90) {
                scaled.transpose();
            }
            reader.setScaledSize(scaled);
        }
    }

    QImage image = reader.read();
    if (image.isNull()) {
        result.status = LoadStatus::DecodeFailed;
        result.error_message = QString("Cannot decode %1: %2").arg(info.fileName(), reader.errorString());
        LOG_WARN("Loader", result.error_message);
        return result;
    }

    // Formats without native scaling may come back at full size
    const QSize target = fitted_size(image.size(), bounds);
    if (target != image.size()) {
        image = image.scaled(target, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }

    result.status = LoadStatus::Ok;
    result.image = image;
    return result;
}
