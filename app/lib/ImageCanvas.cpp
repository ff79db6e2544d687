#include "ImageCanvas.hpp"
#include "ui_constants.hpp"
#include <QMouseEvent>
#include <QWheelEvent>
#include <QResizeEvent>
#include <QPixmap>
#include <cstdlib>

ImageCanvas::ImageCanvas(QWidget* parent)
    : QLabel(parent)
    , wheel_accumulator_(0) {
    setAlignment(Qt::AlignCenter);
    setSizePolicy(QSizePolicy::Ignored, QSizePolicy::Ignored);
    setMinimumSize(ui::scaling::scaled(200), ui::scaling::scaled(150));
    setStyleSheet(QString("background-color: %1; color: %2;")
                  .arg(ui::colors::kCanvasBg).arg(ui::colors::kCanvasPlaceholder));
}

void ImageCanvas::connect_gesture(Gesture gesture, Handler handler) {
    handlers_[gesture] = std::move(handler);
}

void ImageCanvas::disconnect_gesture(Gesture gesture) {
    handlers_.erase(gesture);
}

bool ImageCanvas::fire(Gesture gesture) {
    auto it = handlers_.find(gesture);
    if (it == handlers_.end()) return false;
    // Copy first: the handler may rebind and replace itself
    Handler handler = it->second;
    handler();
    return true;
}

void ImageCanvas::show_image(const QImage& image) {
    setFont(QFont());
    setPixmap(QPixmap::fromImage(image));
}

void ImageCanvas::show_message(const QString& text, int font_size) {
    clear();
    QFont message_font;
    if (font_size > 0) {
        message_font.setPointSize(font_size);
    }
    setFont(message_font);
    setText(text);
}

QSize ImageCanvas::display_bounds() const {
    return contentsRect().size();
}

void ImageCanvas::mousePressEvent(QMouseEvent* event) {
    bool handled = false;
    if (event->button() == Qt::LeftButton) {
        handled = fire(Gesture::PrimaryClick);
    } else if (event->button() == Qt::RightButton) {
        handled = fire(Gesture::SecondaryClick);
    }

    if (handled) {
        event->accept();
    } else {
        QLabel::mousePressEvent(event);
    }
}

void ImageCanvas::wheelEvent(QWheelEvent* event) {
    // Touchpads report fractions of a notch; act once per full notch
    wheel_accumulator_ += event->angleDelta().y();
    if (std::abs(wheel_accumulator_) < kWheelStep) {
        event->accept();
        return;
    }

    const int delta = wheel_accumulator_;
    wheel_accumulator_ = 0;

    const auto gesture = ActionRouter::normalize_wheel(WheelSignal::Combined, delta);
    if (gesture && fire(*gesture)) {
        event->accept();
    } else {
        QLabel::wheelEvent(event);
    }
}

void ImageCanvas::resizeEvent(QResizeEvent* event) {
    QLabel::resizeEvent(event);
    emit resized();
}
