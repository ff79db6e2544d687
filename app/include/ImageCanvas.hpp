#ifndef IMAGE_CANVAS_HPP
#define IMAGE_CANVAS_HPP

#include "ActionRouter.hpp"
#include <QLabel>
#include <QImage>
#include <map>

class QMouseEvent;
class QWheelEvent;
class QResizeEvent;

// Display surface for the current image; also the gesture source the
// router binds clicks and wheel steps to.
class ImageCanvas : public QLabel, public GestureSource {
    Q_OBJECT

public:
    explicit ImageCanvas(QWidget* parent = nullptr);

    void connect_gesture(Gesture gesture, Handler handler) override;
    void disconnect_gesture(Gesture gesture) override;

    void show_image(const QImage& image);
    void show_message(const QString& text, int font_size = 0);

    // Largest area an image can be fit into
    QSize display_bounds() const;

signals:
    void resized();

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private:
    bool fire(Gesture gesture);

    std::map<Gesture, Handler> handlers_;
    int wheel_accumulator_;

    // One notch of a standard mouse wheel, in eighths of a degree
    static constexpr int kWheelStep = 120;
};

#endif // IMAGE_CANVAS_HPP
