#ifndef UI_CONSTANTS_HPP
#define UI_CONSTANTS_HPP

#include <QApplication>
#include <QScreen>

namespace ui::scaling {
    // Returns scale factor relative to 96 DPI baseline.
    // e.g. 1.0 at 96 DPI, 1.5 at 144 DPI, 2.0 at 192 DPI
    inline double factor() {
        static double cached = -1.0;
        if (cached < 0.0) {
            if (auto* screen = QApplication::primaryScreen()) {
                cached = screen->logicalDotsPerInch() / 96.0;
            } else {
                cached = 1.0;
            }
        }
        return cached;
    }

    inline int scaled(int base_value) {
        return static_cast<int>(base_value * factor());
    }
}

namespace ui::dimensions {
    // Base values at 96 DPI (1x scale)
    constexpr int kMainWindowWidth = 800;
    constexpr int kMainWindowHeight = 700;
    constexpr int kMainWindowMinWidth = 600;
    constexpr int kMainWindowMinHeight = 500;

    constexpr int kSettingsDialogWidth = 500;
    constexpr int kSettingsDialogHeight = 400;
    constexpr int kActionComboWidth = 140;

    // Canvas sizes below this are not laid out yet; load at full size then
    constexpr int kMinCanvasExtent = 10;
}

namespace ui::timing {
    // Lets the canvas repaint before the next image is decoded
    constexpr int kAdvanceRefreshDelayMs = 10;
    constexpr int kResizeDebounceMs = 150;
}

namespace ui::colors {
    constexpr const char* kControlPanelBg = "#e1e1e1";
    constexpr const char* kPickerButtonBg = "#d9d9d9";
    constexpr const char* kInstructionsBg = "#f0f0f0";
    constexpr const char* kInstructionsText = "#555555";
    constexpr const char* kStatusText = "#0000ff";
    constexpr const char* kCanvasBg = "#333333";
    constexpr const char* kCanvasPlaceholder = "#888888";
    constexpr const char* kStartColor = "#28a745";
    constexpr const char* kNeutralColor = "#6c757d";
}

namespace ui::fonts {
    constexpr int kStartButtonSize = 11;
    constexpr int kInstructionsSize = 9;
    constexpr int kFinishedSize = 24;
}

#endif // UI_CONSTANTS_HPP
