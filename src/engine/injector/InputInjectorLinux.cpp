// Qt 头文件需在 Xlib 之前包含，避免 None/Bool 等宏污染
#include "../../common/core/logging/LoggingCategories.h"
#include <QtCore/QDebug>
#include "InputInjectorLinux.h"

#ifdef Q_OS_LINUX

namespace {
// X11 按钮编号：1 = 左键，3 = 右键
constexpr unsigned int kPrimaryButton = 1;
constexpr unsigned int kSecondaryButton = 3;
}

InputInjectorLinux::InputInjectorLinux() : InputInjector(), m_display(nullptr) {
}

InputInjectorLinux::~InputInjectorLinux() {
    cleanup();
}

bool InputInjectorLinux::initialize() {
    if (m_initialized) {
        return true;
    }

    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        setLastError("Failed to open X11 display");
        qCWarning(lcInjector) << "InputInjectorLinux: Failed to open X11 display";
        return false;
    }

    int eventBase = 0;
    int errorBase = 0;
    int majorVersion = 0;
    int minorVersion = 0;
    if (!XTestQueryExtension(m_display, &eventBase, &errorBase, &majorVersion, &minorVersion)) {
        setLastError("XTest extension not available");
        qCWarning(lcInjector) << "InputInjectorLinux: XTest extension not available";
        XCloseDisplay(m_display);
        m_display = nullptr;
        return false;
    }

    m_initialized = true;
    qCDebug(lcInjector) << "InputInjectorLinux: Initialized, XTest" << majorVersion << "." << minorVersion;
    return true;
}

void InputInjectorLinux::cleanup() {
    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
    m_initialized = false;
}

bool InputInjectorLinux::moveRelative(int dx, int dy) {
    if (!m_initialized || !m_display) {
        setLastError("InputInjectorLinux not initialized");
        return false;
    }

    const bool result = XTestFakeRelativeMotionEvent(m_display, dx, dy, CurrentTime) != 0;
    XFlush(m_display);
    if (!result) {
        setLastError(QString("XTestFakeRelativeMotionEvent failed: dx=%1 dy=%2").arg(dx).arg(dy));
    }
    qCDebug(lcInjector) << "Relative move: dx=" << dx << "dy=" << dy << "result=" << result;
    return result;
}

bool InputInjectorLinux::setButton(bool isPrimary, bool isDown) {
    if (!m_initialized || !m_display) {
        setLastError("InputInjectorLinux not initialized");
        return false;
    }

    const unsigned int button = isPrimary ? kPrimaryButton : kSecondaryButton;
    const bool result = XTestFakeButtonEvent(m_display, button, isDown ? True : False, CurrentTime) != 0;
    XFlush(m_display);
    if (!result) {
        setLastError(QString("XTestFakeButtonEvent failed: button=%1 down=%2").arg(button).arg(isDown));
    }
    qCDebug(lcInjector) << "Mouse button: button=" << button << "down=" << isDown << "result=" << result;
    return result;
}

#endif // Q_OS_LINUX
