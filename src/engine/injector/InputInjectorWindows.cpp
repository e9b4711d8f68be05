#include "../../common/core/logging/LoggingCategories.h"
#include <QtCore/QDebug>
#include "InputInjectorWindows.h"

#ifdef Q_OS_WIN

InputInjectorWindows::InputInjectorWindows() : InputInjector() {
}

InputInjectorWindows::~InputInjectorWindows() {
    cleanup();
}

bool InputInjectorWindows::initialize() {
    // Windows API 不需要特殊初始化
    m_initialized = true;
    qCDebug(lcInjector) << "InputInjectorWindows: Initialized successfully";
    return true;
}

void InputInjectorWindows::cleanup() {
    m_initialized = false;
}

bool InputInjectorWindows::moveRelative(int dx, int dy) {
    // 不带 MOUSEEVENTF_ABSOLUTE 时 dx/dy 为相对位移
    return sendMouseInput(dx, dy, MOUSEEVENTF_MOVE);
}

bool InputInjectorWindows::setButton(bool isPrimary, bool isDown) {
    DWORD flags;
    if (isPrimary) {
        flags = isDown ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP;
    } else {
        flags = isDown ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP;
    }
    return sendMouseInput(0, 0, flags);
}

bool InputInjectorWindows::sendMouseInput(LONG dx, LONG dy, DWORD flags) {
    if (!m_initialized) {
        setLastError("InputInjectorWindows not initialized");
        return false;
    }

    INPUT input = {0};
    input.type = INPUT_MOUSE;
    input.mi.dx = dx;
    input.mi.dy = dy;
    input.mi.dwFlags = flags;

    UINT sent = SendInput(1, &input, sizeof(INPUT));
    if (sent == 1) {
        qCDebug(lcInjector) << "Mouse input sent: dx=" << dx << "dy=" << dy << "flags=" << flags;
        return true;
    }

    // 被 UIPI 等策略拦截时 SendInput 返回 0
    const DWORD error = GetLastError();
    setLastError(QString("SendInput failed: flags=%1 error=%2").arg(flags).arg(error));
    return false;
}

#endif // Q_OS_WIN
