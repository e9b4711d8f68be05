// Qt 头文件需在 Xlib 之前包含，避免 None/Bool 等宏污染
#include "../../common/core/logging/LoggingCategories.h"
#include <QtCore/QDebug>
#include "KeyStateSourceLinux.h"

#ifdef Q_OS_LINUX

KeyStateSourceLinux::KeyStateSourceLinux() : KeyStateSource(), m_display(nullptr) {
    initializeKeyMappings();
}

KeyStateSourceLinux::~KeyStateSourceLinux() {
    cleanup();
}

bool KeyStateSourceLinux::initialize() {
    if (m_initialized) {
        return true;
    }

    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        setLastError("Failed to open X11 display");
        qCWarning(lcKeyState) << "KeyStateSourceLinux: Failed to open X11 display";
        return false;
    }

    m_initialized = true;
    qCDebug(lcKeyState) << "KeyStateSourceLinux: Initialized, key mappings:" << m_keyMap.size();
    return true;
}

void KeyStateSourceLinux::cleanup() {
    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
    m_initialized = false;
}

bool KeyStateSourceLinux::queryKeyState(int qtKey, bool& held) {
    held = false;
    if (qtKey == 0) {
        return true;
    }

    if (!m_initialized || !m_display) {
        setLastError("X11 display not available");
        return false;
    }

    const KeySym keySym = qtKeyToKeySym(qtKey);
    if (keySym == NoSymbol) {
        setLastError(QString("Unmapped key: 0x%1").arg(qtKey, 0, 16));
        return false;
    }

    const KeyCode keyCode = XKeysymToKeycode(m_display, keySym);
    if (keyCode == 0) {
        setLastError(QString("No keycode for KeySym 0x%1").arg(static_cast<qulonglong>(keySym), 0, 16));
        return false;
    }

    char keymap[32];
    XQueryKeymap(m_display, keymap);
    held = (keymap[keyCode / 8] & (1 << (keyCode % 8))) != 0;
    return true;
}

KeySym KeyStateSourceLinux::qtKeyToKeySym(int qtKey) const {
    // 字母、数字和功能键是连续区间
    if (qtKey >= Qt::Key_A && qtKey <= Qt::Key_Z) {
        return XK_a + static_cast<KeySym>(qtKey - Qt::Key_A);
    }
    if (qtKey >= Qt::Key_0 && qtKey <= Qt::Key_9) {
        return XK_0 + static_cast<KeySym>(qtKey - Qt::Key_0);
    }
    if (qtKey >= Qt::Key_F1 && qtKey <= Qt::Key_F24) {
        return XK_F1 + static_cast<KeySym>(qtKey - Qt::Key_F1);
    }

    auto it = m_keyMap.find(qtKey);
    if (it != m_keyMap.end()) {
        return it->second;
    }
    return NoSymbol;
}

void KeyStateSourceLinux::initializeKeyMappings() {
    // 控制键
    m_keyMap[Qt::Key_Return] = XK_Return;
    m_keyMap[Qt::Key_Enter] = XK_KP_Enter;
    m_keyMap[Qt::Key_Tab] = XK_Tab;
    m_keyMap[Qt::Key_Space] = XK_space;
    m_keyMap[Qt::Key_Backspace] = XK_BackSpace;
    m_keyMap[Qt::Key_Delete] = XK_Delete;
    m_keyMap[Qt::Key_Escape] = XK_Escape;
    m_keyMap[Qt::Key_Insert] = XK_Insert;
    m_keyMap[Qt::Key_Home] = XK_Home;
    m_keyMap[Qt::Key_End] = XK_End;
    m_keyMap[Qt::Key_PageUp] = XK_Page_Up;
    m_keyMap[Qt::Key_PageDown] = XK_Page_Down;

    // 方向键
    m_keyMap[Qt::Key_Left] = XK_Left;
    m_keyMap[Qt::Key_Right] = XK_Right;
    m_keyMap[Qt::Key_Up] = XK_Up;
    m_keyMap[Qt::Key_Down] = XK_Down;

    // 修饰键（查询左侧物理键）
    m_keyMap[Qt::Key_Shift] = XK_Shift_L;
    m_keyMap[Qt::Key_Control] = XK_Control_L;
    m_keyMap[Qt::Key_Alt] = XK_Alt_L;
    m_keyMap[Qt::Key_Meta] = XK_Super_L;
    m_keyMap[Qt::Key_AltGr] = XK_ISO_Level3_Shift;

    // 锁定键
    m_keyMap[Qt::Key_CapsLock] = XK_Caps_Lock;
    m_keyMap[Qt::Key_NumLock] = XK_Num_Lock;
    m_keyMap[Qt::Key_ScrollLock] = XK_Scroll_Lock;

    // 符号键（物理基础键）
    m_keyMap[Qt::Key_Semicolon] = XK_semicolon;
    m_keyMap[Qt::Key_Comma] = XK_comma;
    m_keyMap[Qt::Key_Minus] = XK_minus;
    m_keyMap[Qt::Key_Period] = XK_period;
    m_keyMap[Qt::Key_Slash] = XK_slash;
    m_keyMap[Qt::Key_QuoteLeft] = XK_grave;
    m_keyMap[Qt::Key_BracketLeft] = XK_bracketleft;
    m_keyMap[Qt::Key_Backslash] = XK_backslash;
    m_keyMap[Qt::Key_BracketRight] = XK_bracketright;
    m_keyMap[Qt::Key_Apostrophe] = XK_apostrophe;
    m_keyMap[Qt::Key_Equal] = XK_equal;

    // 系统键
    m_keyMap[Qt::Key_Pause] = XK_Pause;
    m_keyMap[Qt::Key_Print] = XK_Print;
    m_keyMap[Qt::Key_Menu] = XK_Menu;
}

#endif // Q_OS_LINUX
