#include "../../common/core/logging/LoggingCategories.h"
#include <QtCore/QDebug>
#include "KeyStateSourceWindows.h"

#ifdef Q_OS_WIN

KeyStateSourceWindows::KeyStateSourceWindows() : KeyStateSource() {
    initializeKeyMappings();
}

KeyStateSourceWindows::~KeyStateSourceWindows() {
    cleanup();
}

bool KeyStateSourceWindows::initialize() {
    // Windows API 不需要特殊初始化
    m_initialized = true;
    qCDebug(lcKeyState) << "KeyStateSourceWindows: Initialized, key mappings:" << m_keyMap.size();
    return true;
}

void KeyStateSourceWindows::cleanup() {
    m_initialized = false;
}

bool KeyStateSourceWindows::queryKeyState(int qtKey, bool& held) {
    held = false;
    if (qtKey == 0) {
        return true;
    }

    const int virtualKey = qtKeyToVirtualKey(qtKey);
    if (virtualKey == 0) {
        setLastError(QString("Unmapped key: 0x%1").arg(qtKey, 0, 16));
        return false;
    }

    held = (GetAsyncKeyState(virtualKey) & 0x8000) != 0;
    return true;
}

int KeyStateSourceWindows::qtKeyToVirtualKey(int qtKey) const {
    // 字母和数字的虚拟键码与 ASCII 相同
    if ((qtKey >= Qt::Key_A && qtKey <= Qt::Key_Z) || (qtKey >= Qt::Key_0 && qtKey <= Qt::Key_9)) {
        return qtKey;
    }
    if (qtKey >= Qt::Key_F1 && qtKey <= Qt::Key_F24) {
        return VK_F1 + (qtKey - Qt::Key_F1);
    }

    auto it = m_keyMap.find(qtKey);
    if (it != m_keyMap.end()) {
        return it->second;
    }
    return 0;
}

void KeyStateSourceWindows::initializeKeyMappings() {
    // 控制键
    m_keyMap[Qt::Key_Return] = VK_RETURN;
    m_keyMap[Qt::Key_Enter] = VK_RETURN;
    m_keyMap[Qt::Key_Tab] = VK_TAB;
    m_keyMap[Qt::Key_Space] = VK_SPACE;
    m_keyMap[Qt::Key_Backspace] = VK_BACK;
    m_keyMap[Qt::Key_Delete] = VK_DELETE;
    m_keyMap[Qt::Key_Escape] = VK_ESCAPE;
    m_keyMap[Qt::Key_Insert] = VK_INSERT;
    m_keyMap[Qt::Key_Home] = VK_HOME;
    m_keyMap[Qt::Key_End] = VK_END;
    m_keyMap[Qt::Key_PageUp] = VK_PRIOR;
    m_keyMap[Qt::Key_PageDown] = VK_NEXT;

    // 方向键
    m_keyMap[Qt::Key_Left] = VK_LEFT;
    m_keyMap[Qt::Key_Right] = VK_RIGHT;
    m_keyMap[Qt::Key_Up] = VK_UP;
    m_keyMap[Qt::Key_Down] = VK_DOWN;

    // 修饰键（不区分左右）
    m_keyMap[Qt::Key_Shift] = VK_SHIFT;
    m_keyMap[Qt::Key_Control] = VK_CONTROL;
    m_keyMap[Qt::Key_Alt] = VK_MENU;
    m_keyMap[Qt::Key_Meta] = VK_LWIN;

    // 锁定键
    m_keyMap[Qt::Key_CapsLock] = VK_CAPITAL;
    m_keyMap[Qt::Key_NumLock] = VK_NUMLOCK;
    m_keyMap[Qt::Key_ScrollLock] = VK_SCROLL;

    // 符号键（美式键盘布局）
    m_keyMap[Qt::Key_Semicolon] = VK_OEM_1;
    m_keyMap[Qt::Key_Equal] = VK_OEM_PLUS;
    m_keyMap[Qt::Key_Comma] = VK_OEM_COMMA;
    m_keyMap[Qt::Key_Minus] = VK_OEM_MINUS;
    m_keyMap[Qt::Key_Period] = VK_OEM_PERIOD;
    m_keyMap[Qt::Key_Slash] = VK_OEM_2;
    m_keyMap[Qt::Key_QuoteLeft] = VK_OEM_3;
    m_keyMap[Qt::Key_BracketLeft] = VK_OEM_4;
    m_keyMap[Qt::Key_Backslash] = VK_OEM_5;
    m_keyMap[Qt::Key_BracketRight] = VK_OEM_6;
    m_keyMap[Qt::Key_Apostrophe] = VK_OEM_7;

    // 系统键
    m_keyMap[Qt::Key_Pause] = VK_PAUSE;
    m_keyMap[Qt::Key_Print] = VK_SNAPSHOT;
    m_keyMap[Qt::Key_Menu] = VK_APPS;
}

#endif // Q_OS_WIN
