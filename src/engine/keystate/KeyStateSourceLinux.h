#ifndef KEYSTATESOURCELINUX_H
#define KEYSTATESOURCELINUX_H

#include "KeyStateSource.h"

#ifdef Q_OS_LINUX
#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <unordered_map>

/**
 * @brief X11 按键状态查询
 *
 * 通过 XQueryKeymap 读取服务器端的全局按键位图。
 */
class KeyStateSourceLinux : public KeyStateSource {
public:
    KeyStateSourceLinux();
    ~KeyStateSourceLinux() override;

    // 初始化和清理
    bool initialize() override;
    void cleanup() override;

    bool queryKeyState(int qtKey, bool& held) override;

    // Qt 按键转 X11 KeySym，未映射时返回 NoSymbol
    KeySym qtKeyToKeySym(int qtKey) const;

private:
    // 初始化按键映射表
    void initializeKeyMappings();

    Display* m_display;
    std::unordered_map<int, KeySym> m_keyMap;
};

#endif // Q_OS_LINUX

#endif // KEYSTATESOURCELINUX_H
