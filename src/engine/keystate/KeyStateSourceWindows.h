#ifndef KEYSTATESOURCEWINDOWS_H
#define KEYSTATESOURCEWINDOWS_H

#include "KeyStateSource.h"

#ifdef Q_OS_WIN
#include <windows.h>
#include <unordered_map>

/**
 * @brief Windows 按键状态查询
 *
 * 使用 GetAsyncKeyState 读取异步按键状态的最高位。
 */
class KeyStateSourceWindows : public KeyStateSource {
public:
    KeyStateSourceWindows();
    ~KeyStateSourceWindows() override;

    // 初始化和清理
    bool initialize() override;
    void cleanup() override;

    bool queryKeyState(int qtKey, bool& held) override;

    // Qt 按键转 Windows 虚拟键码，未映射时返回 0
    int qtKeyToVirtualKey(int qtKey) const;

private:
    void initializeKeyMappings();

    std::unordered_map<int, int> m_keyMap;
};

#endif // Q_OS_WIN

#endif // KEYSTATESOURCEWINDOWS_H
