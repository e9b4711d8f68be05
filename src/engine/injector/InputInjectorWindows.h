#ifndef INPUTINJECTORWINDOWS_H
#define INPUTINJECTORWINDOWS_H

#include "InputInjector.h"

#ifdef Q_OS_WIN
#include <windows.h>

/**
 * @brief Windows SendInput 输入注入
 */
class InputInjectorWindows : public InputInjector {
public:
    InputInjectorWindows();
    ~InputInjectorWindows() override;

    // 初始化和清理
    bool initialize() override;
    void cleanup() override;

    bool moveRelative(int dx, int dy) override;
    bool setButton(bool isPrimary, bool isDown) override;

private:
    bool sendMouseInput(LONG dx, LONG dy, DWORD flags);
};

#endif // Q_OS_WIN

#endif // INPUTINJECTORWINDOWS_H
