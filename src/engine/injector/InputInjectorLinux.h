#ifndef INPUTINJECTORLINUX_H
#define INPUTINJECTORLINUX_H

#include "InputInjector.h"

#ifdef Q_OS_LINUX
#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>

/**
 * @brief X11 XTest 输入注入
 */
class InputInjectorLinux : public InputInjector {
public:
    InputInjectorLinux();
    ~InputInjectorLinux() override;

    // 初始化和清理
    bool initialize() override;
    void cleanup() override;

    bool moveRelative(int dx, int dy) override;
    bool setButton(bool isPrimary, bool isDown) override;

private:
    Display* m_display;
};

#endif // Q_OS_LINUX

#endif // INPUTINJECTORLINUX_H
