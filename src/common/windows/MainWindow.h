#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QtWidgets/QMainWindow>
#include <QtGui/QCloseEvent>
#include <QtGui/QKeyEvent>
#include <array>

#include "../types/KeyBindings.h"

QT_BEGIN_NAMESPACE
class QCheckBox;
class QLabel;
class QPushButton;
class QSpinBox;
class QTimer;
QT_END_NAMESPACE

class EmulatorController;

/**
 * @brief 模拟器设置窗口
 *
 * 启用开关、六个按键重映射按钮、移动量和轮询间隔输入框以及保存按钮。
 * 点击重映射按钮后抓取键盘，下一次按键成为新的绑定，Escape 取消。
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(EmulatorController *controller, QWidget *parent = nullptr);
    ~MainWindow() override;

    /// 当前是否处于按键捕获状态
    bool isCapturingKey() const { return m_captureSlot >= 0; }

protected:
    void closeEvent(QCloseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private slots:
    void onEnableToggled(bool checked);
    void onEnabledChanged(bool enabled);
    void onRemapClicked(int slot);
    void onMoveAmountChanged(int value);
    void onPollingIntervalChanged(int value);
    void onSaveClicked();
    void onControllerError(const QString &error);
    void refreshFromConfig();
    void updateStatistics();

private:
    void createCentralWidget();
    void setupConnections();
    void updateKeyButton(KeyMouse::KeySlot slot);
    void beginKeyCapture(int slot);
    void endKeyCapture();

    EmulatorController *m_controller;

    QCheckBox *m_enableCheckBox;
    QLabel *m_instructionLabel;
    std::array<QPushButton *, KeyMouse::KeySlotCount> m_keyButtons;
    QSpinBox *m_moveAmountSpinBox;
    QSpinBox *m_pollingIntervalSpinBox;
    QPushButton *m_saveButton;
    QLabel *m_statsLabel;
    QTimer *m_statsTimer;

    int m_captureSlot;          ///< 正在捕获的槽位，-1 表示未捕获
    bool m_isShuttingDown;
};

#endif // MAINWINDOW_H
