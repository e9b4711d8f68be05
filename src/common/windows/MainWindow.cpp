#include "MainWindow.h"
#include "../../engine/EmulatorController.h"
#include "../../engine/PollingEngine.h"
#include "../core/config/Constants.h"
#include "../core/logging/LoggingCategories.h"

#include <QtWidgets/QCheckBox>
#include <QtWidgets/QFormLayout>
#include <QtWidgets/QGridLayout>
#include <QtWidgets/QGroupBox>
#include <QtWidgets/QLabel>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QSpinBox>
#include <QtWidgets/QStatusBar>
#include <QtWidgets/QVBoxLayout>
#include <QtCore/QSignalBlocker>
#include <QtCore/QTimer>

using namespace KeyMouse;

MainWindow::MainWindow(EmulatorController *controller, QWidget *parent)
    : QMainWindow(parent)
    , m_controller(controller)
    , m_enableCheckBox(nullptr)
    , m_instructionLabel(nullptr)
    , m_keyButtons{}
    , m_moveAmountSpinBox(nullptr)
    , m_pollingIntervalSpinBox(nullptr)
    , m_saveButton(nullptr)
    , m_statsLabel(nullptr)
    , m_statsTimer(nullptr)
    , m_captureSlot(-1)
    , m_isShuttingDown(false) {
    createCentralWidget();
    setupConnections();
    refreshFromConfig();

    setWindowTitle(tr("Mouse Simulator Configuration"));
    statusBar()->showMessage(tr("Version %1").arg(EmulatorConstants::getVersionString()));
}

MainWindow::~MainWindow() {
    if ( m_statsTimer ) {
        m_statsTimer->stop();
    }
    if ( m_controller ) {
        disconnect(m_controller, nullptr, this, nullptr);
    }
}

void MainWindow::createCentralWidget() {
    QWidget *central = new QWidget(this);
    QVBoxLayout *mainLayout = new QVBoxLayout(central);

    m_enableCheckBox = new QCheckBox(tr("Enable Mouse Simulation"), central);
    mainLayout->addWidget(m_enableCheckBox);

    m_instructionLabel = new QLabel(tr("Click a button to remap a key. Then press the desired key."), central);
    m_instructionLabel->setWordWrap(true);
    mainLayout->addWidget(m_instructionLabel);

    // 按键绑定：两列三行
    QGroupBox *keyGroup = new QGroupBox(tr("Key Bindings"), central);
    QGridLayout *keyLayout = new QGridLayout(keyGroup);
    for ( KeySlot slot : allKeySlots() ) {
        const int index = static_cast<int>(slot);
        QPushButton *button = new QPushButton(keyGroup);
        button->setFocusPolicy(Qt::NoFocus);
        m_keyButtons[index] = button;
        keyLayout->addWidget(button, index / 2, index % 2);
    }
    mainLayout->addWidget(keyGroup);

    QFormLayout *formLayout = new QFormLayout();
    m_moveAmountSpinBox = new QSpinBox(central);
    m_moveAmountSpinBox->setRange(EmulatorConstants::Motion::MIN_MOVE_AMOUNT,
                                  EmulatorConstants::Motion::MAX_MOVE_AMOUNT);
    formLayout->addRow(tr("Movement Amount (Pixels):"), m_moveAmountSpinBox);

    m_pollingIntervalSpinBox = new QSpinBox(central);
    m_pollingIntervalSpinBox->setRange(EmulatorConstants::Polling::MIN_INTERVAL_MS,
                                       EmulatorConstants::Polling::MAX_INTERVAL_MS);
    formLayout->addRow(tr("Polling Interval (Milliseconds):"), m_pollingIntervalSpinBox);
    mainLayout->addLayout(formLayout);

    m_saveButton = new QPushButton(tr("Save Configuration"), central);
    mainLayout->addWidget(m_saveButton);

    m_statsLabel = new QLabel(central);
    mainLayout->addWidget(m_statsLabel);
    mainLayout->addStretch();

    setCentralWidget(central);

    m_statsTimer = new QTimer(this);
    m_statsTimer->setInterval(EmulatorConstants::Polling::STATS_UPDATE_INTERVAL_MS);
}

void MainWindow::setupConnections() {
    connect(m_enableCheckBox, &QCheckBox::toggled, this, &MainWindow::onEnableToggled);
    for ( int i = 0; i < KeySlotCount; ++i ) {
        connect(m_keyButtons[i], &QPushButton::clicked, this, [this, i]() { onRemapClicked(i); });
    }
    connect(m_moveAmountSpinBox, QOverload<int>::of(&QSpinBox::valueChanged),
            this, &MainWindow::onMoveAmountChanged);
    connect(m_pollingIntervalSpinBox, QOverload<int>::of(&QSpinBox::valueChanged),
            this, &MainWindow::onPollingIntervalChanged);
    connect(m_saveButton, &QPushButton::clicked, this, &MainWindow::onSaveClicked);
    connect(m_statsTimer, &QTimer::timeout, this, &MainWindow::updateStatistics);

    connect(m_controller, &EmulatorController::enabledChanged, this, &MainWindow::onEnabledChanged);
    connect(m_controller, &EmulatorController::errorOccurred, this, &MainWindow::onControllerError);
    connect(m_controller->config(), &SimulatorConfig::configLoaded, this, &MainWindow::refreshFromConfig);
}

void MainWindow::refreshFromConfig() {
    SimulatorConfig *config = m_controller->config();

    for ( KeySlot slot : allKeySlots() ) {
        updateKeyButton(slot);
    }

    {
        const QSignalBlocker moveBlocker(m_moveAmountSpinBox);
        const QSignalBlocker intervalBlocker(m_pollingIntervalSpinBox);
        m_moveAmountSpinBox->setValue(config->moveAmount());
        m_pollingIntervalSpinBox->setValue(config->pollingInterval());
    }

    onEnabledChanged(m_controller->isEnabled());
}

void MainWindow::updateKeyButton(KeySlot slot) {
    const int qtKey = m_controller->config()->key(slot);
    const QString keyText = qtKey ? keyToText(qtKey) : tr("(none)");
    m_keyButtons[static_cast<int>(slot)]->setText(QString("%1: %2").arg(keySlotDisplayName(slot), keyText));
}

void MainWindow::onEnableToggled(bool checked) {
    qCDebug(lcMainWindow) << "Enable checkbox toggled:" << checked;
    // 失败时 enabledChanged(false) 会把复选框恢复
    m_controller->setEnabled(checked);
}

void MainWindow::onEnabledChanged(bool enabled) {
    {
        const QSignalBlocker blocker(m_enableCheckBox);
        m_enableCheckBox->setChecked(enabled);
    }

    if ( enabled ) {
        m_statsTimer->start();
    } else {
        m_statsTimer->stop();
    }
    updateStatistics();
}

void MainWindow::onRemapClicked(int slot) {
    if ( isCapturingKey() ) {
        endKeyCapture();
    }
    beginKeyCapture(slot);
}

void MainWindow::beginKeyCapture(int slot) {
    m_captureSlot = slot;
    m_keyButtons[slot]->setText(tr("Press new key..."));
    grabKeyboard();
    qCDebug(lcMainWindow) << "Capturing key for" << keySlotElementName(static_cast<KeySlot>(slot));
}

void MainWindow::endKeyCapture() {
    if ( !isCapturingKey() ) {
        return;
    }
    const KeySlot slot = static_cast<KeySlot>(m_captureSlot);
    m_captureSlot = -1;
    releaseKeyboard();
    updateKeyButton(slot);
}

void MainWindow::keyPressEvent(QKeyEvent *event) {
    if ( !isCapturingKey() ) {
        QMainWindow::keyPressEvent(event);
        return;
    }

    event->accept();
    if ( event->isAutoRepeat() ) {
        return;
    }

    const int qtKey = event->key();
    if ( qtKey == Qt::Key_Escape ) {
        qCDebug(lcMainWindow) << "Key capture cancelled";
        endKeyCapture();
        return;
    }
    if ( qtKey == 0 || qtKey == Qt::Key_unknown ) {
        qCWarning(lcMainWindow) << "Ignoring unknown key during capture, native code" << event->nativeScanCode();
        return;
    }

    const KeySlot slot = static_cast<KeySlot>(m_captureSlot);
    m_controller->setKeyBinding(slot, qtKey);
    qCInfo(lcMainWindow) << "Remapped" << keySlotElementName(slot) << "to" << keyToText(qtKey);
    endKeyCapture();
}

void MainWindow::onMoveAmountChanged(int value) {
    m_controller->setMovementMagnitude(value);
}

void MainWindow::onPollingIntervalChanged(int value) {
    m_controller->setPollingInterval(value);
}

void MainWindow::onSaveClicked() {
    if ( m_controller->saveConfiguration() ) {
        QMessageBox::information(this, tr("Configuration Saved"), tr("Configuration saved successfully."));
    }
    // 失败时 onControllerError 负责提示
}

void MainWindow::onControllerError(const QString &error) {
    qCWarning(lcMainWindow) << "Controller error:" << error;
    if ( !m_isShuttingDown ) {
        QMessageBox::warning(this, tr("Mouse Simulator"), error);
    }
}

void MainWindow::updateStatistics() {
    const PollingEngine::TickStats stats = m_controller->engine()->statistics();
    m_statsLabel->setText(tr("Ticks: %1  Moves: %2  Clicks: %3  Failures: %4")
                              .arg(stats.ticks)
                              .arg(stats.moveEvents)
                              .arg(stats.buttonEvents)
                              .arg(stats.injectionFailures + stats.keyQueryFailures));
}

void MainWindow::closeEvent(QCloseEvent *event) {
    qCInfo(lcMainWindow) << "MainWindow::closeEvent() - shutting down";

    if ( m_isShuttingDown ) {
        event->accept();
        return;
    }

    m_isShuttingDown = true;
    endKeyCapture();
    m_statsTimer->stop();
    m_controller->shutdown();
    event->accept();
}
