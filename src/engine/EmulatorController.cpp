#include "EmulatorController.h"
#include "PollingEngine.h"
#include "injector/InputInjector.h"
#include "keystate/KeyStateSource.h"
#include "../common/core/logging/LoggingCategories.h"
#include <QtCore/QDebug>

EmulatorController::EmulatorController(QObject *parent)
    : EmulatorController(KeyStateSource::createForPlatform(), InputInjector::createForPlatform(), parent)
{
}

EmulatorController::EmulatorController(std::unique_ptr<KeyStateSource> source,
                                       std::unique_ptr<InputInjector> injector,
                                       QObject *parent)
    : QObject(parent)
    , m_config(std::make_unique<SimulatorConfig>())
    , m_source(std::move(source))
    , m_injector(std::move(injector))
{
    setupEngine();
}

EmulatorController::~EmulatorController()
{
    shutdown();
}

void EmulatorController::setupEngine()
{
    if (!m_source) {
        qCWarning(lcEngine) << "No key state source available on this platform";
    }
    if (!m_injector) {
        qCWarning(lcEngine) << "No input injector available on this platform";
    }

    m_engine = std::make_unique<PollingEngine>(m_config.get(), m_source.get(), m_injector.get());
    connect(m_engine.get(), &Worker::errorOccurred, this, &EmulatorController::onEngineError);
}

SimulatorConfig::LoadStatus EmulatorController::loadConfiguration(const QString &filePath)
{
    if (!filePath.isEmpty()) {
        m_config->setConfigFile(filePath);
    }

    const bool wasRunning = m_engine->isRunning();
    const SimulatorConfig::LoadStatus status = m_config->load();

    if (status == SimulatorConfig::LoadStatus::Malformed) {
        m_lastError = m_config->lastError();
        emit errorOccurred(m_lastError);
    }

    // 加载的启用标志只有在重新调用 setEnabled 时才生效，运行中的引擎保持运行
    if (wasRunning) {
        m_config->setEnabled(true);
    }
    return status;
}

bool EmulatorController::saveConfiguration()
{
    if (!m_config->save()) {
        m_lastError = m_config->lastError();
        emit errorOccurred(m_lastError);
        return false;
    }
    return true;
}

bool EmulatorController::setEnabled(bool enabled)
{
    if (enabled) {
        if (m_engine->isRunning() && m_config->isEnabled()) {
            return true;
        }

        m_config->setEnabled(true);
        if (!m_engine->start()) {
            // 错误已经通过 onEngineError 报告
            m_config->setEnabled(false);
            qCWarning(lcEngine) << "Failed to enable emulation:" << m_lastError;
            emit enabledChanged(false);
            return false;
        }
        qCInfo(lcEngine) << "Emulation enabled";
    } else {
        m_config->setEnabled(false);
        if (m_engine->isRunning()) {
            m_engine->stop();
            qCInfo(lcEngine) << "Emulation disabled";
        }
    }

    emit enabledChanged(enabled);
    return true;
}

bool EmulatorController::isEnabled() const
{
    return m_config->isEnabled() && m_engine->isRunning();
}

void EmulatorController::setKeyBinding(KeyMouse::KeySlot slot, int qtKey)
{
    m_config->setKey(slot, qtKey);
}

void EmulatorController::setMovementMagnitude(int amount)
{
    m_config->setMoveAmount(amount);
}

void EmulatorController::setPollingInterval(int intervalMs)
{
    m_config->setPollingInterval(intervalMs);
}

void EmulatorController::shutdown()
{
    if (m_engine && m_engine->isRunning()) {
        qCInfo(lcEngine) << "Shutting down polling engine";
        m_engine->stop();
    }
}

void EmulatorController::onEngineError(const QString &error)
{
    m_lastError = error;
    emit errorOccurred(error);
}
