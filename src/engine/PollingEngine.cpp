#include "PollingEngine.h"
#include "injector/InputInjector.h"
#include "keystate/KeyStateSource.h"
#include "../common/core/config/SimulatorConfig.h"
#include "../common/core/config/Constants.h"
#include "../common/core/logging/LoggingCategories.h"
#include <QtCore/QDebug>

using KeyMouse::KeyBindings;
using KeyMouse::KeySlot;
using KeyMouse::KeyTransition;

PollingEngine::PollingEngine(SimulatorConfig* config, KeyStateSource* source, InputInjector* injector,
                             QObject* parent)
    : Worker(parent)
    , m_config(config)
    , m_source(source)
    , m_injector(injector)
    , m_tracker(source)
    , m_suppressedFailures(0) {
    setName("PollingEngine");
}

PollingEngine::~PollingEngine() {
    stop();
}

PollingEngine::TickStats PollingEngine::statistics() const {
    TickStats stats;
    stats.ticks = m_ticks.load();
    stats.idleTicks = m_idleTicks.load();
    stats.moveEvents = m_moveEvents.load();
    stats.buttonEvents = m_buttonEvents.load();
    stats.injectionFailures = m_injectionFailures.load();
    stats.keyQueryFailures = m_tracker.queryFailures();
    return stats;
}

void PollingEngine::processTask() {
    // 空 tick 也要采样计时器，重新启用时不会产生补偿性的大位移
    processTick(m_integrator.takeElapsedNs());
}

int PollingEngine::sleepIntervalMs() const {
    return m_config ? m_config->pollingInterval() : EmulatorConstants::Polling::DEFAULT_INTERVAL_MS;
}

void PollingEngine::processTick(qint64 elapsedNanos) {
    m_ticks.fetch_add(1);

    if ( !m_config || !m_config->isEnabled() ) {
        m_idleTicks.fetch_add(1);
        return;
    }

    const KeyBindings bindings = m_config->keyBindings();
    const int magnitude = m_config->moveAmount();

    // 先采样全部按键，再注入事件
    const bool left = m_tracker.isHeld(bindings.key(KeySlot::MoveLeft));
    const bool right = m_tracker.isHeld(bindings.key(KeySlot::MoveRight));
    const bool up = m_tracker.isHeld(bindings.key(KeySlot::MoveUp));
    const bool down = m_tracker.isHeld(bindings.key(KeySlot::MoveDown));
    const KeyTransition primary = m_tracker.transition(KeySlot::ClickLeft, bindings.key(KeySlot::ClickLeft));
    const KeyTransition secondary = m_tracker.transition(KeySlot::ClickRight, bindings.key(KeySlot::ClickRight));

    if ( !m_injector ) {
        return;
    }

    const int step = m_integrator.advance(magnitude, elapsedNanos);

    // 每个按住的方向独立注入，相反方向同时按住时产生两次相互抵消的调用
    if ( left ) {
        inject(m_injector->moveRelative(-step, 0), m_moveEvents);
    }
    if ( right ) {
        inject(m_injector->moveRelative(step, 0), m_moveEvents);
    }
    if ( up ) {
        inject(m_injector->moveRelative(0, -step), m_moveEvents);
    }
    if ( down ) {
        inject(m_injector->moveRelative(0, step), m_moveEvents);
    }

    if ( primary != KeyTransition::None || secondary != KeyTransition::None ) {
        qCDebug(lcEngine) << "Click edges: left" << KeyMouse::transitionToString(primary)
                          << "right" << KeyMouse::transitionToString(secondary);
    }
    if ( primary != KeyTransition::None ) {
        inject(m_injector->setButton(true, primary == KeyTransition::Pressed), m_buttonEvents);
    }
    if ( secondary != KeyTransition::None ) {
        inject(m_injector->setButton(false, secondary == KeyTransition::Pressed), m_buttonEvents);
    }
}

void PollingEngine::inject(bool ok, std::atomic<quint64>& successCounter) {
    if ( ok ) {
        successCounter.fetch_add(1);
        return;
    }

    m_injectionFailures.fetch_add(1);

    // 限流：每个日志间隔内最多记录一次，其余只计数
    if ( m_failureLogTimer.isValid()
         && m_failureLogTimer.elapsed() < EmulatorConstants::Polling::FAILURE_LOG_INTERVAL_MS ) {
        ++m_suppressedFailures;
        return;
    }

    qCWarning(lcEngine) << "Input injection failed:" << m_injector->lastError()
                        << "(suppressed since last report:" << m_suppressedFailures << ")";
    m_suppressedFailures = 0;
    m_failureLogTimer.start();
}

bool PollingEngine::initialize() {
    if ( !m_config || !m_source || !m_injector ) {
        qCCritical(lcEngine) << "PollingEngine: missing configuration, key source or injector";
        return false;
    }

    // 平台资源不可用时仍然运行，每次查询或注入失败都会被记录
    if ( !m_source->initialize() ) {
        qCWarning(lcEngine) << "Key state source unavailable:" << m_source->lastError();
    }
    if ( !m_injector->initialize() ) {
        qCWarning(lcEngine) << "Input injector unavailable:" << m_injector->lastError();
    }

    m_tracker.reset();
    resetStatistics();
    m_integrator.restart();

    qCInfo(lcEngine) << "Polling engine starting: interval" << m_config->pollingInterval()
                     << "ms, move amount" << m_config->moveAmount();
    return true;
}

void PollingEngine::cleanup() {
    // 停止时不补发抬起事件
    m_source->cleanup();
    m_injector->cleanup();

    const TickStats stats = statistics();
    qCInfo(lcEngine) << "Polling engine stopped: ticks" << stats.ticks << "moves" << stats.moveEvents
                     << "buttons" << stats.buttonEvents << "injection failures" << stats.injectionFailures
                     << "query failures" << stats.keyQueryFailures;
}

void PollingEngine::resetStatistics() {
    m_ticks.store(0);
    m_idleTicks.store(0);
    m_moveEvents.store(0);
    m_buttonEvents.store(0);
    m_injectionFailures.store(0);
    m_failureLogTimer.invalidate();
    m_suppressedFailures = 0;
}
