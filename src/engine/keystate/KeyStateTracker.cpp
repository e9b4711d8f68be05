#include "KeyStateTracker.h"
#include "KeyStateSource.h"
#include "../../common/core/logging/LoggingCategories.h"
#include <QtCore/QDebug>

using KeyMouse::KeySlot;
using KeyMouse::KeyTransition;

KeyStateTracker::KeyStateTracker(KeyStateSource* source)
    : m_source(source) {
}

bool KeyStateTracker::isHeld(int qtKey) {
    bool held = false;
    return query(qtKey, held) && held;
}

KeyTransition KeyStateTracker::transition(KeySlot slot, int qtKey) {
    bool held = false;
    if ( !query(qtKey, held) ) {
        return KeyTransition::None;
    }
    return update(slot, held);
}

KeyTransition KeyStateTracker::update(KeySlot slot, bool held) {
    bool& stored = m_held[static_cast<int>(slot)];
    if ( held == stored ) {
        return KeyTransition::None;
    }

    stored = held;
    return held ? KeyTransition::Pressed : KeyTransition::Released;
}

bool KeyStateTracker::storedState(KeySlot slot) const {
    return m_held[static_cast<int>(slot)];
}

void KeyStateTracker::reset() {
    m_held.fill(false);
    m_queryFailures.store(0);
}

bool KeyStateTracker::query(int qtKey, bool& held) {
    held = false;
    if ( !m_source ) {
        m_queryFailures.fetch_add(1);
        return false;
    }

    if ( !m_source->queryKeyState(qtKey, held) ) {
        const quint64 failures = m_queryFailures.fetch_add(1) + 1;
        // 只记录第一次以及之后每 1000 次失败，避免每个 tick 刷屏
        if ( failures == 1 || failures % 1000 == 0 ) {
            qCWarning(lcKeyState) << "Key state query failed for key" << Qt::hex << qtKey
                                  << ":" << m_source->lastError() << "(failures:" << Qt::dec << failures << ")";
        }
        held = false;
        return false;
    }
    return true;
}
