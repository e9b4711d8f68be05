#include "MotionIntegrator.h"
#include "../common/core/config/Constants.h"
#include <limits>

int MotionIntegrator::computeDisplacement(int magnitude, qint64 elapsedMillis) {
    if ( magnitude <= 0 || elapsedMillis <= 0 ) {
        return 0;
    }

    // 整数运算，避免 10 * 0.02 * 60 这类浮点误差截断成 11
    const qint64 scaled = static_cast<qint64>(magnitude) * elapsedMillis
                          * EmulatorConstants::Motion::REFERENCE_FPS;
    const qint64 pixels = scaled / EmulatorConstants::Motion::MILLISECONDS_PER_SECOND;
    return static_cast<int>(qMin<qint64>(pixels, std::numeric_limits<int>::max()));
}

int MotionIntegrator::advance(int magnitude, qint64 elapsedNanos) {
    if ( magnitude <= 0 ) {
        return 0;
    }

    // 上限保证 magnitude * ns * 60 不溢出 qint64
    const qint64 elapsed = qBound<qint64>(0, elapsedNanos, EmulatorConstants::Motion::MAX_STEP_ELAPSED_NS);
    const qint64 scaled = static_cast<qint64>(magnitude) * elapsed * EmulatorConstants::Motion::REFERENCE_FPS
                          + m_remainder;
    m_remainder = scaled % EmulatorConstants::Motion::NANOSECONDS_PER_SECOND;
    return static_cast<int>(scaled / EmulatorConstants::Motion::NANOSECONDS_PER_SECOND);
}

void MotionIntegrator::restart() {
    m_remainder = 0;
    m_timer.start();
}

qint64 MotionIntegrator::takeElapsedNs() {
    if ( !m_timer.isValid() ) {
        m_timer.start();
        return 0;
    }
    const qint64 elapsed = m_timer.nsecsElapsed();
    m_timer.start();
    return qMax<qint64>(0, elapsed);
}
