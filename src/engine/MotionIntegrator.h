#ifndef MOTIONINTEGRATOR_H
#define MOTIONINTEGRATOR_H

#include <QtCore/QElapsedTimer>
#include <QtCore/QtGlobal>

/**
 * @brief 光标位移积分器
 *
 * 把“每参考帧移动的像素数”换算为与实际经过时间成正比的位移，
 * 使移动速度不受轮询间隔影响：
 *
 *     pixels = magnitude * (elapsed / 1s) * REFERENCE_FPS
 *
 * 计时使用单调时钟，每个 tick 以纳秒精度读取一次并立即重置。
 * 逐 tick 的位移由 advance() 计算，不足 1 像素的余量累积到下一个 tick，
 * 因此任意轮询间隔下的累计位移与精确值相差不超过 1 像素。
 */
class MotionIntegrator {
public:
    MotionIntegrator() = default;

    /**
     * @brief 计算单段时间的位移（向零截断，不累积余量）
     * @param magnitude 每参考帧的像素数
     * @param elapsedMillis 经过的毫秒数，负值视为 0
     */
    static int computeDisplacement(int magnitude, qint64 elapsedMillis);

    /**
     * @brief 计算本 tick 的位移并保留亚像素余量
     * @param magnitude 每参考帧的像素数，非正值返回 0 且不改变余量
     * @param elapsedNanos 距上一个 tick 的纳秒数，负值视为 0
     */
    int advance(int magnitude, qint64 elapsedNanos);

    /// 重新开始计时并清空余量
    void restart();

    /// 读取自上次重置以来的纳秒数并重置计时器；未启动时启动并返回 0
    qint64 takeElapsedNs();

    bool isRunning() const { return m_timer.isValid(); }

    /// 当前累积的亚像素余量，单位为 1e-9 像素
    qint64 remainder() const { return m_remainder; }

private:
    QElapsedTimer m_timer;
    qint64 m_remainder = 0;
};

#endif // MOTIONINTEGRATOR_H
