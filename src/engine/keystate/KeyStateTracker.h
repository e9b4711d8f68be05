#ifndef KEYSTATETRACKER_H
#define KEYSTATETRACKER_H

#include "../../common/types/KeyBindings.h"
#include <array>
#include <atomic>

class KeyStateSource;

/**
 * @brief 按键状态跟踪器
 *
 * 对物理按键做直接查询，并为点击槽位维护“上一次是否按下”的状态，用于检测边沿。
 * 状态按逻辑槽位保存：两个点击槽位绑定到同一个按键时各自产生边沿。
 *
 * 只能在轮询线程中使用；失败计数可以从任意线程读取。
 */
class KeyStateTracker {
public:
    explicit KeyStateTracker(KeyStateSource* source);

    /**
     * @brief 查询按键是否按下
     *
     * 查询失败时记录日志并视为未按下。
     */
    bool isHeld(int qtKey);

    /**
     * @brief 查询点击槽位的边沿变化
     *
     * 比较本次查询结果与该槽位上次保存的状态，然后覆盖保存值。
     * 查询失败时返回 None，且不修改保存值。
     */
    KeyMouse::KeyTransition transition(KeyMouse::KeySlot slot, int qtKey);

    /**
     * @brief 以给定的采样结果更新槽位状态并返回边沿变化
     */
    KeyMouse::KeyTransition update(KeyMouse::KeySlot slot, bool held);

    /// 当前保存的槽位状态
    bool storedState(KeyMouse::KeySlot slot) const;

    /// 清空全部保存状态和失败计数（引擎启动时调用）
    void reset();

    quint64 queryFailures() const { return m_queryFailures.load(); }

private:
    // 返回 false 表示查询失败
    bool query(int qtKey, bool& held);

    KeyStateSource* m_source;
    std::array<bool, KeyMouse::KeySlotCount> m_held{};
    std::atomic<quint64> m_queryFailures{0};
};

#endif // KEYSTATETRACKER_H
