#pragma once

#include <QtCore/QString>
#include <QtCore/Qt>
#include <array>

/**
 * @file KeyBindings.h
 * @brief 按键绑定相关类型定义
 *
 * 定义引擎、配置和界面之间共享的逻辑按键槽位、按键绑定和按键边沿类型。
 * 按键统一使用 Qt::Key 取值，由各平台实现负责转换为系统按键码。
 */

namespace KeyMouse {

    /**
     * @brief 逻辑按键槽位
     */
    enum class KeySlot {
        MoveLeft = 0,      ///< 向左移动
        MoveRight = 1,     ///< 向右移动
        MoveUp = 2,        ///< 向上移动
        MoveDown = 3,      ///< 向下移动
        ClickLeft = 4,     ///< 左键
        ClickRight = 5     ///< 右键
    };

    constexpr int KeySlotCount = 6;

    /**
     * @brief 按键边沿变化
     */
    enum class KeyTransition {
        None = 0,          ///< 无变化
        Pressed = 1,       ///< 未按下 -> 按下
        Released = 2       ///< 按下 -> 未按下
    };

    /**
     * @brief 六个逻辑槽位的按键绑定快照
     *
     * 允许重复绑定：同一个物理按键绑定到多个槽位时，各槽位独立生效。
     */
    struct KeyBindings {
        std::array<int, KeySlotCount> keys{};

        int key(KeySlot slot) const { return keys[static_cast<int>(slot)]; }
        void setKey(KeySlot slot, int qtKey) { keys[static_cast<int>(slot)] = qtKey; }

        bool operator==(const KeyBindings& other) const { return keys == other.keys; }
        bool operator!=(const KeyBindings& other) const { return keys != other.keys; }

        /// 默认绑定：A/D/W/S 移动，E 左键，Q 右键
        static KeyBindings defaults();
    };

    /// 全部槽位，按声明顺序
    constexpr std::array<KeySlot, KeySlotCount> allKeySlots() {
        return { KeySlot::MoveLeft, KeySlot::MoveRight, KeySlot::MoveUp,
                 KeySlot::MoveDown, KeySlot::ClickLeft, KeySlot::ClickRight };
    }

    /// 配置文件中使用的元素名（KeyLeft、KeyClickRight 等）
    QString keySlotElementName(KeySlot slot);

    /// 界面显示用名称（Left、Click Right 等）
    QString keySlotDisplayName(KeySlot slot);

    /// 按键的可移植文本（"A"、"Left"、"Space"），无效按键返回空字符串
    QString keyToText(int qtKey);

    /// 从可移植文本解析按键，失败返回 0
    int keyFromText(const QString& text);

    /// 边沿的日志名称："none"、"pressed"、"released"
    QString transitionToString(KeyTransition transition);

} // namespace KeyMouse

