#ifndef EMULATOR_CONSTANTS_H
#define EMULATOR_CONSTANTS_H

#include <QtCore/QString>

/**
 * @brief 核心常量定义类
 *
 * 提供系统级别的常量定义，按功能模块分组管理。
 * 默认值与取值范围同时被配置加载、控制接口和界面输入控件使用。
 */
class EmulatorConstants {
public:
    /**
     * @brief 系统版本信息
     */
    struct Version {
        static constexpr int MAJOR = 1;
        static constexpr int MINOR = 0;
        static constexpr int PATCH = 0;
        static const QString VERSION_STRING;
    };

    /**
     * @brief 光标移动相关常量
     */
    struct Motion {
        static constexpr int REFERENCE_FPS = 60;                        ///< 位移归一化使用的参考帧率
        static constexpr int DEFAULT_MOVE_AMOUNT = 10;                  ///< 默认移动量 px/参考帧
        static constexpr int MIN_MOVE_AMOUNT = 1;                       ///< 最小移动量
        static constexpr int MAX_MOVE_AMOUNT = 100;                     ///< 最大移动量
        static constexpr int MILLISECONDS_PER_SECOND = 1000;            ///< 每秒毫秒数
        static constexpr qint64 NANOSECONDS_PER_SECOND = 1000000000LL;  ///< 每秒纳秒数
        static constexpr qint64 MAX_STEP_ELAPSED_NS = 3600LL * NANOSECONDS_PER_SECOND; ///< 单步计入的最长时间
    };

    /**
     * @brief 轮询相关常量
     */
    struct Polling {
        static constexpr int DEFAULT_INTERVAL_MS = 20;                  ///< 默认轮询间隔 20ms
        static constexpr int MIN_INTERVAL_MS = 1;                       ///< 最小轮询间隔
        static constexpr int MAX_INTERVAL_MS = 1000;                    ///< 最大轮询间隔
        static constexpr int FAILURE_LOG_INTERVAL_MS = 5000;            ///< 注入失败日志间隔 5000ms
        static constexpr int STATS_UPDATE_INTERVAL_MS = 1000;           ///< 界面统计刷新间隔 1s
    };

    /**
     * @brief 配置文件相关常量
     */
    struct Config {
        static const QString FILE_NAME;                                 ///< 配置文件名
        static const QString ROOT_ELEMENT;                              ///< XML 根元素
        static constexpr int FORMAT_VERSION = 1;                        ///< 配置格式版本
    };

    /**
     * @brief 日志相关常量
     */
    struct Logging {
        static constexpr qint64 DEFAULT_MAX_FILE_SIZE = 5 * 1024 * 1024; ///< 默认日志文件上限 5MB
        static constexpr int DEFAULT_MAX_FILE_COUNT = 5;                ///< 保留的轮转文件数
        static const QString FILE_NAME;                                 ///< 默认日志文件名
    };

    static QString getVersionString();

    /**
     * @brief 验证移动量是否在有效范围内
     */
    static bool isValidMoveAmount(int amount);

    /**
     * @brief 验证轮询间隔是否在有效范围内
     */
    static bool isValidPollingInterval(int intervalMs);

private:
    EmulatorConstants() = delete;
};

#endif // EMULATOR_CONSTANTS_H
