#include "Constants.h"

// 版本信息静态成员定义
const QString EmulatorConstants::Version::VERSION_STRING =
    QString("%1.%2.%3").arg(MAJOR).arg(MINOR).arg(PATCH);

const QString EmulatorConstants::Config::FILE_NAME = "config.xml";
const QString EmulatorConstants::Config::ROOT_ELEMENT = "Configuration";

const QString EmulatorConstants::Logging::FILE_NAME = "keymouse.log";

QString EmulatorConstants::getVersionString()
{
    return Version::VERSION_STRING;
}

bool EmulatorConstants::isValidMoveAmount(int amount)
{
    return amount >= Motion::MIN_MOVE_AMOUNT && amount <= Motion::MAX_MOVE_AMOUNT;
}

bool EmulatorConstants::isValidPollingInterval(int intervalMs)
{
    return intervalMs >= Polling::MIN_INTERVAL_MS && intervalMs <= Polling::MAX_INTERVAL_MS;
}
