#include "KeyStateSource.h"
#include "../../common/core/logging/LoggingCategories.h"

// 平台特定的包含
#if defined(Q_OS_WIN)
#include "KeyStateSourceWindows.h"
#elif defined(Q_OS_LINUX)
#include "KeyStateSourceLinux.h"
#endif

KeyStateSource::KeyStateSource(QObject* parent)
    : QObject(parent)
    , m_initialized(false) {
}

KeyStateSource::~KeyStateSource() {
}

void KeyStateSource::setLastError(const QString& error) {
    m_lastError = error;
}

std::unique_ptr<KeyStateSource> KeyStateSource::createForPlatform() {
#if defined(Q_OS_WIN)
    return std::make_unique<KeyStateSourceWindows>();
#elif defined(Q_OS_LINUX)
    return std::make_unique<KeyStateSourceLinux>();
#else
    qCWarning(lcKeyState) << "KeyStateSource: Unsupported platform";
    return nullptr;
#endif
}
