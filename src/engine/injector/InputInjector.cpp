#include "InputInjector.h"
#include "../../common/core/logging/LoggingCategories.h"

// 平台特定的包含
#if defined(Q_OS_WIN)
#include "InputInjectorWindows.h"
#elif defined(Q_OS_LINUX)
#include "InputInjectorLinux.h"
#endif

InputInjector::InputInjector(QObject* parent)
    : QObject(parent)
    , m_initialized(false) {
}

InputInjector::~InputInjector() {
}

void InputInjector::setLastError(const QString& error) {
    m_lastError = error;
}

std::unique_ptr<InputInjector> InputInjector::createForPlatform() {
#if defined(Q_OS_WIN)
    return std::make_unique<InputInjectorWindows>();
#elif defined(Q_OS_LINUX)
    return std::make_unique<InputInjectorLinux>();
#else
    qCWarning(lcInjector) << "InputInjector: Unsupported platform";
    return nullptr;
#endif
}
