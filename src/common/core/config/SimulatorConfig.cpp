#include "SimulatorConfig.h"
#include "Constants.h"
#include "../logging/LoggingCategories.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>
#include <QtCore/QStandardPaths>
#include <QtCore/QXmlStreamReader>
#include <QtCore/QXmlStreamWriter>
#include <QtCore/QMutexLocker>

using namespace KeyMouse;

namespace {

const QString kMoveAmountElement = QStringLiteral("MoveAmount");
const QString kPollingIntervalElement = QStringLiteral("PollingInterval");
const QString kEnabledElement = QStringLiteral("IsEnabled");

// 解析结果暂存，全部成功后才应用
struct ParsedConfig {
    KeyBindings bindings = KeyBindings::defaults();
    int moveAmount = EmulatorConstants::Motion::DEFAULT_MOVE_AMOUNT;
    int pollingInterval = EmulatorConstants::Polling::DEFAULT_INTERVAL_MS;
    bool enabled = false;
};

bool parseBool(const QString &text, bool &value)
{
    const QString lowered = text.trimmed().toLower();
    if (lowered == "true" || lowered == "1") {
        value = true;
        return true;
    }
    if (lowered == "false" || lowered == "0") {
        value = false;
        return true;
    }
    return false;
}

bool parseSlotElement(const QString &name, KeySlot &slot)
{
    for (KeySlot candidate : allKeySlots()) {
        if (keySlotElementName(candidate) == name) {
            slot = candidate;
            return true;
        }
    }
    return false;
}

bool parseDocument(QXmlStreamReader &reader, ParsedConfig &parsed, QString &error)
{
    if (!reader.readNextStartElement()) {
        error = reader.hasError() ? reader.errorString() : QStringLiteral("Empty document");
        return false;
    }
    if (reader.name() != EmulatorConstants::Config::ROOT_ELEMENT) {
        error = QString("Unexpected root element: %1").arg(reader.name().toString());
        return false;
    }

    const QString version = reader.attributes().value(QStringLiteral("version")).toString();
    if (!version.isEmpty() && version.toInt() > EmulatorConstants::Config::FORMAT_VERSION) {
        qCWarning(lcConfig) << "Config format version" << version << "is newer than supported"
                            << EmulatorConstants::Config::FORMAT_VERSION;
    }

    while (reader.readNextStartElement()) {
        const QString name = reader.name().toString();
        KeySlot slot;

        if (parseSlotElement(name, slot)) {
            const QString text = reader.readElementText().trimmed();
            const int qtKey = keyFromText(text);
            if (!text.isEmpty() && qtKey == 0) {
                error = QString("Invalid key '%1' in <%2>").arg(text, name);
                return false;
            }
            parsed.bindings.setKey(slot, qtKey);
        } else if (name == kMoveAmountElement || name == kPollingIntervalElement) {
            const QString text = reader.readElementText();
            bool ok = false;
            const int value = text.trimmed().toInt(&ok);
            if (!ok) {
                error = QString("Invalid integer '%1' in <%2>").arg(text, name);
                return false;
            }
            if (name == kMoveAmountElement) {
                parsed.moveAmount = value;
            } else {
                parsed.pollingInterval = value;
            }
        } else if (name == kEnabledElement) {
            const QString text = reader.readElementText();
            if (!parseBool(text, parsed.enabled)) {
                error = QString("Invalid boolean '%1' in <%2>").arg(text, name);
                return false;
            }
        } else {
            qCDebug(lcConfig) << "Ignoring unknown config element" << name;
            reader.skipCurrentElement();
        }
    }

    if (reader.hasError()) {
        error = QString("XML error at line %1: %2").arg(reader.lineNumber()).arg(reader.errorString());
        return false;
    }
    return true;
}

} // namespace

SimulatorConfig::SimulatorConfig(QObject *parent)
    : QObject(parent)
    , m_moveAmount(EmulatorConstants::Motion::DEFAULT_MOVE_AMOUNT)
    , m_pollingInterval(EmulatorConstants::Polling::DEFAULT_INTERVAL_MS)
    , m_enabled(false)
    , m_configFilePath(defaultConfigFile())
{
    const KeyBindings defaults = KeyBindings::defaults();
    for (int i = 0; i < KeySlotCount; ++i) {
        m_keys[i].store(defaults.keys[i]);
    }
}

SimulatorConfig::~SimulatorConfig()
{
}

void SimulatorConfig::setConfigFile(const QString &filePath)
{
    QMutexLocker locker(&m_fileMutex);
    m_configFilePath = filePath;
}

QString SimulatorConfig::configFile() const
{
    QMutexLocker locker(&m_fileMutex);
    return m_configFilePath;
}

QString SimulatorConfig::defaultConfigFile()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath(EmulatorConstants::Config::FILE_NAME);
}

SimulatorConfig::LoadStatus SimulatorConfig::load()
{
    ParsedConfig parsed;
    LoadStatus status = LoadStatus::Loaded;
    QString path;

    {
        QMutexLocker locker(&m_fileMutex);
        path = m_configFilePath;
        m_lastError.clear();

        QFile file(path);
        if (!file.exists()) {
            status = LoadStatus::FileMissing;
        } else if (!file.open(QIODevice::ReadOnly)) {
            m_lastError = QString("Cannot open %1: %2").arg(path, file.errorString());
            status = LoadStatus::Malformed;
        } else {
            QXmlStreamReader reader(&file);
            QString error;
            if (!parseDocument(reader, parsed, error)) {
                m_lastError = QString("Malformed config %1: %2").arg(path, error);
                status = LoadStatus::Malformed;
            }
        }
    }

    if (status != LoadStatus::Loaded) {
        // 读取失败时所有字段整体回退
        parsed = ParsedConfig();
    }

    switch (status) {
    case LoadStatus::Loaded:
        qCInfo(lcConfig) << "Configuration loaded from" << path;
        break;
    case LoadStatus::FileMissing:
        qCInfo(lcConfig) << "Config file" << path << "not found, using defaults";
        break;
    case LoadStatus::Malformed:
        qCWarning(lcConfig) << lastError() << "- using defaults";
        break;
    }

    for (int i = 0; i < KeySlotCount; ++i) {
        m_keys[i].store(parsed.bindings.keys[i]);
    }
    setMoveAmount(parsed.moveAmount);
    setPollingInterval(parsed.pollingInterval);
    m_enabled.store(parsed.enabled);

    emit configChanged();
    emit configLoaded();
    return status;
}

bool SimulatorConfig::save()
{
    QString path;
    {
        QMutexLocker locker(&m_fileMutex);
        path = m_configFilePath;
        m_lastError.clear();

        const QFileInfo info(path);
        if (!QDir().mkpath(info.absolutePath())) {
            m_lastError = QString("Cannot create directory %1").arg(info.absolutePath());
        } else {
            QSaveFile file(path);
            if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
                m_lastError = QString("Cannot open %1 for writing: %2").arg(path, file.errorString());
            } else {
                QXmlStreamWriter writer(&file);
                writer.setAutoFormatting(true);
                writer.writeStartDocument();
                writer.writeStartElement(EmulatorConstants::Config::ROOT_ELEMENT);
                writer.writeAttribute("version", QString::number(EmulatorConstants::Config::FORMAT_VERSION));

                for (KeySlot slot : allKeySlots()) {
                    writer.writeTextElement(keySlotElementName(slot), keyToText(key(slot)));
                }
                writer.writeTextElement(kMoveAmountElement, QString::number(moveAmount()));
                writer.writeTextElement(kPollingIntervalElement, QString::number(pollingInterval()));
                writer.writeTextElement(kEnabledElement, isEnabled() ? "true" : "false");

                writer.writeEndElement();
                writer.writeEndDocument();

                if (writer.hasError()) {
                    m_lastError = QString("Failed to write %1").arg(path);
                    file.cancelWriting();
                } else if (!file.commit()) {
                    m_lastError = QString("Failed to commit %1: %2").arg(path, file.errorString());
                }
            }
        }

        if (!m_lastError.isEmpty()) {
            qCWarning(lcConfig) << m_lastError;
            return false;
        }
    }

    qCInfo(lcConfig) << "Configuration saved to" << path;
    emit configSaved();
    return true;
}

QString SimulatorConfig::lastError() const
{
    QMutexLocker locker(&m_fileMutex);
    return m_lastError;
}

int SimulatorConfig::key(KeySlot slot) const
{
    return m_keys[static_cast<int>(slot)].load();
}

void SimulatorConfig::setKey(KeySlot slot, int qtKey)
{
    const int index = static_cast<int>(slot);
    if (m_keys[index].exchange(qtKey) == qtKey) {
        return;
    }
    qCDebug(lcConfig) << "Key binding" << keySlotElementName(slot) << "->" << keyToText(qtKey);
    emit keyBindingChanged(index, qtKey);
    emit configChanged();
}

KeyBindings SimulatorConfig::keyBindings() const
{
    KeyBindings bindings;
    for (int i = 0; i < KeySlotCount; ++i) {
        bindings.keys[i] = m_keys[i].load();
    }
    return bindings;
}

void SimulatorConfig::setMoveAmount(int amount)
{
    const int clamped = clampMoveAmount(amount);
    if (clamped != amount) {
        qCWarning(lcConfig) << "Move amount" << amount << "out of range, clamped to" << clamped;
    }
    if (m_moveAmount.exchange(clamped) != clamped) {
        emit configChanged();
    }
}

void SimulatorConfig::setPollingInterval(int intervalMs)
{
    const int clamped = clampPollingInterval(intervalMs);
    if (clamped != intervalMs) {
        qCWarning(lcConfig) << "Polling interval" << intervalMs << "out of range, clamped to" << clamped;
    }
    if (m_pollingInterval.exchange(clamped) != clamped) {
        emit configChanged();
    }
}

void SimulatorConfig::setEnabled(bool enabled)
{
    if (m_enabled.exchange(enabled) != enabled) {
        qCDebug(lcConfig) << "Enabled flag ->" << enabled;
        emit configChanged();
    }
}

int SimulatorConfig::clampMoveAmount(int amount)
{
    return qBound(EmulatorConstants::Motion::MIN_MOVE_AMOUNT, amount,
                  EmulatorConstants::Motion::MAX_MOVE_AMOUNT);
}

int SimulatorConfig::clampPollingInterval(int intervalMs)
{
    return qBound(EmulatorConstants::Polling::MIN_INTERVAL_MS, intervalMs,
                  EmulatorConstants::Polling::MAX_INTERVAL_MS);
}
