#include "KeyBindings.h"

#include <QtGui/QKeySequence>

namespace KeyMouse {

KeyBindings KeyBindings::defaults() {
    KeyBindings bindings;
    bindings.setKey(KeySlot::MoveLeft, Qt::Key_A);
    bindings.setKey(KeySlot::MoveRight, Qt::Key_D);
    bindings.setKey(KeySlot::MoveUp, Qt::Key_W);
    bindings.setKey(KeySlot::MoveDown, Qt::Key_S);
    bindings.setKey(KeySlot::ClickLeft, Qt::Key_E);
    bindings.setKey(KeySlot::ClickRight, Qt::Key_Q);
    return bindings;
}

QString keySlotElementName(KeySlot slot) {
    switch ( slot ) {
        case KeySlot::MoveLeft: return QStringLiteral("KeyLeft");
        case KeySlot::MoveRight: return QStringLiteral("KeyRight");
        case KeySlot::MoveUp: return QStringLiteral("KeyUp");
        case KeySlot::MoveDown: return QStringLiteral("KeyDown");
        case KeySlot::ClickLeft: return QStringLiteral("KeyClickLeft");
        case KeySlot::ClickRight: return QStringLiteral("KeyClickRight");
    }
    return QString();
}

QString keySlotDisplayName(KeySlot slot) {
    switch ( slot ) {
        case KeySlot::MoveLeft: return QStringLiteral("Left");
        case KeySlot::MoveRight: return QStringLiteral("Right");
        case KeySlot::MoveUp: return QStringLiteral("Up");
        case KeySlot::MoveDown: return QStringLiteral("Down");
        case KeySlot::ClickLeft: return QStringLiteral("Click Left");
        case KeySlot::ClickRight: return QStringLiteral("Click Right");
    }
    return QString();
}

QString keyToText(int qtKey) {
    if ( qtKey == 0 || qtKey == Qt::Key_unknown ) {
        return QString();
    }
    const QString text = QKeySequence(qtKey).toString(QKeySequence::PortableText);
    // 单独的修饰键等无法通过文本往返，退回十六进制按键码
    if ( keyFromText(text) != qtKey ) {
        return QStringLiteral("0x") + QString::number(qtKey, 16);
    }
    return text;
}

int keyFromText(const QString& text) {
    const QString trimmed = text.trimmed();
    if ( trimmed.isEmpty() ) {
        return 0;
    }

    if ( trimmed.startsWith(QLatin1String("0x"), Qt::CaseInsensitive) ) {
        bool ok = false;
        const int key = trimmed.mid(2).toInt(&ok, 16);
        return ok && key > 0 ? key : 0;
    }

    const QKeySequence sequence = QKeySequence::fromString(trimmed, QKeySequence::PortableText);
    // 只接受单个不带修饰键的按键
    if ( sequence.count() != 1 ) {
        return 0;
    }
    const QKeyCombination combination = sequence[0];
    if ( combination.keyboardModifiers() != Qt::NoModifier ) {
        return 0;
    }
    const int key = combination.key();
    return key == Qt::Key_unknown ? 0 : key;
}

QString transitionToString(KeyTransition transition) {
    switch ( transition ) {
        case KeyTransition::None: return QStringLiteral("none");
        case KeyTransition::Pressed: return QStringLiteral("pressed");
        case KeyTransition::Released: return QStringLiteral("released");
    }
    return QStringLiteral("unknown");
}

} // namespace KeyMouse
