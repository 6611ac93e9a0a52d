#ifndef LEDGERTYPES_H
#define LEDGERTYPES_H

#include <QObject>
#include <QString>

namespace LedgerTypes {

    // Stored in logs.kind as the lowercase name
    Q_NAMESPACE
    enum class LogKind {
        Start,
        Stop,
        Adjust
    };
    Q_ENUM_NS(LogKind)

    inline QString logKindToString(LogKind kind)
    {
        switch (kind) {
            case LogKind::Start:  return QStringLiteral("start");
            case LogKind::Stop:   return QStringLiteral("stop");
            case LogKind::Adjust: return QStringLiteral("adjust");
        }
        return QString();
    }

    inline bool logKindFromString(const QString &name, LogKind &kind)
    {
        if (name == QLatin1String("start")) {
            kind = LogKind::Start;
        } else if (name == QLatin1String("stop")) {
            kind = LogKind::Stop;
        } else if (name == QLatin1String("adjust")) {
            kind = LogKind::Adjust;
        } else {
            return false;
        }
        return true;
    }

}

#endif // LEDGERTYPES_H
