#include "command_bridge.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace oni {

CommandBridge::CommandBridge(QObject* parent)
    : QObject(parent)
{
}

void CommandBridge::registerCommand(const QString& name, Handler handler)
{
    if (!handler) {
        LOG_WARN(oniApp, "Refusing to register command '%s' without a handler",
                 qPrintable(name));
        return;
    }
    if (m_handlers.contains(name)) {
        LOG_WARN(oniApp, "Command '%s' already registered, replacing handler", qPrintable(name));
    }
    m_handlers.insert(name, std::move(handler));
}

bool CommandBridge::hasCommand(const QString& name) const
{
    return m_handlers.contains(name);
}

QStringList CommandBridge::commandNames() const
{
    QStringList names = m_handlers.keys();
    std::sort(names.begin(), names.end());
    return names;
}

QVariant CommandBridge::invoke(const QString& name, const QVariantMap& args)
{
    const auto it = m_handlers.constFind(name);
    if (it == m_handlers.constEnd()) {
        const QString error = QStringLiteral("Unknown command: %1").arg(name);
        LOG_WARN(oniApp, "%s", qPrintable(error));
        emit commandFailed(name, error);
        return {};
    }

    LOG_DEBUG(oniApp, "Invoking command '%s'", qPrintable(name));
    return it.value()(args);
}

} // namespace oni
