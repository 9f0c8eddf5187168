#pragma once

#include <QHash>
#include <QObject>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>

#include <functional>

namespace oni {

// Named query commands callable from QML, e.g.
//   shellCommands.invoke("get_server_port")
class CommandBridge : public QObject {
    Q_OBJECT

public:
    using Handler = std::function<QVariant(const QVariantMap& args)>;

    explicit CommandBridge(QObject* parent = nullptr);

    // Registering an existing name replaces its handler.
    void registerCommand(const QString& name, Handler handler);
    bool hasCommand(const QString& name) const;
    QStringList commandNames() const;

    // Returns an invalid QVariant for unknown commands.
    Q_INVOKABLE QVariant invoke(const QString& name, const QVariantMap& args = {});

signals:
    void commandFailed(const QString& name, const QString& error);

private:
    QHash<QString, Handler> m_handlers;
};

} // namespace oni
