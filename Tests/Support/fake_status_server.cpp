#include "fake_status_server.h"

#include <QHostAddress>
#include <QTcpSocket>

namespace oni::test {

namespace {

QByteArray reasonPhrase(int statusCode)
{
    switch (statusCode) {
    case 200:
        return "OK";
    case 404:
        return "Not Found";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    default:
        return "Status";
    }
}

} // namespace

FakeStatusServer::FakeStatusServer(QString statusPath, QObject* parent)
    : QObject(parent)
    , m_statusPath(std::move(statusPath))
{
    connect(&m_server, &QTcpServer::newConnection,
            this, &FakeStatusServer::onNewConnection);
}

bool FakeStatusServer::listen(quint16 port)
{
    return m_server.listen(QHostAddress::LocalHost, port);
}

void FakeStatusServer::close()
{
    m_server.close();
}

quint16 FakeStatusServer::port() const
{
    return m_server.serverPort();
}

void FakeStatusServer::onNewConnection()
{
    while (QTcpSocket* socket = m_server.nextPendingConnection()) {
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
            handleReadyRead(socket);
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_buffers.remove(socket);
            socket->deleteLater();
        });
    }
}

void FakeStatusServer::handleReadyRead(QTcpSocket* socket)
{
    QByteArray& buffer = m_buffers[socket];
    buffer += socket->readAll();
    if (!buffer.contains("\r\n\r\n")) {
        return;
    }

    // "GET /path HTTP/1.1"
    const QByteArray requestLine = buffer.left(buffer.indexOf("\r\n"));
    const QList<QByteArray> parts = requestLine.split(' ');
    const QString path = parts.size() >= 2 ? QString::fromLatin1(parts.at(1)) : QString();
    m_requestedPaths.append(path);
    buffer.clear();

    const int statusCode = (path == m_statusPath) ? m_statusCode : 404;
    const QByteArray body = statusCode >= 200 && statusCode < 300
        ? QByteArrayLiteral("{\"status\":\"ok\"}")
        : QByteArrayLiteral("{\"status\":\"unavailable\"}");

    QByteArray response;
    response += "HTTP/1.1 " + QByteArray::number(statusCode) + ' ' + reasonPhrase(statusCode) + "\r\n";
    response += "Content-Type: application/json\r\n";
    response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;

    socket->write(response);
    socket->flush();
    socket->disconnectFromHost();
}

} // namespace oni::test
