#include "core/sidecar/health_probe.h"
#include "core/shared/logging.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QScopedPointer>
#include <QTimer>

#include <algorithm>

namespace oni {

QUrl statusUrl(quint16 port, const QString& path)
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(QStringLiteral("127.0.0.1"));
    url.setPort(port);
    url.setPath(path.startsWith(QLatin1Char('/')) ? path : QLatin1Char('/') + path);
    return url;
}

HttpHealthProbe::HttpHealthProbe()
    : m_manager(std::make_unique<QNetworkAccessManager>())
{
    // Loopback only; never route through a system proxy.
    m_manager->setProxy(QNetworkProxy::NoProxy);
}

HttpHealthProbe::~HttpHealthProbe() = default;

bool HttpHealthProbe::probe(const QUrl& url, int timeoutMs)
{
    m_lastStatusCode = 0;
    const int effectiveTimeoutMs = std::max(1, timeoutMs);

    QNetworkRequest request(url);
    request.setTransferTimeout(effectiveTimeoutMs);
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute,
                         QNetworkRequest::AlwaysNetwork);

    QScopedPointer<QNetworkReply> reply(m_manager->get(request));

    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&reply]() {
        reply->abort();
    });
    deadline.start(effectiveTimeoutMs);

    if (!reply->isFinished()) {
        loop.exec(QEventLoop::ExcludeUserInputEvents);
    }
    deadline.stop();

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    m_lastStatusCode = status.isValid() ? status.toInt() : 0;

    if (m_lastStatusCode == 0) {
        LOG_DEBUG(oniSidecar, "Health probe %s: %s",
                  qPrintable(url.toString()), qPrintable(reply->errorString()));
        return false;
    }

    LOG_DEBUG(oniSidecar, "Health probe %s -> HTTP %d",
              qPrintable(url.toString()), m_lastStatusCode);
    return m_lastStatusCode >= 200 && m_lastStatusCode < 300;
}

} // namespace oni
