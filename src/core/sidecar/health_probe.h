#pragma once

#include <QString>
#include <QUrl>

#include <memory>

class QNetworkAccessManager;

namespace oni {

// http://127.0.0.1:<port><path>
QUrl statusUrl(quint16 port, const QString& path);

class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    // Blocking check. True only when the endpoint answered with a 2xx status
    // within timeoutMs.
    virtual bool probe(const QUrl& url, int timeoutMs) = 0;
};

class HttpHealthProbe final : public HealthProbe {
public:
    HttpHealthProbe();
    ~HttpHealthProbe() override;

    HttpHealthProbe(const HttpHealthProbe&) = delete;
    HttpHealthProbe& operator=(const HttpHealthProbe&) = delete;

    bool probe(const QUrl& url, int timeoutMs) override;

    // Status code of the last completed probe, 0 if no HTTP response arrived.
    int lastStatusCode() const { return m_lastStatusCode; }

private:
    std::unique_ptr<QNetworkAccessManager> m_manager;
    int m_lastStatusCode = 0;
};

} // namespace oni
