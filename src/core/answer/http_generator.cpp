#include "core/answer/http_generator.h"
#include "core/shared/logging.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <utility>

namespace pa {

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpTooManyRequests = 429;

} // namespace

HttpGenerator::HttpGenerator(const QString& name, const GeneratorEndpoint& endpoint, uint32_t timeoutMs,
                             GeneratorCircuitBreaker::Clock clock)
    : m_name(name)
    , m_endpoint(endpoint)
    , m_timeoutMs(timeoutMs)
    , m_circuitBreaker(name, std::move(clock))
{
}

GenerationOutcome HttpGenerator::generate(const PromptContext& context)
{
    if (m_endpoint.endpoint.isEmpty()) {
        return GenerationOutcome::failed(m_name, GenerationFailure::Unavailable,
                                         QStringLiteral("no endpoint configured"));
    }

    if (!m_circuitBreaker.allowRequest()) {
        LOG_DEBUG(paAnswer, "%s: circuit open, skipping", qUtf8Printable(m_name));
        return GenerationOutcome::failed(m_name, GenerationFailure::CircuitOpen,
                                         QStringLiteral("backend is cooling down after failures"));
    }

    GenerationOutcome outcome = post(context.render());
    m_circuitBreaker.record(outcome.failure);
    return outcome;
}

GenerationOutcome HttpGenerator::post(const QString& prompt)
{
    const QUrl url(m_endpoint.endpoint);
    if (!url.isValid()) {
        return GenerationOutcome::failed(m_name, GenerationFailure::Unavailable,
                                         QStringLiteral("invalid endpoint: %1").arg(m_endpoint.endpoint));
    }

    QJsonObject body;
    body[QStringLiteral("model")] = m_endpoint.model;
    body[QStringLiteral("prompt")] = prompt;
    body[QStringLiteral("stream")] = false;

    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    // Replies are children of the manager and go away with it.
    QNetworkAccessManager manager;
    QNetworkReply* reply = manager.post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(m_timeoutMs));
    if (!reply->isFinished()) {
        loop.exec();
    }

    if (!reply->isFinished()) {
        reply->abort();
        LOG_WARN(paAnswer, "%s: no response within %u ms", qUtf8Printable(m_name), m_timeoutMs);
        return GenerationOutcome::failed(m_name, GenerationFailure::Timeout,
                                         QStringLiteral("timed out after %1 ms").arg(m_timeoutMs));
    }
    timer.stop();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 0 && reply->error() != QNetworkReply::NoError) {
        return GenerationOutcome::failed(m_name, GenerationFailure::TransportError,
                                         reply->errorString());
    }
    if (status == kHttpTooManyRequests) {
        return GenerationOutcome::failed(m_name, GenerationFailure::QuotaExceeded,
                                         QStringLiteral("HTTP 429"));
    }
    if (status != kHttpOk) {
        return GenerationOutcome::failed(m_name, GenerationFailure::HttpError,
                                         QStringLiteral("HTTP %1").arg(status));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(reply->readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()
        || !doc.object().value(QStringLiteral("response")).isString()) {
        return GenerationOutcome::failed(m_name, GenerationFailure::MalformedResponse,
                                         parseError.error != QJsonParseError::NoError
                                             ? parseError.errorString()
                                             : QStringLiteral("missing \"response\""));
    }

    const QString text = doc.object().value(QStringLiteral("response")).toString().trimmed();
    if (text.isEmpty()) {
        return GenerationOutcome::failed(m_name, GenerationFailure::EmptyResponse);
    }
    return GenerationOutcome::success(m_name, text);
}

} // namespace pa
