#include <format>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkRequest>
#include <QScopeGuard>
#include <QTimer>

#include <qcoronetworkreply.h>

#include "OllamaCorrector.h"
#include "ScopedTimer.h"
#include "logging.h"

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const OllamaCorrector& m, bool json) {
    const auto url = m.baseUrl().toString().toStdString();
    if (json) {
        return make_pair(true, std::format(R"("corrector":"ollama", "url":"{}")", url));
    }
    return make_pair(false, std::format("OllamaCorrector{{url={}}}", url));
}
} // logfault ns

using namespace std;

namespace {

CorrectionResult failure(CorrectionResult::Status status, QString why, int httpStatus = 0) {
    CorrectionResult r;
    r.status = status;
    r.error = std::move(why);
    r.http_status = httpStatus;
    return r;
}

bool mentionsMissingModel(const QString& error) {
    return error.contains(QStringLiteral("not found"), Qt::CaseInsensitive);
}

bool isJson(const QByteArray& contentType, const QByteArray& body) {
    if (contentType.contains("json")) {
        return true;
    }
    return contentType.isEmpty() && body.trimmed().startsWith('{');
}

// Hard limit for the whole request. QNetworkRequest::setTransferTimeout()
// restarts whenever data arrives, so a slow trickle would never hit it.
void startDeadline(QTimer& deadline, QNetworkReply *reply, chrono::milliseconds timeout) {
    deadline.setSingleShot(true);
    // Queued, so the coroutine does not resume inside the timer's signal
    QObject::connect(&deadline, &QTimer::timeout, reply, &QNetworkReply::abort, Qt::QueuedConnection);
    deadline.start(timeout);
}

bool deadlineExpired(const QTimer& deadline, const QNetworkReply& reply) {
    return !deadline.isActive() && reply.error() == QNetworkReply::OperationCanceledError;
}

} // anon ns

OllamaCorrector::OllamaCorrector(Config config, QObject *parent)
    : QObject(parent), config_{std::move(config)}
{
    LOG_DEBUG_EX(*this) << "Using prompt style " << CorrectionPrompts::displayName(config_.style)
                        << " (" << CorrectionPrompts::name(config_.style) << ")"
                        << ", timeout " << config_.timeout.count() << " ms";
}

QUrl OllamaCorrector::baseUrl() const
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(config_.host);
    url.setPort(config_.port);
    return url;
}

QNetworkRequest OllamaCorrector::makeRequest(const QString &path) const
{
    auto url = baseUrl();
    url.setPath(path);

    QNetworkRequest req{url};
    req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    return req;
}

QByteArray OllamaCorrector::makeGenerateBody(const QString &text, const QString &model) const
{
    QJsonObject options;
    options.insert("temperature", config_.temperature);

    QJsonObject body;
    body.insert("model", model);
    body.insert("prompt", CorrectionPrompts::makePrompt(config_.style, text));
    body.insert("stream", false);
    body.insert("options", options);

    return QJsonDocument{body}.toJson(QJsonDocument::Compact);
}

QCoro::Task<CorrectionResult> OllamaCorrector::correct(QString text, QString model)
{
    if (text.trimmed().isEmpty()) {
        co_return failure(CorrectionResult::Status::BadResponse, tr("Nothing to correct"));
    }

    const ScopedTimer timer;
    auto *reply = nam_.post(makeRequest(QStringLiteral("/api/generate")), makeGenerateBody(text, model));
    const auto guard = qScopeGuard([reply] {
        reply->deleteLater();
    });

    QTimer deadline;
    startDeadline(deadline, reply, config_.timeout);

    co_await reply;

    if (deadlineExpired(deadline, *reply)) {
        LOG_WARN_EX(*this) << "Correction with " << model << " timed out after "
                           << config_.timeout.count() << " ms";
        co_return failure(CorrectionResult::Status::Transient,
                          tr("The correction server did not answer within %1 ms").arg(config_.timeout.count()));
    }

    const auto http_status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    auto result = interpretReply(reply->error(),
                                 http_status,
                                 reply->errorString(),
                                 reply->header(QNetworkRequest::ContentTypeHeader).toByteArray(),
                                 reply->readAll());

    if (result.ok()) {
        LOG_DEBUG_EX(*this) << "Corrected " << text.size() << " characters with " << model
                            << " in " << timer.elapsed() << " seconds";
    } else {
        LOG_WARN_EX(*this) << "Correction with " << model << " failed (" << result.status
                           << ", http " << http_status << "): " << result.error;
    }

    co_return result;
}

QCoro::Task<std::optional<QStringList>> OllamaCorrector::listAvailableModels()
{
    auto req = makeRequest(QStringLiteral("/api/tags"));
    auto *reply = nam_.get(req);
    const auto guard = qScopeGuard([reply] {
        reply->deleteLater();
    });

    QTimer deadline;
    startDeadline(deadline, reply, config_.timeout);

    co_await reply;

    if (reply->error() != QNetworkReply::NoError) {
        LOG_DEBUG_EX(*this) << "Failed to list models: " << reply->errorString();
        co_return std::nullopt;
    }

    auto models = parseModelList(reply->readAll());
    if (!models) {
        LOG_WARN_EX(*this) << "Unexpected reply when listing models";
    }
    co_return models;
}

bool OllamaCorrector::isTransient(QNetworkReply::NetworkError error) noexcept
{
    switch (error) {
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError: // deadline
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ServiceUnavailableError:
        return true;
    default:
        return false;
    }
}

CorrectionResult OllamaCorrector::interpretReply(QNetworkReply::NetworkError error,
                                                 int httpStatus,
                                                 const QString &errorString,
                                                 const QByteArray &contentType,
                                                 const QByteArray &body)
{
    using Status = CorrectionResult::Status;

    if (httpStatus == 0) {
        if (error == QNetworkReply::NoError) {
            return failure(Status::BadResponse, QStringLiteral("No HTTP response"));
        }
        return failure(isTransient(error) ? Status::Transient : Status::BadResponse, errorString);
    }

    if (httpStatus == 502 || httpStatus == 503 || httpStatus == 504) {
        return failure(Status::Transient, QStringLiteral("HTTP %1: %2").arg(httpStatus).arg(errorString), httpStatus);
    }

    QString text;
    QString server_error;
    if (isJson(contentType, body)) {
        QJsonParseError perr;
        const auto doc = QJsonDocument::fromJson(body, &perr);
        if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
            return failure(Status::BadResponse,
                           QStringLiteral("Malformed JSON in response: %1").arg(perr.errorString()),
                           httpStatus);
        }

        const auto obj = doc.object();
        server_error = obj.value("error").toString();
        if (server_error.isEmpty() && httpStatus < 400) {
            const auto response = obj.value("response");
            if (!response.isString()) {
                return failure(Status::BadResponse, QStringLiteral("The response has no text"), httpStatus);
            }
            text = response.toString();
        }
    } else if (httpStatus < 400) {
        text = QString::fromUtf8(body);
    } else {
        server_error = QString::fromUtf8(body).trimmed();
    }

    if (httpStatus == 404 || (!server_error.isEmpty() && mentionsMissingModel(server_error))) {
        return failure(Status::ModelMissing,
                       server_error.isEmpty() ? QStringLiteral("Model not found") : server_error,
                       httpStatus);
    }

    if (httpStatus >= 400 || !server_error.isEmpty()) {
        return failure(Status::BadResponse,
                       QStringLiteral("HTTP %1: %2").arg(httpStatus)
                           .arg(server_error.isEmpty() ? errorString : server_error),
                       httpStatus);
    }

    text = text.trimmed();
    if (text.isEmpty()) {
        return failure(Status::BadResponse, QStringLiteral("The server returned an empty text"), httpStatus);
    }

    CorrectionResult ok;
    ok.status = Status::Ok;
    ok.text = std::move(text);
    ok.http_status = httpStatus;
    return ok;
}

optional<QStringList> OllamaCorrector::parseModelList(const QByteArray &body)
{
    QJsonParseError perr;
    const auto doc = QJsonDocument::fromJson(body, &perr);
    if (perr.error != QJsonParseError::NoError) {
        return {};
    }

    // Either {"models":[{"name":...}, ...]} or a plain array of names
    QJsonArray models;
    if (doc.isObject()) {
        const auto v = doc.object().value("models");
        if (!v.isArray()) {
            return {};
        }
        models = v.toArray();
    } else if (doc.isArray()) {
        models = doc.array();
    } else {
        return {};
    }

    QStringList names;
    for (const auto& m : models) {
        if (m.isString()) {
            names << m.toString();
        } else if (const auto name = m.toObject().value("name").toString(); !name.isEmpty()) {
            names << name;
        }
    }
    return names;
}
