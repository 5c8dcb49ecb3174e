#pragma once

#include <chrono>

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QUrl>

#include "TextCorrector.h"
#include "CorrectionPrompts.h"

/*! TextCorrector for an Ollama compatible server.
 *
 * Uses POST /api/generate for corrections and GET /api/tags to list models.
 * Must be used from the thread that created it.
 */
class OllamaCorrector : public QObject, public TextCorrector
{
    Q_OBJECT
public:
    struct Config {
        QString host{"localhost"};
        int port{11434};
        CorrectionPrompts::Style style{CorrectionPrompts::Style::Transcription};
        std::chrono::milliseconds timeout{30000};
        double temperature{0.2};
    };

    explicit OllamaCorrector(Config config, QObject *parent = nullptr);

    QCoro::Task<CorrectionResult> correct(QString text, QString model) override;
    QCoro::Task<std::optional<QStringList>> listAvailableModels() override;

    QUrl baseUrl() const;
    const Config& config() const noexcept { return config_; }

    QByteArray makeGenerateBody(const QString& text, const QString& model) const;

    /*! Turn the outcome of one request into a CorrectionResult.
     *
     * @param error Network error reported by Qt
     * @param httpStatus HTTP status code, 0 if no response was received
     * @param errorString Qt's description of the error
     * @param contentType The Content-Type header of the response
     * @param body The response body
     */
    static CorrectionResult interpretReply(QNetworkReply::NetworkError error,
                                           int httpStatus,
                                           const QString& errorString,
                                           const QByteArray& contentType,
                                           const QByteArray& body);

    static bool isTransient(QNetworkReply::NetworkError error) noexcept;

    static std::optional<QStringList> parseModelList(const QByteArray& body);

private:
    QNetworkRequest makeRequest(const QString& path) const;

    const Config config_;
    QNetworkAccessManager nam_;
};
