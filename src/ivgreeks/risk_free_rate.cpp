#include "ivgreeks/risk_free_rate.hpp"

#include <cmath>

#include <QByteArray>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>
#include <QVariant>

namespace ivgreeks {

std::optional<double> parse_risk_free_rate(const std::string& payload,
                                           const std::string& security) {
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(
        QByteArray::fromStdString(payload), &error);
    if (error.error != QJsonParseError::NoError) {
        qWarning() << "[RiskFreeRate] Feed is not JSON:" << error.errorString();
        return std::nullopt;
    }
    if (!doc.isArray()) {
        qWarning() << "[RiskFreeRate] Feed is not a list of securities";
        return std::nullopt;
    }

    const QString wanted = QString::fromStdString(security);
    for (const QJsonValue& entry : doc.array()) {
        const QJsonObject record = entry.toObject();
        if (record.value("GovernmentSecurityName").toString() != wanted)
            continue;

        // Published both as a number and as a numeric string.
        bool ok = false;
        const double percent =
            record.value("Percent").toVariant().toDouble(&ok);
        if (!ok || !std::isfinite(percent)) {
            qWarning() << "[RiskFreeRate] Unreadable Percent for" << wanted;
            return std::nullopt;
        }
        return percent;
    }

    qWarning() << "[RiskFreeRate] No record for" << wanted;
    return std::nullopt;
}

double risk_free_rate_percent(const std::optional<std::string>& payload,
                              double fallback_percent,
                              const std::string& security) {
    if (payload) {
        if (auto percent = parse_risk_free_rate(*payload, security))
            return *percent;
    }
    qWarning() << "[RiskFreeRate] Using fallback rate" << fallback_percent;
    return fallback_percent;
}

double risk_free_rate_percent(const std::optional<std::string>& payload,
                              const EngineConfig& config,
                              const std::string& security) {
    return risk_free_rate_percent(payload, config.fallback_rate_percent,
                                  security);
}

}  // namespace ivgreeks
