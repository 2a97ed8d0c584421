#include "ivgreeks/config.hpp"

#include <QDate>
#include <QDebug>
#include <QFileInfo>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTime>

namespace ivgreeks {

namespace {

double read_double(const QSettings& settings, const QString& key,
                   double fallback) {
    if (!settings.contains(key))
        return fallback;
    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok)
        throw InvalidInput("config: " + key.toStdString() +
                           " is not a number");
    return value;
}

int read_int(const QSettings& settings, const QString& key, int fallback) {
    if (!settings.contains(key))
        return fallback;
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok)
        throw InvalidInput("config: " + key.toStdString() +
                           " is not an integer");
    return value;
}

// "HH:mm" -> seconds since midnight
double read_time_of_day(const QSettings& settings, const QString& key,
                        double fallback) {
    if (!settings.contains(key))
        return fallback;
    const QString text = settings.value(key).toString();
    const QTime t = QTime::fromString(text, "HH:mm");
    if (!t.isValid())
        throw InvalidInput("config: " + key.toStdString() +
                           " is not HH:mm: " + text.toStdString());
    return t.msecsSinceStartOfDay() / 1000.0;
}

std::vector<QuantLib::Date> read_holidays(const QSettings& settings,
                                          const std::vector<QuantLib::Date>& fallback) {
    if (!settings.contains("holidays"))
        return fallback;
    std::vector<QuantLib::Date> holidays;
    for (const QString& item : settings.value("holidays").toStringList()) {
        const QString text = item.trimmed();
        if (text.isEmpty())
            continue;
        const QDate d = QDate::fromString(text, Qt::ISODate);
        if (!d.isValid())
            throw InvalidInput("config: bad holiday date: " +
                               text.toStdString());
        holidays.emplace_back(d.day(), static_cast<QuantLib::Month>(d.month()),
                              d.year());
    }
    return holidays;
}

}  // namespace

DayCountConvention parse_day_count(const std::string& name) {
    if (name == "calendar")
        return DayCountConvention::CalendarDays;
    if (name == "business")
        return DayCountConvention::BusinessDays;
    if (name == "trading")
        return DayCountConvention::TradingDays;
    throw InvalidInput("unknown day count convention: " + name);
}

std::string to_string(DayCountConvention convention) {
    switch (convention) {
    case DayCountConvention::CalendarDays:
        return "calendar";
    case DayCountConvention::BusinessDays:
        return "business";
    case DayCountConvention::TradingDays:
        return "trading";
    }
    return "calendar";
}

EngineConfig load_engine_config(const std::string& path) {
    const QString file = QString::fromStdString(path);
    if (!QFileInfo::exists(file))
        throw InvalidInput("config file not found: " + path);

    QSettings settings(file, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError)
        throw InvalidInput("config file unreadable: " + path);

    EngineConfig config;
    settings.beginGroup("ENGINE");

    if (settings.contains("day_count"))
        config.day_count = parse_day_count(
            settings.value("day_count").toString().trimmed().toStdString());
    config.risk_free_rate_percent = read_double(
        settings, "risk_free_rate_percent", config.risk_free_rate_percent);
    config.premium_floor =
        read_double(settings, "premium_floor", config.premium_floor);
    config.parity_tolerance =
        read_double(settings, "parity_tolerance", config.parity_tolerance);

    config.solver.lower = read_double(settings, "iv_lower", config.solver.lower);
    config.solver.upper = read_double(settings, "iv_upper", config.solver.upper);
    config.solver.tolerance =
        read_double(settings, "iv_tolerance", config.solver.tolerance);
    config.solver.max_iterations =
        read_int(settings, "iv_max_iterations", config.solver.max_iterations);
    if (!(config.solver.lower > 0.0 && config.solver.lower < config.solver.upper))
        throw InvalidInput("config: iv_lower must be positive and below iv_upper");
    if (config.solver.max_iterations <= 0)
        throw InvalidInput("config: iv_max_iterations must be positive");

    config.session.expiry_close =
        read_time_of_day(settings, "expiry_close", config.session.expiry_close);
    config.session.session_offset = read_time_of_day(
        settings, "session_offset", config.session.session_offset);
    config.holidays = read_holidays(settings, config.holidays);

    config.fallback_rate_percent = read_double(
        settings, "fallback_rate_percent", config.fallback_rate_percent);
    if (settings.contains("use_otm_liquidity"))
        config.use_otm_liquidity = settings.value("use_otm_liquidity").toBool();

    settings.endGroup();

    qDebug() << "[EngineConfig] Loaded" << file
             << "day_count=" << QString::fromStdString(to_string(config.day_count))
             << "rate=" << config.risk_free_rate_percent
             << "holidays=" << static_cast<int>(config.holidays.size());
    return config;
}

}  // namespace ivgreeks
