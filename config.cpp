#include "config.h"

#include "calendar.h"
#include "errors.h"

#include <cstdlib>
#include <stdexcept>

int ScheduleConfig::durationFor(int courseId) const {
    auto it = durationOverrides.find(courseId);
    if (it != durationOverrides.end()) return it->second;
    return defaultDurationMinutes;
}

void validateScheduleConfig(const ScheduleConfig& cfg) {
    long first = 0, last = 0;
    if (!parseDate(cfg.window.startDate, first)) {
        throw InvalidInputError("bad window start date '" + cfg.window.startDate + "'");
    }
    if (!parseDate(cfg.window.endDate, last)) {
        throw InvalidInputError("bad window end date '" + cfg.window.endDate + "'");
    }
    if (last < first) {
        throw InvalidInputError("window end " + cfg.window.endDate +
                                " is before start " + cfg.window.startDate);
    }

    const OperatingHours& h = cfg.hours;
    if (h.openMinutes < 0 || h.closeMinutes > 24 * 60 || h.openMinutes >= h.closeMinutes) {
        throw InvalidInputError("operating hours " + formatTime(h.openMinutes) + "-" +
                                formatTime(h.closeMinutes) + " are empty");
    }
    if (h.slotStepMinutes <= 0) {
        throw InvalidInputError("slot step must be positive");
    }

    if (cfg.defaultDurationMinutes <= 0) {
        throw InvalidInputError("default exam duration must be positive");
    }
    for (const auto& p : cfg.durationOverrides) {
        if (p.second <= 0) {
            throw InvalidInputError("duration override for course " +
                                    std::to_string(p.first) + " must be positive");
        }
    }

    if (cfg.breakMinutes < 0) {
        throw InvalidInputError("break between exams cannot be negative");
    }
    if (cfg.breakMinutes > h.closeMinutes - h.openMinutes) {
        throw InvalidInputError("break of " + std::to_string(cfg.breakMinutes) +
                                " min is longer than the operating day");
    }
    if (cfg.maxExamsPerDayPerLevel < 1) {
        throw InvalidInputError("daily exam limit per class level must be at least 1");
    }
    for (int wd : cfg.excludedWeekdays) {
        if (wd < 1 || wd > 7) {
            throw InvalidInputError("excluded weekday " + std::to_string(wd) +
                                    " is not in 1..7");
        }
    }
    if (cfg.maxBacktracks < 0 || cfg.timeBudgetMs < 0) {
        throw InvalidInputError("search budget cannot be negative");
    }

    if (usableDates(cfg.window.startDate, cfg.window.endDate, cfg.excludedWeekdays).empty()) {
        throw InvalidInputError("every day of the window " + cfg.window.startDate + " - " +
                                cfg.window.endDate + " is excluded");
    }
}

// ==================== AppConfig::fromEnv ====================

static std::string getEnvOr(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

AppConfig AppConfig::fromEnv() {
    AppConfig cfg;
    cfg.httpHost = getEnvOr("EXAMPLAN_HTTP_HOST", "127.0.0.1");
    cfg.tlsCert  = getEnvOr("EXAMPLAN_TLS_CERT", "server-cert.pem");
    cfg.tlsKey   = getEnvOr("EXAMPLAN_TLS_KEY", "server-key.pem");
    cfg.logFile  = getEnvOr("EXAMPLAN_LOG_FILE", "examplan.log");

    const char* portStr = std::getenv("EXAMPLAN_HTTP_PORT");
    cfg.httpPort = portStr ? std::stoi(portStr) : 8443;

    std::string level = getEnvOr("EXAMPLAN_LOG_LEVEL", "info");
    if (!logLevelFromString(level, cfg.logLevel)) {
        throw std::runtime_error("EXAMPLAN_LOG_LEVEL has unknown value '" + level + "'");
    }

    return cfg;
}
