#pragma once

#include <map>
#include <set>
#include <string>

#include "layout.h"
#include "logger.h"
#include "model.h"

struct SchedulingWindow {
    std::string startDate;  // включительно
    std::string endDate;    // включительно
};

struct OperatingHours {
    int openMinutes     = 9 * 60;
    int closeMinutes    = 17 * 60;
    int slotStepMinutes = 15;   // шаг сетки времени начала
};

struct ScheduleConfig {
    ExamType examType = ExamType::Midterm;
    SchedulingWindow window;
    OperatingHours hours;

    int defaultDurationMinutes = 75;
    std::map<int, int> durationOverrides;   // courseId -> минуты

    int breakMinutes = 15;                  // перерыв между экзаменами
    int maxExamsPerDayPerLevel = 2;
    std::set<int> excludedWeekdays = {6, 7};
    bool noSimultaneousExams = false;

    SeatLayout seatLayout = SeatLayout::Dense;

    // ограничения перебора с возвратом
    int maxBacktracks = 20000;
    int timeBudgetMs  = 0;      // 0: без ограничения по времени

    int durationFor(int courseId) const;
};

struct SeatingConfig {
    unsigned int seed = 0;
    SeatLayout layout = SeatLayout::Dense;
};

// Бросает InvalidInputError при противоречивых ограничениях
void validateScheduleConfig(const ScheduleConfig& cfg);

// Конфигурация процесса (сервер, логирование) из переменных окружения
struct AppConfig {
    std::string httpHost;
    int         httpPort;
    std::string tlsCert;
    std::string tlsKey;
    std::string logFile;
    LogLevel    logLevel;

    static AppConfig fromEnv();
};
