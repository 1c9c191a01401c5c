#pragma once

#include <vector>

#include "generator.h"
#include "model.h"
#include "seating.h"

// Интерфейсы внешних сервисов, через которые ядро общается с хостом.
// Ядро не знает, откуда пришли данные и куда уходят результаты.

class ImportProvider {
public:
    virtual ~ImportProvider() = default;

    virtual DomainData loadDomainData() = 0;
};

class PersistenceProvider {
public:
    virtual ~PersistenceProvider() = default;

    // Атомарно заменяет экзамены типа type для courseIds (и их рассадку).
    // Возвращает экзамены с id, присвоенными хранилищем.
    virtual std::vector<Exam> replaceExams(
        ExamType type,
        const std::vector<int>& courseIds,
        const std::vector<Exam>& exams
    ) = 0;

    // Атомарно заменяет рассадку одного экзамена
    virtual void replaceSeating(int examId, const std::vector<SeatAssignment>& seats) = 0;

    virtual std::vector<Exam> loadExams(ExamType type) = 0;
    virtual std::vector<SeatAssignment> loadSeating(int examId) = 0;
};

class ExportProvider {
public:
    virtual ~ExportProvider() = default;

    virtual void exportSchedule(const ScheduleResult& result, const DomainData& data) = 0;
    virtual void exportSeating(const SeatingPlan& plan, const Exam& exam, const DomainData& data) = 0;
};
