#pragma once

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "api_dto.h"
#include "config.h"
#include "errors.h"
#include "generator.h"
#include "model.h"
#include "providers.h"
#include "seating.h"

// Входной документ: справочники + ограничения запуска
struct InputDocument {
    DomainData data;
    std::vector<int> selectedCourseIds;   // пусто: все курсы
    ScheduleConfig schedule;
    SeatingConfig seating;
};

DomainData parseDomainData(const nlohmann::json& j);
ScheduleConfig parseScheduleConfig(const nlohmann::json& constraints,
                                   const std::vector<Course>& courses);
SeatingConfig parseSeatingConfig(const nlohmann::json& j);
InputDocument parseInputDocument(const nlohmann::json& j);

// Курсы из выборки документа; на неизвестный id бросает InvalidInputError
std::vector<Course> selectedCourses(const InputDocument& doc);

Exam parseExam(const nlohmann::json& j);

// Id экзамена из запроса рассадки: "examId" или "exam.id"
int requestedExamId(const nlohmann::json& body);
// Поля "exam" из запроса должны совпадать с сохранённым экзаменом, иначе InvalidInputError
void checkRequestedExam(const nlohmann::json& body, const Exam& stored);
Student parseStudent(const nlohmann::json& j);
Classroom parseClassroom(const nlohmann::json& j);

nlohmann::json examToJson(const ExamView& e);
nlohmann::json scheduleToJson(const ScheduleResult& result, const DomainData& data);
nlohmann::json seatingToJson(const SeatingView& view);
nlohmann::json errorToJson(const SchedulingError& err);

// InvalidInput -> 400, Infeasible -> 409, Capacity -> 422, Verification -> 500
int httpStatusFor(const SchedulingError& err);

class JsonImportProvider : public ImportProvider {
public:
    explicit JsonImportProvider(nlohmann::json doc) : doc_(std::move(doc)) {}

    static JsonImportProvider fromFile(const std::string& path);

    DomainData loadDomainData() override;
    InputDocument loadDocument() const;

private:
    nlohmann::json doc_;
};

// Пишет результаты в поток как JSON (stdout у CLI)
class JsonExporter : public ExportProvider {
public:
    explicit JsonExporter(std::ostream& out) : out_(out) {}

    void exportSchedule(const ScheduleResult& result, const DomainData& data) override;
    void exportSeating(const SeatingPlan& plan, const Exam& exam, const DomainData& data) override;

private:
    std::ostream& out_;
};
