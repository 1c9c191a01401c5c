#include <gtest/gtest.h>

#include <sstream>

#include <nlohmann/json.hpp>

#include "api_json.h"
#include "test_support.h"

using nlohmann::json;

namespace {

json sampleDocument() {
    return json::parse(R"({
        "courses": [
            {"id": 1, "code": "MATH101", "name": "Calculus", "classLevel": 1},
            {"id": 2, "code": "PHYS101", "name": "Physics", "classLevel": 1, "mandatory": false},
            {"id": 3, "code": "HIST201", "name": "History", "classLevel": 2}
        ],
        "students": [
            {"id": 1, "number": "S1001", "name": "Ann", "classLevel": 1, "courses": [1, 2]},
            {"id": 2, "number": "S1002", "name": "Bob", "classLevel": 1, "courses": [1]},
            {"id": 3, "number": "S1003", "name": "Cid", "classLevel": 2, "courses": [3]}
        ],
        "classrooms": [
            {"id": 1, "code": "A-101", "name": "Hall A", "capacity": 30, "rows": 5, "columns": 3, "seatGroup": 2},
            {"id": 2, "code": "B-201", "name": "Hall B", "capacity": 12, "rows": 2, "columns": 2, "seatGroup": 3}
        ],
        "constraints": {
            "examType": "final",
            "startDate": "2025-01-20",
            "endDate": "2025-01-24",
            "openTime": "9:00",
            "closeTime": "13:00",
            "slotStepMinutes": 30,
            "defaultDurationMinutes": 90,
            "breakMinutes": 10,
            "maxExamsPerDay": 1,
            "excludedWeekdays": [6, 7],
            "seatLayout": "spaced",
            "durationOverrides": {"PHYS101": 120, "NOPE": 45}
        },
        "seating": {"seed": 17}
    })");
}

} // namespace

TEST(ApiJsonTest, ParsesInputDocument) {
    InputDocument doc = parseInputDocument(sampleDocument());

    ASSERT_EQ(doc.data.courses.size(), 3u);
    EXPECT_EQ(doc.data.courses[0].code, "MATH101");
    EXPECT_TRUE(doc.data.courses[0].mandatory);
    EXPECT_FALSE(doc.data.courses[1].mandatory);
    ASSERT_EQ(doc.data.students.size(), 3u);
    EXPECT_EQ(doc.data.students[0].courseIds, (std::vector<int>{1, 2}));
    ASSERT_EQ(doc.data.classrooms.size(), 2u);
    EXPECT_EQ(doc.data.classrooms[1].seatGroup, 3);

    const ScheduleConfig& cfg = doc.schedule;
    EXPECT_EQ(cfg.examType, ExamType::Final);
    EXPECT_EQ(cfg.window.startDate, "2025-01-20");
    EXPECT_EQ(cfg.hours.openMinutes, 540);
    EXPECT_EQ(cfg.hours.closeMinutes, 780);
    EXPECT_EQ(cfg.hours.slotStepMinutes, 30);
    EXPECT_EQ(cfg.breakMinutes, 10);
    EXPECT_EQ(cfg.maxExamsPerDayPerLevel, 1);
    EXPECT_EQ(cfg.seatLayout, SeatLayout::Spaced);
    EXPECT_EQ(cfg.durationFor(2), 120);
    EXPECT_EQ(cfg.durationFor(1), 90);
    EXPECT_EQ(cfg.durationOverrides.size(), 1u);

    EXPECT_EQ(doc.seating.seed, 17u);
    EXPECT_EQ(doc.seating.layout, SeatLayout::Spaced);
    EXPECT_EQ(selectedCourses(doc).size(), 3u);
}

TEST(ApiJsonTest, RejectsBadValues) {
    json doc = sampleDocument();
    doc["constraints"]["examType"] = "quiz";
    EXPECT_THROW(parseInputDocument(doc), InvalidInputError);

    doc = sampleDocument();
    doc["constraints"]["openTime"] = "nine";
    EXPECT_THROW(parseInputDocument(doc), InvalidInputError);

    doc = sampleDocument();
    doc["seating"]["layout"] = "random";
    EXPECT_THROW(parseInputDocument(doc), InvalidInputError);
}

TEST(ApiJsonTest, OneSeatLayoutForScheduleAndSeating) {
    json j = sampleDocument();
    j["seating"]["layout"] = "dense";
    EXPECT_THROW(parseInputDocument(j), InvalidInputError);

    j["seating"]["layout"] = "spaced";
    EXPECT_EQ(parseInputDocument(j).seating.layout, SeatLayout::Spaced);

    // раскладка только в разделе рассадки действует и на расписание
    j["constraints"].erase("seatLayout");
    InputDocument doc = parseInputDocument(j);
    EXPECT_EQ(doc.schedule.seatLayout, SeatLayout::Spaced);
    EXPECT_EQ(doc.seating.layout, SeatLayout::Spaced);

    j["seating"].erase("layout");
    doc = parseInputDocument(j);
    EXPECT_EQ(doc.schedule.seatLayout, SeatLayout::Dense);
    EXPECT_EQ(doc.seating.layout, SeatLayout::Dense);
}

// 12 студентов, две аудитории по 20 мест плотно и 10 через одно:
// расписание обязано выделить обе, иначе рассадка упрётся в нехватку мест
TEST(ApiJsonTest, SpacedSeatingLayoutSizesScheduledRooms) {
    json j = json::parse(R"({
        "courses": [{"id": 1, "code": "MATH101", "name": "Calculus", "classLevel": 1}],
        "classrooms": [
            {"id": 1, "code": "A", "name": "A", "capacity": 40, "rows": 5, "columns": 2, "seatGroup": 2},
            {"id": 2, "code": "B", "name": "B", "capacity": 40, "rows": 5, "columns": 2, "seatGroup": 2}
        ],
        "constraints": {"startDate": "2025-01-20", "endDate": "2025-01-20"},
        "seating": {"seed": 3, "layout": "spaced"}
    })");
    json students = json::array();
    for (int i = 1; i <= 12; ++i) {
        students.push_back({{"id", i}, {"number", "S" + std::to_string(i)},
                            {"name", "Student"}, {"classLevel", 1}, {"courses", {1}}});
    }
    j["students"] = students;

    InputDocument doc = parseInputDocument(j);
    ScheduleResult result = scheduleExams(doc.data.courses, doc.data.students,
                                          doc.data.classrooms, doc.schedule);
    ASSERT_EQ(result.exams.size(), 1u);
    const Exam& exam = result.exams[0];
    EXPECT_EQ(exam.classroomIds, (std::vector<int>{1, 2}));

    SeatingPlan plan = assignSeating(exam, doc.data.students, doc.data.classrooms,
                                     doc.seating.seed, doc.seating.layout);
    EXPECT_EQ(plan.seats.size(), 12u);
}

TEST(ApiJsonTest, CourseSelection) {
    json j = sampleDocument();
    j["courseIds"] = {3, 1};
    InputDocument doc = parseInputDocument(j);
    std::vector<Course> selected = selectedCourses(doc);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].id, 1);
    EXPECT_EQ(selected[1].id, 3);

    j["courseIds"] = {1, 99};
    doc = parseInputDocument(j);
    EXPECT_THROW(selectedCourses(doc), InvalidInputError);
}

TEST(ApiJsonTest, ScheduleRoundTripThroughExporter) {
    InputDocument doc = parseInputDocument(sampleDocument());
    ScheduleResult result = scheduleExams(
        selectedCourses(doc), doc.data.students, doc.data.classrooms, doc.schedule);

    std::ostringstream out;
    JsonExporter exporter(out);
    exporter.exportSchedule(result, doc.data);

    json j = json::parse(out.str());
    EXPECT_TRUE(j["ok"].get<bool>());
    EXPECT_EQ(j["examType"], "final");
    ASSERT_EQ(j["exams"].size(), 3u);
    EXPECT_EQ(j["stats"]["examCount"], 3);

    for (const auto& e : j["exams"]) {
        EXPECT_TRUE(e.contains("weekday"));
        EXPECT_TRUE(e.contains("classrooms"));
        if (e["code"] == "PHYS101") {
            EXPECT_EQ(e["durationMinutes"], 120);
            EXPECT_EQ(e["studentCount"], 1);
        }
        if (e["code"] == "MATH101") EXPECT_EQ(e["studentCount"], 2);
    }
}

TEST(ApiJsonTest, ExamViewCountsRepeatedEnrolmentOnce) {
    DomainData data;
    data.courses  = {makeCourse(1, 1, "MATH101")};
    data.students = {makeStudent(1, {1, 1}), makeStudent(2, {1})};

    Exam e;
    e.id           = 1;
    e.courseId     = 1;
    e.type         = ExamType::Midterm;
    e.date         = "2025-01-20";
    e.startMinutes = 540;
    e.endMinutes   = 615;

    std::vector<ExamView> views = buildExamViews({e}, data);
    ASSERT_EQ(views.size(), 1u);
    EXPECT_EQ(views[0].studentCount, 2);
}

TEST(ApiJsonTest, SeatingExportHasGrid) {
    InputDocument doc = parseInputDocument(sampleDocument());

    Exam exam;
    exam.id           = 4;
    exam.courseId     = 1;
    exam.type         = ExamType::Final;
    exam.date         = "2025-01-20";
    exam.startMinutes = 540;
    exam.endMinutes   = 630;
    exam.classroomIds = {1};

    std::vector<Student> enrolled = enrolledIn(doc.data.students, 1);
    SeatingPlan plan = assignSeating(exam, enrolled, {doc.data.classrooms[0]}, 5u);

    std::ostringstream out;
    JsonExporter exporter(out);
    exporter.exportSeating(plan, exam, doc.data);

    json j = json::parse(out.str());
    EXPECT_EQ(j["examId"], 4);
    EXPECT_EQ(j["course"], "MATH101");
    ASSERT_EQ(j["seats"].size(), 2u);
    ASSERT_EQ(j["rooms"].size(), 1u);
    EXPECT_EQ(j["rooms"][0]["classroom"], "A-101");
    EXPECT_EQ(j["rooms"][0]["grid"].size(), 5u);
    EXPECT_EQ(j["rooms"][0]["grid"][0].size(), 6u);

    int filled = 0;
    for (const auto& row : j["rooms"][0]["grid"]) {
        for (const auto& cell : row) {
            if (!cell.get<std::string>().empty()) ++filled;
        }
    }
    EXPECT_EQ(filled, 2);
}

TEST(ApiJsonTest, ErrorPayloads) {
    json j = errorToJson(InfeasibleScheduleError("no slot", {4, 7}));
    EXPECT_FALSE(j["ok"].get<bool>());
    EXPECT_EQ(j["error"], "infeasible_schedule");
    EXPECT_EQ(j["unplaceable"], json({4, 7}));

    j = errorToJson(CapacityShortfallError(25, 20));
    EXPECT_EQ(j["error"], "capacity_shortfall");
    EXPECT_EQ(j["shortfall"], 5);

    j = errorToJson(InvalidInputError("bad"));
    EXPECT_EQ(j["error"], "invalid_input");

    j = errorToJson(VerificationError("schedule failed verification: x"));
    EXPECT_EQ(j["error"], "verification_failed");
}

TEST(ApiJsonTest, HttpStatusPerErrorKind) {
    EXPECT_EQ(httpStatusFor(InvalidInputError("bad")), 400);
    EXPECT_EQ(httpStatusFor(InfeasibleScheduleError("no slot", {1})), 409);
    EXPECT_EQ(httpStatusFor(CapacityShortfallError(25, 20)), 422);
    EXPECT_EQ(httpStatusFor(VerificationError("broken")), 500);
}

TEST(ApiJsonTest, ParsesExam) {
    json je = json::parse(R"({"id": 3, "courseId": 2, "examType": "makeup",
        "date": "2025-02-03", "startTime": "10:15", "endTime": "11:30", "classroomIds": [2, 1]})");
    Exam e = parseExam(je);
    EXPECT_EQ(e.id, 3);
    EXPECT_EQ(e.type, ExamType::Makeup);
    EXPECT_EQ(e.startMinutes, 615);
    EXPECT_EQ(e.endMinutes, 690);
    EXPECT_EQ(e.classroomIds, (std::vector<int>{2, 1}));
}

TEST(ApiJsonTest, SeatingRequestMustMatchStoredExam) {
    Exam stored;
    stored.id           = 7;
    stored.courseId     = 2;
    stored.type         = ExamType::Final;
    stored.date         = "2025-01-21";
    stored.startMinutes = 540;
    stored.endMinutes   = 630;
    stored.classroomIds = {3, 1};

    EXPECT_EQ(requestedExamId(json{{"examId", 7}}), 7);
    EXPECT_EQ(requestedExamId(json{{"exam", {{"id", 7}, {"courseId", 2}}}}), 7);
    EXPECT_THROW(requestedExamId(json{{"seed", 1}}), json::exception);

    EXPECT_NO_THROW(checkRequestedExam(json{{"examId", 7}}, stored));
    EXPECT_NO_THROW(checkRequestedExam(
        json{{"exam", {{"id", 7}, {"courseId", 2}, {"examType", "final"},
                       {"classroomIds", {3, 1}}}}}, stored));

    // чужой курс под id сохранённого экзамена
    EXPECT_THROW(checkRequestedExam(json{{"exam", {{"id", 7}, {"courseId", 5}}}}, stored),
                 InvalidInputError);
    EXPECT_THROW(checkRequestedExam(
                     json{{"exam", {{"id", 7}, {"courseId", 2}, {"classroomIds", {1, 3}}}}}, stored),
                 InvalidInputError);
    EXPECT_THROW(checkRequestedExam(
                     json{{"exam", {{"id", 7}, {"courseId", 2}, {"examType", "midterm"}}}}, stored),
                 InvalidInputError);
    EXPECT_THROW(checkRequestedExam(
                     json{{"examId", 7}, {"exam", {{"id", 8}, {"courseId", 2}}}}, stored),
                 InvalidInputError);
}

TEST(ApiJsonTest, ImportProviderLoadsDomainData) {
    JsonImportProvider provider(sampleDocument());
    ImportProvider& base = provider;
    DomainData d = base.loadDomainData();
    EXPECT_EQ(d.courses.size(), 3u);
    EXPECT_EQ(d.students.size(), 3u);
    EXPECT_EQ(d.classrooms.size(), 2u);

    EXPECT_THROW(JsonImportProvider::fromFile("/nonexistent/input.json"), std::runtime_error);
}
