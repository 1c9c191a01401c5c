#include "api_json.h"
#include "calendar.h"
#include "logger.h"

#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

using nlohmann::json;

// --- разбор справочников ---

Student parseStudent(const json& js) {
    Student s;
    s.id         = js.at("id").get<int>();
    s.number     = js.value("number", std::string());
    s.name       = js.value("name", std::string());
    s.classLevel = js.value("classLevel", 0);
    if (js.contains("courses") && js["courses"].is_array()) {
        for (const auto& c : js["courses"]) s.courseIds.push_back(c.get<int>());
    }
    return s;
}

Classroom parseClassroom(const json& jr) {
    Classroom r;
    r.id        = jr.at("id").get<int>();
    r.code      = jr.value("code", std::string());
    r.name      = jr.value("name", std::string());
    r.capacity  = jr.value("capacity", 0);
    r.rows      = jr.value("rows", 0);
    r.columns   = jr.value("columns", 0);
    r.seatGroup = jr.value("seatGroup", 2);
    return r;
}

DomainData parseDomainData(const json& j) {
    DomainData d;

    if (j.contains("courses") && j["courses"].is_array()) {
        for (const auto& jc : j["courses"]) {
            Course c;
            c.id         = jc.at("id").get<int>();
            c.code       = jc.value("code", std::string());
            c.name       = jc.value("name", std::string());
            c.instructor = jc.value("instructor", std::string());
            c.classLevel = jc.value("classLevel", 1);
            c.mandatory  = jc.value("mandatory", true);
            d.courses.push_back(c);
        }
    }

    if (j.contains("students") && j["students"].is_array()) {
        for (const auto& js : j["students"]) d.students.push_back(parseStudent(js));
    }

    if (j.contains("classrooms") && j["classrooms"].is_array()) {
        for (const auto& jr : j["classrooms"]) d.classrooms.push_back(parseClassroom(jr));
    }

    return d;
}

// --- разбор ограничений ---

static int readTime(const json& j, const char* key, int fallback) {
    if (!j.contains(key)) return fallback;
    std::string s = j[key].get<std::string>();
    int minutes = 0;
    if (!parseTime(s, minutes)) {
        throw InvalidInputError(std::string(key) + " '" + s + "' is not HH:MM");
    }
    return minutes;
}

ScheduleConfig parseScheduleConfig(const json& jc, const std::vector<Course>& courses) {
    ScheduleConfig cfg;
    if (!jc.is_object()) return cfg;

    if (jc.contains("examType")) {
        std::string t = jc["examType"].get<std::string>();
        if (!examTypeFromString(t, cfg.examType)) {
            throw InvalidInputError("unknown exam type '" + t + "'");
        }
    }

    cfg.window.startDate = jc.value("startDate", std::string());
    cfg.window.endDate   = jc.value("endDate", std::string());

    cfg.hours.openMinutes     = readTime(jc, "openTime", cfg.hours.openMinutes);
    cfg.hours.closeMinutes    = readTime(jc, "closeTime", cfg.hours.closeMinutes);
    cfg.hours.slotStepMinutes = jc.value("slotStepMinutes", cfg.hours.slotStepMinutes);

    cfg.defaultDurationMinutes = jc.value("defaultDurationMinutes", cfg.defaultDurationMinutes);
    cfg.breakMinutes           = jc.value("breakMinutes", cfg.breakMinutes);
    cfg.maxExamsPerDayPerLevel = jc.value("maxExamsPerDay", cfg.maxExamsPerDayPerLevel);
    cfg.noSimultaneousExams    = jc.value("noSimultaneousExams", cfg.noSimultaneousExams);
    cfg.maxBacktracks          = jc.value("maxBacktracks", cfg.maxBacktracks);
    cfg.timeBudgetMs           = jc.value("timeBudgetMs", cfg.timeBudgetMs);

    if (jc.contains("excludedWeekdays") && jc["excludedWeekdays"].is_array()) {
        cfg.excludedWeekdays.clear();
        for (const auto& d : jc["excludedWeekdays"]) cfg.excludedWeekdays.insert(d.get<int>());
    }

    if (jc.contains("seatLayout")) {
        std::string l = jc["seatLayout"].get<std::string>();
        if (!seatLayoutFromString(l, cfg.seatLayout)) {
            throw InvalidInputError("unknown seat layout '" + l + "'");
        }
    }

    // исключения по длительности задаются кодом курса
    if (jc.contains("durationOverrides") && jc["durationOverrides"].is_object()) {
        for (auto it = jc["durationOverrides"].begin(); it != jc["durationOverrides"].end(); ++it) {
            const std::string& code = it.key();
            int minutes = it.value().get<int>();

            const Course* found = nullptr;
            for (const Course& c : courses) {
                if (c.code == code || std::to_string(c.id) == code) {
                    found = &c;
                    break;
                }
            }
            if (!found) {
                logWarning("Исключение по длительности для неизвестного курса '" + code +
                           "' пропущено");
                continue;
            }
            cfg.durationOverrides[found->id] = minutes;
        }
    }

    return cfg;
}

SeatingConfig parseSeatingConfig(const json& j) {
    SeatingConfig cfg;
    if (!j.is_object()) return cfg;

    cfg.seed = j.value("seed", 0u);
    if (j.contains("layout")) {
        std::string l = j["layout"].get<std::string>();
        if (!seatLayoutFromString(l, cfg.layout)) {
            throw InvalidInputError("unknown seat layout '" + l + "'");
        }
    }
    return cfg;
}

InputDocument parseInputDocument(const json& j) {
    InputDocument doc;
    doc.data = parseDomainData(j);

    if (j.contains("courseIds") && j["courseIds"].is_array()) {
        for (const auto& c : j["courseIds"]) doc.selectedCourseIds.push_back(c.get<int>());
    }

    doc.schedule = parseScheduleConfig(j.value("constraints", json::object()), doc.data.courses);
    doc.seating  = parseSeatingConfig(j.value("seating", json::object()));

    // Расписание и рассадка считают места по одной раскладке: указанная
    // в одном разделе переходит в другой, разные значения отклоняются.
    bool scheduleLayout = j.contains("constraints") && j["constraints"].is_object() &&
                          j["constraints"].contains("seatLayout");
    bool seatingLayout  = j.contains("seating") && j["seating"].is_object() &&
                          j["seating"].contains("layout");
    if (scheduleLayout && seatingLayout && doc.schedule.seatLayout != doc.seating.layout) {
        throw InvalidInputError(std::string("seat layout '") +
                                seatLayoutToString(doc.schedule.seatLayout) +
                                "' of constraints differs from seating layout '" +
                                seatLayoutToString(doc.seating.layout) + "'");
    }
    if (seatingLayout) {
        doc.schedule.seatLayout = doc.seating.layout;
    } else {
        doc.seating.layout = doc.schedule.seatLayout;
    }
    return doc;
}

std::vector<Course> selectedCourses(const InputDocument& doc) {
    if (doc.selectedCourseIds.empty()) return doc.data.courses;

    std::set<int> wanted(doc.selectedCourseIds.begin(), doc.selectedCourseIds.end());
    std::vector<Course> result;
    for (const Course& c : doc.data.courses) {
        if (wanted.erase(c.id)) result.push_back(c);
    }
    if (!wanted.empty()) {
        throw InvalidInputError("selected course " + std::to_string(*wanted.begin()) +
                                " is not in the course list");
    }
    return result;
}

Exam parseExam(const json& je) {
    Exam e;
    e.id       = je.at("id").get<int>();
    e.courseId = je.at("courseId").get<int>();
    e.type     = ExamType::Midterm;
    if (je.contains("examType")) {
        std::string t = je["examType"].get<std::string>();
        if (!examTypeFromString(t, e.type)) {
            throw InvalidInputError("unknown exam type '" + t + "'");
        }
    }
    e.date         = je.value("date", std::string());
    e.startMinutes = readTime(je, "startTime", 0);
    e.endMinutes   = readTime(je, "endTime", 0);
    if (je.contains("classroomIds") && je["classroomIds"].is_array()) {
        for (const auto& r : je["classroomIds"]) e.classroomIds.push_back(r.get<int>());
    }
    return e;
}

int requestedExamId(const json& body) {
    if (body.contains("examId")) return body["examId"].get<int>();
    return body.at("exam").at("id").get<int>();
}

void checkRequestedExam(const json& body, const Exam& stored) {
    if (!body.contains("exam")) return;
    const json& je = body["exam"];
    Exam e = parseExam(je);

    if (e.id != stored.id) {
        throw InvalidInputError("exam id " + std::to_string(e.id) +
                                " differs from requested exam " + std::to_string(stored.id));
    }
    if (e.courseId != stored.courseId) {
        throw InvalidInputError("exam " + std::to_string(stored.id) + " belongs to course " +
                                std::to_string(stored.courseId) + ", not " +
                                std::to_string(e.courseId));
    }
    if (je.contains("examType") && e.type != stored.type) {
        throw InvalidInputError("exam " + std::to_string(stored.id) + " is a " +
                                examTypeToString(stored.type) + " exam, not " +
                                examTypeToString(e.type));
    }
    if (je.contains("classroomIds") && e.classroomIds != stored.classroomIds) {
        throw InvalidInputError("classrooms of exam " + std::to_string(stored.id) +
                                " differ from the stored ones");
    }
}

// --- сериализация ---

json examToJson(const ExamView& e) {
    return json{
        {"id", e.examId},
        {"courseId", e.courseId},
        {"code", e.courseCode},
        {"name", e.courseName},
        {"classLevel", e.classLevel},
        {"examType", e.examType},
        {"date", e.date},
        {"weekday", e.weekday},
        {"startTime", e.startTime},
        {"endTime", e.endTime},
        {"durationMinutes", e.durationMinutes},
        {"studentCount", e.studentCount},
        {"classrooms", e.classrooms}
    };
}

json scheduleToJson(const ScheduleResult& result, const DomainData& data) {
    json exams = json::array();
    std::vector<ExamView> views = buildExamViews(result.exams, data);
    for (size_t i = 0; i < views.size(); ++i) {
        json item = examToJson(views[i]);
        item["classroomIds"] = result.exams[i].classroomIds;
        exams.push_back(item);
    }

    return json{
        {"ok", true},
        {"examType", examTypeToString(result.examType)},
        {"exams", exams},
        {"stats", {
            {"examCount", result.stats.examCount},
            {"daysUsed", result.stats.daysUsed},
            {"usableDays", result.stats.usableDays},
            {"multiRoomExams", result.stats.multiRoomExams},
            {"backtracks", result.stats.backtracks}
        }}
    };
}

json seatingToJson(const SeatingView& view) {
    json seats = json::array();
    for (const SeatView& s : view.seats) {
        seats.push_back({
            {"classroomId", s.classroomId},
            {"classroom", s.classroom},
            {"row", s.row},
            {"column", s.column},
            {"studentId", s.studentId},
            {"studentNumber", s.studentNumber},
            {"studentName", s.studentName}
        });
    }

    json rooms = json::array();
    for (const RoomGridView& r : view.rooms) {
        rooms.push_back({
            {"classroomId", r.classroomId},
            {"classroom", r.classroom},
            {"placed", r.placed},
            {"grid", r.grid}
        });
    }

    return json{
        {"ok", true},
        {"examId", view.examId},
        {"course", view.courseCode},
        {"seats", seats},
        {"rooms", rooms}
    };
}

json errorToJson(const SchedulingError& err) {
    json j = {{"ok", false}, {"message", err.what()}};

    if (const auto* inf = dynamic_cast<const InfeasibleScheduleError*>(&err)) {
        j["error"] = "infeasible_schedule";
        j["unplaceable"] = inf->unplaceable();
    } else if (const auto* cap = dynamic_cast<const CapacityShortfallError*>(&err)) {
        j["error"] = "capacity_shortfall";
        j["shortfall"] = cap->shortfall();
        j["required"] = cap->required();
        j["available"] = cap->available();
    } else if (dynamic_cast<const InvalidInputError*>(&err)) {
        j["error"] = "invalid_input";
    } else if (dynamic_cast<const VerificationError*>(&err)) {
        j["error"] = "verification_failed";
    } else {
        j["error"] = "scheduling_error";
    }
    return j;
}

int httpStatusFor(const SchedulingError& err) {
    if (dynamic_cast<const InfeasibleScheduleError*>(&err)) return 409;
    if (dynamic_cast<const CapacityShortfallError*>(&err)) return 422;
    if (dynamic_cast<const VerificationError*>(&err)) return 500;
    return 400;
}

// --- провайдеры ---

JsonImportProvider JsonImportProvider::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open input file " + path);
    }
    json doc = json::parse(in);
    logInfo("Загружен входной файл " + path);
    return JsonImportProvider(std::move(doc));
}

DomainData JsonImportProvider::loadDomainData() {
    return parseDomainData(doc_);
}

InputDocument JsonImportProvider::loadDocument() const {
    return parseInputDocument(doc_);
}

void JsonExporter::exportSchedule(const ScheduleResult& result, const DomainData& data) {
    out_ << scheduleToJson(result, data).dump(2) << "\n";
}

void JsonExporter::exportSeating(const SeatingPlan& plan, const Exam& exam, const DomainData& data) {
    out_ << seatingToJson(buildSeatingView(plan, exam, data)).dump(2) << "\n";
}
