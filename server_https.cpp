// server_https.cpp
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

#include <pqxx/pqxx>

#include "db.h"

#include "api_dto.h"
#include "api_json.h"
#include "config.h"
#include "errors.h"
#include "generator.h"
#include "logger.h"
#include "model.h"
#include "seating.h"

using nlohmann::json;

static const char* kJson = "application/json; charset=utf-8";

static void setCors(httplib::Response& res, const char* methods) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", methods);
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

static void sendSchedulingError(httplib::Response& res, const SchedulingError& err) {
    res.status = httpStatusFor(err);
    res.set_content(errorToJson(err).dump(), kJson);
}

// Экзамен по id среди всех типов; false, если не найден
static bool findStoredExam(PersistenceProvider& store, int examId, Exam& out) {
    for (ExamType t : {ExamType::Midterm, ExamType::Final, ExamType::Makeup}) {
        for (const Exam& e : store.loadExams(t)) {
            if (e.id == examId) {
                out = e;
                return true;
            }
        }
    }
    return false;
}

int main() {
    AppConfig app;
    try {
        app = AppConfig::fromEnv();
    } catch (const std::exception& ex) {
        logError(std::string("Fatal error on startup: ") + ex.what());
        return 1;
    }
    configureLogging(app.logFile, app.logLevel);

    logInfo("=== Запуск HTTPS сервера на " + app.httpHost + ":" + std::to_string(app.httpPort) + " ===");

    try {
        // Конфиг БД из env
        db::DbConfig dbCfg = db::DbConfig::fromEnv();
        db::ConnectionFactory dbFactory{dbCfg};
        db::PgStore store{dbFactory};

        logInfo("Успешно инициализирована конфигурация БД");

        httplib::SSLServer svr(app.tlsCert.c_str(), app.tlsKey.c_str());

        if (!svr.is_valid()) {
            logError("SSLServer невалиден. Проверь " + app.tlsCert + " и " + app.tlsKey);
            return 1;
        }

        // --- корень ---
        svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_content(
                "HTTPS exam planner is running.\n"
                "GET  /api/health/db          (проверка подключения к БД)\n"
                "POST /api/schedule           (документ -> расписание экзаменов)\n"
                "GET  /api/exams?type=midterm (сохранённые экзамены)\n"
                "POST /api/seating            (рассадка одного экзамена)\n"
                "GET  /api/seating/{examId}   (сохранённая рассадка)\n",
                "text/plain; charset=utf-8"
            );
        });

        // --- health-check БД ---
        svr.Get("/api/health/db", [&](const httplib::Request&, httplib::Response& res) {
            setCors(res, "GET, OPTIONS");
            try {
                bool ok = store.ping();
                res.status = ok ? 200 : 500;
                res.set_content(json{{"ok", ok}}.dump(), kJson);
            } catch (const std::exception& ex) {
                logError(std::string("DB health check failed: ") + ex.what());
                res.status = 500;
                res.set_content(json{{"ok", false}, {"error", ex.what()}}.dump(), kJson);
            }
        });

        // --- POST /api/schedule ---
        svr.Post("/api/schedule", [&](const httplib::Request& req, httplib::Response& res) {
            setCors(res, "POST, OPTIONS");

            try {
                json body = json::parse(req.body);
                InputDocument doc = parseInputDocument(body);
                std::vector<Course> courses = selectedCourses(doc);

                logInfo(
                    "POST /api/schedule"
                    " courses="    + std::to_string(courses.size()) +
                    " students="   + std::to_string(doc.data.students.size()) +
                    " classrooms=" + std::to_string(doc.data.classrooms.size()) +
                    " type="       + examTypeToString(doc.schedule.examType)
                );

                ScheduleResult result = scheduleExams(
                    courses,
                    doc.data.students,
                    doc.data.classrooms,
                    doc.schedule
                );

                std::vector<int> courseIds;
                for (const Course& c : courses) courseIds.push_back(c.id);
                result.exams = store.replaceExams(result.examType, courseIds, result.exams);

                res.status = 200;
                res.set_content(scheduleToJson(result, doc.data).dump(), kJson);

            } catch (const SchedulingError& ex) {
                logWarning(std::string("POST /api/schedule: ") + ex.what());
                sendSchedulingError(res, ex);
            } catch (const json::exception& ex) {
                logError(std::string("Error in POST /api/schedule: ") + ex.what());
                res.status = 400;
                res.set_content(R"({"ok":false,"error":"invalid JSON"})", kJson);
            } catch (const std::exception& ex) {
                logError(std::string("Error in POST /api/schedule: ") + ex.what());
                res.status = 500;
                res.set_content(R"({"ok":false,"error":"internal server error"})", kJson);
            }
        });

        // --- GET /api/exams?type=... ---
        svr.Get("/api/exams", [&](const httplib::Request& req, httplib::Response& res) {
            setCors(res, "GET, OPTIONS");

            ExamType type = ExamType::Midterm;
            if (req.has_param("type")) {
                std::string t = req.get_param_value("type");
                if (!examTypeFromString(t, type)) {
                    res.status = 400;
                    res.set_content(json{{"ok", false}, {"error", "unknown exam type"}}.dump(), kJson);
                    return;
                }
            }

            try {
                DomainData data = store.loadDomainData();
                std::vector<Exam> exams = store.loadExams(type);

                json items = json::array();
                for (const ExamView& v : buildExamViews(exams, data)) items.push_back(examToJson(v));

                json resp = {
                    {"ok", true},
                    {"examType", examTypeToString(type)},
                    {"exams", items}
                };
                res.status = 200;
                res.set_content(resp.dump(), kJson);
            } catch (const std::exception& ex) {
                logError(std::string("Error in GET /api/exams: ") + ex.what());
                res.status = 500;
                res.set_content(R"({"ok":false,"error":"internal server error"})", kJson);
            }
        });

        // --- POST /api/seating ---
        // {"examId" | "exam": {...}, "students": [...], "classrooms": [...], "courses": [...], "seed", "layout"}
        // курс и аудитории берутся из сохранённого экзамена
        svr.Post("/api/seating", [&](const httplib::Request& req, httplib::Response& res) {
            setCors(res, "POST, OPTIONS");

            try {
                json body = json::parse(req.body);
                int examId = requestedExamId(body);

                Exam exam;
                if (!findStoredExam(store, examId, exam)) {
                    res.status = 404;
                    res.set_content(R"({"ok":false,"error":"exam_not_found"})", kJson);
                    return;
                }
                checkRequestedExam(body, exam);

                DomainData data = parseDomainData(body);
                SeatingConfig cfg = parseSeatingConfig(body);

                // аудитории экзамена в порядке, сохранённом в exam.classroomIds
                std::map<int, const Classroom*> roomById;
                for (const Classroom& r : data.classrooms) roomById[r.id] = &r;
                std::vector<Classroom> rooms;
                for (int rid : exam.classroomIds) {
                    auto it = roomById.find(rid);
                    if (it == roomById.end()) {
                        throw InvalidInputError("classroom " + std::to_string(rid) +
                                                " of exam is not in the request");
                    }
                    rooms.push_back(*it->second);
                }

                std::vector<Student> enrolled;
                for (const Student& s : data.students) {
                    for (int c : s.courseIds) {
                        if (c == exam.courseId) {
                            enrolled.push_back(s);
                            break;
                        }
                    }
                }

                logInfo("POST /api/seating examId=" + std::to_string(exam.id) +
                        " students=" + std::to_string(enrolled.size()) +
                        " seed=" + std::to_string(cfg.seed));

                SeatingPlan plan = assignSeating(exam, enrolled, rooms, cfg.seed, cfg.layout);
                store.replaceSeating(exam.id, plan.seats);

                json resp = seatingToJson(buildSeatingView(plan, exam, data));
                resp["seed"] = cfg.seed;
                res.status = 200;
                res.set_content(resp.dump(), kJson);

            } catch (const SchedulingError& ex) {
                logWarning(std::string("POST /api/seating: ") + ex.what());
                sendSchedulingError(res, ex);
            } catch (const json::exception& ex) {
                logError(std::string("Error in POST /api/seating: ") + ex.what());
                res.status = 400;
                res.set_content(R"({"ok":false,"error":"invalid JSON"})", kJson);
            } catch (const std::invalid_argument& ex) {
                // экзамен удалён между загрузкой и записью рассадки
                logError(std::string("Error in POST /api/seating: ") + ex.what());
                res.status = 400;
                res.set_content(json{{"ok", false}, {"error", ex.what()}}.dump(), kJson);
            } catch (const std::exception& ex) {
                logError(std::string("Error in POST /api/seating: ") + ex.what());
                res.status = 500;
                res.set_content(R"({"ok":false,"error":"internal server error"})", kJson);
            }
        });

        // --- GET /api/seating/{examId} ---
        svr.Get(R"(/api/seating/(\d+))", [&](const httplib::Request& req, httplib::Response& res) {
            setCors(res, "GET, OPTIONS");

            try {
                int examId = std::stoi(req.matches[1].str());

                Exam exam;
                if (!findStoredExam(store, examId, exam)) {
                    res.status = 404;
                    res.set_content(R"({"ok":false,"error":"exam_not_found"})", kJson);
                    return;
                }

                SeatingPlan plan;
                plan.examId = examId;
                plan.seats  = store.loadSeating(examId);

                std::map<int, int> placed;
                for (const SeatAssignment& s : plan.seats) placed[s.classroomId]++;
                for (int rid : exam.classroomIds) {
                    auto it = placed.find(rid);
                    if (it != placed.end()) plan.rooms.push_back(RoomFill{rid, it->second});
                }

                DomainData data = store.loadDomainData();
                res.status = 200;
                res.set_content(seatingToJson(buildSeatingView(plan, exam, data)).dump(), kJson);
            } catch (const std::exception& ex) {
                logError(std::string("Error in GET /api/seating: ") + ex.what());
                res.status = 500;
                res.set_content(R"({"ok":false,"error":"internal server error"})", kJson);
            }
        });

        // preflight
        for (const char* path : {"/api/health/db", "/api/schedule", "/api/exams", "/api/seating"}) {
            svr.Options(path, [](const httplib::Request&, httplib::Response& res) {
                setCors(res, "GET, POST, OPTIONS");
                res.status = 204;
            });
        }

        bool ok = svr.listen(app.httpHost.c_str(), app.httpPort);
        if (!ok) {
            logError("Не удалось запустить HTTPS сервер на порту " + std::to_string(app.httpPort));
            return 1;
        }

    } catch (const std::exception& ex) {
        logError(std::string("Fatal error on startup: ") + ex.what());
        return 1;
    }

    return 0;
}
