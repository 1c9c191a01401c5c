#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Ошибки ядра, кроме VerificationError, исправимые: вызывающий меняет входные данные
// и повторяет запуск.
class SchedulingError : public std::runtime_error {
public:
    explicit SchedulingError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Некорректные входные ограничения; бросается до любой попытки размещения.
class InvalidInputError : public SchedulingError {
public:
    explicit InvalidInputError(const std::string& msg)
        : SchedulingError("invalid input: " + msg) {}
};

class InfeasibleScheduleError : public SchedulingError {
public:
    InfeasibleScheduleError(const std::string& msg, std::vector<int> unplaceable)
        : SchedulingError(msg), unplaceable_(std::move(unplaceable)) {}

    const std::vector<int>& unplaceable() const { return unplaceable_; }

private:
    std::vector<int> unplaceable_;
};

// Найденное расписание не прошло собственную проверку: ошибка в ядре, а не во входных данных.
class VerificationError : public SchedulingError {
public:
    explicit VerificationError(const std::string& msg)
        : SchedulingError(msg) {}
};

class CapacityShortfallError : public SchedulingError {
public:
    CapacityShortfallError(int required, int available)
        : SchedulingError("capacity shortfall: " + std::to_string(required) +
                          " students, " + std::to_string(available) +
                          " seats, missing " + std::to_string(required - available)),
          required_(required),
          available_(available) {}

    int shortfall() const { return required_ - available_; }
    int required() const { return required_; }
    int available() const { return available_; }

private:
    int required_;
    int available_;
};
