/**
 * @file scheduler.hpp
 * @brief Cron-driven scheduling of backup tasks.
 *
 * CronSchedule understands the classic five-field crontab syntax
 * (minute hour day-of-month month day-of-week) with lists, ranges, steps,
 * month/weekday names and the @hourly/@daily/@weekly/@monthly/@yearly
 * shorthands. Times are evaluated in local time.
 *
 * BackupScheduler keeps one entry per task name and is updated incrementally:
 * changing one task never disturbs the next fire time of another.
 */

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "backup_types.hpp"
#include <bitset>
#include <chrono>
#include <ctime>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

class Logger;

class CronSchedule {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Parses a crontab expression.
     *
     * @param expression e.g. "0 4 * * *" or "@daily".
     * @return std::expected<CronSchedule, std::string> The schedule or a parse error.
     */
    static std::expected<CronSchedule, std::string> parse(const std::string& expression);

    /**
     * @brief First matching minute strictly after @p after.
     *
     * @return std::optional<TimePoint> std::nullopt when the expression never fires (e.g. "0 0 31 2 *").
     */
    std::optional<TimePoint> nextAfter(TimePoint after) const;

    /**
     * @brief True if the broken-down local time matches every field.
     */
    bool matches(const std::tm& localTime) const;

    const std::string& expression() const { return text; }

private:
    CronSchedule() = default;

    bool dayMatches(const std::tm& localTime) const;

    std::bitset<60> minutes;
    std::bitset<24> hours;
    std::bitset<32> daysOfMonth; ///< Index 1..31.
    std::bitset<13> months;      ///< Index 1..12.
    std::bitset<7> daysOfWeek;   ///< 0 = Sunday.
    bool dayOfMonthRestricted = false;
    bool dayOfWeekRestricted = false;
    std::string text;
};

/**
 * @brief Mapping from task name to next fire time.
 *
 * Not thread-safe; owned by the daemon loop.
 */
class BackupScheduler {
public:
    using TimePoint = CronSchedule::TimePoint;

    explicit BackupScheduler(const Logger& logger);

    /**
     * @brief Adds or updates a task.
     *
     * If the task exists with the same cron expression, its configuration is
     * replaced and its next fire time kept. Otherwise the next fire time is
     * computed from @p now. A task whose expression does not parse is removed
     * from the schedule.
     *
     * @return std::expected<void, std::string> Success or the cron parse error.
     */
    std::expected<void, std::string> upsert(const TaskConfig& task, TimePoint now);

    /**
     * @brief Removes a task.
     *
     * @return bool True if the task was scheduled.
     */
    bool remove(const std::string& taskName);

    /**
     * @brief Tasks whose fire time is at or before @p now.
     *
     * Each returned task is advanced to its next fire time after @p now, so
     * missed firings collapse into a single run.
     */
    std::vector<TaskConfig> dueTasks(TimePoint now);

    /**
     * @brief Brings the schedule in line with a full task list.
     *
     * Tasks absent from @p tasks are removed, the rest upserted. Parse errors
     * are logged.
     */
    void sync(const std::vector<TaskConfig>& tasks, TimePoint now);

    std::optional<TimePoint> nextFireTime(const std::string& taskName) const;
    bool contains(const std::string& taskName) const;
    size_t size() const { return entries.size(); }

private:
    struct Entry {
        TaskConfig task;
        CronSchedule schedule;
        std::optional<TimePoint> next;
    };

    const Logger& logger;
    std::map<std::string, Entry> entries;
};

#endif // SCHEDULER_HPP
