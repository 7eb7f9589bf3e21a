#include "scheduler.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <set>
#include <sstream>

namespace {

using NameTable = std::map<std::string, int>;

const NameTable kMonthNames = {
    {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"may", 5}, {"jun", 6},
    {"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12}
};

const NameTable kDayNames = {
    {"sun", 0}, {"mon", 1}, {"tue", 2}, {"wed", 3}, {"thu", 4}, {"fri", 5}, {"sat", 6}
};

const std::map<std::string, std::string> kShorthands = {
    {"@yearly", "0 0 1 1 *"},
    {"@annually", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"},
    {"@weekly", "0 0 * * 0"},
    {"@daily", "0 0 * * *"},
    {"@midnight", "0 0 * * *"},
    {"@hourly", "0 * * * *"}
};

// Bounds the search for expressions that can never fire.
constexpr int kMaxSearchSteps = 100000;

std::string toLower(std::string text) {
    std::ranges::transform(text, text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> splitOn(const std::string& text, char separator) {
    std::vector<std::string> items;
    std::string item;
    std::istringstream stream(text);
    while (std::getline(stream, item, separator)) {
        items.push_back(item);
    }
    if (!text.empty() && text.back() == separator) {
        items.emplace_back();
    }
    return items;
}

std::expected<int, std::string> parseValue(const std::string& token, const NameTable* names) {
    if (names) {
        if (auto it = names->find(toLower(token)); it != names->end()) {
            return it->second;
        }
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc() || ptr != token.data() + token.size()) {
        return std::unexpected(std::format("invalid value '{}'", token));
    }
    return value;
}

template <size_t N>
std::expected<void, std::string> parseField(const std::string& field, int minValue, int maxValue,
                                             const NameTable* names, std::bitset<N>& bits) {
    for (const auto& item : splitOn(field, ',')) {
        if (item.empty()) {
            return std::unexpected(std::format("empty list item in '{}'", field));
        }

        std::string range = item;
        int step = 1;
        auto slash = item.find('/');
        if (slash != std::string::npos) {
            range = item.substr(0, slash);
            auto parsedStep = parseValue(item.substr(slash + 1), nullptr);
            if (!parsedStep || *parsedStep <= 0) {
                return std::unexpected(std::format("invalid step in '{}'", item));
            }
            step = *parsedStep;
        }

        int low = minValue;
        int high = maxValue;
        if (range != "*") {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                auto first = parseValue(range.substr(0, dash), names);
                auto last = parseValue(range.substr(dash + 1), names);
                if (!first) {
                    return std::unexpected(first.error());
                }
                if (!last) {
                    return std::unexpected(last.error());
                }
                low = *first;
                high = *last;
            } else {
                auto single = parseValue(range, names);
                if (!single) {
                    return std::unexpected(single.error());
                }
                low = *single;
                high = slash != std::string::npos ? maxValue : low;
            }
        }

        if (low < minValue || high > maxValue || low > high) {
            return std::unexpected(std::format("'{}' is outside {}-{}", item, minValue, maxValue));
        }
        for (int value = low; value <= high; value += step) {
            bits.set(static_cast<size_t>(value));
        }
    }
    return {};
}

std::time_t normalize(std::tm& localTime) {
    localTime.tm_isdst = -1;
    return std::mktime(&localTime);
}

} // namespace

std::expected<CronSchedule, std::string> CronSchedule::parse(const std::string& expression) {
    std::string trimmed = trim(expression);
    std::string expanded = trimmed;
    if (!trimmed.empty() && trimmed.front() == '@') {
        auto it = kShorthands.find(toLower(trimmed));
        if (it == kShorthands.end()) {
            return std::unexpected(std::format("unknown shorthand '{}'", trimmed));
        }
        expanded = it->second;
    }

    std::istringstream stream(expanded);
    std::vector<std::string> fields;
    for (std::string field; stream >> field;) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        return std::unexpected(std::format("expected 5 fields, got {} in '{}'", fields.size(), trimmed));
    }

    CronSchedule schedule;
    schedule.text = trimmed;

    std::bitset<8> weekdays;
    for (auto result : {parseField(fields[0], 0, 59, nullptr, schedule.minutes),
                        parseField(fields[1], 0, 23, nullptr, schedule.hours),
                        parseField(fields[2], 1, 31, nullptr, schedule.daysOfMonth),
                        parseField(fields[3], 1, 12, &kMonthNames, schedule.months),
                        parseField(fields[4], 0, 7, &kDayNames, weekdays)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }

    for (size_t day = 0; day < 7; ++day) {
        schedule.daysOfWeek[day] = weekdays[day];
    }
    if (weekdays[7]) {
        schedule.daysOfWeek.set(0);
    }
    schedule.dayOfMonthRestricted = fields[2].front() != '*';
    schedule.dayOfWeekRestricted = fields[4].front() != '*';
    return schedule;
}

bool CronSchedule::dayMatches(const std::tm& localTime) const {
    bool dayOfMonth = daysOfMonth[static_cast<size_t>(localTime.tm_mday)];
    bool dayOfWeek = daysOfWeek[static_cast<size_t>(localTime.tm_wday)];
    if (dayOfMonthRestricted && dayOfWeekRestricted) {
        return dayOfMonth || dayOfWeek;
    }
    return dayOfMonth && dayOfWeek;
}

bool CronSchedule::matches(const std::tm& localTime) const {
    return minutes[static_cast<size_t>(localTime.tm_min)] && hours[static_cast<size_t>(localTime.tm_hour)] &&
           months[static_cast<size_t>(localTime.tm_mon + 1)] && dayMatches(localTime);
}

std::optional<CronSchedule::TimePoint> CronSchedule::nextAfter(TimePoint after) const {
    auto afterT = std::chrono::system_clock::to_time_t(after);
    std::tm t{};
    localtime_r(&afterT, &t);
    t.tm_sec = 0;
    t.tm_min += 1;
    normalize(t);

    for (int step = 0; step < kMaxSearchSteps; ++step) {
        if (!months[static_cast<size_t>(t.tm_mon + 1)]) {
            t.tm_mon += 1;
            t.tm_mday = 1;
            t.tm_hour = 0;
            t.tm_min = 0;
        } else if (!dayMatches(t)) {
            t.tm_mday += 1;
            t.tm_hour = 0;
            t.tm_min = 0;
        } else if (!hours[static_cast<size_t>(t.tm_hour)]) {
            t.tm_hour += 1;
            t.tm_min = 0;
        } else if (!minutes[static_cast<size_t>(t.tm_min)]) {
            t.tm_min += 1;
        } else {
            return std::chrono::system_clock::from_time_t(normalize(t));
        }
        normalize(t);
    }
    return std::nullopt;
}

BackupScheduler::BackupScheduler(const Logger& logger) : logger(logger) {}

std::expected<void, std::string> BackupScheduler::upsert(const TaskConfig& task, TimePoint now) {
    auto parsed = CronSchedule::parse(task.cron);
    if (!parsed) {
        entries.erase(task.name);
        return std::unexpected(std::format("Invalid cron expression '{}' for task {}: {}", task.cron, task.name, parsed.error()));
    }

    auto it = entries.find(task.name);
    if (it != entries.end() && it->second.schedule.expression() == parsed->expression()) {
        it->second.task = task;
        return {};
    }

    auto next = parsed->nextAfter(now);
    entries.insert_or_assign(task.name, Entry{task, *parsed, next});
    if (next) {
        logger.logMessage(std::format("[{}] Scheduled '{}', next run at {}", task.name, parsed->expression(),
                                      formatLocalTime(*next, "%Y-%m-%d %H:%M:%S")));
    } else {
        logger.logMessage(std::format("[{}] Cron expression '{}' never fires", task.name, parsed->expression()));
    }
    return {};
}

bool BackupScheduler::remove(const std::string& taskName) {
    return entries.erase(taskName) > 0;
}

std::vector<TaskConfig> BackupScheduler::dueTasks(TimePoint now) {
    std::vector<TaskConfig> due;
    for (auto& [name, entry] : entries) {
        if (entry.next && *entry.next <= now) {
            due.push_back(entry.task);
            entry.next = entry.schedule.nextAfter(now);
        }
    }
    return due;
}

void BackupScheduler::sync(const std::vector<TaskConfig>& tasks, TimePoint now) {
    std::set<std::string> wanted;
    for (const auto& task : tasks) {
        wanted.insert(task.name);
    }

    for (auto it = entries.begin(); it != entries.end();) {
        if (!wanted.contains(it->first)) {
            logger.logMessage(std::format("[{}] Removed from schedule", it->first));
            it = entries.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& task : tasks) {
        if (auto result = upsert(task, now); !result) {
            logger.logError(result.error());
        }
    }
}

std::optional<BackupScheduler::TimePoint> BackupScheduler::nextFireTime(const std::string& taskName) const {
    auto it = entries.find(taskName);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.next;
}

bool BackupScheduler::contains(const std::string& taskName) const {
    return entries.contains(taskName);
}
