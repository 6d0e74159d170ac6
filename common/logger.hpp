#ifndef DRTP_LOGGER_H
#define DRTP_LOGGER_H

#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

class Logger;

/**
 * @brief One log line built with operator<<, queued when it goes out of scope.
 */
class LogLine
{
public:
    LogLine(Logger &logger, bool isError);
    LogLine(LogLine &&other);
    ~LogLine();

    template <class T>
    LogLine &operator<<(const T &value)
    {
        stream << value;
        return *this;
    }

private:
    LogLine(const LogLine &);
    LogLine &operator=(const LogLine &);

    Logger *logger;
    bool isError;
    std::ostringstream stream;
};

/**
 * @brief Asynchronous console logger.
 *
 * Protocol threads only push lines onto the queue; a single consumer thread
 * prints them in the order they were queued. stop() queues the quit sentinel
 * and joins the consumer, every line queued before it is printed.
 */
class Logger
{
public:
    explicit Logger(std::ostream &out = std::cout, std::ostream &err = std::cerr);
    ~Logger();

    void info(const std::string &text);
    void error(const std::string &text);

    LogLine info() { return LogLine(*this, false); }
    LogLine error() { return LogLine(*this, true); }

    // Flush what's queued and join the consumer. Later lines are dropped.
    void stop();

private:
    Logger(const Logger &);
    Logger &operator=(const Logger &);

    struct Entry
    {
        bool quit;
        bool isError;
        std::string text;
    };

    void push(const Entry &entry);
    void run();

    std::ostream &out;
    std::ostream &err;

    std::deque<Entry> queue;
    std::mutex queueLock;
    std::condition_variable notEmpty;
    bool stopped;

    std::thread consumer;
};

// Wall clock time as HH:MM:SS.ffffff
std::string timestamp();

#endif
