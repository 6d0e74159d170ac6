#include <stdio.h>
#include <time.h>
#include <chrono>

#include "common/logger.hpp"

std::string timestamp()
{
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    time_t seconds = std::chrono::system_clock::to_time_t(now);
    long micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    struct tm local;
    localtime_r(&seconds, &local);

    char buf[32];
    size_t len = strftime(buf, sizeof buf, "%H:%M:%S", &local);
    snprintf(buf + len, sizeof buf - len, ".%06ld", micros);
    return buf;
}

LogLine::LogLine(Logger &logger, bool isError) : logger(&logger), isError(isError)
{
}

LogLine::LogLine(LogLine &&other) : logger(other.logger), isError(other.isError), stream(std::move(other.stream))
{
    other.logger = NULL;
}

LogLine::~LogLine()
{
    if (this->logger == NULL)
        return;

    if (this->isError)
        this->logger->error(this->stream.str());
    else
        this->logger->info(this->stream.str());
}

Logger::Logger(std::ostream &out, std::ostream &err) : out(out), err(err), stopped(false)
{
    this->consumer = std::thread(&Logger::run, this);
}

Logger::~Logger()
{
    this->stop();
}

void Logger::info(const std::string &text)
{
    Entry entry = {false, false, timestamp() + " " + text};
    this->push(entry);
}

void Logger::error(const std::string &text)
{
    Entry entry = {false, true, timestamp() + " " + text};
    this->push(entry);
}

void Logger::push(const Entry &entry)
{
    {
        std::lock_guard<std::mutex> lg(this->queueLock);
        if (this->stopped)
            return;
        if (entry.quit)
            this->stopped = true;
        this->queue.push_back(entry);
    }
    this->notEmpty.notify_one();
}

void Logger::stop()
{
    Entry sentinel = {true, false, ""};
    this->push(sentinel);

    if (this->consumer.joinable())
    {
        this->consumer.join();
    }
}

void Logger::run()
{
    std::deque<Entry> batch;
    while (true)
    {
        {
            std::unique_lock<std::mutex> ul(this->queueLock);
            this->notEmpty.wait(ul, [this]
                                { return !this->queue.empty(); });
            batch.swap(this->queue);
        }

        for (std::deque<Entry>::const_iterator it = batch.begin(); it != batch.end(); ++it)
        {
            if (it->quit)
            {
                this->out.flush();
                this->err.flush();
                return;
            }
            std::ostream &stream = it->isError ? this->err : this->out;
            stream << it->text << '\n';
        }
        this->out.flush();
        batch.clear();
    }
}
