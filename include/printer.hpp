#ifndef RBT_UTIL_PRINTER_HPP
#define RBT_UTIL_PRINTER_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "print.hpp"
#include "thread/affinity.hpp"

namespace util
{

// Asynchronous line printer.  Worker threads hand formatted lines to
// print(); a background thread pinned to `core_id` writes them to stdout
// in arrival order.  Lines queued before stop()/destruction are still
// written.
class printer final
{
public:
    inline explicit printer(int core_id) noexcept;
    inline ~printer() noexcept;

    template <typename... Args>
    void print(const std::string& message, const Args&... args) noexcept;

    inline void stop() noexcept;

    printer()                          = delete;
    printer(const printer&)            = delete;
    printer(printer&&)                 = delete;
    printer& operator=(const printer&) = delete;
    printer& operator=(printer&&)      = delete;

private:
    void push(std::string value) noexcept
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push(std::move(value));
        }
        cv_.notify_one();
    }

    inline void flush() noexcept;

    std::queue<std::string> queue_;
    std::mutex              queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool>       running_;
    std::thread             printer_thread_;
};

printer::printer(int core_id) noexcept
    : running_(true)
{
    this->printer_thread_ = std::thread([this, core_id]
    {
        [[maybe_unused]] bool pinned = use_core(core_id);
        this->flush();
    });
}

printer::~printer() noexcept
{
    this->stop();
    if (this->printer_thread_.joinable()) this->printer_thread_.join();
}

void printer::stop() noexcept
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        this->running_ = false;
    }
    cv_.notify_all();
}

template <typename... Args>
void printer::print(const std::string& message, const Args&... args) noexcept
{
    this->push(detail::format(message, args...));
}

void printer::flush() noexcept
{
    std::unique_lock<std::mutex> lock(this->queue_mutex_);
    for (;;)
    {
        cv_.wait(lock, [this] { return !queue_.empty() || !this->running_; });

        while (!this->queue_.empty())
        {
            std::string content = std::move(this->queue_.front());
            this->queue_.pop();

            lock.unlock();
            std::cout << content << std::endl; // already formatted
            lock.lock();
        }

        if (!this->running_) break;
    }
}

}  // namespace util

#endif  // RBT_UTIL_PRINTER_HPP
