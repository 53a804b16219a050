#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: thread_pool_job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн job модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include "shp/job/job_system.hpp"

namespace shp
{
    inline size_t default_worker_count()
    {
        const unsigned hw = std::thread::hardware_concurrency();
        return hw == 0u ? 1u : (size_t)hw;
    }

    // Stage invocation-уудыг ажиллуулах энгийн thread pool.
    // Хүлээх, алдаа дамжуулах нь WaitGroup-ийн үүрэг (parallel_for.hpp).
    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        explicit ThreadPoolJobSystem(size_t worker_count = default_worker_count())
        {
            const size_t n = worker_count == 0 ? 1 : worker_count;
            workers_.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                workers_.emplace_back([this]() { worker_loop(); });
            }
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                stop_ = true;
            }
            cv_.notify_all();
            for (auto& w : workers_)
            {
                if (w.joinable()) w.join();
            }
        }

        void enqueue(std::function<void()> job) override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                jobs_.push(std::move(job));
            }
            cv_.notify_one();
        }

        size_t worker_count() const override
        {
            return workers_.size();
        }

    private:
        void worker_loop()
        {
            while (true)
            {
                std::function<void()> job{};
                {
                    std::unique_lock<std::mutex> lock(mtx_);
                    cv_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
                    if (stop_ && jobs_.empty()) return;
                    job = std::move(jobs_.front());
                    jobs_.pop();
                }

                job();
            }
        }

        std::vector<std::thread> workers_{};
        std::queue<std::function<void()>> jobs_{};
        mutable std::mutex mtx_{};
        std::condition_variable cv_{};
        bool stop_ = false;
    };
}
