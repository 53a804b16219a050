#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: wait_group.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн job модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>

namespace shp
{
    // Invocation chunk-уудын дуусахыг хүлээж, анхны алдааг dispatch хийсэн thread рүү буцаана.
    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            count_.fetch_add(n, std::memory_order_relaxed);
        }

        void done()
        {
            // Lock дор бууруулна: wait() буцаж WaitGroup устсаны дараа mutex-д хүрэхгүй.
            std::lock_guard<std::mutex> lock(mtx_);
            if (count_.fetch_sub(1, std::memory_order_acq_rel) == 1)
            {
                cv_.notify_all();
            }
        }

        // Эхний алдаа л хадгалагдана, дараагийнх нь хаягдана.
        void fail(std::exception_ptr e)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!error_) error_ = std::move(e);
        }

        void wait()
        {
            std::exception_ptr err{};
            {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [&]() { return count_.load(std::memory_order_acquire) == 0; });
                err = error_;
                error_ = nullptr;
            }
            if (err) std::rethrow_exception(err);
        }

    private:
        std::atomic<int> count_{0};
        std::mutex mtx_{};
        std::condition_variable cv_{};
        std::exception_ptr error_{};
    };
}
