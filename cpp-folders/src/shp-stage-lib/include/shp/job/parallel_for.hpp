#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: parallel_for.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн job модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <limits>
#include <stdexcept>

#include "shp/job/job_system.hpp"
#include "shp/job/wait_group.hpp"

namespace shp
{
    // [begin, end) мужийг chunk болгон хувааж fn(b, e)-г ажиллуулна.
    // Chunk-уудын гүйцэтгэх дараалал тодорхойгүй; fn нь дарааллаас хамаарах ёсгүй.
    template<typename Fn>
    inline void parallel_for_1d(
        IJobSystem* js,
        int begin,
        int end,
        int min_grain,
        Fn&& fn
    )
    {
        if (end <= begin) return;
        const int count = end - begin;
        // Ажил бага эсвэл job system байхгүй үед sync замаар ажиллуулна.
        if (!js || count <= std::max(1, min_grain))
        {
            fn(begin, end);
            return;
        }

        const int workers = (int)std::max<size_t>(1, js->worker_count());
        const int grain = std::max(1, min_grain);
        const int chunks = std::max(1, std::min(workers * 2, (count + grain - 1) / grain));
        const int chunk_size = (count + chunks - 1) / chunks;

        WaitGroup wg{};
        for (int i = 0; i < chunks; ++i)
        {
            const int b = begin + i * chunk_size;
            const int e = std::min(end, b + chunk_size);
            if (b >= e) continue;

            wg.add(1);
            js->enqueue([b, e, &fn, &wg]() {
                try
                {
                    fn(b, e);
                }
                catch (...)
                {
                    wg.fail(std::current_exception());
                }
                wg.done();
            });
        }
        wg.wait();
    }

    // Нэг invocation = нэг index. fn(i) нь зөвхөн i-р гаралтыг эзэмшинэ.
    // Index нь int мужид багтах ёстой.
    template<typename Fn>
    inline void parallel_for_index(IJobSystem* js, size_t count, int min_grain, Fn&& fn)
    {
        if (count > (size_t)std::numeric_limits<int>::max())
        {
            throw std::invalid_argument("parallel_for_index: invocation count exceeds INT_MAX");
        }
        parallel_for_1d(js, 0, (int)count, min_grain, [&fn](int b, int e)
        {
            for (int i = b; i < e; ++i) fn((size_t)i);
        });
    }
}
