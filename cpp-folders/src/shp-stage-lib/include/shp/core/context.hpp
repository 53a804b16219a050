#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: context.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <cstdint>

#include "shp/job/job_system.hpp"

namespace shp
{
    // Dispatch бүрийн дараа dispatch хийсэн thread дээр нэмэгдэнэ (invocation дотор биш).
    struct StageDebugStats
    {
        uint64_t vertex_invocations = 0;
        uint64_t fragment_invocations = 0;
        uint64_t compute_invocations = 0;
        uint64_t tri_input = 0;
        uint64_t tri_raster = 0;
        uint64_t draws = 0;
        uint64_t dispatches = 0;

        void reset()
        {
            *this = StageDebugStats{};
        }
    };

    struct StageContext
    {
        // nullptr үед бүх dispatch тухайн thread дээр sync ажиллана.
        IJobSystem* job_system = nullptr;
        StageDebugStats debug{};
    };
}
