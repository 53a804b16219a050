#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Stage invocation-уудыг (vertex, fragment мөр, compute index)
            тараах job system-ийн интерфэйс.
*/


#include <cstddef>
#include <functional>

namespace shp
{
    // Stage dispatcher-ууд (parallel_for_1d / parallel_for_index) зөвхөн энэ интерфэйсээр
    // ажил тараана. nullptr job system өгвөл бүх invocation dispatch хийсэн thread дээр ажиллана.
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;

        // Job exception шидэх ёсгүй. parallel_for_1d алдааг WaitGroup-д барьж
        // dispatch хийсэн thread дээр дахин шиднэ.
        virtual void enqueue(std::function<void()> job) = 0;

        // Chunk-ийн тоог тооцоход ашиглана.
        virtual size_t worker_count() const = 0;
    };
}
