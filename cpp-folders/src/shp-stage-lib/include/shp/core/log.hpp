#pragma once

/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь shp-stage-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <iostream>
#include <mutex>
#include <string>

namespace shp
{
    namespace detail
    {
        // Олон worker thread-ээс зэрэг бичихэд мөр холилдохгүй байлгана.
        inline std::mutex& log_mutex()
        {
            static std::mutex m{};
            return m;
        }
    }

    inline void log_info(const std::string& msg)
    {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
