/*
    SHP ШЭЙДИНГ САН

    ФАЙЛ: shp_stage_lib.cpp
    МОДУЛЬ: shp-stage-lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
*/

#include "shp/compute/compute_stage.hpp"
#include "shp/passes/pass_post_process.hpp"
#include "shp/passes/pass_tonemap.hpp"
#include "shp/render/stage_draws.hpp"

namespace shp
{
    int shp_stage_compiled_target_anchor()
    {
        return 0;
    }
}
